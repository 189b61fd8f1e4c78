#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace voicelive_bridge;

TEST_CASE("Registry tracks calls by id and correlation id") {
    fakes::BridgeHarness first("call-a");
    fakes::BridgeHarness second("call-b");
    bridge::CallRegistry registry;

    registry.insert("call-a", "corr-a", first.bridge);
    registry.insert("call-b", "", second.bridge);

    REQUIRE(registry.size() == 2);
    REQUIRE(registry.contains("call-a"));
    REQUIRE(registry.find("call-b") == second.bridge);
    REQUIRE(registry.find_by_correlation("corr-a") == first.bridge);
    REQUIRE(registry.find_by_correlation("") == nullptr);
    REQUIRE(registry.find("call-c") == nullptr);
    REQUIRE(registry.snapshot().size() == 2);
}

TEST_CASE("Duplicate call ids are rejected") {
    fakes::BridgeHarness first("call-a");
    fakes::BridgeHarness second("call-a");
    bridge::CallRegistry registry;

    registry.insert("call-a", "corr-1", first.bridge);
    REQUIRE_THROWS_AS(registry.insert("call-a", "corr-2", second.bridge), DuplicateCallError);
    REQUIRE(registry.find("call-a") == first.bridge);
    REQUIRE(registry.find_by_correlation("corr-1") == first.bridge);
    REQUIRE(registry.find_by_correlation("corr-2") == nullptr);
}

TEST_CASE("remove drops both indexes") {
    fakes::BridgeHarness harness("call-a");
    bridge::CallRegistry registry;
    registry.insert("call-a", "corr-a", harness.bridge);

    REQUIRE(registry.remove("call-a"));
    REQUIRE_FALSE(registry.remove("call-a"));
    REQUIRE(registry.size() == 0);
    REQUIRE(registry.find_by_correlation("corr-a") == nullptr);
}

TEST_CASE("Concurrent inserts of one call id admit exactly one") {
    constexpr int kThreads = 8;
    std::vector<std::unique_ptr<fakes::BridgeHarness>> harnesses;
    for (int i = 0; i < kThreads; ++i) {
        harnesses.push_back(std::make_unique<fakes::BridgeHarness>("call-race"));
    }
    bridge::CallRegistry registry;
    std::atomic<int> inserted{0};
    std::atomic<int> duplicates{0};
    std::atomic<bool> go{false};

    std::vector<std::thread> workers;
    for (int i = 0; i < kThreads; ++i) {
        workers.emplace_back([&, i]() {
            while (!go) {
                std::this_thread::yield();
            }
            try {
                registry.insert("call-race", "corr-" + std::to_string(i), harnesses[i]->bridge);
                ++inserted;
            } catch (const DuplicateCallError&) {
                ++duplicates;
            }
        });
    }
    go = true;
    for (auto& worker : workers) {
        worker.join();
    }

    REQUIRE(inserted == 1);
    REQUIRE(duplicates == kThreads - 1);
    REQUIRE(registry.size() == 1);
    const auto winner = registry.find("call-race");
    REQUIRE(winner != nullptr);
    int correlated = 0;
    for (int i = 0; i < kThreads; ++i) {
        if (registry.find_by_correlation("corr-" + std::to_string(i)) == winner) {
            ++correlated;
        }
    }
    REQUIRE(correlated == 1);
}

TEST_CASE("Removals do not disturb lookups of other calls") {
    constexpr int kCalls = 16;
    std::vector<std::unique_ptr<fakes::BridgeHarness>> harnesses;
    bridge::CallRegistry registry;
    for (int i = 0; i < kCalls; ++i) {
        const auto call_id = "call-" + std::to_string(i);
        harnesses.push_back(std::make_unique<fakes::BridgeHarness>(call_id));
        registry.insert(call_id, "corr-" + std::to_string(i), harnesses.back()->bridge);
    }

    std::atomic<bool> removing{true};
    std::atomic<int> missed{0};
    std::atomic<int> lookups{0};
    std::thread remover([&]() {
        for (int i = 0; i < kCalls; i += 2) {
            registry.remove("call-" + std::to_string(i));
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        removing = false;
    });
    std::vector<std::thread> readers;
    for (int r = 0; r < 3; ++r) {
        readers.emplace_back([&]() {
            do {
                for (int i = 1; i < kCalls; i += 2) {
                    const auto call_id = "call-" + std::to_string(i);
                    if (registry.find(call_id) != harnesses[i]->bridge ||
                        registry.find_by_correlation("corr-" + std::to_string(i)) !=
                            harnesses[i]->bridge) {
                        ++missed;
                    }
                    ++lookups;
                }
            } while (removing);
        });
    }
    remover.join();
    for (auto& reader : readers) {
        reader.join();
    }

    REQUIRE(missed == 0);
    REQUIRE(lookups > 0);
    REQUIRE(registry.size() == kCalls / 2);
    for (int i = 0; i < kCalls; i += 2) {
        REQUIRE_FALSE(registry.contains("call-" + std::to_string(i)));
    }
}
