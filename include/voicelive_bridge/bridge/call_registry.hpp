#pragma once

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace voicelive_bridge {
namespace bridge {

class VoiceBridge;

// Process-wide table of live calls. Writers are serialized; lookups run concurrently.
class CallRegistry {
public:
    // Throws DuplicateCallError when the call id is already present.
    void insert(const std::string& call_id,
                const std::string& correlation_id,
                std::shared_ptr<VoiceBridge> bridge);
    bool remove(const std::string& call_id);

    std::shared_ptr<VoiceBridge> find(const std::string& call_id) const;
    std::shared_ptr<VoiceBridge> find_by_correlation(const std::string& correlation_id) const;
    bool contains(const std::string& call_id) const;
    size_t size() const;
    std::vector<std::shared_ptr<VoiceBridge>> snapshot() const;

private:
    struct Entry {
        std::string correlation_id;
        std::shared_ptr<VoiceBridge> bridge;
    };

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Entry> calls_;
    std::unordered_map<std::string, std::string> correlation_calls_;
};

}
}
