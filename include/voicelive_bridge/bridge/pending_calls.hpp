#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace voicelive_bridge {
namespace bridge {

struct PendingCall {
    std::string correlation_id;
    std::string caller_info;
    std::chrono::steady_clock::time_point created_at;
};

// Calls announced by the incoming-call webhook whose media socket has not
// connected yet. Entries older than the ttl are evicted.
class PendingCalls {
public:
    explicit PendingCalls(std::chrono::milliseconds ttl);

    void add(const std::string& call_id,
             std::string correlation_id,
             std::string caller_info,
             std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());
    // Removes and returns the entry for a connecting media socket.
    std::optional<PendingCall> take(const std::string& call_id);
    size_t remove_by_correlation(const std::string& correlation_id);
    size_t evict_expired(
        std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());
    size_t size() const;

private:
    std::chrono::milliseconds ttl_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, PendingCall> calls_;
};

}
}
