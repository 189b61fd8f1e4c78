#include "voicelive_bridge/bridge/pending_calls.hpp"

#include "voicelive_bridge/logging.hpp"

namespace voicelive_bridge {
namespace bridge {

PendingCalls::PendingCalls(std::chrono::milliseconds ttl) : ttl_(ttl) {}

void PendingCalls::add(const std::string& call_id,
                       std::string correlation_id,
                       std::string caller_info,
                       std::chrono::steady_clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    calls_[call_id] = PendingCall{std::move(correlation_id), std::move(caller_info), now};
}

std::optional<PendingCall> PendingCalls::take(const std::string& call_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = calls_.find(call_id);
    if (it == calls_.end()) {
        return std::nullopt;
    }
    auto pending = std::move(it->second);
    calls_.erase(it);
    return pending;
}

size_t PendingCalls::remove_by_correlation(const std::string& correlation_id) {
    if (correlation_id.empty()) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = calls_.begin(); it != calls_.end();) {
        if (it->second.correlation_id == correlation_id) {
            it = calls_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t PendingCalls::evict_expired(std::chrono::steady_clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t evicted = 0;
    for (auto it = calls_.begin(); it != calls_.end();) {
        if (now - it->second.created_at >= ttl_) {
            warn("Pending call expired before its media socket connected",
                 {kv("call_id", it->first), kv("correlation_id", it->second.correlation_id)});
            it = calls_.erase(it);
            ++evicted;
        } else {
            ++it;
        }
    }
    return evicted;
}

size_t PendingCalls::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_.size();
}

}
}
