#include "voicelive_bridge/bridge/call_registry.hpp"

#include <mutex>

#include "voicelive_bridge/errors.hpp"

namespace voicelive_bridge {
namespace bridge {

void CallRegistry::insert(const std::string& call_id,
                          const std::string& correlation_id,
                          std::shared_ptr<VoiceBridge> bridge) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (calls_.count(call_id) > 0) {
        throw DuplicateCallError(call_id);
    }
    calls_.emplace(call_id, Entry{correlation_id, std::move(bridge)});
    if (!correlation_id.empty()) {
        correlation_calls_[correlation_id] = call_id;
    }
}

bool CallRegistry::remove(const std::string& call_id) {
    std::shared_ptr<VoiceBridge> released;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = calls_.find(call_id);
        if (it == calls_.end()) {
            return false;
        }
        const auto correlation = correlation_calls_.find(it->second.correlation_id);
        if (correlation != correlation_calls_.end() && correlation->second == call_id) {
            correlation_calls_.erase(correlation);
        }
        released = std::move(it->second.bridge);
        calls_.erase(it);
    }
    // The last reference may go here; never destroy a bridge under the lock.
    released.reset();
    return true;
}

std::shared_ptr<VoiceBridge> CallRegistry::find(const std::string& call_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const auto it = calls_.find(call_id);
    if (it == calls_.end()) {
        return nullptr;
    }
    return it->second.bridge;
}

std::shared_ptr<VoiceBridge> CallRegistry::find_by_correlation(
    const std::string& correlation_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const auto correlation = correlation_calls_.find(correlation_id);
    if (correlation == correlation_calls_.end()) {
        return nullptr;
    }
    const auto it = calls_.find(correlation->second);
    if (it == calls_.end()) {
        return nullptr;
    }
    return it->second.bridge;
}

bool CallRegistry::contains(const std::string& call_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return calls_.count(call_id) > 0;
}

size_t CallRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return calls_.size();
}

std::vector<std::shared_ptr<VoiceBridge>> CallRegistry::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::shared_ptr<VoiceBridge>> result;
    result.reserve(calls_.size());
    for (const auto& item : calls_) {
        result.push_back(item.second.bridge);
    }
    return result;
}

}
}
