#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace voicelive_bridge {
namespace utils {

enum class PushResult {
    Accepted,
    DroppedOldest,
    Closed
};

// FIFO shared by one or more producers and one consumer. When full, the oldest
// element is discarded to make room. A capacity of zero means unbounded.
// After close() producers are rejected and consumers drain what is left.
template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t capacity) : capacity_(capacity) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    PushResult push(T item) {
        PushResult result = PushResult::Accepted;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return PushResult::Closed;
            }
            if (capacity_ > 0 && items_.size() >= capacity_) {
                items_.pop_front();
                result = PushResult::DroppedOldest;
            }
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
        return result;
    }

    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() { return closed_ || !items_.empty(); });
        return take_front();
    }

    // Returns nullopt on timeout as well as on a closed, empty queue.
    template <typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this]() { return closed_ || !items_.empty(); });
        return take_front();
    }

    std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        return take_front();
    }

    // Removes everything currently queued and hands it back to the caller.
    std::deque<T> drain() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::deque<T> result;
        result.swap(items_);
        return result;
    }

    size_t clear() {
        return drain().size();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    size_t capacity() const { return capacity_; }

private:
    std::optional<T> take_front() {
        if (items_.empty()) {
            return std::nullopt;
        }
        std::optional<T> item(std::move(items_.front()));
        items_.pop_front();
        return item;
    }

    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> items_;
    bool closed_ = false;
};

}
}
