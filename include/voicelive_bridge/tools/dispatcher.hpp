#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "voicelive_bridge/tools/registry.hpp"
#include "voicelive_bridge/tools/tool_call.hpp"

namespace voicelive_bridge {
namespace tools {

struct DispatcherOptions {
    int max_inflight = 2;
    std::chrono::milliseconds timeout{8000};
};

// Runs tool handlers for one call off the relay threads.
// At most max_inflight handlers run at once, the rest wait in FIFO order.
// Every accepted request gets exactly one completion: the handler result, an
// error result, or a ToolTimeout result. Cancelled requests get none: once
// cancel_all() returns, no completion is running or will run. Completions must
// not call cancel_all() themselves.
class ToolDispatcher {
public:
    using Completion = std::function<void(ToolCallResult)>;

    ToolDispatcher(std::string call_id,
                   std::shared_ptr<const ToolRegistry> registry,
                   ToolContext context,
                   DispatcherOptions options);
    ~ToolDispatcher();

    ToolDispatcher(const ToolDispatcher&) = delete;
    ToolDispatcher& operator=(const ToolDispatcher&) = delete;

    void dispatch(ToolCallRequest request, Completion completion);
    // Drops queued requests, abandons running ones and rejects later dispatches.
    // Blocks while a completion is being delivered.
    void cancel_all();

    size_t inflight() const;
    size_t pending() const;

private:
    struct Invocation {
        uint64_t id = 0;
        ToolCallRequest request;
        Completion completion;
        ToolHandler handler;
        std::chrono::steady_clock::time_point started_at;

        std::mutex mutex;
        std::condition_variable cv;
        bool finished = false;
        bool cancelled = false;
        // Set while the completion runs; cancel_all() waits for it to clear.
        bool delivering = false;
        std::optional<ToolCallResult> result;
    };

    std::optional<ToolCallResult> validate(const ToolCallRequest& request,
                                           const ToolRegistry::Entry*& entry) const;
    std::vector<std::shared_ptr<Invocation>> take_startable_locked();
    void maybe_start();
    void start(const std::shared_ptr<Invocation>& invocation);
    void wait_for_outcome(const std::shared_ptr<Invocation>& invocation);
    void on_finished(uint64_t id);

    std::string call_id_;
    std::shared_ptr<const ToolRegistry> registry_;
    ToolContext context_;
    DispatcherOptions options_;

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    std::deque<std::shared_ptr<Invocation>> pending_;
    std::map<uint64_t, std::shared_ptr<Invocation>> running_;
    uint64_t next_id_ = 1;
    size_t waiters_ = 0;
    bool closed_ = false;
};

}
}
