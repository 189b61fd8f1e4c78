#include "voicelive_bridge/tools/dispatcher.hpp"

#include <algorithm>

#include "voicelive_bridge/logging.hpp"
#include "voicelive_bridge/metrics.hpp"
#include "voicelive_bridge/utils/async.hpp"

namespace voicelive_bridge {
namespace tools {

namespace {

double seconds_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

}

ToolDispatcher::ToolDispatcher(std::string call_id,
                               std::shared_ptr<const ToolRegistry> registry,
                               ToolContext context,
                               DispatcherOptions options)
    : call_id_(std::move(call_id)),
      registry_(std::move(registry)),
      context_(std::move(context)),
      options_(options) {
    if (!registry_) {
        throw std::invalid_argument("ToolDispatcher requires a registry");
    }
}

ToolDispatcher::~ToolDispatcher() {
    cancel_all();
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this]() { return waiters_ == 0; });
}

std::optional<ToolCallResult> ToolDispatcher::validate(
    const ToolCallRequest& request,
    const ToolRegistry::Entry*& entry) const {
    entry = registry_->find(request.name);
    if (!entry) {
        return ToolCallResult::failure(request.request_id, ToolErrorCode::UnknownTool,
                                       "unknown tool: " + request.name);
    }
    if (!request.arguments.is_object()) {
        return ToolCallResult::failure(request.request_id, ToolErrorCode::InvalidArguments,
                                       "arguments must be a JSON object");
    }
    const auto& schema = entry->definition.parameters;
    const auto required = schema.find("required");
    if (required != schema.end() && required->is_array()) {
        for (const auto& field : *required) {
            if (!field.is_string()) {
                continue;
            }
            const auto name = field.get<std::string>();
            const auto value = request.arguments.find(name);
            if (value == request.arguments.end() || value->is_null()) {
                return ToolCallResult::failure(request.request_id,
                                               ToolErrorCode::InvalidArguments,
                                               "missing required argument: " + name);
            }
        }
    }
    return std::nullopt;
}

void ToolDispatcher::dispatch(ToolCallRequest request, Completion completion) {
    const ToolRegistry::Entry* entry = nullptr;
    if (auto rejected = validate(request, entry)) {
        warn("Tool call rejected",
             {kv("call_id", call_id_),
              kv("tool", request.name),
              kv("request_id", request.request_id),
              kv("code", to_string(rejected->error->code))});
        Metrics::instance().increment_tool_call(request.name,
                                                to_string(rejected->error->code));
        if (completion) {
            completion(std::move(*rejected));
        }
        return;
    }

    auto invocation = std::make_shared<Invocation>();
    invocation->request = std::move(request);
    invocation->completion = std::move(completion);
    invocation->handler = entry->handler;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            warn("Tool call ignored after cancellation",
                 {kv("call_id", call_id_), kv("request_id", invocation->request.request_id)});
            return;
        }
        invocation->id = next_id_++;
        pending_.push_back(invocation);
    }
    debug("Tool call queued",
          {kv("call_id", call_id_),
           kv("tool", invocation->request.name),
           kv("request_id", invocation->request.request_id)});
    maybe_start();
}

void ToolDispatcher::cancel_all() {
    std::deque<std::shared_ptr<Invocation>> dropped;
    std::vector<std::shared_ptr<Invocation>> abandoned;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        dropped.swap(pending_);
        for (const auto& item : running_) {
            abandoned.push_back(item.second);
        }
    }
    for (const auto& invocation : abandoned) {
        {
            std::lock_guard<std::mutex> lock(invocation->mutex);
            invocation->cancelled = true;
        }
        invocation->cv.notify_all();
    }
    for (const auto& invocation : abandoned) {
        std::unique_lock<std::mutex> lock(invocation->mutex);
        invocation->cv.wait(lock, [&]() { return !invocation->delivering; });
    }
    for (const auto& invocation : dropped) {
        Metrics::instance().increment_tool_call(invocation->request.name, "cancelled");
    }
    if (!dropped.empty() || !abandoned.empty()) {
        info("Tool calls cancelled",
             {kv("call_id", call_id_),
              kv("queued", dropped.size()),
              kv("running", abandoned.size())});
    }
}

size_t ToolDispatcher::inflight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_.size();
}

size_t ToolDispatcher::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

std::vector<std::shared_ptr<ToolDispatcher::Invocation>>
ToolDispatcher::take_startable_locked() {
    std::vector<std::shared_ptr<Invocation>> to_start;
    const auto max_inflight = static_cast<size_t>(std::max(1, options_.max_inflight));
    while (!closed_ && running_.size() < max_inflight && !pending_.empty()) {
        auto invocation = std::move(pending_.front());
        pending_.pop_front();
        running_.emplace(invocation->id, invocation);
        ++waiters_;
        to_start.push_back(std::move(invocation));
    }
    return to_start;
}

void ToolDispatcher::maybe_start() {
    std::vector<std::shared_ptr<Invocation>> to_start;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        to_start = take_startable_locked();
    }
    for (const auto& invocation : to_start) {
        start(invocation);
    }
}

void ToolDispatcher::start(const std::shared_ptr<Invocation>& invocation) {
    invocation->started_at = std::chrono::steady_clock::now();
    info("Tool call started",
         {kv("call_id", call_id_),
          kv("tool", invocation->request.name),
          kv("request_id", invocation->request.request_id)});

    // The handler thread may outlive the dispatcher after a timeout, so it only
    // holds the invocation and its own copy of the context.
    utils::run_async([invocation, context = context_]() {
        const auto& request_id = invocation->request.request_id;
        ToolCallResult result;
        try {
            result = ToolCallResult::success(
                request_id, invocation->handler(invocation->request.arguments, context));
        } catch (const ToolError& ex) {
            result = ToolCallResult::failure(request_id, ex.code(), ex.what());
        } catch (const std::exception& ex) {
            result = ToolCallResult::failure(request_id, ToolErrorCode::HandlerFailed,
                                             ex.what());
        }
        {
            std::lock_guard<std::mutex> lock(invocation->mutex);
            invocation->finished = true;
            invocation->result = std::move(result);
        }
        invocation->cv.notify_all();
    });

    utils::run_async([this, invocation]() { wait_for_outcome(invocation); });
}

void ToolDispatcher::wait_for_outcome(const std::shared_ptr<Invocation>& invocation) {
    const auto& request = invocation->request;
    std::optional<ToolCallResult> outcome;
    bool cancelled = false;
    bool timed_out = false;
    {
        std::unique_lock<std::mutex> lock(invocation->mutex);
        invocation->cv.wait_until(lock, invocation->started_at + options_.timeout, [&]() {
            return invocation->finished || invocation->cancelled;
        });
        if (invocation->cancelled) {
            cancelled = true;
        } else if (invocation->finished) {
            outcome = std::move(invocation->result);
            invocation->delivering = true;
        } else {
            timed_out = true;
            // A late handler result is ignored from here on.
            invocation->cancelled = true;
            invocation->delivering = true;
            outcome = ToolCallResult::failure(
                request.request_id, ToolErrorCode::ToolTimeout,
                "tool " + request.name + " did not finish within " +
                    std::to_string(options_.timeout.count()) + " ms");
        }
    }

    const auto elapsed = seconds_since(invocation->started_at);
    auto& metrics = Metrics::instance();
    metrics.observe_tool_latency(request.name, elapsed);

    if (cancelled) {
        metrics.increment_tool_call(request.name, "cancelled");
        info("Tool call cancelled",
             {kv("call_id", call_id_), kv("tool", request.name),
              kv("request_id", request.request_id)});
    } else {
        const auto outcome_name =
            outcome->ok() ? std::string("ok") : to_string(outcome->error->code);
        metrics.increment_tool_call(request.name, outcome_name);
        if (timed_out) {
            warn("Tool call timed out",
                 {kv("call_id", call_id_), kv("tool", request.name),
                  kv("request_id", request.request_id)});
        } else {
            info("Tool call finished",
                 {kv("call_id", call_id_),
                  kv("tool", request.name),
                  kv("request_id", request.request_id),
                  kv("outcome", outcome_name),
                  kv("elapsed_ms", static_cast<int>(elapsed * 1000))});
        }
        if (invocation->completion) {
            try {
                invocation->completion(std::move(*outcome));
            } catch (const std::exception& ex) {
                error("Tool result delivery failed",
                      {kv("call_id", call_id_),
                       kv("request_id", request.request_id),
                       kv("error", ex.what())});
            }
        }
        {
            std::lock_guard<std::mutex> lock(invocation->mutex);
            invocation->delivering = false;
        }
        invocation->cv.notify_all();
    }
    on_finished(invocation->id);
}

void ToolDispatcher::on_finished(uint64_t id) {
    std::vector<std::shared_ptr<Invocation>> to_start;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_.erase(id);
        to_start = take_startable_locked();
        // Newly started invocations keep waiters_ above zero, so the
        // dispatcher stays alive for the start() calls below.
        --waiters_;
        idle_cv_.notify_all();
    }
    for (const auto& invocation : to_start) {
        start(invocation);
    }
}

}
}
