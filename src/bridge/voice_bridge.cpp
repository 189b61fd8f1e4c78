#include "voicelive_bridge/bridge/voice_bridge.hpp"

#include <algorithm>

#include "voicelive_bridge/errors.hpp"
#include "voicelive_bridge/logging.hpp"
#include "voicelive_bridge/metrics.hpp"

namespace voicelive_bridge {
namespace bridge {

std::string to_string(CallState state) {
    switch (state) {
        case CallState::Initiated:
            return "initiated";
        case CallState::ConnectingAi:
            return "connecting_ai";
        case CallState::Active:
            return "active";
        case CallState::Draining:
            return "draining";
        case CallState::Terminated:
            return "terminated";
    }
    return "unknown";
}

std::string to_string(TerminationReason reason) {
    switch (reason) {
        case TerminationReason::SetupFailed:
            return "setup_failed";
        case TerminationReason::CallerHangup:
            return "caller_hangup";
        case TerminationReason::TransportLost:
            return "transport_lost";
        case TerminationReason::SessionError:
            return "session_error";
        case TerminationReason::RemoteDisconnect:
            return "remote_disconnect";
        case TerminationReason::Shutdown:
            return "shutdown";
    }
    return "unknown";
}

VoiceBridge::VoiceBridge(CallInfo info,
                         std::shared_ptr<transport::TransportSession> transport,
                         std::unique_ptr<realtime::AiSession> ai,
                         realtime::SessionConfiguration configuration,
                         std::unique_ptr<tools::ToolDispatcher> dispatcher,
                         std::shared_ptr<CallRegistry> registry,
                         BridgeOptions options)
    : info_(std::move(info)),
      registry_(std::move(registry)),
      transport_(std::move(transport)),
      ai_(std::move(ai)),
      configuration_(std::move(configuration)),
      dispatcher_(std::move(dispatcher)),
      options_(options),
      control_(options.control_buffer_size) {}

VoiceBridge::~VoiceBridge() {
    stop();
    control_.close();
    for (auto* worker : {&router_, &caller_relay_, &ai_relay_}) {
        if (!worker->joinable()) {
            continue;
        }
        if (worker->get_id() == std::this_thread::get_id()) {
            worker->detach();
        } else {
            worker->join();
        }
    }
}

void VoiceBridge::start() {
    try {
        registry_->insert(info_.call_id, info_.correlation_id, shared_from_this());
    } catch (const DuplicateCallError&) {
        warn("Duplicate call rejected", {kv("call_id", info_.call_id)});
        transport_->hangup("duplicate_call");
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            reason_ = TerminationReason::SetupFailed;
        }
        set_state(CallState::Terminated);
        throw;
    }
    Metrics::instance().increment_call_started();
    logging::info("Call registered",
         {kv("call_id", info_.call_id),
          kv("correlation_id", info_.correlation_id),
          kv("caller", info_.caller_info)});

    set_state(CallState::ConnectingAi);
    try {
        transport_->accept();
        audio::ensure_compatible(transport_->negotiate_format(), ai_->format());
        ai_->start(configuration_);
    } catch (const std::exception& ex) {
        error("Call setup failed", {kv("call_id", info_.call_id), kv("error", ex.what())});
        fail_setup(ex.what());
        return;
    }

    set_state(CallState::Active);
    auto self = shared_from_this();
    caller_relay_ = std::thread([this]() { caller_relay(); });
    ai_relay_ = std::thread([this]() { ai_relay(); });
    router_ = std::thread([self]() { self->router(); });
}

void VoiceBridge::fail_setup(const std::string& reason) {
    dispatcher_->cancel_all();
    ai_->close(options_.close_grace);
    transport_->hangup(to_string(TerminationReason::SetupFailed));
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        reason_ = TerminationReason::SetupFailed;
    }
    registry_->remove(info_.call_id);
    Metrics::instance().increment_call_terminated(to_string(TerminationReason::SetupFailed));
    set_state(CallState::Terminated);
    logging::info("Call terminated",
         {kv("call_id", info_.call_id),
          kv("reason", to_string(TerminationReason::SetupFailed)),
          kv("detail", reason)});
}

void VoiceBridge::handle_lifecycle_event(const LifecycleEvent& event) {
    ControlEvent control;
    control.kind = ControlEvent::Kind::Lifecycle;
    control.lifecycle = event;
    push_control(std::move(control));
}

void VoiceBridge::stop() {
    ControlEvent control;
    control.kind = ControlEvent::Kind::Shutdown;
    push_control(std::move(control));
}

bool VoiceBridge::wait_terminated(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(state_mutex_);
    return state_cv_.wait_for(lock, timeout, [this]() {
        return state_ == CallState::Terminated;
    });
}

CallState VoiceBridge::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

std::vector<CallState> VoiceBridge::state_history() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return history_;
}

std::optional<TerminationReason> VoiceBridge::termination_reason() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return reason_;
}

void VoiceBridge::set_state(CallState state) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == state) {
            return;
        }
        state_ = state;
        history_.push_back(state);
    }
    state_cv_.notify_all();
    debug("Call state changed", {kv("call_id", info_.call_id), kv("state", to_string(state))});
}

void VoiceBridge::push_control(ControlEvent event) {
    if (control_.push(std::move(event)) == utils::PushResult::DroppedOldest) {
        warn("Control channel saturated, oldest event dropped", {kv("call_id", info_.call_id)});
    }
}

void VoiceBridge::caller_relay() {
    while (auto event = transport_->next_event()) {
        if (event->type == transport::TransportEvent::Type::AudioFrame) {
            ai_->send_audio(event->frame);
            continue;
        }
        ControlEvent control;
        control.kind = ControlEvent::Kind::Transport;
        control.transport = std::move(*event);
        push_control(std::move(control));
    }
    // Reached after the terminal event or when the session was hung up from outside.
    ControlEvent closed;
    closed.kind = ControlEvent::Kind::Transport;
    closed.transport.type = transport::TransportEvent::Type::TransportLost;
    closed.transport.reason = "transport_closed";
    push_control(std::move(closed));
    debug("Caller relay finished", {kv("call_id", info_.call_id)});
}

void VoiceBridge::ai_relay() {
    while (auto event = ai_->next_event()) {
        if (event->type == realtime::AiEvent::Type::AudioFrame) {
            forward_ai_audio(event->frame);
            continue;
        }
        ControlEvent control;
        control.kind = ControlEvent::Kind::Ai;
        control.ai = std::move(*event);
        push_control(std::move(control));
    }
    ControlEvent closed;
    closed.kind = ControlEvent::Kind::Ai;
    closed.ai.type = realtime::AiEvent::Type::SessionError;
    closed.ai.error_code = "stream_closed";
    push_control(std::move(closed));
    debug("AI relay finished", {kv("call_id", info_.call_id)});
}

void VoiceBridge::forward_ai_audio(const audio::AudioFrame& frame) {
    std::lock_guard<std::mutex> lock(playout_mutex_);
    // A barge-in may have landed between next_event() and here.
    if (ai_->is_truncated(frame.response_id)) {
        return;
    }
    if (frame.item_id != playout_item_id_) {
        playout_item_id_ = frame.item_id;
        forwarded_ms_ = 0;
    }
    if (transport_->send_audio(frame)) {
        last_frame_ms_ = frame.duration_ms(transport_->format());
        forwarded_ms_ += last_frame_ms_;
    }
}

void VoiceBridge::router() {
    std::optional<TerminationReason> reason;
    while (!reason) {
        auto event = control_.pop();
        if (!event) {
            reason = TerminationReason::Shutdown;
            break;
        }
        try {
            switch (event->kind) {
                case ControlEvent::Kind::Transport:
                    reason = handle_transport_event(event->transport);
                    break;
                case ControlEvent::Kind::Ai:
                    reason = handle_ai_event(event->ai);
                    break;
                case ControlEvent::Kind::Lifecycle:
                    reason = handle_lifecycle(event->lifecycle);
                    break;
                case ControlEvent::Kind::Shutdown:
                    reason = TerminationReason::Shutdown;
                    break;
            }
        } catch (const std::exception& ex) {
            error("Call routing failed", {kv("call_id", info_.call_id), kv("error", ex.what())});
            reason = TerminationReason::SessionError;
        }
    }
    drain(*reason);
}

std::optional<TerminationReason> VoiceBridge::handle_transport_event(
    const transport::TransportEvent& event) {
    using Type = transport::TransportEvent::Type;
    switch (event.type) {
        case Type::SpeechStarted:
            interrupt("caller");
            return std::nullopt;
        case Type::DtmfDigit:
            logging::info("DTMF received", {kv("call_id", info_.call_id), kv("digit", event.digit)});
            return std::nullopt;
        case Type::CallerHangup:
            logging::info("Caller hung up", {kv("call_id", info_.call_id), kv("reason", event.reason)});
            return TerminationReason::CallerHangup;
        case Type::TransportLost:
            warn("Transport lost", {kv("call_id", info_.call_id), kv("reason", event.reason)});
            return TerminationReason::TransportLost;
        case Type::AudioFrame:
            return std::nullopt;
    }
    return std::nullopt;
}

std::optional<TerminationReason> VoiceBridge::handle_ai_event(const realtime::AiEvent& event) {
    using Type = realtime::AiEvent::Type;
    switch (event.type) {
        case Type::SpeechStarted:
            interrupt("ai_vad");
            return std::nullopt;
        case Type::SpeechStopped:
            debug("Caller speech stopped", {kv("call_id", info_.call_id)});
            return std::nullopt;
        case Type::ToolCallRequested: {
            if (!event.tool_call) {
                return std::nullopt;
            }
            logging::info("Tool call requested",
                 {kv("call_id", info_.call_id),
                  kv("tool", event.tool_call->name),
                  kv("request_id", event.tool_call->request_id)});
            dispatcher_->dispatch(*event.tool_call,
                                  [this](tools::ToolCallResult result) {
                                      on_tool_result(result);
                                  });
            return std::nullopt;
        }
        case Type::Transcript:
            transport_->send_transcript(event.text);
            return std::nullopt;
        case Type::ResponseCompleted:
            debug("AI response completed",
                  {kv("call_id", info_.call_id),
                   kv("response_id", event.response_id),
                   kv("status", event.text)});
            return std::nullopt;
        case Type::SessionError:
            error("AI session error",
                  {kv("call_id", info_.call_id),
                   kv("code", event.error_code),
                   kv("message", event.text)});
            return TerminationReason::SessionError;
        case Type::AudioFrame:
            return std::nullopt;
    }
    return std::nullopt;
}

std::optional<TerminationReason> VoiceBridge::handle_lifecycle(const LifecycleEvent& event) {
    switch (event.type) {
        case LifecycleEvent::Type::IncomingCall:
            logging::info("Incoming call event for a live call", {kv("call_id", info_.call_id)});
            return std::nullopt;
        case LifecycleEvent::Type::CallConnected:
            logging::info("Call connected", {kv("call_id", info_.call_id)});
            if (transport_->state() == transport::TransportState::Ringing) {
                transport_->accept();
            }
            return std::nullopt;
        case LifecycleEvent::Type::CallDisconnected:
            logging::info("Call disconnected", {kv("call_id", info_.call_id), kv("reason", event.reason)});
            return TerminationReason::RemoteDisconnect;
    }
    return std::nullopt;
}

void VoiceBridge::interrupt(const std::string& source) {
    std::lock_guard<std::mutex> lock(playout_mutex_);
    const auto queued = transport_->queued_frames();
    if (queued == 0 && !ai_->response_active()) {
        debug("Speech start without AI playback", {kv("call_id", info_.call_id)});
        return;
    }
    const auto cleared = transport_->clear_outbound();
    const auto unplayed = static_cast<int>(cleared) * last_frame_ms_;
    const auto audio_end_ms = std::max(0, forwarded_ms_ - unplayed);
    try {
        ai_->truncate(playout_item_id_, audio_end_ms);
    } catch (const TransportError& ex) {
        warn("Truncation not delivered", {kv("call_id", info_.call_id), kv("error", ex.what())});
    }
    forwarded_ms_ = audio_end_ms;
    interruptions_.fetch_add(1);
    Metrics::instance().increment_interruption();
    logging::info("Barge-in",
         {kv("call_id", info_.call_id),
          kv("source", source),
          kv("cleared_frames", cleared),
          kv("item_id", playout_item_id_),
          kv("audio_end_ms", audio_end_ms)});
}

void VoiceBridge::on_tool_result(const tools::ToolCallResult& result) {
    try {
        ai_->submit_tool_result(result);
        debug("Tool result submitted",
              {kv("call_id", info_.call_id),
               kv("request_id", result.request_id),
               kv("ok", result.ok())});
    } catch (const UnknownRequestId& ex) {
        warn("Tool result rejected", {kv("call_id", info_.call_id), kv("error", ex.what())});
    } catch (const TransportError& ex) {
        warn("Tool result not delivered",
             {kv("call_id", info_.call_id), kv("error", ex.what())});
    }
}

void VoiceBridge::drain(TerminationReason reason) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        reason_ = reason;
    }
    set_state(CallState::Draining);
    logging::info("Call draining", {kv("call_id", info_.call_id), kv("reason", to_string(reason))});

    dispatcher_->cancel_all();
    ai_->close(options_.close_grace);
    transport_->hangup(to_string(reason));
    if (caller_relay_.joinable()) {
        caller_relay_.join();
    }
    if (ai_relay_.joinable()) {
        ai_relay_.join();
    }
    control_.close();

    registry_->remove(info_.call_id);
    Metrics::instance().increment_call_terminated(to_string(reason));
    set_state(CallState::Terminated);
    logging::info("Call terminated", {kv("call_id", info_.call_id), kv("reason", to_string(reason))});
}

}
}
