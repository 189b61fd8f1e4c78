#include "voicelive_bridge/realtime/ai_session.hpp"

#include <algorithm>

#include "voicelive_bridge/errors.hpp"
#include "voicelive_bridge/logging.hpp"
#include "voicelive_bridge/metrics.hpp"
#include "voicelive_bridge/utils/ids.hpp"

namespace voicelive_bridge {
namespace realtime {

namespace {

std::string string_value(const nlohmann::json& object, const char* key) {
    if (!object.is_object()) {
        return {};
    }
    const auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

}

std::string to_string(AiEvent::Type type) {
    switch (type) {
        case AiEvent::Type::AudioFrame:
            return "audio_frame";
        case AiEvent::Type::SpeechStarted:
            return "speech_started";
        case AiEvent::Type::SpeechStopped:
            return "speech_stopped";
        case AiEvent::Type::ToolCallRequested:
            return "tool_call_requested";
        case AiEvent::Type::ResponseCompleted:
            return "response_completed";
        case AiEvent::Type::Transcript:
            return "transcript";
        case AiEvent::Type::SessionError:
            return "session_error";
    }
    return "unknown";
}

std::string to_string(AiSessionState state) {
    switch (state) {
        case AiSessionState::Connecting:
            return "connecting";
        case AiSessionState::Configured:
            return "configured";
        case AiSessionState::Streaming:
            return "streaming";
        case AiSessionState::Closing:
            return "closing";
        case AiSessionState::Closed:
            return "closed";
        case AiSessionState::Failed:
            return "failed";
    }
    return "unknown";
}

AiSession::AiSession(std::string call_id,
                     ConnectionSettings settings,
                     std::unique_ptr<AiConnection> connection,
                     AiSessionOptions options)
    : call_id_(std::move(call_id)),
      settings_(std::move(settings)),
      connection_(std::move(connection)),
      options_(options),
      send_queue_(options.send_buffer_frames),
      events_(options.event_buffer_size) {
    if (!connection_) {
        throw std::invalid_argument("AiSession requires a connection");
    }
}

AiSession::~AiSession() {
    close(std::chrono::milliseconds(0));
}

void AiSession::start(const SessionConfiguration& configuration) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != AiSessionState::Connecting) {
            throw SessionSetupError("AI session already started");
        }
    }
    info("Connecting AI session",
         {kv("call_id", call_id_), kv("model", configuration.model)});

    try {
        const auto headers = settings_.headers(utils::make_uuid());
        connection_->open(
            settings_.realtime_url(), headers, options_.connect_timeout,
            [this](const std::string& payload) { on_message(payload); },
            [this](bool clean, const std::string& reason) { on_close(clean, reason); });
        connection_->send(configuration.to_session_update().dump());
        connection_->send(nlohmann::json{{"type", "response.create"}}.dump());
    } catch (const SessionSetupError& ex) {
        abort_setup(ex.what());
        throw;
    } catch (const std::exception& ex) {
        abort_setup(ex.what());
        throw SessionSetupError(std::string("AI session setup failed: ") + ex.what());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == AiSessionState::Connecting) {
            state_ = AiSessionState::Configured;
        }
    }
    if (state() != AiSessionState::Configured) {
        abort_setup("connection lost during setup");
        throw SessionSetupError("AI connection lost during setup");
    }
    sender_ = std::thread([this]() { sender_loop(); });
    info("AI session configured", {kv("call_id", call_id_)});
}

bool AiSession::send_audio(const audio::AudioFrame& frame) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == AiSessionState::Configured) {
            state_ = AiSessionState::Streaming;
        } else if (state_ != AiSessionState::Streaming) {
            return false;
        }
    }
    const auto result = send_queue_.push(codec_.encode_outbound(frame).payload);
    if (result == utils::PushResult::Closed) {
        return false;
    }
    if (result == utils::PushResult::DroppedOldest) {
        const auto dropped = ++dropped_frames_;
        Metrics::instance().add_dropped_frames("to_ai", 1);
        if (dropped == 1 || dropped % 100 == 0) {
            warn("AI send buffer saturated, dropping oldest audio",
                 {kv("call_id", call_id_), kv("dropped", dropped)});
        }
    }
    return true;
}

std::optional<AiEvent> AiSession::next_event() {
    while (true) {
        auto event = events_.pop();
        if (!event) {
            return std::nullopt;
        }
        if (event->type == AiEvent::Type::AudioFrame &&
            is_truncated(event->frame.response_id)) {
            continue;
        }
        return event;
    }
}

std::optional<AiEvent> AiSession::next_event_for(std::chrono::milliseconds timeout) {
    while (true) {
        auto event = events_.pop_for(timeout);
        if (!event) {
            return std::nullopt;
        }
        if (event->type == AiEvent::Type::AudioFrame &&
            is_truncated(event->frame.response_id)) {
            continue;
        }
        return event;
    }
}

void AiSession::submit_tool_result(const tools::ToolCallResult& result) {
    bool request_response = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = outstanding_.find(result.request_id);
        if (it == outstanding_.end()) {
            throw UnknownRequestId(result.request_id);
        }
        outstanding_.erase(it);
        if (state_ != AiSessionState::Configured && state_ != AiSessionState::Streaming) {
            debug("Tool result dropped, AI session is not streaming",
                  {kv("call_id", call_id_), kv("request_id", result.request_id)});
            return;
        }
        request_response = outstanding_.empty();
    }

    send_control({{"type", "conversation.item.create"},
                  {"item",
                   {{"type", "function_call_output"},
                    {"call_id", result.request_id},
                    {"output", result.output()}}}});
    if (request_response) {
        send_control({{"type", "response.create"}});
    }
    info("Tool result submitted",
         {kv("call_id", call_id_),
          kv("request_id", result.request_id),
          kv("ok", result.ok()),
          kv("response_requested", request_response)});
}

void AiSession::truncate(const std::string& item_id, int audio_end_ms) {
    std::string response_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        response_id = current_response_id_;
        if (!response_id.empty()) {
            truncated_.insert(response_id);
        }
        response_active_ = false;
    }
    send_control({{"type", "response.cancel"}});
    if (!item_id.empty()) {
        send_control({{"type", "conversation.item.truncate"},
                      {"item_id", item_id},
                      {"content_index", 0},
                      {"audio_end_ms", std::max(0, audio_end_ms)}});
    }
    info("AI response truncated",
         {kv("call_id", call_id_),
          kv("response_id", response_id),
          kv("item_id", item_id),
          kv("audio_end_ms", audio_end_ms)});
}

void AiSession::abort_setup(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = AiSessionState::Failed;
    }
    events_.close();
    connection_->close(std::chrono::milliseconds(0));
    error("AI session setup failed", {kv("call_id", call_id_), kv("error", reason)});
}

void AiSession::close(std::chrono::milliseconds grace) {
    std::lock_guard<std::mutex> close_lock(close_mutex_);
    if (close_done_) {
        return;
    }
    close_done_ = true;
    AiSessionState previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = state_;
        if (state_ != AiSessionState::Failed) {
            state_ = AiSessionState::Closing;
        }
    }

    send_queue_.clear();
    send_queue_.close();
    if (sender_.joinable()) {
        sender_.join();
    }
    connection_->close(grace);
    events_.close();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != AiSessionState::Failed) {
            state_ = AiSessionState::Closed;
        }
    }
    info("AI session closed",
         {kv("call_id", call_id_),
          kv("previous_state", to_string(previous)),
          kv("dropped_frames", dropped_frames_.load())});
}

AiSessionState AiSession::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool AiSession::response_active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return response_active_;
}

bool AiSession::is_truncated(const std::string& response_id) const {
    if (response_id.empty()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return truncated_.count(response_id) > 0;
}

size_t AiSession::outstanding_tool_calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outstanding_.size();
}

void AiSession::on_message(const std::string& payload) {
    nlohmann::json event;
    try {
        event = nlohmann::json::parse(payload);
    } catch (const nlohmann::json::parse_error& ex) {
        warn("Unparseable realtime message", {kv("call_id", call_id_), kv("error", ex.what())});
        return;
    }
    try {
        handle_event(event);
    } catch (const std::exception& ex) {
        warn("Malformed realtime event",
             {kv("call_id", call_id_),
              kv("type", string_value(event, "type")),
              kv("error", ex.what())});
    }
}

void AiSession::handle_event(const nlohmann::json& event) {
    const auto type = string_value(event, "type");

    if (type == "response.audio.delta" || type == "response.output_audio.delta") {
        handle_audio_delta(event);
    } else if (type == "input_audio_buffer.speech_started") {
        AiEvent out;
        out.type = AiEvent::Type::SpeechStarted;
        out.item_id = string_value(event, "item_id");
        push_event(std::move(out));
    } else if (type == "input_audio_buffer.speech_stopped") {
        AiEvent out;
        out.type = AiEvent::Type::SpeechStopped;
        out.item_id = string_value(event, "item_id");
        push_event(std::move(out));
    } else if (type == "response.created") {
        const auto response = event.value("response", nlohmann::json::object());
        const auto response_id = string_value(response, "id");
        std::lock_guard<std::mutex> lock(mutex_);
        current_response_id_ = response_id;
        response_active_ = true;
    } else if (type == "response.function_call_arguments.done") {
        handle_tool_call(event);
    } else if (type == "response.audio_transcript.done" ||
               type == "response.output_audio_transcript.done") {
        AiEvent out;
        out.type = AiEvent::Type::Transcript;
        out.response_id = string_value(event, "response_id");
        out.item_id = string_value(event, "item_id");
        out.text = string_value(event, "transcript");
        push_event(std::move(out));
    } else if (type == "response.done") {
        const auto response = event.value("response", nlohmann::json::object());
        AiEvent out;
        out.type = AiEvent::Type::ResponseCompleted;
        out.response_id = string_value(response, "id");
        out.text = string_value(response, "status");
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (out.response_id.empty() || out.response_id == current_response_id_) {
                response_active_ = false;
            }
        }
        push_event(std::move(out));
    } else if (type == "conversation.item.input_audio_transcription.completed") {
        info("Caller transcript",
             {kv("call_id", call_id_), kv("text", string_value(event, "transcript"))});
    } else if (type == "conversation.item.input_audio_transcription.failed") {
        warn("Caller transcription failed",
             {kv("call_id", call_id_),
              kv("error", string_value(event.value("error", nlohmann::json::object()),
                                       "message"))});
    } else if (type == "session.created") {
        info("AI session created",
             {kv("call_id", call_id_),
              kv("session_id",
                 string_value(event.value("session", nlohmann::json::object()), "id"))});
    } else if (type == "error") {
        handle_error(event);
    } else {
        trace("Realtime event ignored", {kv("call_id", call_id_), kv("type", type)});
    }
}

void AiSession::handle_audio_delta(const nlohmann::json& event) {
    const auto response_id = string_value(event, "response_id");
    if (is_truncated(response_id)) {
        return;
    }
    const auto delta = string_value(event, "delta");
    if (delta.empty()) {
        return;
    }
    AiEvent out;
    out.type = AiEvent::Type::AudioFrame;
    out.frame = codec_.decode_inbound(delta, ++inbound_sequence_);
    out.frame.response_id = response_id;
    out.frame.item_id = string_value(event, "item_id");
    out.response_id = response_id;
    out.item_id = out.frame.item_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!response_id.empty()) {
            current_response_id_ = response_id;
        }
        response_active_ = true;
    }
    push_event(std::move(out));
}

void AiSession::handle_tool_call(const nlohmann::json& event) {
    tools::ToolCallRequest request;
    request.call_id = call_id_;
    request.request_id = string_value(event, "call_id");
    request.name = string_value(event, "name");
    request.raw_arguments = string_value(event, "arguments");
    if (request.request_id.empty()) {
        warn("Tool call without call_id ignored",
             {kv("call_id", call_id_), kv("tool", request.name)});
        return;
    }
    if (request.raw_arguments.empty()) {
        request.arguments = nlohmann::json::object();
    } else {
        try {
            request.arguments = nlohmann::json::parse(request.raw_arguments);
        } catch (const nlohmann::json::parse_error&) {
            // Left as a string so the dispatcher reports InvalidArguments.
            request.arguments = request.raw_arguments;
        }
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        outstanding_.insert(request.request_id);
    }
    info("Tool call requested",
         {kv("call_id", call_id_),
          kv("tool", request.name),
          kv("request_id", request.request_id)});

    AiEvent out;
    out.type = AiEvent::Type::ToolCallRequested;
    out.response_id = string_value(event, "response_id");
    out.item_id = string_value(event, "item_id");
    out.tool_call = std::move(request);
    push_event(std::move(out));
}

void AiSession::handle_error(const nlohmann::json& event) {
    const auto details = event.value("error", nlohmann::json::object());
    const auto type = string_value(details, "type");
    const auto code = string_value(details, "code");
    const auto message = string_value(details, "message");
    if (type == "invalid_request_error") {
        warn("Realtime request rejected",
             {kv("call_id", call_id_), kv("code", code), kv("message", message)});
        return;
    }
    fail(code.empty() ? (type.empty() ? std::string("server_error") : type) : code, message);
}

void AiSession::push_event(AiEvent event) {
    const auto type = event.type;
    if (events_.push(std::move(event)) == utils::PushResult::DroppedOldest) {
        warn("AI event buffer saturated, dropping oldest event",
             {kv("call_id", call_id_), kv("type", to_string(type))});
    }
}

void AiSession::fail(const std::string& code, const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == AiSessionState::Closing || state_ == AiSessionState::Closed ||
            state_ == AiSessionState::Failed) {
            return;
        }
        state_ = AiSessionState::Failed;
    }
    error("AI session failed",
          {kv("call_id", call_id_), kv("code", code), kv("message", message)});
    AiEvent out;
    out.type = AiEvent::Type::SessionError;
    out.error_code = code;
    out.text = message;
    push_event(std::move(out));
    events_.close();
}

void AiSession::on_close(bool clean, const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == AiSessionState::Closing || state_ == AiSessionState::Closed) {
            return;
        }
    }
    fail(clean ? "connection_closed" : "connection_lost",
         "realtime connection ended: " + reason);
}

void AiSession::send_control(const nlohmann::json& message) {
    connection_->send(message.dump());
}

void AiSession::sender_loop() {
    while (auto payload = send_queue_.pop()) {
        try {
            connection_->send(*payload);
        } catch (const TransportError& ex) {
            warn("AI audio send failed, sender stopping",
                 {kv("call_id", call_id_), kv("error", ex.what())});
            return;
        }
    }
}

}
}
