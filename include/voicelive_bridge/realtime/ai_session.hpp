#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "voicelive_bridge/audio/codec.hpp"
#include "voicelive_bridge/realtime/connection.hpp"
#include "voicelive_bridge/realtime/events.hpp"
#include "voicelive_bridge/realtime/session_config.hpp"
#include "voicelive_bridge/utils/bounded_queue.hpp"

namespace voicelive_bridge {
namespace realtime {

enum class AiSessionState {
    Connecting,
    Configured,
    Streaming,
    Closing,
    Closed,
    Failed
};

std::string to_string(AiSessionState state);

struct AiSessionOptions {
    size_t send_buffer_frames = 256;
    size_t event_buffer_size = 1024;
    std::chrono::milliseconds connect_timeout{10000};
    audio::AudioFormat format;
};

// One realtime speech session. Caller audio goes out through a bounded buffer
// drained by a sender thread; server events come back through next_event().
class AiSession {
public:
    AiSession(std::string call_id,
              ConnectionSettings settings,
              std::unique_ptr<AiConnection> connection,
              AiSessionOptions options);
    ~AiSession();

    AiSession(const AiSession&) = delete;
    AiSession& operator=(const AiSession&) = delete;

    // Throws SessionSetupError; the session is then Failed.
    void start(const SessionConfiguration& configuration);
    // Returns false when the session does not accept audio in its current state.
    bool send_audio(const audio::AudioFrame& frame);
    // Blocks until the next event. nullopt marks the end of the stream.
    std::optional<AiEvent> next_event();
    std::optional<AiEvent> next_event_for(std::chrono::milliseconds timeout);
    // Throws UnknownRequestId unless the request is outstanding.
    void submit_tool_result(const tools::ToolCallResult& result);
    // Cancels the current response and trims the item to what the caller heard.
    void truncate(const std::string& item_id, int audio_end_ms);
    void close(std::chrono::milliseconds grace);

    AiSessionState state() const;
    bool response_active() const;
    bool is_truncated(const std::string& response_id) const;
    size_t outstanding_tool_calls() const;
    uint64_t dropped_frames() const { return dropped_frames_.load(); }
    const audio::AudioFormat& format() const { return options_.format; }
    const std::string& call_id() const { return call_id_; }

private:
    void abort_setup(const std::string& reason);
    void on_message(const std::string& payload);
    void on_close(bool clean, const std::string& reason);
    void handle_event(const nlohmann::json& event);
    void handle_audio_delta(const nlohmann::json& event);
    void handle_tool_call(const nlohmann::json& event);
    void handle_error(const nlohmann::json& event);
    void push_event(AiEvent event);
    void fail(const std::string& code, const std::string& message);
    void send_control(const nlohmann::json& message);
    void sender_loop();

    std::string call_id_;
    ConnectionSettings settings_;
    std::unique_ptr<AiConnection> connection_;
    AiSessionOptions options_;
    audio::RealtimeAudioCodec codec_;

    mutable std::mutex mutex_;
    AiSessionState state_ = AiSessionState::Connecting;
    std::set<std::string> outstanding_;
    std::set<std::string> truncated_;
    std::string current_response_id_;
    bool response_active_ = false;

    utils::BoundedQueue<std::string> send_queue_;
    utils::BoundedQueue<AiEvent> events_;
    std::thread sender_;
    std::mutex close_mutex_;
    bool close_done_ = false;
    std::atomic<uint64_t> inbound_sequence_{0};
    std::atomic<uint64_t> dropped_frames_{0};
};

}
}
