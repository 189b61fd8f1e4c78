#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "voicelive_bridge/audio/codec.hpp"
#include "voicelive_bridge/transport/media_socket.hpp"
#include "voicelive_bridge/utils/bounded_queue.hpp"

namespace voicelive_bridge {
namespace transport {

enum class TransportKind {
    Telephony,
    Browser
};

enum class TransportState {
    Ringing,
    Active,
    Ended
};

std::string to_string(TransportKind kind);
std::string to_string(TransportState state);

struct TransportEvent {
    enum class Type {
        AudioFrame,
        SpeechStarted,
        DtmfDigit,
        CallerHangup,
        TransportLost
    };

    Type type = Type::TransportLost;
    audio::AudioFrame frame;
    std::string digit;
    std::string reason;
};

std::string to_string(TransportEvent::Type type);

struct TransportSessionOptions {
    size_t send_buffer_frames = 512;
    size_t event_buffer_size = 1024;
    audio::AudioFormat format;
    // How long negotiate_format() waits for telephony AudioMetadata.
    std::chrono::milliseconds metadata_timeout{0};
};

// Caller side of a call. The media server feeds inbound messages through
// on_message() and on_disconnect(); the bridge consumes them via next_event().
class TransportSession {
public:
    TransportSession(std::string call_id,
                     TransportKind kind,
                     std::shared_ptr<MediaSocket> socket,
                     TransportSessionOptions options);
    ~TransportSession();

    TransportSession(const TransportSession&) = delete;
    TransportSession& operator=(const TransportSession&) = delete;

    // Ringing -> Active. Throws TransportError once the session has ended.
    void accept();
    // Returns false unless Active.
    bool send_audio(const audio::AudioFrame& frame);
    // Discards queued outbound audio and tells the client to stop playback.
    size_t clear_outbound();
    void send_transcript(const std::string& text);
    // Fixes the caller's audio format for the rest of the call. Telephony
    // sessions wait up to metadata_timeout for AudioMetadata and fall back to
    // the configured format. Throws UnsupportedFormat for a non-PCM encoding.
    audio::AudioFormat negotiate_format();
    // Idempotent. Also releases the socket of a session that already ended.
    void hangup(const std::string& reason);

    std::optional<TransportEvent> next_event();
    std::optional<TransportEvent> next_event_for(std::chrono::milliseconds timeout);

    void on_message(const std::string& payload, bool binary);
    void on_disconnect(bool clean, const std::string& reason);

    TransportState state() const;
    TransportKind kind() const { return kind_; }
    const std::string& call_id() const { return call_id_; }
    const audio::AudioFormat& format() const { return options_.format; }
    size_t queued_frames() const { return send_queue_.size(); }
    uint64_t dropped_frames() const { return dropped_frames_.load(); }

private:
    void handle_telephony_message(const std::string& payload);
    void handle_audio_metadata(const nlohmann::json& metadata);
    void handle_audio_data(const nlohmann::json& data);
    void push_frame(const std::string& pcm);
    void push_event(TransportEvent event);
    void send_control(const std::string& payload);
    // Moves to Ended and reports `type` unless the session already ended.
    void end(TransportEvent::Type type, const std::string& reason);
    void sender_loop();
    void stop_sender();

    std::string call_id_;
    TransportKind kind_;
    std::shared_ptr<MediaSocket> socket_;
    TransportSessionOptions options_;
    std::unique_ptr<audio::WireCodec> codec_;

    mutable std::mutex mutex_;
    std::condition_variable format_cv_;
    TransportState state_ = TransportState::Ringing;
    std::optional<audio::AudioFormat> announced_format_;
    std::string announced_encoding_;
    std::optional<audio::AudioFormat> negotiated_format_;
    bool last_silent_ = true;
    bool hung_up_ = false;

    utils::BoundedQueue<audio::WireMessage> send_queue_;
    utils::BoundedQueue<TransportEvent> events_;
    std::thread sender_;
    std::mutex sender_mutex_;
    std::atomic<uint64_t> inbound_sequence_{0};
    std::atomic<uint64_t> dropped_frames_{0};
};

}
}
