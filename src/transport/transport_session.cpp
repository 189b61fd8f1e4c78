#include "voicelive_bridge/transport/transport_session.hpp"

#include "voicelive_bridge/errors.hpp"
#include "voicelive_bridge/logging.hpp"
#include "voicelive_bridge/metrics.hpp"

namespace voicelive_bridge {
namespace transport {

namespace {

// Inbound telephony messages use camelCase keys, outbound ones PascalCase.
const nlohmann::json* find_either(const nlohmann::json& object,
                                  const char* lower,
                                  const char* upper) {
    if (!object.is_object()) {
        return nullptr;
    }
    auto it = object.find(lower);
    if (it != object.end()) {
        return &*it;
    }
    it = object.find(upper);
    if (it != object.end()) {
        return &*it;
    }
    return nullptr;
}

std::string string_of(const nlohmann::json* value) {
    if (!value || !value->is_string()) {
        return {};
    }
    return value->get<std::string>();
}

}

std::string to_string(TransportKind kind) {
    switch (kind) {
        case TransportKind::Telephony:
            return "telephony";
        case TransportKind::Browser:
            return "browser";
    }
    return "unknown";
}

std::string to_string(TransportState state) {
    switch (state) {
        case TransportState::Ringing:
            return "ringing";
        case TransportState::Active:
            return "active";
        case TransportState::Ended:
            return "ended";
    }
    return "unknown";
}

std::string to_string(TransportEvent::Type type) {
    switch (type) {
        case TransportEvent::Type::AudioFrame:
            return "audio_frame";
        case TransportEvent::Type::SpeechStarted:
            return "speech_started";
        case TransportEvent::Type::DtmfDigit:
            return "dtmf_digit";
        case TransportEvent::Type::CallerHangup:
            return "caller_hangup";
        case TransportEvent::Type::TransportLost:
            return "transport_lost";
    }
    return "unknown";
}

TransportSession::TransportSession(std::string call_id,
                                   TransportKind kind,
                                   std::shared_ptr<MediaSocket> socket,
                                   TransportSessionOptions options)
    : call_id_(std::move(call_id)),
      kind_(kind),
      socket_(std::move(socket)),
      options_(options),
      send_queue_(options.send_buffer_frames),
      events_(options.event_buffer_size) {
    if (!socket_) {
        throw std::invalid_argument("TransportSession requires a socket");
    }
    if (kind_ == TransportKind::Telephony) {
        codec_ = std::make_unique<audio::AcsMediaCodec>();
    } else {
        codec_ = std::make_unique<audio::RawPcmCodec>();
    }
}

TransportSession::~TransportSession() {
    hangup("session destroyed");
    stop_sender();
}

void TransportSession::accept() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == TransportState::Ended) {
            throw TransportError("transport already ended");
        }
        if (state_ == TransportState::Active) {
            return;
        }
        state_ = TransportState::Active;
    }
    {
        std::lock_guard<std::mutex> lock(sender_mutex_);
        sender_ = std::thread([this]() { sender_loop(); });
    }
    info("Transport accepted", {kv("call_id", call_id_), kv("kind", to_string(kind_))});
}

bool TransportSession::send_audio(const audio::AudioFrame& frame) {
    if (state() != TransportState::Active) {
        return false;
    }
    const auto result = send_queue_.push(codec_->encode_outbound(frame));
    if (result == utils::PushResult::Closed) {
        return false;
    }
    if (result == utils::PushResult::DroppedOldest) {
        const auto dropped = ++dropped_frames_;
        Metrics::instance().add_dropped_frames("to_caller", 1);
        if (dropped == 1 || dropped % 100 == 0) {
            warn("Caller send buffer saturated, dropping oldest audio",
                 {kv("call_id", call_id_), kv("dropped", dropped)});
        }
    }
    return true;
}

size_t TransportSession::clear_outbound() {
    const auto cleared = send_queue_.clear();
    if (state() == TransportState::Active) {
        send_control(audio::AcsMediaCodec::stop_audio().payload);
    }
    debug("Outbound audio cleared", {kv("call_id", call_id_), kv("frames", cleared)});
    return cleared;
}

void TransportSession::send_transcript(const std::string& text) {
    if (state() != TransportState::Active || text.empty()) {
        return;
    }
    send_control(nlohmann::json{{"Kind", "Transcription"}, {"Text", text}}.dump());
}

void TransportSession::hangup(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (hung_up_) {
            return;
        }
        hung_up_ = true;
        state_ = TransportState::Ended;
    }
    format_cv_.notify_all();
    send_queue_.clear();
    send_queue_.close();
    stop_sender();
    try {
        socket_->close(reason);
    } catch (const std::exception& ex) {
        warn("Transport close failed", {kv("call_id", call_id_), kv("error", ex.what())});
    }
    events_.close();
    info("Transport hung up", {kv("call_id", call_id_), kv("reason", reason)});
}

std::optional<TransportEvent> TransportSession::next_event() {
    return events_.pop();
}

std::optional<TransportEvent> TransportSession::next_event_for(
    std::chrono::milliseconds timeout) {
    return events_.pop_for(timeout);
}

void TransportSession::on_message(const std::string& payload, bool binary) {
    if (state() == TransportState::Ended) {
        return;
    }
    if (kind_ == TransportKind::Browser) {
        if (binary) {
            push_frame(payload);
        } else {
            debug("Browser text message ignored", {kv("call_id", call_id_)});
        }
        return;
    }
    if (binary) {
        warn("Unexpected binary telephony message", {kv("call_id", call_id_)});
        return;
    }
    handle_telephony_message(payload);
}

void TransportSession::on_disconnect(bool clean, const std::string& reason) {
    end(clean ? TransportEvent::Type::CallerHangup : TransportEvent::Type::TransportLost,
        reason);
}

TransportState TransportSession::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void TransportSession::handle_telephony_message(const std::string& payload) {
    nlohmann::json message;
    try {
        message = nlohmann::json::parse(payload);
    } catch (const nlohmann::json::parse_error& ex) {
        warn("Unparseable telephony message", {kv("call_id", call_id_), kv("error", ex.what())});
        return;
    }
    const auto kind = string_of(find_either(message, "kind", "Kind"));
    if (kind == "AudioData") {
        if (const auto* data = find_either(message, "audioData", "AudioData")) {
            handle_audio_data(*data);
        }
    } else if (kind == "AudioMetadata") {
        if (const auto* metadata = find_either(message, "audioMetadata", "AudioMetadata")) {
            handle_audio_metadata(*metadata);
        }
    } else if (kind == "DtmfData") {
        const auto* data = find_either(message, "dtmfData", "DtmfData");
        const auto digit = data ? string_of(find_either(*data, "data", "Data")) : std::string();
        if (!digit.empty()) {
            TransportEvent event;
            event.type = TransportEvent::Type::DtmfDigit;
            event.digit = digit;
            push_event(std::move(event));
        }
    } else {
        debug("Telephony message ignored", {kv("call_id", call_id_), kv("kind", kind)});
    }
}

void TransportSession::handle_audio_metadata(const nlohmann::json& metadata) {
    audio::AudioFormat announced = options_.format;
    if (const auto* rate = find_either(metadata, "sampleRate", "SampleRate");
        rate && rate->is_number_integer()) {
        announced.sample_rate = rate->get<int>();
    }
    if (const auto* channels = find_either(metadata, "channels", "Channels");
        channels && channels->is_number_integer()) {
        announced.channels = channels->get<int>();
    }
    const auto encoding = string_of(find_either(metadata, "encoding", "Encoding"));

    std::optional<audio::AudioFormat> negotiated;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        negotiated = negotiated_format_;
        if (!negotiated) {
            announced_format_ = announced;
            announced_encoding_ = encoding;
        }
    }
    if (!negotiated) {
        format_cv_.notify_all();
        info("Telephony audio metadata",
             {kv("call_id", call_id_),
              kv("format", audio::to_string(announced)),
              kv("encoding", encoding)});
        return;
    }
    if (announced != *negotiated || (!encoding.empty() && encoding != "PCM")) {
        error("Telephony audio format changed mid-call",
              {kv("call_id", call_id_),
               kv("announced", audio::to_string(announced)),
               kv("encoding", encoding),
               kv("negotiated", audio::to_string(*negotiated))});
        end(TransportEvent::Type::TransportLost, "format_changed");
    }
}

audio::AudioFormat TransportSession::negotiate_format() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (negotiated_format_) {
        return *negotiated_format_;
    }
    if (kind_ == TransportKind::Telephony) {
        format_cv_.wait_for(lock, options_.metadata_timeout, [this]() {
            return announced_format_.has_value() || state_ == TransportState::Ended;
        });
    }
    if (state_ == TransportState::Ended) {
        throw TransportError("transport ended before the audio format was known");
    }
    if (!announced_encoding_.empty() && announced_encoding_ != "PCM") {
        throw UnsupportedFormat("unsupported telephony encoding " + announced_encoding_);
    }
    if (kind_ == TransportKind::Telephony && !announced_format_ &&
        options_.metadata_timeout.count() > 0) {
        warn("No telephony audio metadata, assuming configured format",
             {kv("call_id", call_id_), kv("format", audio::to_string(options_.format))});
    }
    negotiated_format_ = announced_format_.value_or(options_.format);
    return *negotiated_format_;
}

void TransportSession::handle_audio_data(const nlohmann::json& data) {
    const auto* silent = find_either(data, "silent", "Silent");
    const bool is_silent = silent && silent->is_boolean() && silent->get<bool>();
    bool speech_started = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        speech_started = last_silent_ && !is_silent;
        last_silent_ = is_silent;
    }
    if (is_silent) {
        return;
    }
    const auto encoded = string_of(find_either(data, "data", "Data"));
    if (encoded.empty()) {
        return;
    }
    if (speech_started) {
        TransportEvent event;
        event.type = TransportEvent::Type::SpeechStarted;
        push_event(std::move(event));
    }
    TransportEvent event;
    event.type = TransportEvent::Type::AudioFrame;
    event.frame = codec_->decode_inbound(encoded, ++inbound_sequence_);
    push_event(std::move(event));
}

void TransportSession::push_frame(const std::string& pcm) {
    if (pcm.empty()) {
        return;
    }
    TransportEvent event;
    event.type = TransportEvent::Type::AudioFrame;
    event.frame = codec_->decode_inbound(pcm, ++inbound_sequence_);
    push_event(std::move(event));
}

void TransportSession::push_event(TransportEvent event) {
    const auto type = event.type;
    if (events_.push(std::move(event)) == utils::PushResult::DroppedOldest) {
        Metrics::instance().add_dropped_frames("from_caller", 1);
        warn("Transport event buffer saturated, dropping oldest event",
             {kv("call_id", call_id_), kv("type", to_string(type))});
    }
}

void TransportSession::send_control(const std::string& payload) {
    try {
        socket_->send_text(payload);
    } catch (const TransportError& ex) {
        end(TransportEvent::Type::TransportLost, ex.what());
    }
}

void TransportSession::end(TransportEvent::Type type, const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == TransportState::Ended) {
            return;
        }
        state_ = TransportState::Ended;
    }
    format_cv_.notify_all();
    send_queue_.clear();
    send_queue_.close();
    TransportEvent event;
    event.type = type;
    event.reason = reason;
    push_event(std::move(event));
    events_.close();
    if (type == TransportEvent::Type::CallerHangup) {
        info("Caller hung up", {kv("call_id", call_id_), kv("reason", reason)});
    } else {
        warn("Transport lost", {kv("call_id", call_id_), kv("reason", reason)});
    }
}

void TransportSession::sender_loop() {
    while (auto message = send_queue_.pop()) {
        try {
            if (message->binary) {
                socket_->send_binary(message->payload);
            } else {
                socket_->send_text(message->payload);
            }
        } catch (const TransportError& ex) {
            end(TransportEvent::Type::TransportLost, ex.what());
            return;
        }
    }
}

void TransportSession::stop_sender() {
    std::lock_guard<std::mutex> lock(sender_mutex_);
    if (!sender_.joinable()) {
        return;
    }
    if (sender_.get_id() == std::this_thread::get_id()) {
        sender_.detach();
        return;
    }
    send_queue_.close();
    sender_.join();
}

}
}
