#include "voicelive_bridge/audio/codec.hpp"

#include <nlohmann/json.hpp>
#include <websocketpp/base64/base64.hpp>

#include "voicelive_bridge/errors.hpp"
#include "voicelive_bridge/logging.hpp"

namespace voicelive_bridge {
namespace audio {

std::string to_string(Encoding encoding) {
    switch (encoding) {
        case Encoding::Pcm16:
            return "pcm16";
    }
    return "unknown";
}

std::string to_string(FrameSource source) {
    switch (source) {
        case FrameSource::Caller:
            return "caller";
        case FrameSource::Ai:
            return "ai";
    }
    return "unknown";
}

std::string to_string(const AudioFormat& format) {
    return to_string(format.encoding) + "/" + std::to_string(format.sample_rate) + "/" +
           std::to_string(format.channels);
}

void ensure_compatible(const AudioFormat& transport_format, const AudioFormat& ai_format) {
    if (transport_format.sample_rate <= 0 || transport_format.channels <= 0) {
        throw UnsupportedFormat("invalid transport format " + to_string(transport_format));
    }
    if (transport_format != ai_format) {
        throw UnsupportedFormat("transport format " + to_string(transport_format) +
                                " does not match AI format " + to_string(ai_format));
    }
}

std::string base64_encode(const std::string& bytes) {
    return websocketpp::base64_encode(bytes);
}

std::string base64_decode(const std::string& text) {
    if (!is_base64(text)) {
        warn("Malformed base64 audio payload, decoded audio may be truncated",
             {kv("length", text.size())});
    }
    return websocketpp::base64_decode(text);
}

bool is_base64(const std::string& text) {
    if (text.size() % 4 != 0) {
        return false;
    }
    size_t padding = 0;
    for (const char c : text) {
        if (c == '=') {
            ++padding;
            continue;
        }
        // Padding only at the end.
        if (padding > 0) {
            return false;
        }
        const bool valid = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                           (c >= '0' && c <= '9') || c == '+' || c == '/';
        if (!valid) {
            return false;
        }
    }
    return padding <= 2;
}

WireMessage AcsMediaCodec::encode_outbound(const AudioFrame& frame) const {
    nlohmann::json message{
        {"Kind", "AudioData"},
        {"AudioData", {{"Data", base64_encode(frame.pcm)}}},
        {"StopAudio", nullptr}};
    return {message.dump(), false};
}

AudioFrame AcsMediaCodec::decode_inbound(const std::string& wire, uint64_t sequence) const {
    AudioFrame frame;
    frame.source = FrameSource::Caller;
    frame.sequence = sequence;
    frame.pcm = base64_decode(wire);
    return frame;
}

WireMessage AcsMediaCodec::stop_audio() {
    nlohmann::json message{
        {"Kind", "StopAudio"},
        {"AudioData", nullptr},
        {"StopAudio", nlohmann::json::object()}};
    return {message.dump(), false};
}

WireMessage RawPcmCodec::encode_outbound(const AudioFrame& frame) const {
    return {frame.pcm, true};
}

AudioFrame RawPcmCodec::decode_inbound(const std::string& wire, uint64_t sequence) const {
    AudioFrame frame;
    frame.source = FrameSource::Caller;
    frame.sequence = sequence;
    frame.pcm = wire;
    return frame;
}

WireMessage RealtimeAudioCodec::encode_outbound(const AudioFrame& frame) const {
    nlohmann::json message{
        {"type", "input_audio_buffer.append"},
        {"audio", base64_encode(frame.pcm)}};
    return {message.dump(), false};
}

AudioFrame RealtimeAudioCodec::decode_inbound(const std::string& wire,
                                              uint64_t sequence) const {
    AudioFrame frame;
    frame.source = FrameSource::Ai;
    frame.sequence = sequence;
    frame.pcm = base64_decode(wire);
    return frame;
}

}
}
