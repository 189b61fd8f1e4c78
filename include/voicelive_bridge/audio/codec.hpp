#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "voicelive_bridge/audio/frame.hpp"

namespace voicelive_bridge {
namespace audio {

struct WireMessage {
    std::string payload;
    bool binary = false;
};

// Throws UnsupportedFormat unless audio can pass between the two sides unchanged.
void ensure_compatible(const AudioFormat& transport_format, const AudioFormat& ai_format);

std::string base64_encode(const std::string& bytes);
// Decodes up to the first invalid character and logs a warning for malformed input.
std::string base64_decode(const std::string& text);
// Padded standard alphabet, length a multiple of four.
bool is_base64(const std::string& text);

// Translates audio between AudioFrame and one side's wire representation.
// Implementations hold no mutable state and may be shared across threads.
class WireCodec {
public:
    virtual ~WireCodec() = default;

    virtual WireMessage encode_outbound(const AudioFrame& frame) const = 0;
    virtual AudioFrame decode_inbound(const std::string& wire, uint64_t sequence) const = 0;
};

// Telephony media socket: JSON envelopes carrying base64 PCM.
class AcsMediaCodec : public WireCodec {
public:
    WireMessage encode_outbound(const AudioFrame& frame) const override;
    // `wire` is the base64 `audioData.data` field of an inbound AudioData message.
    AudioFrame decode_inbound(const std::string& wire, uint64_t sequence) const override;

    static WireMessage stop_audio();
};

// Browser socket: PCM travels as raw binary messages.
class RawPcmCodec : public WireCodec {
public:
    WireMessage encode_outbound(const AudioFrame& frame) const override;
    AudioFrame decode_inbound(const std::string& wire, uint64_t sequence) const override;
};

// AI realtime socket: input_audio_buffer.append out, response.audio.delta in.
class RealtimeAudioCodec : public WireCodec {
public:
    WireMessage encode_outbound(const AudioFrame& frame) const override;
    // `wire` is the base64 `delta` field of a response audio delta event.
    AudioFrame decode_inbound(const std::string& wire, uint64_t sequence) const override;
};

}
}
