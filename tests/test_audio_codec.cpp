#include <catch2/catch_test_macros.hpp>

#include "voicelive_bridge/audio/codec.hpp"
#include "voicelive_bridge/errors.hpp"

#include <nlohmann/json.hpp>

using namespace voicelive_bridge;

TEST_CASE("Frame duration follows the format") {
    audio::AudioFrame frame;
    frame.pcm = std::string(960, '\0');
    audio::AudioFormat format;
    REQUIRE(frame.duration_ms(format) == 20);
    format.sample_rate = 16000;
    REQUIRE(frame.duration_ms(format) == 30);
    format.sample_rate = 8000;
    format.channels = 2;
    REQUIRE(frame.duration_ms(format) == 30);
}

TEST_CASE("ensure_compatible rejects mismatched formats") {
    audio::AudioFormat transport_format;
    audio::AudioFormat ai_format;
    REQUIRE_NOTHROW(audio::ensure_compatible(transport_format, ai_format));

    transport_format.sample_rate = 16000;
    REQUIRE_THROWS_AS(audio::ensure_compatible(transport_format, ai_format), UnsupportedFormat);

    transport_format.sample_rate = 0;
    REQUIRE_THROWS_AS(audio::ensure_compatible(transport_format, transport_format),
                      UnsupportedFormat);
}

TEST_CASE("base64 handles binary PCM") {
    const std::string pcm("\x00\x01\xfe\xff\x7f", 5);
    REQUIRE(audio::base64_encode("hello") == "aGVsbG8=");
    REQUIRE(audio::base64_decode(audio::base64_encode(pcm)) == pcm);
}

TEST_CASE("Malformed base64 is detected") {
    REQUIRE(audio::is_base64(""));
    REQUIRE(audio::is_base64("aGVsbG8="));
    REQUIRE(audio::is_base64(audio::base64_encode(std::string("\x00\xff\x10", 3))));
    REQUIRE_FALSE(audio::is_base64("aGVsbG8"));
    REQUIRE_FALSE(audio::is_base64("aGV$bG8="));
    REQUIRE_FALSE(audio::is_base64("aG=sbG8="));
    REQUIRE_FALSE(audio::is_base64("a==="));

    // Decoding stops at the first bad character.
    REQUIRE(audio::base64_decode("aGVs$G8=") == "hel");
}

TEST_CASE("Telephony codec wraps audio in AudioData envelopes") {
    audio::AcsMediaCodec codec;
    audio::AudioFrame frame;
    frame.pcm = "abc";

    const auto wire = codec.encode_outbound(frame);
    REQUIRE_FALSE(wire.binary);
    const auto message = nlohmann::json::parse(wire.payload);
    REQUIRE(message["Kind"] == "AudioData");
    REQUIRE(message["AudioData"]["Data"] == audio::base64_encode("abc"));
    REQUIRE(message["StopAudio"].is_null());

    const auto inbound = codec.decode_inbound(audio::base64_encode("xyz"), 5);
    REQUIRE(inbound.pcm == "xyz");
    REQUIRE(inbound.sequence == 5);
    REQUIRE(inbound.source == audio::FrameSource::Caller);

    const auto stop = nlohmann::json::parse(audio::AcsMediaCodec::stop_audio().payload);
    REQUIRE(stop["Kind"] == "StopAudio");
    REQUIRE(stop["AudioData"].is_null());
}

TEST_CASE("Browser codec passes PCM through as binary") {
    audio::RawPcmCodec codec;
    audio::AudioFrame frame;
    frame.pcm = std::string("\x01\x02", 2);
    const auto wire = codec.encode_outbound(frame);
    REQUIRE(wire.binary);
    REQUIRE(wire.payload == frame.pcm);
    REQUIRE(codec.decode_inbound(wire.payload, 1).pcm == frame.pcm);
}

TEST_CASE("Realtime codec builds append messages and decodes deltas") {
    audio::RealtimeAudioCodec codec;
    audio::AudioFrame frame;
    frame.pcm = "pcm";
    const auto message = nlohmann::json::parse(codec.encode_outbound(frame).payload);
    REQUIRE(message["type"] == "input_audio_buffer.append");
    REQUIRE(message["audio"] == audio::base64_encode("pcm"));

    const auto inbound = codec.decode_inbound(audio::base64_encode("out"), 9);
    REQUIRE(inbound.pcm == "out");
    REQUIRE(inbound.source == audio::FrameSource::Ai);
}
