#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"

#include <string>
#include <thread>

using namespace voicelive_bridge;
using fakes::wait_until;
using transport::TransportEvent;
using transport::TransportKind;
using transport::TransportSession;
using transport::TransportState;

namespace {

struct TransportFixture {
    std::shared_ptr<fakes::FakeMediaSocket> socket = std::make_shared<fakes::FakeMediaSocket>();
    std::shared_ptr<TransportSession> session;

    explicit TransportFixture(TransportKind kind = TransportKind::Telephony,
                              size_t send_buffer_frames = 512) {
        transport::TransportSessionOptions options;
        options.send_buffer_frames = send_buffer_frames;
        session = std::make_shared<TransportSession>("call-transport", kind, socket, options);
    }

    ~TransportFixture() { socket->release_audio(); }

    TransportEvent next() {
        auto event = session->next_event_for(std::chrono::milliseconds(1000));
        REQUIRE(event.has_value());
        return *event;
    }
};

audio::AudioFrame ai_frame(const std::string& pcm) {
    audio::AudioFrame frame;
    frame.source = audio::FrameSource::Ai;
    frame.pcm = pcm;
    return frame;
}

}

TEST_CASE("Audio is only sent once the transport is accepted") {
    TransportFixture fixture;
    REQUIRE(fixture.session->state() == TransportState::Ringing);
    REQUIRE_FALSE(fixture.session->send_audio(ai_frame("early")));

    fixture.session->accept();
    fixture.session->accept();
    REQUIRE(fixture.session->state() == TransportState::Active);
    REQUIRE(fixture.session->send_audio(ai_frame("hello")));

    REQUIRE(wait_until([&]() { return fixture.socket->texts().size() == 1; }));
    const auto message = fixture.socket->texts().front();
    REQUIRE(message["Kind"] == "AudioData");
    REQUIRE(audio::base64_decode(message["AudioData"]["Data"].get<std::string>()) == "hello");
}

TEST_CASE("Telephony audio produces frames and a speech start edge") {
    TransportFixture fixture;
    fixture.session->accept();

    fixture.session->on_message(fakes::telephony_audio("quiet", true).dump(), false);
    fixture.session->on_message(fakes::telephony_audio("voice-1").dump(), false);
    fixture.session->on_message(fakes::telephony_audio("voice-2").dump(), false);

    auto event = fixture.next();
    REQUIRE(event.type == TransportEvent::Type::SpeechStarted);
    event = fixture.next();
    REQUIRE(event.type == TransportEvent::Type::AudioFrame);
    REQUIRE(event.frame.pcm == "voice-1");
    REQUIRE(event.frame.source == audio::FrameSource::Caller);
    const auto first_sequence = event.frame.sequence;
    event = fixture.next();
    REQUIRE(event.type == TransportEvent::Type::AudioFrame);
    REQUIRE(event.frame.pcm == "voice-2");
    REQUIRE(event.frame.sequence == first_sequence + 1);
    REQUIRE_FALSE(fixture.session->next_event_for(std::chrono::milliseconds(20)).has_value());
}

TEST_CASE("PascalCase telephony keys are accepted") {
    TransportFixture fixture;
    fixture.session->accept();

    const nlohmann::json message{
        {"Kind", "AudioData"},
        {"AudioData", {{"Data", audio::base64_encode("pascal")}, {"Silent", false}}}};
    fixture.session->on_message(message.dump(), false);

    REQUIRE(fixture.next().type == TransportEvent::Type::SpeechStarted);
    REQUIRE(fixture.next().frame.pcm == "pascal");
}

TEST_CASE("DTMF digits are reported") {
    TransportFixture fixture;
    fixture.session->accept();

    fixture.session->on_message(
        nlohmann::json{{"kind", "DtmfData"}, {"dtmfData", {{"data", "7"}}}}.dump(), false);

    const auto event = fixture.next();
    REQUIRE(event.type == TransportEvent::Type::DtmfDigit);
    REQUIRE(event.digit == "7");
}

TEST_CASE("Telephony audio metadata decides the negotiated format") {
    TransportFixture fixture;
    fixture.session->on_message(
        nlohmann::json{{"kind", "AudioMetadata"},
                       {"audioMetadata",
                        {{"sampleRate", 16000}, {"channels", 1}, {"encoding", "PCM"}}}}
            .dump(),
        false);
    fixture.session->accept();

    const auto format = fixture.session->negotiate_format();
    REQUIRE(format.sample_rate == 16000);
    REQUIRE(format.channels == 1);
    REQUIRE(fixture.session->negotiate_format() == format);
    REQUIRE(fixture.session->state() == TransportState::Active);
}

TEST_CASE("negotiate_format waits for late audio metadata") {
    transport::TransportSessionOptions options;
    options.metadata_timeout = std::chrono::milliseconds(2000);
    auto socket = std::make_shared<fakes::FakeMediaSocket>();
    TransportSession session("call-metadata", TransportKind::Telephony, socket, options);
    session.accept();

    std::thread announcer([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        session.on_message(
            nlohmann::json{{"kind", "AudioMetadata"},
                           {"audioMetadata", {{"sampleRate", 8000}, {"channels", 1}}}}
                .dump(),
            false);
    });
    const auto format = session.negotiate_format();
    announcer.join();
    REQUIRE(format.sample_rate == 8000);
}

TEST_CASE("Without audio metadata the configured format is assumed") {
    transport::TransportSessionOptions options;
    options.metadata_timeout = std::chrono::milliseconds(20);
    options.format.sample_rate = 24000;
    auto socket = std::make_shared<fakes::FakeMediaSocket>();
    TransportSession session("call-metadata", TransportKind::Telephony, socket, options);
    session.accept();

    REQUIRE(session.negotiate_format().sample_rate == 24000);
}

TEST_CASE("Non-PCM telephony encodings are unsupported") {
    TransportFixture fixture;
    fixture.session->on_message(
        nlohmann::json{{"kind", "AudioMetadata"},
                       {"audioMetadata",
                        {{"sampleRate", 24000}, {"channels", 1}, {"encoding", "OPUS"}}}}
            .dump(),
        false);
    fixture.session->accept();

    REQUIRE_THROWS_AS(fixture.session->negotiate_format(), UnsupportedFormat);
}

TEST_CASE("negotiate_format fails once the transport has ended") {
    transport::TransportSessionOptions options;
    options.metadata_timeout = std::chrono::milliseconds(2000);
    auto socket = std::make_shared<fakes::FakeMediaSocket>();
    TransportSession session("call-metadata", TransportKind::Telephony, socket, options);
    session.accept();

    std::thread disconnecter([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        session.on_disconnect(true, "caller left");
    });
    REQUIRE_THROWS_AS(session.negotiate_format(), TransportError);
    disconnecter.join();
}

TEST_CASE("A format change after negotiation ends the transport") {
    TransportFixture fixture;
    fixture.session->accept();
    REQUIRE(fixture.session->negotiate_format().sample_rate == 24000);

    fixture.session->on_message(
        nlohmann::json{{"kind", "AudioMetadata"},
                       {"audioMetadata",
                        {{"sampleRate", 24000}, {"channels", 1}, {"encoding", "PCM"}}}}
            .dump(),
        false);
    REQUIRE(fixture.session->state() == TransportState::Active);

    fixture.session->on_message(
        nlohmann::json{{"kind", "AudioMetadata"},
                       {"audioMetadata", {{"sampleRate", 16000}, {"channels", 1}}}}
            .dump(),
        false);

    const auto event = fixture.next();
    REQUIRE(event.type == TransportEvent::Type::TransportLost);
    REQUIRE(event.reason == "format_changed");
    REQUIRE(fixture.session->state() == TransportState::Ended);
}

TEST_CASE("Garbage telephony messages are ignored") {
    TransportFixture fixture;
    fixture.session->accept();

    fixture.session->on_message("{not json", false);
    fixture.session->on_message(nlohmann::json{{"kind", "Unknown"}}.dump(), false);
    fixture.session->on_message("raw", true);

    REQUIRE_FALSE(fixture.session->next_event_for(std::chrono::milliseconds(20)).has_value());
    REQUIRE(fixture.session->state() == TransportState::Active);
}

TEST_CASE("Browser transport relays raw PCM both ways") {
    TransportFixture fixture(TransportKind::Browser);
    fixture.session->accept();

    fixture.session->on_message("caller-pcm", true);
    fixture.session->on_message("text is ignored", false);
    const auto event = fixture.next();
    REQUIRE(event.type == TransportEvent::Type::AudioFrame);
    REQUIRE(event.frame.pcm == "caller-pcm");

    fixture.session->send_audio(ai_frame("ai-pcm"));
    REQUIRE(wait_until([&]() { return fixture.socket->binaries().size() == 1; }));
    REQUIRE(fixture.socket->binaries().front() == "ai-pcm");
}

TEST_CASE("clear_outbound discards queued audio and stops playback") {
    TransportFixture fixture;
    fixture.session->accept();
    fixture.socket->hold_audio();

    for (int i = 0; i < 6; ++i) {
        fixture.session->send_audio(ai_frame("frame-" + std::to_string(i)));
    }
    REQUIRE(wait_until([&]() { return fixture.session->queued_frames() == 5; }));

    REQUIRE(fixture.session->clear_outbound() == 5);
    REQUIRE(fixture.session->queued_frames() == 0);
    REQUIRE(fixture.socket->texts_of_kind("StopAudio").size() == 1);

    fixture.socket->release_audio();
    REQUIRE(wait_until([&]() { return fixture.socket->texts_of_kind("AudioData").size() == 1; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    REQUIRE(fixture.socket->texts_of_kind("AudioData").size() == 1);
}

TEST_CASE("Saturated outbound buffer drops the oldest frames") {
    TransportFixture fixture(TransportKind::Browser, 2);
    fixture.session->accept();
    fixture.socket->hold_audio();

    fixture.session->send_audio(ai_frame("0"));
    REQUIRE(wait_until([&]() { return fixture.session->queued_frames() == 0; }));
    for (int i = 1; i <= 4; ++i) {
        fixture.session->send_audio(ai_frame(std::to_string(i)));
    }
    REQUIRE(fixture.session->dropped_frames() == 2);

    fixture.socket->release_audio();
    REQUIRE(wait_until([&]() { return fixture.socket->binaries().size() == 3; }));
    const std::vector<std::string> expected{"0", "3", "4"};
    REQUIRE(fixture.socket->binaries() == expected);
}

TEST_CASE("Transcripts are sent as text messages") {
    TransportFixture fixture;
    fixture.session->accept();
    fixture.session->send_transcript("Hello");
    fixture.session->send_transcript("");

    const auto transcripts = fixture.socket->texts_of_kind("Transcription");
    REQUIRE(transcripts.size() == 1);
    REQUIRE(transcripts[0]["Text"] == "Hello");
}

TEST_CASE("Clean disconnect is a caller hangup, anything else is a loss") {
    SECTION("clean") {
        TransportFixture fixture;
        fixture.session->accept();
        fixture.session->on_disconnect(true, "bye");
        const auto event = fixture.next();
        REQUIRE(event.type == TransportEvent::Type::CallerHangup);
        REQUIRE(fixture.session->state() == TransportState::Ended);
        REQUIRE_FALSE(fixture.session->next_event().has_value());
    }
    SECTION("abnormal") {
        TransportFixture fixture;
        fixture.session->accept();
        fixture.session->on_disconnect(false, "reset");
        REQUIRE(fixture.next().type == TransportEvent::Type::TransportLost);
    }
}

TEST_CASE("Write failures end the transport") {
    TransportFixture fixture(TransportKind::Browser);
    fixture.session->accept();
    fixture.socket->set_fail_sends(true);

    fixture.session->send_audio(ai_frame("doomed"));

    const auto event = fixture.next();
    REQUIRE(event.type == TransportEvent::Type::TransportLost);
    REQUIRE(fixture.session->state() == TransportState::Ended);
    REQUIRE_FALSE(fixture.session->send_audio(ai_frame("after")));
}

TEST_CASE("hangup is idempotent") {
    TransportFixture fixture;
    fixture.session->accept();
    fixture.session->send_audio(ai_frame("pending"));

    fixture.session->hangup("done");
    fixture.session->hangup("again");

    REQUIRE(fixture.socket->closed());
    REQUIRE(fixture.socket->close_reason() == "done");
    REQUIRE(fixture.session->state() == TransportState::Ended);
    REQUIRE_FALSE(fixture.session->next_event().has_value());
    REQUIRE_THROWS_AS(fixture.session->accept(), TransportError);
}
