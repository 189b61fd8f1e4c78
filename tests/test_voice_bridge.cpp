#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"

#include "voicelive_bridge/metrics.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace voicelive_bridge;
using fakes::BridgeHarness;
using fakes::wait_until;

namespace {

size_t index_of(const std::vector<nlohmann::json>& messages, const std::string& type,
                size_t from = 0) {
    for (size_t i = from; i < messages.size(); ++i) {
        if (messages[i].value("type", "") == type) {
            return i;
        }
    }
    return messages.size();
}

}

TEST_CASE("AI setup failure terminates the call with SetupFailed") {
    BridgeHarness harness("call-setup-fail");
    harness.peer->set_fail_open(true);

    harness.bridge->start();

    REQUIRE(harness.bridge->state() == bridge::CallState::Terminated);
    REQUIRE(harness.bridge->termination_reason() == bridge::TerminationReason::SetupFailed);
    const std::vector<bridge::CallState> expected{bridge::CallState::Initiated,
                                                  bridge::CallState::ConnectingAi,
                                                  bridge::CallState::Terminated};
    REQUIRE(harness.bridge->state_history() == expected);
    REQUIRE(harness.transport->state() == transport::TransportState::Ended);
    REQUIRE(harness.socket->closed());
    REQUIRE_FALSE(harness.registry->contains("call-setup-fail"));
}

TEST_CASE("Incompatible audio formats fail setup before the AI is contacted") {
    fakes::BridgeHarness harness("call-format");
    // Re-create the transport at 16 kHz while the AI side stays at 24 kHz.
    transport::TransportSessionOptions options;
    options.format.sample_rate = 16000;
    auto socket = std::make_shared<fakes::FakeMediaSocket>();
    auto transport = std::make_shared<transport::TransportSession>(
        "call-format", transport::TransportKind::Browser, socket, options);

    realtime::AiSessionOptions ai_options;
    auto peer = std::make_shared<fakes::FakeAiPeer>();
    auto ai = std::make_unique<realtime::AiSession>(
        "call-format", fakes::test_connection_settings(),
        std::make_unique<fakes::FakeAiConnection>(peer), ai_options);
    auto dispatcher = std::make_unique<tools::ToolDispatcher>(
        "call-format", tools::make_customer_tool_registry(), tools::ToolContext{},
        tools::DispatcherOptions{});
    bridge::CallInfo info;
    info.call_id = "call-format";
    auto call = std::make_shared<bridge::VoiceBridge>(
        info, transport, std::move(ai), fakes::test_session_configuration(),
        std::move(dispatcher), harness.registry, bridge::BridgeOptions{});

    call->start();

    REQUIRE(call->termination_reason() == bridge::TerminationReason::SetupFailed);
    REQUIRE(socket->closed());
    REQUIRE(peer->url().empty());
    REQUIRE_FALSE(harness.registry->contains("call-format"));
}

TEST_CASE("Telephony metadata that disagrees with the AI format fails setup") {
    BridgeHarness harness("call-format-acs");
    harness.transport->on_message(
        nlohmann::json{{"kind", "AudioMetadata"},
                       {"audioMetadata",
                        {{"sampleRate", 16000}, {"channels", 1}, {"encoding", "PCM"}}}}
            .dump(),
        false);

    harness.bridge->start();

    REQUIRE(harness.bridge->termination_reason() == bridge::TerminationReason::SetupFailed);
    const std::vector<bridge::CallState> expected{bridge::CallState::Initiated,
                                                  bridge::CallState::ConnectingAi,
                                                  bridge::CallState::Terminated};
    REQUIRE(harness.bridge->state_history() == expected);
    REQUIRE(harness.socket->closed());
    REQUIRE(harness.peer->url().empty());
    REQUIRE_FALSE(harness.registry->contains("call-format-acs"));
}

TEST_CASE("Successful start registers the call and configures the AI session") {
    BridgeHarness harness("call-start");

    harness.bridge->start();

    REQUIRE(harness.bridge->state() == bridge::CallState::Active);
    REQUIRE(harness.registry->contains("call-start"));
    REQUIRE(harness.registry->find_by_correlation("corr-call-start") == harness.bridge);
    REQUIRE(harness.transport->state() == transport::TransportState::Active);

    const auto sent = harness.peer->sent();
    REQUIRE(sent.size() >= 2);
    REQUIRE(sent[0]["type"] == "session.update");
    REQUIRE(sent[0]["session"]["tools"].size() == 3);
    REQUIRE(sent[1]["type"] == "response.create");
}

TEST_CASE("Duplicate call id is rejected") {
    BridgeHarness first("call-dup");
    first.bridge->start();
    REQUIRE(first.bridge->state() == bridge::CallState::Active);

    BridgeHarness second("call-dup");
    second.registry = first.registry;
    auto call = std::make_shared<bridge::VoiceBridge>(
        bridge::CallInfo{"call-dup", "other", "", std::chrono::system_clock::now()},
        second.transport,
        std::make_unique<realtime::AiSession>("call-dup", fakes::test_connection_settings(),
                                              std::make_unique<fakes::FakeAiConnection>(
                                                  second.peer),
                                              realtime::AiSessionOptions{}),
        fakes::test_session_configuration(),
        std::make_unique<tools::ToolDispatcher>("call-dup",
                                                tools::make_customer_tool_registry(),
                                                tools::ToolContext{},
                                                tools::DispatcherOptions{}),
        first.registry, bridge::BridgeOptions{});

    REQUIRE_THROWS_AS(call->start(), DuplicateCallError);
    REQUIRE(call->termination_reason() == bridge::TerminationReason::SetupFailed);
    REQUIRE(second.socket->closed());
    REQUIRE(first.registry->find("call-dup") == first.bridge);
    REQUIRE(first.registry->size() == 1);
}

TEST_CASE("Caller audio reaches the AI in sequence order") {
    BridgeHarness harness("call-order", transport::TransportKind::Browser);
    harness.bridge->start();

    const int frames = 50;
    for (int i = 0; i < frames; ++i) {
        harness.transport->on_message(std::string(480, static_cast<char>('A' + i % 26)) +
                                          std::to_string(i),
                                      true);
    }
    REQUIRE(harness.peer->wait_for("input_audio_buffer.append", frames));

    const auto appends = harness.peer->sent_of_type("input_audio_buffer.append");
    REQUIRE(appends.size() == static_cast<size_t>(frames));
    for (int i = 0; i < frames; ++i) {
        const auto pcm = audio::base64_decode(appends[i]["audio"].get<std::string>());
        REQUIRE(pcm.substr(480) == std::to_string(i));
    }
}

TEST_CASE("AI audio is forwarded to the caller") {
    BridgeHarness harness("call-playback", transport::TransportKind::Browser);
    harness.bridge->start();

    harness.peer->inject({{"type", "response.created"}, {"response", {{"id", "resp_1"}}}});
    for (int i = 0; i < 5; ++i) {
        harness.peer->inject(
            fakes::ai_audio_delta("resp_1", "item_1", fakes::pcm_chunk(static_cast<char>(i))));
    }
    REQUIRE(wait_until([&]() { return harness.socket->binaries().size() == 5; }));
    const auto binaries = harness.socket->binaries();
    for (int i = 0; i < 5; ++i) {
        REQUIRE(binaries[i] == fakes::pcm_chunk(static_cast<char>(i)));
    }
}

TEST_CASE("Caller speech during AI playback interrupts it") {
    BridgeHarness harness("call-barge-in");
    harness.bridge->start();
    harness.socket->hold_audio();

    harness.peer->inject({{"type", "response.created"}, {"response", {{"id", "resp_1"}}}});
    for (int i = 0; i < 10; ++i) {
        harness.peer->inject(fakes::ai_audio_delta("resp_1", "item_1", fakes::pcm_chunk('x')));
    }
    // One frame is stuck in the socket, the rest wait in the outbound queue.
    REQUIRE(wait_until([&]() { return harness.transport->queued_frames() == 9; }));

    harness.transport->on_message(fakes::telephony_audio(fakes::pcm_chunk('c')).dump(), false);

    REQUIRE(harness.peer->wait_for("conversation.item.truncate"));
    REQUIRE(harness.transport->queued_frames() == 0);
    REQUIRE(harness.bridge->interruptions() == 1);
    REQUIRE(harness.peer->count("response.cancel") == 1);

    const auto truncate = harness.peer->sent_of_type("conversation.item.truncate").front();
    REQUIRE(truncate["item_id"] == "item_1");
    REQUIRE(truncate["content_index"] == 0);
    REQUIRE(truncate["audio_end_ms"] == 20);
    REQUIRE(wait_until([&]() { return !harness.socket->texts_of_kind("StopAudio").empty(); }));

    // Late audio of the interrupted response never reaches the caller.
    for (int i = 0; i < 5; ++i) {
        harness.peer->inject(fakes::ai_audio_delta("resp_1", "item_1", fakes::pcm_chunk('y')));
    }
    harness.socket->release_audio();
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    REQUIRE(harness.socket->texts_of_kind("AudioData").size() <= 1);
    REQUIRE(harness.transport->queued_frames() == 0);

    // The caller audio itself still went to the AI.
    REQUIRE(harness.peer->wait_for("input_audio_buffer.append"));
}

TEST_CASE("Speech start without AI playback is not an interruption") {
    BridgeHarness harness("call-no-barge-in");
    harness.bridge->start();

    harness.peer->inject({{"type", "input_audio_buffer.speech_started"}, {"item_id", "in_1"}});
    harness.transport->on_message(fakes::telephony_audio(fakes::pcm_chunk('c')).dump(), false);
    REQUIRE(harness.peer->wait_for("input_audio_buffer.append"));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    REQUIRE(harness.bridge->interruptions() == 0);
    REQUIRE(harness.peer->count("response.cancel") == 0);
}

TEST_CASE("Server VAD speech start truncates an active response") {
    BridgeHarness harness("call-vad", transport::TransportKind::Browser);
    harness.bridge->start();

    harness.peer->inject({{"type", "response.created"}, {"response", {{"id", "resp_9"}}}});
    harness.peer->inject(fakes::ai_audio_delta("resp_9", "item_9", fakes::pcm_chunk('z')));
    REQUIRE(wait_until([&]() { return harness.socket->binaries().size() == 1; }));

    harness.peer->inject({{"type", "input_audio_buffer.speech_started"}, {"item_id", "in_2"}});

    REQUIRE(harness.peer->wait_for("conversation.item.truncate"));
    const auto truncate = harness.peer->sent_of_type("conversation.item.truncate").front();
    REQUIRE(truncate["item_id"] == "item_9");
    REQUIRE(truncate["audio_end_ms"] == 20);
    REQUIRE(harness.ai->is_truncated("resp_9"));
}

TEST_CASE("lookup_client result is submitted before the next response") {
    BridgeHarness harness("call-tool");
    harness.bridge->start();

    harness.peer->inject(
        fakes::ai_tool_call("req_1", tools::kLookupClient, R"({"client_id":"C123"})"));

    REQUIRE(harness.peer->wait_for("conversation.item.create"));
    REQUIRE(harness.peer->wait_for("response.create", 2));

    const auto sent = harness.peer->sent();
    const auto item_index = index_of(sent, "conversation.item.create");
    const auto response_index = index_of(sent, "response.create", 2);
    REQUIRE(item_index < response_index);

    const auto& item = sent[item_index]["item"];
    REQUIRE(item["type"] == "function_call_output");
    REQUIRE(item["call_id"] == "req_1");
    const auto output = nlohmann::json::parse(item["output"].get<std::string>());
    REQUIRE(output["client_id"] == "C123");
    REQUIRE(output["client_name"] == "Ada Lovelace");
    REQUIRE(output["products"].size() == 2);
    REQUIRE(output["open_cases"].size() == 1);
    REQUIRE(harness.ai->outstanding_tool_calls() == 0);
}

TEST_CASE("Unknown tool yields an error result and the call continues") {
    BridgeHarness harness("call-unknown-tool");
    harness.bridge->start();

    harness.peer->inject(fakes::ai_tool_call("req_x", "launch_rocket", "{}"));

    REQUIRE(harness.peer->wait_for("conversation.item.create"));
    const auto item = harness.peer->sent_of_type("conversation.item.create").front()["item"];
    const auto output = nlohmann::json::parse(item["output"].get<std::string>());
    REQUIRE(output["code"] == "unknown_tool");
    REQUIRE(harness.bridge->state() == bridge::CallState::Active);
}

TEST_CASE("Caller hangup drains the call and cancels outstanding tools") {
    BridgeHarness harness("call-hangup");
    harness.directory->set_delay(std::chrono::milliseconds(400));
    harness.bridge->start();

    harness.peer->inject(
        fakes::ai_tool_call("req_slow", tools::kLookupClient, R"({"client_id":"C123"})"));
    REQUIRE(wait_until([&]() { return harness.directory->lookups() == 1; }));

    harness.transport->on_disconnect(true, "caller left");

    REQUIRE(harness.bridge->wait_terminated(std::chrono::milliseconds(3000)));
    REQUIRE(harness.bridge->termination_reason() == bridge::TerminationReason::CallerHangup);
    const auto history = harness.bridge->state_history();
    REQUIRE(std::find(history.begin(), history.end(), bridge::CallState::Draining) !=
            history.end());
    REQUIRE(history.back() == bridge::CallState::Terminated);
    REQUIRE_FALSE(harness.registry->contains("call-hangup"));
    REQUIRE(harness.peer->closed());

    // The slow lookup finishes after the hangup; its result is never delivered.
    std::this_thread::sleep_for(std::chrono::milliseconds(600));
    REQUIRE(harness.peer->count("conversation.item.create") == 0);
    REQUIRE(Metrics::instance().render_prometheus().find(
                "tool_calls_total{tool=\"lookup_client\",outcome=\"cancelled\"}") !=
            std::string::npos);
}

TEST_CASE("AI connection loss ends the call with SessionError") {
    BridgeHarness harness("call-ai-lost");
    harness.bridge->start();

    harness.peer->drop(false, "network unreachable");

    REQUIRE(harness.bridge->wait_terminated(std::chrono::milliseconds(3000)));
    REQUIRE(harness.bridge->termination_reason() == bridge::TerminationReason::SessionError);
    REQUIRE(harness.socket->closed());
    REQUIRE_FALSE(harness.registry->contains("call-ai-lost"));
}

TEST_CASE("Transport failure ends the call with TransportLost") {
    BridgeHarness harness("call-transport-lost");
    harness.bridge->start();

    harness.transport->on_disconnect(false, "connection reset");

    REQUIRE(harness.bridge->wait_terminated(std::chrono::milliseconds(3000)));
    REQUIRE(harness.bridge->termination_reason() == bridge::TerminationReason::TransportLost);
}

TEST_CASE("CallDisconnected lifecycle event ends the call") {
    BridgeHarness harness("call-remote");
    harness.bridge->start();

    bridge::LifecycleEvent connected;
    connected.type = bridge::LifecycleEvent::Type::CallConnected;
    connected.call_id = "call-remote";
    harness.bridge->handle_lifecycle_event(connected);

    bridge::LifecycleEvent disconnected;
    disconnected.type = bridge::LifecycleEvent::Type::CallDisconnected;
    disconnected.call_id = "call-remote";
    disconnected.reason = "remote_disconnect";
    harness.bridge->handle_lifecycle_event(disconnected);

    REQUIRE(harness.bridge->wait_terminated(std::chrono::milliseconds(3000)));
    REQUIRE(harness.bridge->termination_reason() ==
            bridge::TerminationReason::RemoteDisconnect);
    REQUIRE(harness.socket->closed());
}

TEST_CASE("Stop shuts an active call down") {
    BridgeHarness harness("call-stop");
    harness.bridge->start();

    harness.bridge->stop();

    REQUIRE(harness.bridge->wait_terminated(std::chrono::milliseconds(3000)));
    REQUIRE(harness.bridge->termination_reason() == bridge::TerminationReason::Shutdown);
    REQUIRE(harness.registry->size() == 0);
}

TEST_CASE("AI transcripts are relayed to the caller") {
    BridgeHarness harness("call-transcript");
    harness.bridge->start();

    harness.peer->inject({{"type", "response.audio_transcript.done"},
                          {"response_id", "resp_1"},
                          {"item_id", "item_1"},
                          {"transcript", "How can I help you today?"}});

    REQUIRE(wait_until([&]() { return !harness.socket->texts_of_kind("Transcription").empty(); }));
    REQUIRE(harness.socket->texts_of_kind("Transcription").front()["Text"] ==
            "How can I help you today?");
}
