#include <catch2/catch_test_macros.hpp>

#include "voicelive_bridge/bridge/lifecycle.hpp"

#include <stdexcept>

using namespace voicelive_bridge;
using bridge::LifecycleEvent;

TEST_CASE("Lifecycle type names accept the namespaced form") {
    REQUIRE(bridge::parse_lifecycle_type("CallConnected") == LifecycleEvent::Type::CallConnected);
    REQUIRE(bridge::parse_lifecycle_type("Microsoft.Communication.CallDisconnected") ==
            LifecycleEvent::Type::CallDisconnected);
    REQUIRE_FALSE(bridge::parse_lifecycle_type("Microsoft.Communication.PlayCompleted"));
}

TEST_CASE("Callback bodies produce one event per known entry") {
    const nlohmann::json body = nlohmann::json::array(
        {{{"type", "Microsoft.Communication.CallConnected"},
          {"data", {{"callConnectionId", "conn-1"}}}},
         {{"type", "Microsoft.Communication.ParticipantsUpdated"}, {"data", {}}},
         {{"type", "Microsoft.Communication.CallDisconnected"},
          {"data", {{"callConnectionId", "conn-1"}}}}});

    const auto events = bridge::parse_callback_events(body, "corr-1");
    REQUIRE(events.size() == 2);
    REQUIRE(events[0].type == LifecycleEvent::Type::CallConnected);
    REQUIRE(events[0].call_id == "conn-1");
    REQUIRE(events[0].correlation_id == "corr-1");
    REQUIRE(events[1].type == LifecycleEvent::Type::CallDisconnected);
    REQUIRE(events[1].reason == "remote_disconnect");
}

TEST_CASE("A single callback object is accepted") {
    const nlohmann::json body{{"type", "CallDisconnected"},
                              {"data",
                               {{"correlationId", "corr-9"},
                                {"resultInformation", {{"message", "Call ended by user"}}}}}};
    const auto events = bridge::parse_callback_events(body, "");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].correlation_id == "corr-9");
    REQUIRE(events[0].reason == "Call ended by user");
}

TEST_CASE("Incoming calls parse from both body shapes") {
    const auto plain = bridge::parse_incoming_call(
        {{"correlation_id", "corr-1"}, {"caller_info", "4:+15550100"}});
    REQUIRE(plain.type == LifecycleEvent::Type::IncomingCall);
    REQUIRE(plain.correlation_id == "corr-1");
    REQUIRE(plain.caller_info == "4:+15550100");

    const auto grid = bridge::parse_incoming_call(
        {{"eventType", "Microsoft.Communication.IncomingCall"},
         {"data", {{"correlationId", "corr-2"}, {"from", {{"rawId", "4:+15550199"}}}}}});
    REQUIRE(grid.correlation_id == "corr-2");
    REQUIRE(grid.caller_info == "4:+15550199");

    REQUIRE_THROWS_AS(bridge::parse_incoming_call(nlohmann::json::array()),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(
        bridge::parse_incoming_call({{"eventType", "Microsoft.Communication.CallConnected"}}),
        std::invalid_argument);
}

TEST_CASE("Direct call events need a known type") {
    const auto event = bridge::parse_call_event("call-1", {{"type", "CallDisconnected"}});
    REQUIRE(event.call_id == "call-1");
    REQUIRE(event.type == LifecycleEvent::Type::CallDisconnected);
    REQUIRE(event.reason == "remote_disconnect");

    REQUIRE_THROWS_AS(bridge::parse_call_event("call-1", {{"type", "Hold"}}),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(bridge::parse_call_event("call-1", nlohmann::json::object()),
                      std::invalid_argument);
}

TEST_CASE("Subscription validation handshake is detected") {
    const nlohmann::json body = nlohmann::json::array(
        {{{"eventType", "Microsoft.EventGrid.SubscriptionValidationEvent"},
          {"data", {{"validationCode", "code-123"}}}}});
    REQUIRE(bridge::subscription_validation_code(body) == std::string("code-123"));
    REQUIRE_FALSE(bridge::subscription_validation_code({{"correlation_id", "x"}}));
}
