#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace voicelive_bridge {
namespace bridge {

struct LifecycleEvent {
    enum class Type {
        IncomingCall,
        CallConnected,
        CallDisconnected
    };

    Type type = Type::IncomingCall;
    std::string call_id;
    std::string correlation_id;
    std::string caller_info;
    std::string reason;
};

std::string to_string(LifecycleEvent::Type type);

// Accepts bare names and the "Microsoft.Communication." prefixed form.
std::optional<LifecycleEvent::Type> parse_lifecycle_type(const std::string& name);

// Call automation callback body: an array (or single object) of {type, data}.
// Unknown event types are skipped.
std::vector<LifecycleEvent> parse_callback_events(const nlohmann::json& body,
                                                  const std::string& correlation_id);

// {correlation_id, caller_info} or an Event Grid IncomingCall event.
// Throws std::invalid_argument when the body is neither.
LifecycleEvent parse_incoming_call(const nlohmann::json& body);

// Direct routing body {type, reason} for a known call id.
// Throws std::invalid_argument for a missing or unknown type.
LifecycleEvent parse_call_event(const std::string& call_id, const nlohmann::json& body);

// Event Grid subscription handshake; nullopt for any other body.
std::optional<std::string> subscription_validation_code(const nlohmann::json& body);

}
}
