#include "voicelive_bridge/bridge/lifecycle.hpp"

#include <stdexcept>

#include "voicelive_bridge/logging.hpp"

namespace voicelive_bridge {
namespace bridge {

namespace {

const std::string kCommunicationPrefix = "Microsoft.Communication.";

std::string string_field(const nlohmann::json& object, const char* key) {
    if (!object.is_object()) {
        return {};
    }
    const auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

// Event Grid uses eventType, cloud events use type.
std::string event_type_of(const nlohmann::json& event) {
    auto type = string_field(event, "type");
    if (type.empty()) {
        type = string_field(event, "eventType");
    }
    return type;
}

std::string caller_of(const nlohmann::json& data) {
    if (!data.is_object()) {
        return {};
    }
    const auto from = data.find("from");
    if (from != data.end() && from->is_object()) {
        return string_field(*from, "rawId");
    }
    return {};
}

}

std::string to_string(LifecycleEvent::Type type) {
    switch (type) {
        case LifecycleEvent::Type::IncomingCall:
            return "IncomingCall";
        case LifecycleEvent::Type::CallConnected:
            return "CallConnected";
        case LifecycleEvent::Type::CallDisconnected:
            return "CallDisconnected";
    }
    return "Unknown";
}

std::optional<LifecycleEvent::Type> parse_lifecycle_type(const std::string& name) {
    auto bare = name;
    if (bare.rfind(kCommunicationPrefix, 0) == 0) {
        bare = bare.substr(kCommunicationPrefix.size());
    }
    if (bare == "IncomingCall") {
        return LifecycleEvent::Type::IncomingCall;
    }
    if (bare == "CallConnected") {
        return LifecycleEvent::Type::CallConnected;
    }
    if (bare == "CallDisconnected") {
        return LifecycleEvent::Type::CallDisconnected;
    }
    return std::nullopt;
}

std::vector<LifecycleEvent> parse_callback_events(const nlohmann::json& body,
                                                  const std::string& correlation_id) {
    std::vector<LifecycleEvent> result;
    const auto events = body.is_array() ? body : nlohmann::json::array({body});
    for (const auto& item : events) {
        const auto name = event_type_of(item);
        const auto type = parse_lifecycle_type(name);
        if (!type) {
            debug("Callback event skipped",
                  {kv("correlation_id", correlation_id), kv("type", name)});
            continue;
        }
        const auto data = item.is_object() && item.contains("data") ? item["data"]
                                                                     : nlohmann::json::object();
        LifecycleEvent event;
        event.type = *type;
        event.correlation_id = correlation_id;
        if (event.correlation_id.empty()) {
            event.correlation_id = string_field(data, "correlationId");
        }
        event.call_id = string_field(data, "callConnectionId");
        event.caller_info = caller_of(data);
        if (data.is_object() && data.contains("resultInformation")) {
            event.reason = string_field(data["resultInformation"], "message");
        }
        if (event.reason.empty() && *type == LifecycleEvent::Type::CallDisconnected) {
            event.reason = "remote_disconnect";
        }
        result.push_back(std::move(event));
    }
    return result;
}

LifecycleEvent parse_incoming_call(const nlohmann::json& body) {
    if (!body.is_object()) {
        throw std::invalid_argument("incoming call body must be an object");
    }
    LifecycleEvent event;
    event.type = LifecycleEvent::Type::IncomingCall;

    const auto name = event_type_of(body);
    if (!name.empty()) {
        if (parse_lifecycle_type(name) != LifecycleEvent::Type::IncomingCall) {
            throw std::invalid_argument("unexpected event type: " + name);
        }
        const auto data = body.value("data", nlohmann::json::object());
        event.correlation_id = string_field(data, "correlationId");
        event.caller_info = caller_of(data);
        return event;
    }

    event.correlation_id = string_field(body, "correlation_id");
    const auto caller = body.find("caller_info");
    if (caller != body.end()) {
        event.caller_info = caller->is_string() ? caller->get<std::string>() : caller->dump();
    }
    return event;
}

LifecycleEvent parse_call_event(const std::string& call_id, const nlohmann::json& body) {
    if (!body.is_object()) {
        throw std::invalid_argument("call event body must be an object");
    }
    const auto name = event_type_of(body);
    const auto type = parse_lifecycle_type(name);
    if (!type) {
        throw std::invalid_argument("unknown call event type: " + name);
    }
    LifecycleEvent event;
    event.type = *type;
    event.call_id = call_id;
    event.correlation_id = string_field(body, "correlation_id");
    event.reason = string_field(body, "reason");
    if (event.reason.empty() && *type == LifecycleEvent::Type::CallDisconnected) {
        event.reason = "remote_disconnect";
    }
    return event;
}

std::optional<std::string> subscription_validation_code(const nlohmann::json& body) {
    const auto& first = body.is_array() && !body.empty() ? body.front() : body;
    if (event_type_of(first) != "Microsoft.EventGrid.SubscriptionValidationEvent") {
        return std::nullopt;
    }
    const auto code = string_field(first.value("data", nlohmann::json::object()),
                                   "validationCode");
    if (code.empty()) {
        return std::nullopt;
    }
    return code;
}

}
}
