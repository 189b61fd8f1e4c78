#include "voicelive_bridge/tools/tool_call.hpp"

namespace voicelive_bridge {
namespace tools {

std::string to_string(ToolErrorCode code) {
    switch (code) {
        case ToolErrorCode::UnknownTool:
            return "unknown_tool";
        case ToolErrorCode::ToolTimeout:
            return "tool_timeout";
        case ToolErrorCode::InvalidArguments:
            return "invalid_arguments";
        case ToolErrorCode::HandlerFailed:
            return "handler_failed";
    }
    return "unknown";
}

nlohmann::json ToolDefinition::to_json() const {
    return {{"type", "function"},
            {"name", name},
            {"description", description},
            {"parameters", parameters}};
}

std::string ToolCallResult::output() const {
    if (error) {
        nlohmann::json body{{"error", error->message}, {"code", to_string(error->code)}};
        return body.dump();
    }
    return payload.dump();
}

ToolCallResult ToolCallResult::success(std::string request_id, nlohmann::json payload) {
    ToolCallResult result;
    result.request_id = std::move(request_id);
    result.payload = std::move(payload);
    return result;
}

ToolCallResult ToolCallResult::failure(std::string request_id, ToolErrorCode code,
                                       std::string message) {
    ToolCallResult result;
    result.request_id = std::move(request_id);
    result.error = Error{code, std::move(message)};
    return result;
}

}
}
