#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace voicelive_bridge {
namespace tools {

enum class ToolErrorCode {
    UnknownTool,
    ToolTimeout,
    InvalidArguments,
    HandlerFailed
};

std::string to_string(ToolErrorCode code);

// Thrown by handlers; the dispatcher turns it into an error result.
class ToolError : public std::runtime_error {
public:
    ToolError(ToolErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ToolErrorCode code() const { return code_; }

private:
    ToolErrorCode code_;
};

struct ToolDefinition {
    std::string name;
    std::string description;
    nlohmann::json parameters = nlohmann::json::object();

    nlohmann::json to_json() const;
};

struct ToolCallRequest {
    std::string call_id;
    std::string request_id;
    std::string name;
    nlohmann::json arguments = nlohmann::json::object();
    std::string raw_arguments;
};

struct ToolCallResult {
    struct Error {
        ToolErrorCode code;
        std::string message;
    };

    std::string request_id;
    nlohmann::json payload;
    std::optional<Error> error;

    bool ok() const { return !error.has_value(); }
    // String handed to the model as the function_call_output.
    std::string output() const;

    static ToolCallResult success(std::string request_id, nlohmann::json payload);
    static ToolCallResult failure(std::string request_id, ToolErrorCode code,
                                  std::string message);
};

}
}
