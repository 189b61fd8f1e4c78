#pragma once

#include <optional>
#include <string>

#include "voicelive_bridge/audio/frame.hpp"
#include "voicelive_bridge/tools/tool_call.hpp"

namespace voicelive_bridge {
namespace realtime {

struct AiEvent {
    enum class Type {
        AudioFrame,
        SpeechStarted,
        SpeechStopped,
        ToolCallRequested,
        ResponseCompleted,
        Transcript,
        SessionError
    };

    Type type = Type::SessionError;
    audio::AudioFrame frame;
    std::optional<tools::ToolCallRequest> tool_call;
    std::string response_id;
    std::string item_id;
    // Transcript text, response status or error message depending on the type.
    std::string text;
    std::string error_code;
};

std::string to_string(AiEvent::Type type);

}
}
