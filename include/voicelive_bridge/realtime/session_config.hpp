#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "voicelive_bridge/audio/frame.hpp"
#include "voicelive_bridge/config.hpp"
#include "voicelive_bridge/tools/tool_call.hpp"

namespace voicelive_bridge {
namespace realtime {

struct VoiceSettings {
    std::string name = "en-US-Ava:DragonHDLatestNeural";
    std::string type = "azure-standard";
    double temperature = 0.8;
};

struct TurnDetection {
    std::string type = "azure_semantic_vad";
    double threshold = 0.3;
    int prefix_padding_ms = 200;
    int silence_duration_ms = 200;
    bool remove_filler_words = false;
};

// Immutable for the lifetime of a call. Serialized as one session.update message.
struct SessionConfiguration {
    std::string model;
    std::string instructions;
    std::vector<tools::ToolDefinition> tools;
    VoiceSettings voice;
    TurnDetection turn_detection;
    std::string noise_reduction = "azure_deep_noise_suppression";
    std::string echo_cancellation = "server_echo_cancellation";
    audio::AudioFormat format;

    nlohmann::json to_session_update() const;
};

std::string default_instructions();

// Reads INSTRUCTIONS_FILE when set, otherwise falls back to default_instructions().
SessionConfiguration make_session_configuration(const Config& config,
                                                std::vector<tools::ToolDefinition> tools);

struct ConnectionSettings {
    std::string endpoint;
    std::string model;
    std::string api_version;
    std::optional<std::string> api_key;
    std::optional<std::string> bearer_token;

    std::string realtime_url() const;
    // Throws SessionSetupError when no credential is configured.
    std::map<std::string, std::string> headers(const std::string& client_request_id) const;

    static ConnectionSettings from_config(const Config& config);
};

}
}
