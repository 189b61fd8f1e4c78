#include "voicelive_bridge/realtime/session_config.hpp"

#include <fstream>
#include <sstream>

#include "voicelive_bridge/errors.hpp"
#include "voicelive_bridge/logging.hpp"
#include "voicelive_bridge/utils/http.hpp"

namespace voicelive_bridge {
namespace realtime {

nlohmann::json SessionConfiguration::to_session_update() const {
    auto tool_list = nlohmann::json::array();
    for (const auto& tool : tools) {
        tool_list.push_back(tool.to_json());
    }

    nlohmann::json session{
        {"instructions", instructions},
        {"tools", std::move(tool_list)},
        {"turn_detection",
         {{"type", turn_detection.type},
          {"threshold", turn_detection.threshold},
          {"prefix_padding_ms", turn_detection.prefix_padding_ms},
          {"silence_duration_ms", turn_detection.silence_duration_ms},
          {"remove_filler_words", turn_detection.remove_filler_words}}},
        {"input_audio_noise_reduction", {{"type", noise_reduction}}},
        {"input_audio_echo_cancellation", {{"type", echo_cancellation}}},
        {"input_audio_sampling_rate", format.sample_rate},
        {"voice",
         {{"name", voice.name}, {"type", voice.type}, {"temperature", voice.temperature}}}};
    if (!tools.empty()) {
        session["tool_choice"] = "auto";
    }
    return {{"type", "session.update"}, {"session", std::move(session)}};
}

std::string default_instructions() {
    return "## Objective\n"
           "You are a voice agent called 'Assistant', a customer service agent.\n\n"
           "## Main Functions:\n"
           "1. **Existing clients**: If they identify as a client, ask for their client ID "
           "and check their contracted products and open support cases using "
           "'lookup_client'.\n"
           "2. **Support cases**: If a client requests to create a support case, use "
           "'create_support_case' with their client ID and problem description.\n"
           "3. **General information**: If they are not a client, respond about general "
           "products and services.\n"
           "4. **Conversation summary**: BEFORE ending the call with an existing client, "
           "ALWAYS use 'send_conversation_summary' to send them an email summary of what "
           "was discussed in the conversation.\n\n"
           "## Personality and Tone\n"
           "- Warm, accessible and professional tone\n"
           "- Brief, natural and spoken responses in English\n"
           "- Don't use emojis, annotations, or parentheses\n";
}

SessionConfiguration make_session_configuration(const Config& config,
                                                std::vector<tools::ToolDefinition> tools) {
    SessionConfiguration configuration;
    configuration.model = config.voice_live_model;
    configuration.instructions = default_instructions();
    if (config.instructions_file) {
        std::ifstream stream(*config.instructions_file);
        if (!stream.is_open()) {
            throw std::runtime_error("Cannot read INSTRUCTIONS_FILE: " +
                                     config.instructions_file->string());
        }
        std::ostringstream buffer;
        buffer << stream.rdbuf();
        configuration.instructions = buffer.str();
        info("Instructions loaded",
             {kv("path", config.instructions_file->string()),
              kv("bytes", configuration.instructions.size())});
    }
    configuration.tools = std::move(tools);
    configuration.voice.name = config.voice_name;
    configuration.voice.type = config.voice_type;
    configuration.voice.temperature = config.voice_temperature;
    configuration.turn_detection.type = config.vad_type;
    configuration.turn_detection.threshold = config.vad_threshold;
    configuration.turn_detection.prefix_padding_ms = config.vad_prefix_padding_ms;
    configuration.turn_detection.silence_duration_ms = config.vad_silence_duration_ms;
    configuration.format.sample_rate = config.audio_sample_rate;
    return configuration;
}

std::string ConnectionSettings::realtime_url() const {
    auto base = utils::to_websocket_url(endpoint);
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + "/voice-live/realtime?api-version=" + utils::url_encode(api_version) +
           "&model=" + utils::url_encode(model);
}

std::map<std::string, std::string> ConnectionSettings::headers(
    const std::string& client_request_id) const {
    std::map<std::string, std::string> result{{"x-ms-client-request-id", client_request_id}};
    if (api_key) {
        result.emplace("api-key", *api_key);
    } else if (bearer_token) {
        result.emplace("Authorization", "Bearer " + *bearer_token);
    } else {
        throw SessionSetupError("no Voice Live credential configured");
    }
    return result;
}

ConnectionSettings ConnectionSettings::from_config(const Config& config) {
    ConnectionSettings settings;
    settings.endpoint = config.voice_live_endpoint;
    settings.model = config.voice_live_model;
    settings.api_version = config.voice_live_api_version;
    settings.api_key = config.voice_live_api_key;
    settings.bearer_token = config.voice_live_bearer_token;
    return settings;
}

}
}
