#include "voicelive_bridge/config.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace voicelive_bridge {

namespace {

std::string get_env_str(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : fallback;
}

std::optional<std::string> get_env_optional(const char* name) {
    const char* value = std::getenv(name);
    if (!value) {
        return std::nullopt;
    }
    std::string result(value);
    if (result.empty()) {
        return std::nullopt;
    }
    return result;
}

std::string get_env_required(const char* name) {
    const char* value = std::getenv(name);
    if (!value || std::string(value).empty()) {
        throw std::runtime_error(std::string(name) + " is required");
    }
    return std::string(value);
}

int get_env_int(const char* name, int fallback) {
    const char* value = std::getenv(name);
    if (!value) {
        return fallback;
    }
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        throw std::runtime_error(std::string(name) + " must be an integer");
    }
}

double get_env_double(const char* name, double fallback) {
    const char* value = std::getenv(name);
    if (!value) {
        return fallback;
    }
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        throw std::runtime_error(std::string(name) + " must be a number");
    }
}

std::string trim(std::string value) {
    auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(),
                                            [&](unsigned char ch) { return !is_space(ch); }));
    value.erase(std::find_if(value.rbegin(), value.rend(),
                             [&](unsigned char ch) { return !is_space(ch); }).base(),
                value.end());
    return value;
}

std::string timestamp_suffix() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_value{};
    localtime_r(&time_t, &tm_value);
    std::ostringstream stream;
    stream << std::put_time(&tm_value, "%Y%m%d_%H%M%S");
    return stream.str();
}

std::string strip_quotes(std::string value) {
    if (value.size() < 2) {
        return value;
    }
    if ((value.front() == '"' && value.back() == '"') ||
        (value.front() == '\'' && value.back() == '\'')) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

// Values already present in the environment win over the .env file.
void load_dotenv() {
    const std::filesystem::path dotenv_path = std::filesystem::current_path() / ".env";
    if (!std::filesystem::exists(dotenv_path)) {
        return;
    }

    std::ifstream stream(dotenv_path);
    if (!stream.is_open()) {
        return;
    }

    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty() || line.rfind("#", 0) == 0) {
            continue;
        }
        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }

        const auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = strip_quotes(trim(line.substr(eq_pos + 1)));
        if (key.empty()) {
            continue;
        }
        setenv(key.c_str(), value.c_str(), 0);
    }
}

}

Config Config::load() {
    load_dotenv();
    Config config;

    config.voice_live_endpoint = get_env_required("VOICE_LIVE_ENDPOINT");
    config.voice_live_api_key = get_env_optional("VOICE_LIVE_API_KEY");
    config.voice_live_bearer_token = get_env_optional("VOICE_LIVE_BEARER_TOKEN");
    config.voice_live_model = get_env_str("VOICE_LIVE_MODEL", "gpt-4o-mini");
    config.voice_live_api_version =
        get_env_str("VOICE_LIVE_API_VERSION", "2025-05-01-preview");
    config.voice_name = get_env_str("VOICE_NAME", "en-US-Ava:DragonHDLatestNeural");
    config.voice_type = get_env_str("VOICE_TYPE", "azure-standard");
    config.voice_temperature = get_env_double("VOICE_TEMPERATURE", 0.8);
    if (const auto path = get_env_optional("INSTRUCTIONS_FILE")) {
        config.instructions_file = std::filesystem::path(*path);
    }

    config.vad_type = get_env_str("VAD_TYPE", "azure_semantic_vad");
    config.vad_threshold = get_env_double("VAD_THRESHOLD", 0.3);
    config.vad_prefix_padding_ms = get_env_int("VAD_PREFIX_PADDING_MS", 200);
    config.vad_silence_duration_ms = get_env_int("VAD_SILENCE_DURATION_MS", 200);

    config.audio_sample_rate = get_env_int("AUDIO_SAMPLE_RATE", 24000);
    config.ai_send_buffer_frames = get_env_int("AI_SEND_BUFFER_FRAMES", 256);
    config.transport_send_buffer_frames = get_env_int("TRANSPORT_SEND_BUFFER_FRAMES", 512);
    config.event_buffer_size = get_env_int("EVENT_BUFFER_SIZE", 1024);
    config.tool_timeout_ms = get_env_int("TOOL_TIMEOUT_MS", 8000);
    config.tool_max_inflight = get_env_int("TOOL_MAX_INFLIGHT", 2);
    config.close_grace_ms = get_env_int("CLOSE_GRACE_MS", 1500);
    config.ai_connect_timeout_ms = get_env_int("AI_CONNECT_TIMEOUT_MS", 10000);
    config.audio_metadata_timeout_ms = get_env_int("AUDIO_METADATA_TIMEOUT_MS", 2000);
    config.pending_call_ttl_ms = get_env_int("PENDING_CALL_TTL_MS", 120000);

    config.media_port = get_env_int("MEDIA_PORT", 8765);
    config.webhook_port = get_env_int("WEBHOOK_PORT", 8000);
    config.public_media_url =
        get_env_str("PUBLIC_MEDIA_URL", "ws://localhost:" + std::to_string(config.media_port));

    config.backend_url = get_env_required("BACKEND_URL");
    config.notification_url = get_env_str("NOTIFICATION_URL", config.backend_url);
    config.sender_email = get_env_str("SENDER_EMAIL", "donotreply@example.com");
    config.authorization_token = get_env_optional("AUTHORIZATION_TOKEN");
    config.backend_request_timeout = get_env_double("BACKEND_REQUEST_TIMEOUT", 10.0);
    config.backend_connect_timeout = get_env_double("BACKEND_CONNECT_TIMEOUT", 5.0);
    config.backend_sock_read_timeout = get_env_double("BACKEND_SOCK_READ_TIMEOUT", 10.0);

    config.log_level = get_env_str("LOG_LEVEL", "INFO");
    const auto log_filename_raw = get_env_str("LOG_FILENAME", "");
    if (!log_filename_raw.empty()) {
        const std::filesystem::path log_path(log_filename_raw);
        const auto stamped = log_path.stem().string() + "_" + timestamp_suffix() +
                             log_path.extension().string();
        if (const auto log_dir = get_env_optional("LOGS_DIR")) {
            config.logs_dir = std::filesystem::path(*log_dir);
            config.log_filename = (std::filesystem::path(*log_dir) / stamped).string();
        } else {
            config.log_filename = stamped;
        }
    }
    config.log_name = get_env_str("LOG_NAME", "voicelive_bridge");

    return config;
}

void Config::validate() const {
    if (voice_live_endpoint.empty()) {
        throw std::runtime_error("VOICE_LIVE_ENDPOINT is required");
    }
    if (!voice_live_api_key && !voice_live_bearer_token) {
        throw std::runtime_error(
            "VOICE_LIVE_API_KEY or VOICE_LIVE_BEARER_TOKEN is required");
    }
    if (backend_url.empty()) {
        throw std::runtime_error("BACKEND_URL is required");
    }
    if (audio_sample_rate != 8000 && audio_sample_rate != 16000 &&
        audio_sample_rate != 24000) {
        throw std::runtime_error("AUDIO_SAMPLE_RATE must be 8000, 16000 or 24000");
    }
    if (ai_send_buffer_frames <= 0 || transport_send_buffer_frames <= 0) {
        throw std::runtime_error("send buffer sizes must be positive");
    }
    if (event_buffer_size <= 0) {
        throw std::runtime_error("EVENT_BUFFER_SIZE must be positive");
    }
    if (tool_timeout_ms <= 0) {
        throw std::runtime_error("TOOL_TIMEOUT_MS must be positive");
    }
    if (tool_max_inflight <= 0) {
        throw std::runtime_error("TOOL_MAX_INFLIGHT must be positive");
    }
    if (close_grace_ms < 0) {
        throw std::runtime_error("CLOSE_GRACE_MS must be zero or positive");
    }
    if (ai_connect_timeout_ms <= 0) {
        throw std::runtime_error("AI_CONNECT_TIMEOUT_MS must be positive");
    }
    if (audio_metadata_timeout_ms < 0) {
        throw std::runtime_error("AUDIO_METADATA_TIMEOUT_MS must be zero or positive");
    }
    if (pending_call_ttl_ms <= 0) {
        throw std::runtime_error("PENDING_CALL_TTL_MS must be positive");
    }
    if (media_port <= 0 || webhook_port <= 0) {
        throw std::runtime_error("MEDIA_PORT and WEBHOOK_PORT must be positive");
    }
    if (media_port == webhook_port) {
        throw std::runtime_error("MEDIA_PORT and WEBHOOK_PORT must differ");
    }
    if (vad_threshold < 0.0 || vad_threshold > 1.0) {
        throw std::runtime_error("VAD_THRESHOLD must be within [0, 1]");
    }
}

}
