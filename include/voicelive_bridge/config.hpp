#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace voicelive_bridge {

struct Config {
    std::string voice_live_endpoint;
    std::optional<std::string> voice_live_api_key;
    std::optional<std::string> voice_live_bearer_token;
    std::string voice_live_model = "gpt-4o-mini";
    std::string voice_live_api_version = "2025-05-01-preview";
    std::string voice_name = "en-US-Ava:DragonHDLatestNeural";
    std::string voice_type = "azure-standard";
    double voice_temperature = 0.8;
    std::optional<std::filesystem::path> instructions_file;
    std::string vad_type = "azure_semantic_vad";
    double vad_threshold = 0.3;
    int vad_prefix_padding_ms = 200;
    int vad_silence_duration_ms = 200;
    int audio_sample_rate = 24000;
    int ai_send_buffer_frames = 256;
    int transport_send_buffer_frames = 512;
    int event_buffer_size = 1024;
    int tool_timeout_ms = 8000;
    int tool_max_inflight = 2;
    int close_grace_ms = 1500;
    int ai_connect_timeout_ms = 10000;
    int audio_metadata_timeout_ms = 2000;
    int pending_call_ttl_ms = 120000;
    int media_port = 8765;
    int webhook_port = 8000;
    std::string public_media_url = "ws://localhost:8765";
    std::string backend_url;
    std::string notification_url;
    std::string sender_email = "donotreply@example.com";
    std::optional<std::string> authorization_token;
    double backend_request_timeout = 10.0;
    double backend_connect_timeout = 5.0;
    double backend_sock_read_timeout = 10.0;
    std::string log_level = "INFO";
    std::optional<std::string> log_filename;
    std::optional<std::filesystem::path> logs_dir;
    std::string log_name = "voicelive_bridge";

    static Config load();
    void validate() const;
};

}
