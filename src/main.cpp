#include "voicelive_bridge/app.hpp"
#include "voicelive_bridge/config.hpp"
#include "voicelive_bridge/logging.hpp"

#include <string>

int main() {
    try {
        const auto config = voicelive_bridge::Config::load();
        config.validate();
        voicelive_bridge::logging::init(config);
        voicelive_bridge::info(
            "Starting voicelive-bridge",
            {voicelive_bridge::kv("endpoint", config.voice_live_endpoint),
             voicelive_bridge::kv("model", config.voice_live_model),
             voicelive_bridge::kv("backend_url", config.backend_url),
             voicelive_bridge::kv("webhook_port", config.webhook_port),
             voicelive_bridge::kv("media_port", config.media_port)});
        voicelive_bridge::install_signal_handlers();
        voicelive_bridge::BridgeApp app(config);
        app.init();
        app.run();
    } catch (const std::exception& ex) {
        voicelive_bridge::error(
            "Startup failed",
            {voicelive_bridge::kv("error", ex.what())});
        return 1;
    }
    return 0;
}
