#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

#include "voicelive_bridge/backend/client.hpp"
#include "voicelive_bridge/backend/directory.hpp"
#include "voicelive_bridge/backend/notifier.hpp"
#include "voicelive_bridge/bridge/call_registry.hpp"
#include "voicelive_bridge/bridge/pending_calls.hpp"
#include "voicelive_bridge/config.hpp"
#include "voicelive_bridge/realtime/session_config.hpp"
#include "voicelive_bridge/server/webhook_server.hpp"
#include "voicelive_bridge/tools/registry.hpp"
#include "voicelive_bridge/transport/media_server.hpp"

namespace voicelive_bridge {

class BridgeApp {
public:
    explicit BridgeApp(Config config);
    ~BridgeApp();

    void init();
    // Blocks until stop() or a termination signal.
    void run();
    void stop();

    const Config& config() const { return config_; }
    const std::shared_ptr<bridge::CallRegistry>& registry() const { return registry_; }

    WebhookResponse handle_incoming_call(const nlohmann::json& body);
    WebhookResponse handle_callback(const std::string& correlation_id, const nlohmann::json& body);
    WebhookResponse handle_call_event(const std::string& call_id, const nlohmann::json& body);
    // Builds the call behind a freshly opened media socket; nullptr rejects it.
    std::shared_ptr<transport::TransportSession> handle_media_connection(
        const transport::MediaConnection& connection);

private:
    std::string media_url(const std::string& call_id, const std::string& correlation_id) const;

    Config config_;
    std::shared_ptr<backend::BackendClient> backend_client_;
    std::shared_ptr<backend::BackendClient> notification_client_;
    tools::ToolContext tool_context_;
    std::shared_ptr<const tools::ToolRegistry> tool_registry_;
    realtime::SessionConfiguration session_configuration_;
    realtime::ConnectionSettings connection_settings_;
    std::shared_ptr<bridge::CallRegistry> registry_;

    bridge::PendingCalls pending_calls_;

    std::unique_ptr<WebhookServer> webhook_server_;
    std::unique_ptr<transport::MediaServer> media_server_;
    std::atomic<bool> quitting_{false};
    std::mutex stop_mutex_;
    bool stopped_ = false;
};

// SIGINT and SIGTERM make run() return.
void install_signal_handlers();

}
