#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

namespace voicelive_bridge {

struct WebhookResponse {
    int status = 200;
    nlohmann::json body;
};

struct WebhookHandlers {
    std::function<WebhookResponse(const nlohmann::json&)> on_incoming_call;
    std::function<WebhookResponse(const std::string&, const nlohmann::json&)> on_callback;
    std::function<WebhookResponse(const std::string&, const nlohmann::json&)> on_call_event;
};

// HTTP front door of the call automation service plus health and metrics.
class WebhookServer {
public:
    WebhookServer(int port,
                  std::optional<std::string> authorization_token,
                  WebhookHandlers handlers);
    ~WebhookServer();

    WebhookServer(const WebhookServer&) = delete;
    WebhookServer& operator=(const WebhookServer&) = delete;

    // Binds synchronously, serves on a background thread. Port 0 picks a free port.
    void start();
    void stop();
    int port() const { return bound_port_; }

private:
    bool authorize_request(const httplib::Request& request, httplib::Response& response) const;
    void write_json(httplib::Response& response, const WebhookResponse& payload) const;
    bool parse_body(const httplib::Request& request,
                    httplib::Response& response,
                    nlohmann::json& body) const;

    int port_;
    int bound_port_ = 0;
    std::optional<std::string> authorization_token_;
    WebhookHandlers handlers_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
};

}
