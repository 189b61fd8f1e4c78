#include "voicelive_bridge/server/webhook_server.hpp"

#include <chrono>
#include <stdexcept>

#include "voicelive_bridge/logging.hpp"
#include "voicelive_bridge/metrics.hpp"

namespace voicelive_bridge {

WebhookServer::WebhookServer(int port,
                             std::optional<std::string> authorization_token,
                             WebhookHandlers handlers)
    : port_(port),
      authorization_token_(std::move(authorization_token)),
      handlers_(std::move(handlers)) {}

WebhookServer::~WebhookServer() {
    stop();
}

void WebhookServer::start() {
    server_ = std::make_unique<httplib::Server>();

    server_->Get("/health", [](const httplib::Request&, httplib::Response& res) {
        nlohmann::json payload{{"status", "ok"},
                               {"active_calls", Metrics::instance().active_calls()}};
        res.set_content(payload.dump(), "application/json");
        logging::debug("Health check served");
    });

    server_->Get("/metrics", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(Metrics::instance().render_prometheus(),
                        "text/plain; version=0.0.4");
    });

    server_->Post("/calls/incoming", [this](const httplib::Request& req, httplib::Response& res) {
        Metrics::instance().increment_webhook_request();
        if (!authorize_request(req, res)) {
            return;
        }
        nlohmann::json body;
        if (!parse_body(req, res, body)) {
            return;
        }
        try {
            write_json(res, handlers_.on_incoming_call(body));
        } catch (const std::invalid_argument& ex) {
            logging::warn("Rejected incoming call", {kv("error", ex.what())});
            write_json(res, WebhookResponse{400, nlohmann::json{{"message", ex.what()}}});
        } catch (const std::exception& ex) {
            logging::error("Failed to handle incoming call", {kv("error", ex.what())});
            res.status = 500;
            res.set_content(R"({"message":"failed to accept call"})", "application/json");
        }
    });

    server_->Post(R"(/callbacks/([A-Za-z0-9_.:-]+))",
                  [this](const httplib::Request& req, httplib::Response& res) {
        Metrics::instance().increment_webhook_request();
        if (!authorize_request(req, res)) {
            return;
        }
        const auto correlation_id = req.matches[1].str();
        nlohmann::json body;
        if (!parse_body(req, res, body)) {
            return;
        }
        try {
            write_json(res, handlers_.on_callback(correlation_id, body));
        } catch (const std::exception& ex) {
            logging::error("Failed to handle callback",
                           {kv("correlation_id", correlation_id), kv("error", ex.what())});
            res.status = 500;
            res.set_content(R"({"message":"callback failed"})", "application/json");
        }
    });

    server_->Post(R"(/calls/([A-Za-z0-9_.:-]+)/events)",
                  [this](const httplib::Request& req, httplib::Response& res) {
        Metrics::instance().increment_webhook_request();
        if (!authorize_request(req, res)) {
            return;
        }
        const auto call_id = req.matches[1].str();
        nlohmann::json body;
        if (!parse_body(req, res, body)) {
            return;
        }
        try {
            write_json(res, handlers_.on_call_event(call_id, body));
        } catch (const std::invalid_argument& ex) {
            write_json(res, WebhookResponse{400, nlohmann::json{{"message", ex.what()}}});
        } catch (const std::exception& ex) {
            logging::error("Failed to handle call event",
                           {kv("call_id", call_id), kv("error", ex.what())});
            res.status = 500;
            res.set_content(R"({"message":"event failed"})", "application/json");
        }
    });

    if (port_ == 0) {
        bound_port_ = server_->bind_to_any_port("0.0.0.0");
    } else if (server_->bind_to_port("0.0.0.0", port_)) {
        bound_port_ = port_;
    }
    if (bound_port_ <= 0) {
        throw std::runtime_error("webhook server failed to bind port " + std::to_string(port_));
    }

    server_thread_ = std::thread([this]() {
        logging::info("Webhook server listening", {kv("port", bound_port_)});
        server_->listen_after_bind();
    });
    // stop() is a no-op until the accept loop runs.
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (!server_->is_running() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
}

void WebhookServer::stop() {
    if (server_) {
        server_->stop();
    }
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

bool WebhookServer::authorize_request(const httplib::Request& request,
                                      httplib::Response& response) const {
    if (!authorization_token_) {
        return true;
    }
    const auto it = request.headers.find("Authorization");
    if (it == request.headers.end()) {
        response.status = 401;
        response.set_content(R"({"message":"missing authorization"})", "application/json");
        return false;
    }
    const auto expected = "Bearer " + *authorization_token_;
    if (it->second != expected) {
        response.status = 403;
        response.set_content(R"({"message":"invalid authorization"})", "application/json");
        return false;
    }
    return true;
}

bool WebhookServer::parse_body(const httplib::Request& request,
                               httplib::Response& response,
                               nlohmann::json& body) const {
    if (request.body.empty()) {
        body = nlohmann::json::object();
        return true;
    }
    try {
        body = nlohmann::json::parse(request.body);
    } catch (const std::exception& ex) {
        logging::error("Failed to parse webhook body",
                       {kv("path", request.path), kv("error", ex.what())});
        response.status = 400;
        response.set_content(R"({"message":"invalid request body"})", "application/json");
        return false;
    }
    return true;
}

void WebhookServer::write_json(httplib::Response& response, const WebhookResponse& payload) const {
    response.status = payload.status;
    response.set_content(payload.body.dump(), "application/json");
}

}
