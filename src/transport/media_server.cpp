#include "voicelive_bridge/transport/media_server.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "voicelive_bridge/errors.hpp"
#include "voicelive_bridge/logging.hpp"
#include "voicelive_bridge/utils/http.hpp"

namespace voicelive_bridge {
namespace transport {

namespace {

using WsServer = websocketpp::server<websocketpp::config::asio>;

class WsMediaSocket : public MediaSocket {
public:
    WsMediaSocket(WsServer& server, websocketpp::connection_hdl hdl)
        : server_(server), hdl_(std::move(hdl)) {}

    void send_text(const std::string& payload) override {
        send(payload, websocketpp::frame::opcode::text);
    }

    void send_binary(const std::string& payload) override {
        send(payload, websocketpp::frame::opcode::binary);
    }

    void close(const std::string& reason) override {
        if (closed_.exchange(true)) {
            return;
        }
        websocketpp::lib::error_code ec;
        server_.close(hdl_, websocketpp::close::status::normal, reason, ec);
        if (ec) {
            debug("Media socket close skipped", {kv("error", ec.message())});
        }
    }

private:
    void send(const std::string& payload, websocketpp::frame::opcode::value opcode) {
        if (closed_) {
            throw TransportError("media socket is closed");
        }
        websocketpp::lib::error_code ec;
        server_.send(hdl_, payload, opcode, ec);
        if (ec) {
            throw TransportError("media send failed: " + ec.message());
        }
    }

    WsServer& server_;
    websocketpp::connection_hdl hdl_;
    std::atomic<bool> closed_{false};
};

}

struct MediaServer::State {
    WsServer server;
    std::thread worker;
    std::mutex mutex;
    std::map<websocketpp::connection_hdl,
             std::shared_ptr<TransportSession>,
             std::owner_less<websocketpp::connection_hdl>> sessions;
    uint16_t port = 0;
    bool running = false;

    std::shared_ptr<TransportSession> take(websocketpp::connection_hdl hdl) {
        std::lock_guard<std::mutex> lock(mutex);
        const auto it = sessions.find(hdl);
        if (it == sessions.end()) {
            return nullptr;
        }
        auto session = it->second;
        sessions.erase(it);
        return session;
    }

    std::shared_ptr<TransportSession> find(websocketpp::connection_hdl hdl) {
        std::lock_guard<std::mutex> lock(mutex);
        const auto it = sessions.find(hdl);
        return it == sessions.end() ? nullptr : it->second;
    }
};

bool parse_media_resource(const std::string& resource, MediaConnection& connection) {
    const auto question = resource.find('?');
    const auto path = resource.substr(0, question);
    if (path == "/acs/ws") {
        connection.kind = TransportKind::Telephony;
    } else if (path == "/web/ws") {
        connection.kind = TransportKind::Browser;
    } else {
        return false;
    }
    if (question != std::string::npos) {
        const auto params = utils::parse_query(resource.substr(question + 1));
        const auto call_id = params.find("call_id");
        if (call_id != params.end()) {
            connection.call_id = call_id->second;
        }
        const auto correlation = params.find("correlation_id");
        if (correlation != params.end()) {
            connection.correlation_id = correlation->second;
        }
    }
    return true;
}

MediaServer::MediaServer(int port, ConnectHandler on_connect)
    : port_(port), on_connect_(std::move(on_connect)), state_(std::make_unique<State>()) {}

MediaServer::~MediaServer() {
    stop();
}

void MediaServer::start() {
    auto& server = state_->server;
    server.clear_access_channels(websocketpp::log::alevel::all);
    server.clear_error_channels(websocketpp::log::elevel::all);
    server.init_asio();
    server.set_reuse_addr(true);

    server.set_validate_handler([this](websocketpp::connection_hdl hdl) {
        auto con = state_->server.get_con_from_hdl(hdl);
        MediaConnection connection;
        if (!parse_media_resource(con->get_resource(), connection)) {
            warn("Media socket rejected, unknown path", {kv("resource", con->get_resource())});
            con->set_status(websocketpp::http::status_code::not_found);
            return false;
        }
        return true;
    });

    server.set_open_handler([this](websocketpp::connection_hdl hdl) {
        auto con = state_->server.get_con_from_hdl(hdl);
        MediaConnection connection;
        parse_media_resource(con->get_resource(), connection);
        connection.socket = std::make_shared<WsMediaSocket>(state_->server, hdl);

        std::shared_ptr<TransportSession> session;
        try {
            session = on_connect_(connection);
        } catch (const std::exception& ex) {
            error("Media connection setup failed",
                  {kv("call_id", connection.call_id), kv("error", ex.what())});
        }
        if (!session) {
            websocketpp::lib::error_code ec;
            state_->server.close(hdl, websocketpp::close::status::policy_violation,
                                 "call rejected", ec);
            return;
        }
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->sessions[hdl] = session;
        }
        info("Media socket opened",
             {kv("call_id", connection.call_id), kv("kind", to_string(connection.kind))});
    });

    server.set_message_handler([this](websocketpp::connection_hdl hdl, WsServer::message_ptr msg) {
        auto session = state_->find(hdl);
        if (!session) {
            return;
        }
        const bool binary = msg->get_opcode() == websocketpp::frame::opcode::binary;
        session->on_message(msg->get_payload(), binary);
    });

    server.set_close_handler([this](websocketpp::connection_hdl hdl) {
        auto session = state_->take(hdl);
        if (!session) {
            return;
        }
        auto con = state_->server.get_con_from_hdl(hdl);
        const auto code = con->get_remote_close_code();
        auto reason = con->get_remote_close_reason();
        if (reason.empty()) {
            reason = websocketpp::close::status::get_string(code);
        }
        const bool clean = code == websocketpp::close::status::normal ||
                           code == websocketpp::close::status::going_away;
        session->on_disconnect(clean, reason);
    });

    server.set_fail_handler([this](websocketpp::connection_hdl hdl) {
        auto session = state_->take(hdl);
        if (!session) {
            return;
        }
        auto con = state_->server.get_con_from_hdl(hdl);
        session->on_disconnect(false, con->get_ec().message());
    });

    websocketpp::lib::error_code ec;
    server.listen(static_cast<uint16_t>(port_), ec);
    if (ec) {
        throw TransportError("media server listen failed: " + ec.message());
    }
    websocketpp::lib::asio::error_code endpoint_ec;
    const auto endpoint = server.get_local_endpoint(endpoint_ec);
    state_->port = endpoint_ec ? static_cast<uint16_t>(port_) : endpoint.port();
    server.start_accept(ec);
    if (ec) {
        throw TransportError("media server accept failed: " + ec.message());
    }
    state_->running = true;
    state_->worker = std::thread([this]() {
        info("Media server listening", {kv("port", state_->port)});
        try {
            state_->server.run();
        } catch (const std::exception& ex) {
            error("Media server loop failed", {kv("error", ex.what())});
        }
    });
}

void MediaServer::stop() {
    if (!state_->running) {
        return;
    }
    state_->running = false;
    websocketpp::lib::error_code ec;
    state_->server.stop_listening(ec);

    std::vector<std::shared_ptr<TransportSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        for (auto& item : state_->sessions) {
            sessions.push_back(item.second);
        }
        state_->sessions.clear();
    }
    for (auto& session : sessions) {
        session->hangup("server_shutdown");
    }
    state_->server.stop();
    if (state_->worker.joinable()) {
        state_->worker.join();
    }
    info("Media server stopped");
}

uint16_t MediaServer::port() const {
    return state_->port;
}

}
}
