#include "voicelive_bridge/realtime/connection.hpp"

#include <atomic>
#include <future>
#include <mutex>
#include <thread>

#include <websocketpp/client.hpp>
#include <websocketpp/config/asio_client.hpp>

#include "voicelive_bridge/errors.hpp"
#include "voicelive_bridge/logging.hpp"

namespace voicelive_bridge {
namespace realtime {

struct WsAiConnection::Impl {
    virtual ~Impl() = default;

    virtual void open(const std::string& url,
                      const std::map<std::string, std::string>& headers,
                      std::chrono::milliseconds timeout,
                      MessageHandler on_message,
                      CloseHandler on_close) = 0;
    virtual void send(const std::string& payload) = 0;
    virtual void close(std::chrono::milliseconds grace) = 0;
};

namespace {

using PlainClient = websocketpp::client<websocketpp::config::asio_client>;
using TlsClient = websocketpp::client<websocketpp::config::asio_tls_client>;
using SslContext = websocketpp::lib::asio::ssl::context;

void configure(PlainClient&) {}

void configure(TlsClient& client) {
    client.set_tls_init_handler([](websocketpp::connection_hdl) {
        auto context = websocketpp::lib::make_shared<SslContext>(SslContext::tls_client);
        context->set_options(SslContext::default_workarounds | SslContext::no_sslv2 |
                             SslContext::no_sslv3 | SslContext::single_dh_use);
        context->set_default_verify_paths();
        context->set_verify_mode(websocketpp::lib::asio::ssl::verify_peer);
        return context;
    });
}

template <typename Client>
class ClientImpl : public WsAiConnection::Impl {
public:
    ~ClientImpl() override {
        close(std::chrono::milliseconds(0));
    }

    void open(const std::string& url,
              const std::map<std::string, std::string>& headers,
              std::chrono::milliseconds timeout,
              AiConnection::MessageHandler on_message,
              AiConnection::CloseHandler on_close) override {
        on_message_ = std::move(on_message);
        on_close_ = std::move(on_close);

        client_.clear_access_channels(websocketpp::log::alevel::all);
        client_.clear_error_channels(websocketpp::log::elevel::all);
        client_.init_asio();
        configure(client_);

        auto ready = std::make_shared<std::promise<void>>();
        auto settled = std::make_shared<std::atomic<bool>>(false);
        auto ready_future = ready->get_future();
        stopped_future_ = stopped_.get_future();

        client_.set_open_handler([this, ready, settled](websocketpp::connection_hdl) {
            opened_ = true;
            if (!settled->exchange(true)) {
                ready->set_value();
            }
        });
        client_.set_fail_handler([this, ready, settled](websocketpp::connection_hdl hdl) {
            std::string reason = "connection failed";
            websocketpp::lib::error_code ec;
            auto con = client_.get_con_from_hdl(hdl, ec);
            if (!ec && con) {
                reason = con->get_ec().message();
                const auto status = con->get_response_code();
                if (status != websocketpp::http::status_code::uninitialized) {
                    reason += " (HTTP " + std::to_string(static_cast<int>(status)) + ")";
                }
            }
            if (!settled->exchange(true)) {
                ready->set_exception(
                    std::make_exception_ptr(SessionSetupError("realtime handshake failed: " +
                                                              reason)));
            }
        });
        client_.set_message_handler(
            [this](websocketpp::connection_hdl, typename Client::message_ptr message) {
                if (on_message_) {
                    on_message_(message->get_payload());
                }
            });
        client_.set_close_handler([this](websocketpp::connection_hdl hdl) {
            bool clean = closing_.load();
            std::string reason;
            websocketpp::lib::error_code ec;
            auto con = client_.get_con_from_hdl(hdl, ec);
            if (!ec && con) {
                const auto code = con->get_remote_close_code();
                reason = con->get_remote_close_reason();
                if (code == websocketpp::close::status::normal) {
                    clean = true;
                }
                if (reason.empty()) {
                    reason = websocketpp::close::status::get_string(code);
                }
            }
            if (on_close_) {
                on_close_(clean, reason);
            }
        });

        websocketpp::lib::error_code ec;
        auto con = client_.get_connection(url, ec);
        if (ec) {
            throw SessionSetupError("invalid realtime url: " + ec.message());
        }
        for (const auto& header : headers) {
            con->append_header(header.first, header.second);
        }
        hdl_ = con->get_handle();
        client_.connect(con);
        worker_ = std::thread([this]() { run(); });

        if (ready_future.wait_for(timeout) != std::future_status::ready) {
            settled->store(true);
            close(std::chrono::milliseconds(0));
            throw SessionSetupError("realtime handshake timed out after " +
                                    std::to_string(timeout.count()) + " ms");
        }
        try {
            ready_future.get();
        } catch (const SessionSetupError&) {
            close(std::chrono::milliseconds(0));
            throw;
        }
    }

    void send(const std::string& payload) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!opened_ || closed_) {
            throw TransportError("realtime connection is not open");
        }
        websocketpp::lib::error_code ec;
        client_.send(hdl_, payload, websocketpp::frame::opcode::text, ec);
        if (ec) {
            throw TransportError("realtime send failed: " + ec.message());
        }
    }

    void close(std::chrono::milliseconds grace) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return;
            }
            closed_ = true;
        }
        closing_ = true;
        if (!worker_.joinable()) {
            return;
        }

        bool stopped = false;
        if (opened_) {
            websocketpp::lib::error_code ec;
            client_.close(hdl_, websocketpp::close::status::normal, "call ended", ec);
            if (!ec) {
                stopped = stopped_future_.wait_for(grace) == std::future_status::ready;
            }
        }
        if (!stopped) {
            client_.stop();
        }
        if (worker_.get_id() == std::this_thread::get_id()) {
            worker_.detach();
        } else {
            worker_.join();
        }
    }

private:
    void run() {
        try {
            client_.run();
        } catch (const std::exception& ex) {
            error("Realtime connection loop failed", {kv("error", ex.what())});
        }
        stopped_.set_value();
    }

    Client client_;
    websocketpp::connection_hdl hdl_;
    AiConnection::MessageHandler on_message_;
    AiConnection::CloseHandler on_close_;
    std::thread worker_;
    std::promise<void> stopped_;
    std::future<void> stopped_future_;
    std::mutex mutex_;
    bool closed_ = false;
    std::atomic<bool> opened_{false};
    std::atomic<bool> closing_{false};
};

}

WsAiConnection::WsAiConnection() = default;

WsAiConnection::~WsAiConnection() = default;

void WsAiConnection::open(const std::string& url,
                          const std::map<std::string, std::string>& headers,
                          std::chrono::milliseconds timeout,
                          MessageHandler on_message,
                          CloseHandler on_close) {
    if (impl_) {
        throw SessionSetupError("realtime connection already opened");
    }
    if (url.rfind("wss://", 0) == 0) {
        impl_ = std::make_unique<ClientImpl<TlsClient>>();
    } else {
        impl_ = std::make_unique<ClientImpl<PlainClient>>();
    }
    impl_->open(url, headers, timeout, std::move(on_message), std::move(on_close));
}

void WsAiConnection::send(const std::string& payload) {
    if (!impl_) {
        throw TransportError("realtime connection is not open");
    }
    impl_->send(payload);
}

void WsAiConnection::close(std::chrono::milliseconds grace) {
    if (impl_) {
        impl_->close(grace);
    }
}

}
}
