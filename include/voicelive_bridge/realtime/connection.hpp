#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace voicelive_bridge {
namespace realtime {

// Text message socket to the realtime endpoint.
class AiConnection {
public:
    using MessageHandler = std::function<void(const std::string& payload)>;
    // `clean` is false when the peer or the network ended the connection unexpectedly.
    using CloseHandler = std::function<void(bool clean, const std::string& reason)>;

    virtual ~AiConnection() = default;

    // Blocks until the handshake completes. Throws SessionSetupError on failure or timeout.
    // Handlers run on the connection's own thread.
    virtual void open(const std::string& url,
                      const std::map<std::string, std::string>& headers,
                      std::chrono::milliseconds timeout,
                      MessageHandler on_message,
                      CloseHandler on_close) = 0;
    // Throws TransportError when the message cannot be written.
    virtual void send(const std::string& payload) = 0;
    // Idempotent. Returns once the connection is released or the grace period ran out.
    virtual void close(std::chrono::milliseconds grace) = 0;
};

// websocketpp client over asio; wss:// urls use TLS.
class WsAiConnection : public AiConnection {
public:
    WsAiConnection();
    ~WsAiConnection() override;

    void open(const std::string& url,
              const std::map<std::string, std::string>& headers,
              std::chrono::milliseconds timeout,
              MessageHandler on_message,
              CloseHandler on_close) override;
    void send(const std::string& payload) override;
    void close(std::chrono::milliseconds grace) override;

    struct Impl;

private:
    std::unique_ptr<Impl> impl_;
};

}
}
