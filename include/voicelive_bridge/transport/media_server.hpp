#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "voicelive_bridge/transport/media_socket.hpp"
#include "voicelive_bridge/transport/transport_session.hpp"

namespace voicelive_bridge {
namespace transport {

// What a client asked for when it opened a media socket.
struct MediaConnection {
    TransportKind kind = TransportKind::Telephony;
    std::string call_id;
    std::string correlation_id;
    std::shared_ptr<MediaSocket> socket;
};

// WebSocket endpoint for caller audio. Telephony clients connect to /acs/ws,
// browsers to /web/ws, both with call_id and correlation_id query parameters.
class MediaServer {
public:
    // Returns the session fed by the socket, or nullptr to reject the connection.
    using ConnectHandler =
        std::function<std::shared_ptr<TransportSession>(const MediaConnection&)>;

    MediaServer(int port, ConnectHandler on_connect);
    ~MediaServer();

    MediaServer(const MediaServer&) = delete;
    MediaServer& operator=(const MediaServer&) = delete;

    // Binds synchronously; port 0 picks a free port.
    void start();
    void stop();
    uint16_t port() const;

    struct State;

private:
    int port_;
    ConnectHandler on_connect_;
    std::unique_ptr<State> state_;
};

// "/acs/ws?call_id=..." -> kind and identifiers. False for unknown paths.
bool parse_media_resource(const std::string& resource, MediaConnection& connection);

}
}
