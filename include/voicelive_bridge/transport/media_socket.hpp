#pragma once

#include <string>

namespace voicelive_bridge {
namespace transport {

// Server side of one caller media socket.
class MediaSocket {
public:
    virtual ~MediaSocket() = default;

    // Both throw TransportError when the message cannot be written.
    virtual void send_text(const std::string& payload) = 0;
    virtual void send_binary(const std::string& payload) = 0;
    // Idempotent.
    virtual void close(const std::string& reason) = 0;
};

}
}
