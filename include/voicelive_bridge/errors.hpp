#pragma once

#include <stdexcept>
#include <string>

namespace voicelive_bridge {

class BridgeError : public std::runtime_error {
public:
    explicit BridgeError(const std::string& message) : std::runtime_error(message) {}
};

// Handshake, authentication or configuration failure of a session. Fatal for the call.
class SessionSetupError : public BridgeError {
public:
    explicit SessionSetupError(const std::string& message) : BridgeError(message) {}
};

// The two sides negotiated audio formats that cannot be relayed losslessly.
class UnsupportedFormat : public BridgeError {
public:
    explicit UnsupportedFormat(const std::string& message) : BridgeError(message) {}
};

class UnknownRequestId : public BridgeError {
public:
    explicit UnknownRequestId(const std::string& request_id)
        : BridgeError("unknown tool request id: " + request_id),
          request_id_(request_id) {}

    const std::string& request_id() const { return request_id_; }

private:
    std::string request_id_;
};

class DuplicateCallError : public BridgeError {
public:
    explicit DuplicateCallError(const std::string& call_id)
        : BridgeError("call already registered: " + call_id) {}
};

class TransportError : public BridgeError {
public:
    explicit TransportError(const std::string& message) : BridgeError(message) {}
};

}
