#pragma once

#include <chrono>
#include <httplib.h>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace voicelive_bridge {
namespace backend {

class BackendError : public std::runtime_error {
public:
    explicit BackendError(const std::string& message) : std::runtime_error(message) {}
};

class BackendPermissionError : public BackendError {
public:
    explicit BackendPermissionError(const std::string& message) : BackendError(message) {}
};

class BackendNotFoundError : public BackendError {
public:
    explicit BackendNotFoundError(const std::string& message) : BackendError(message) {}
};

struct BackendRequestOptions {
    std::chrono::milliseconds request_timeout{10000};
    std::chrono::milliseconds connect_timeout{5000};
    std::chrono::milliseconds sock_read_timeout{10000};
};

// Thread safe: every request uses its own httplib client.
class BackendClient {
public:
    BackendClient(std::string base_url,
                  std::optional<std::string> authorization_token,
                  BackendRequestOptions options);

    nlohmann::json get_json(const std::string& path) const;
    nlohmann::json post_json(const std::string& path, const nlohmann::json& body) const;

    const std::string& base_url() const { return base_url_; }

private:
    std::string build_path(const std::string& path) const;
    httplib::Headers headers(bool with_body) const;
    nlohmann::json handle_response(const httplib::Result& response,
                                   const std::string& method,
                                   const std::string& path) const;

    template <typename T>
    void apply_timeouts(T& client) const {
        const auto set = [](auto setter, std::chrono::milliseconds value) {
            const auto sec = std::chrono::duration_cast<std::chrono::seconds>(value);
            const auto usec =
                std::chrono::duration_cast<std::chrono::microseconds>(value - sec);
            setter(static_cast<time_t>(sec.count()), static_cast<time_t>(usec.count()));
        };
        set([&client](time_t s, time_t us) { client.set_connection_timeout(s, us); },
            options_.connect_timeout);
        set([&client](time_t s, time_t us) { client.set_read_timeout(s, us); },
            options_.sock_read_timeout);
        set([&client](time_t s, time_t us) { client.set_write_timeout(s, us); },
            options_.request_timeout);
    }

    template <typename Fn>
    httplib::Result with_client(Fn&& fn) const;

    std::string base_url_;
    std::string scheme_;
    std::string host_;
    int port_ = 80;
    std::string base_path_;
    std::optional<std::string> authorization_token_;
    BackendRequestOptions options_;
};

BackendRequestOptions make_request_options(double request_timeout_sec,
                                           double connect_timeout_sec,
                                           double sock_read_timeout_sec);

}
}
