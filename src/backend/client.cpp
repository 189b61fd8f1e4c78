#include "voicelive_bridge/backend/client.hpp"

#include <cmath>
#include <utility>

#include "voicelive_bridge/utils/http.hpp"

namespace voicelive_bridge {
namespace backend {

namespace {

std::chrono::milliseconds to_millis(double seconds) {
    return std::chrono::milliseconds(static_cast<int64_t>(std::llround(seconds * 1000.0)));
}

}

BackendRequestOptions make_request_options(double request_timeout_sec,
                                           double connect_timeout_sec,
                                           double sock_read_timeout_sec) {
    BackendRequestOptions options;
    options.request_timeout = to_millis(request_timeout_sec);
    options.connect_timeout = to_millis(connect_timeout_sec);
    options.sock_read_timeout = to_millis(sock_read_timeout_sec);
    return options;
}

BackendClient::BackendClient(std::string base_url,
                             std::optional<std::string> authorization_token,
                             BackendRequestOptions options)
    : base_url_(std::move(base_url)),
      authorization_token_(std::move(authorization_token)),
      options_(options) {
    utils::parse_url(base_url_, scheme_, host_, port_, base_path_);
    if (host_.empty()) {
        throw BackendError("Invalid backend url: " + base_url_);
    }
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
    if (scheme_ == "https") {
        throw BackendError("HTTPS backend requires CPPHTTPLIB_OPENSSL_SUPPORT");
    }
#endif
}

template <typename Fn>
httplib::Result BackendClient::with_client(Fn&& fn) const {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    if (scheme_ == "https") {
        httplib::SSLClient client(host_, port_);
        client.enable_server_certificate_verification(false);
        apply_timeouts(client);
        return fn(client);
    }
#endif
    httplib::Client client(host_, port_);
    apply_timeouts(client);
    return fn(client);
}

nlohmann::json BackendClient::get_json(const std::string& path) const {
    const auto full_path = build_path(path);
    const auto request_headers = headers(false);
    auto response = with_client([&](auto& client) {
        return client.Get(full_path.c_str(), request_headers);
    });
    return handle_response(response, "GET", full_path);
}

nlohmann::json BackendClient::post_json(const std::string& path,
                                        const nlohmann::json& body) const {
    const auto full_path = build_path(path);
    const auto request_headers = headers(true);
    const auto payload = body.dump();
    auto response = with_client([&](auto& client) {
        return client.Post(full_path.c_str(), request_headers, payload, "application/json");
    });
    return handle_response(response, "POST", full_path);
}

httplib::Headers BackendClient::headers(bool with_body) const {
    auto result = httplib::Headers{{"Accept", "application/json"}};
    if (with_body) {
        result.emplace("Content-Type", "application/json");
    }
    if (authorization_token_) {
        result.emplace("Authorization", "Bearer " + *authorization_token_);
    }
    return result;
}

nlohmann::json BackendClient::handle_response(const httplib::Result& response,
                                              const std::string& method,
                                              const std::string& path) const {
    if (!response) {
        throw BackendError("Backend request failed: " + method + " " + path + " (" +
                           httplib::to_string(response.error()) + ")");
    }
    if (response->status == 403 || response->status == 401) {
        throw BackendPermissionError(response->body);
    }
    if (response->status == 404) {
        throw BackendNotFoundError(method + " " + path + " not found");
    }
    if (response->status < 200 || response->status >= 300) {
        throw BackendError("Backend returned " + std::to_string(response->status) + " for " +
                           method + " " + path + ": " + response->body);
    }
    if (response->body.empty()) {
        return nlohmann::json::object();
    }
    try {
        return nlohmann::json::parse(response->body);
    } catch (const nlohmann::json::exception& ex) {
        throw BackendError("Backend returned invalid JSON for " + method + " " + path +
                           ": " + ex.what());
    }
}

std::string BackendClient::build_path(const std::string& path) const {
    if (base_path_.empty()) {
        return path;
    }
    if (path.empty()) {
        return base_path_;
    }
    if (base_path_.back() == '/' && path.front() == '/') {
        return base_path_ + path.substr(1);
    }
    if (base_path_.back() != '/' && path.front() != '/') {
        return base_path_ + "/" + path;
    }
    return base_path_ + path;
}

}
}
