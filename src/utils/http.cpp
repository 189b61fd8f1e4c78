#include "voicelive_bridge/utils/http.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace voicelive_bridge::utils {

namespace {

int hex_value(char ch) {
    if (ch >= '0' && ch <= '9') return ch - '0';
    if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
    if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
    return -1;
}

}

void parse_url(const std::string& url, std::string& scheme, std::string& host,
               int& port, std::string& base_path) {
    std::string working = url;
    scheme = "http";
    base_path = "";
    host.clear();
    port = 0;

    const auto scheme_pos = working.find("://");
    if (scheme_pos != std::string::npos) {
        scheme = working.substr(0, scheme_pos);
        std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
        working = working.substr(scheme_pos + 3);
    }

    const auto path_pos = working.find('/');
    if (path_pos != std::string::npos) {
        base_path = working.substr(path_pos);
        working = working.substr(0, path_pos);
    } else {
        base_path = "/";
    }

    const bool secure = scheme == "https" || scheme == "wss";
    const auto port_pos = working.find(':');
    if (port_pos != std::string::npos) {
        host = working.substr(0, port_pos);
        port = std::stoi(working.substr(port_pos + 1));
    } else {
        host = working;
        port = secure ? 443 : 80;
    }
}

std::string build_url(const std::string& scheme,
                      const std::string& host,
                      int port,
                      const std::string& path) {
    std::ostringstream out;
    out << scheme << "://" << host;
    const bool secure = scheme == "https" || scheme == "wss";
    const bool default_port = (secure && port == 443) || (!secure && port == 80);
    if (!default_port && port > 0) {
        out << ":" << port;
    }
    if (!path.empty() && path.front() != '/') {
        out << '/';
    }
    out << path;
    return out.str();
}

std::string url_encode(const std::string& value) {
    std::ostringstream escaped;
    escaped << std::hex << std::uppercase;
    for (unsigned char ch : value) {
        if (std::isalnum(ch) || ch == '-' || ch == '_' || ch == '.' || ch == '~') {
            escaped << ch;
        } else {
            escaped << '%' << std::setw(2) << std::setfill('0')
                    << static_cast<int>(ch);
        }
    }
    return escaped.str();
}

std::string url_decode(const std::string& value) {
    std::string decoded;
    decoded.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        const char ch = value[i];
        if (ch == '+') {
            decoded.push_back(' ');
        } else if (ch == '%' && i + 2 < value.size() &&
                   hex_value(value[i + 1]) >= 0 && hex_value(value[i + 2]) >= 0) {
            decoded.push_back(static_cast<char>(hex_value(value[i + 1]) * 16 +
                                                hex_value(value[i + 2])));
            i += 2;
        } else {
            decoded.push_back(ch);
        }
    }
    return decoded;
}

std::map<std::string, std::string> parse_query(const std::string& query) {
    std::map<std::string, std::string> result;
    std::string working = query;
    if (!working.empty() && working.front() == '?') {
        working.erase(working.begin());
    }
    std::stringstream stream(working);
    std::string item;
    while (std::getline(stream, item, '&')) {
        if (item.empty()) {
            continue;
        }
        const auto eq_pos = item.find('=');
        if (eq_pos == std::string::npos) {
            result[url_decode(item)] = "";
        } else {
            result[url_decode(item.substr(0, eq_pos))] = url_decode(item.substr(eq_pos + 1));
        }
    }
    return result;
}

std::string to_websocket_url(const std::string& url) {
    if (url.rfind("https://", 0) == 0) {
        return "wss://" + url.substr(8);
    }
    if (url.rfind("http://", 0) == 0) {
        return "ws://" + url.substr(7);
    }
    if (url.rfind("wss://", 0) == 0 || url.rfind("ws://", 0) == 0) {
        return url;
    }
    return "wss://" + url;
}

}
