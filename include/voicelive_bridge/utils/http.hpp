#pragma once

#include <map>
#include <string>

namespace voicelive_bridge::utils {

void parse_url(const std::string& url, std::string& scheme, std::string& host,
               int& port, std::string& base_path);

std::string build_url(const std::string& scheme,
                      const std::string& host,
                      int port,
                      const std::string& path);

std::string url_encode(const std::string& value);
std::string url_decode(const std::string& value);

// Splits "a=1&b=two" (an optional leading '?' is ignored) into decoded pairs.
std::map<std::string, std::string> parse_query(const std::string& query);

// http(s):// becomes ws(s)://, ws(s):// is kept, anything else gets wss://.
std::string to_websocket_url(const std::string& url);

}
