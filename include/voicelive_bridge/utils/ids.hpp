#pragma once

#include <string>

namespace voicelive_bridge::utils {

// Random RFC 4122 version 4 identifier, lower-case hex.
std::string make_uuid();

}
