#include "voicelive_bridge/utils/ids.hpp"

#include <cstdint>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>

namespace voicelive_bridge::utils {

std::string make_uuid() {
    static std::mutex mutex;
    static std::mt19937_64 engine{std::random_device{}()};
    uint64_t high = 0;
    uint64_t low = 0;
    {
        std::lock_guard<std::mutex> lock(mutex);
        high = engine();
        low = engine();
    }
    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream out;
    out << std::hex << std::setfill('0')
        << std::setw(8) << static_cast<uint32_t>(high >> 32) << '-'
        << std::setw(4) << static_cast<uint32_t>((high >> 16) & 0xFFFF) << '-'
        << std::setw(4) << static_cast<uint32_t>(high & 0xFFFF) << '-'
        << std::setw(4) << static_cast<uint32_t>(low >> 48) << '-'
        << std::setw(12) << (low & 0xFFFFFFFFFFFFULL);
    return out.str();
}

}
