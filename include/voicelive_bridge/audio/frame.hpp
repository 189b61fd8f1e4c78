#pragma once

#include <cstdint>
#include <string>

namespace voicelive_bridge {
namespace audio {

enum class Encoding {
    Pcm16
};

enum class FrameSource {
    Caller,
    Ai
};

struct AudioFormat {
    int sample_rate = 24000;
    int channels = 1;
    Encoding encoding = Encoding::Pcm16;

    int bytes_per_sample() const { return 2 * channels; }
    bool operator==(const AudioFormat& other) const {
        return sample_rate == other.sample_rate && channels == other.channels &&
               encoding == other.encoding;
    }
    bool operator!=(const AudioFormat& other) const { return !(*this == other); }
};

struct AudioFrame {
    FrameSource source = FrameSource::Caller;
    uint64_t sequence = 0;
    std::string pcm;
    // Only set for AI frames: realtime response and output item the audio belongs to.
    std::string response_id;
    std::string item_id;

    // Whole milliseconds of audio, rounded down.
    int duration_ms(const AudioFormat& format) const {
        const auto bytes_per_second =
            static_cast<int64_t>(format.sample_rate) * format.bytes_per_sample();
        if (bytes_per_second <= 0) {
            return 0;
        }
        return static_cast<int>(static_cast<int64_t>(pcm.size()) * 1000 / bytes_per_second);
    }
};

std::string to_string(Encoding encoding);
std::string to_string(FrameSource source);
std::string to_string(const AudioFormat& format);

}
}
