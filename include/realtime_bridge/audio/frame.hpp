#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace realtime_bridge {

struct Config;

namespace audio {

enum class Encoding {
    Mulaw,
    Pcm16
};

Encoding parse_encoding(const std::string& name);
const char* encoding_name(Encoding encoding);

struct FrameFormat {
    Encoding encoding = Encoding::Mulaw;
    int sample_rate = 8000;
    std::chrono::milliseconds frame_duration{20};

    size_t samples_per_frame() const;
    size_t bytes_per_sample() const;
    size_t frame_bytes() const;

    static FrameFormat from_config(const Config& config);
};

// One fixed-duration unit of outbound audio. Sequence numbers are assigned by
// the framer and are strictly increasing for the lifetime of a session.
struct AudioFrame {
    uint64_t seq = 0;
    std::string turn_id;
    std::vector<uint8_t> payload;
};

}
}
