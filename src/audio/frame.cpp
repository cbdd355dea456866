#include "realtime_bridge/audio/frame.hpp"

#include <stdexcept>

#include "realtime_bridge/config.hpp"

namespace realtime_bridge::audio {

Encoding parse_encoding(const std::string& name) {
    if (name == "mulaw") {
        return Encoding::Mulaw;
    }
    if (name == "pcm16") {
        return Encoding::Pcm16;
    }
    throw std::runtime_error("unsupported audio encoding: " + name);
}

const char* encoding_name(Encoding encoding) {
    switch (encoding) {
        case Encoding::Mulaw:
            return "mulaw";
        case Encoding::Pcm16:
            return "pcm16";
    }
    return "unknown";
}

size_t FrameFormat::samples_per_frame() const {
    return static_cast<size_t>(sample_rate) *
           static_cast<size_t>(frame_duration.count()) / 1000;
}

size_t FrameFormat::bytes_per_sample() const {
    return encoding == Encoding::Pcm16 ? 2 : 1;
}

size_t FrameFormat::frame_bytes() const {
    return samples_per_frame() * bytes_per_sample();
}

FrameFormat FrameFormat::from_config(const Config& config) {
    FrameFormat format;
    format.encoding = parse_encoding(config.audio_encoding);
    format.sample_rate = config.audio_sample_rate;
    format.frame_duration = std::chrono::milliseconds(config.frame_ms);
    return format;
}

}
