#include "realtime_bridge/audio/samples.hpp"

#include <cmath>

namespace realtime_bridge::audio {

namespace {

constexpr int kMulawBias = 0x84;
constexpr int kMulawClip = 32635;

int16_t read_pcm16(const std::vector<uint8_t>& payload, size_t offset) {
    const auto raw = static_cast<uint16_t>(payload[offset] |
                                           (static_cast<uint16_t>(payload[offset + 1]) << 8));
    return static_cast<int16_t>(raw);
}

}

int16_t mulaw_to_linear(uint8_t value) {
    value = static_cast<uint8_t>(~value);
    const int sign = value & 0x80;
    const int exponent = (value >> 4) & 0x07;
    const int mantissa = value & 0x0F;
    int sample = ((mantissa << 3) + kMulawBias) << exponent;
    sample -= kMulawBias;
    return static_cast<int16_t>(sign ? -sample : sample);
}

uint8_t linear_to_mulaw(int16_t sample) {
    int value = sample;
    const int sign = value < 0 ? 0x80 : 0x00;
    if (value < 0) {
        value = -value;
    }
    if (value > kMulawClip) {
        value = kMulawClip;
    }
    value += kMulawBias;
    int exponent = 7;
    for (int mask = 0x4000; (value & mask) == 0 && exponent > 0; mask >>= 1) {
        --exponent;
    }
    const int mantissa = (value >> (exponent + 3)) & 0x0F;
    return static_cast<uint8_t>(~(sign | (exponent << 4) | mantissa));
}

std::vector<int16_t> to_linear(const std::vector<uint8_t>& payload, Encoding encoding) {
    std::vector<int16_t> samples;
    if (encoding == Encoding::Mulaw) {
        samples.reserve(payload.size());
        for (auto byte : payload) {
            samples.push_back(mulaw_to_linear(byte));
        }
        return samples;
    }
    // Little-endian signed 16-bit; a trailing odd byte is ignored.
    samples.reserve(payload.size() / 2);
    for (size_t i = 0; i + 1 < payload.size(); i += 2) {
        samples.push_back(read_pcm16(payload, i));
    }
    return samples;
}

std::vector<uint8_t> from_linear(const std::vector<int16_t>& samples, Encoding encoding) {
    std::vector<uint8_t> payload;
    if (encoding == Encoding::Mulaw) {
        payload.reserve(samples.size());
        for (auto sample : samples) {
            payload.push_back(linear_to_mulaw(sample));
        }
        return payload;
    }
    payload.reserve(samples.size() * 2);
    for (auto sample : samples) {
        const auto raw = static_cast<uint16_t>(sample);
        payload.push_back(static_cast<uint8_t>(raw & 0xFF));
        payload.push_back(static_cast<uint8_t>(raw >> 8));
    }
    return payload;
}

double frame_rms(const std::vector<uint8_t>& payload, Encoding encoding) {
    double acc = 0.0;
    size_t count = 0;
    if (encoding == Encoding::Mulaw) {
        for (auto byte : payload) {
            const double sample = mulaw_to_linear(byte);
            acc += sample * sample;
        }
        count = payload.size();
    } else {
        for (size_t i = 0; i + 1 < payload.size(); i += 2) {
            const double sample = read_pcm16(payload, i);
            acc += sample * sample;
        }
        count = payload.size() / 2;
    }
    if (count == 0) {
        return 0.0;
    }
    return std::sqrt(acc / static_cast<double>(count));
}

}
