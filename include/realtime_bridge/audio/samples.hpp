#pragma once

#include <cstdint>
#include <vector>

#include "realtime_bridge/audio/frame.hpp"

namespace realtime_bridge::audio {

// G.711 u-law.
int16_t mulaw_to_linear(uint8_t value);
uint8_t linear_to_mulaw(int16_t sample);

std::vector<int16_t> to_linear(const std::vector<uint8_t>& payload, Encoding encoding);
std::vector<uint8_t> from_linear(const std::vector<int16_t>& samples, Encoding encoding);

// Root-mean-square amplitude of one frame on the 16-bit linear scale.
double frame_rms(const std::vector<uint8_t>& payload, Encoding encoding);

}
