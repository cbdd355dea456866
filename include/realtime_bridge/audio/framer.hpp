#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "realtime_bridge/audio/frame.hpp"

namespace realtime_bridge {
namespace audio {

// Cuts the realtime channel's variable-size audio chunks into fixed-size
// frames. Any remainder shorter than one frame stays buffered until the next
// chunk of the same turn arrives or reset() discards it.
class Framer {
public:
    using FrameSink = std::function<void(AudioFrame&&)>;

    Framer(size_t frame_bytes, FrameSink sink);

    size_t feed(const std::string& turn_id, const std::vector<uint8_t>& bytes);
    size_t reset();
    size_t pending_bytes() const;
    std::vector<uint8_t> pending() const;
    uint64_t frames_emitted() const;

private:
    size_t frame_bytes_;
    FrameSink sink_;
    mutable std::mutex mutex_;
    std::vector<uint8_t> buffer_;
    std::string buffer_turn_;
    uint64_t next_seq_ = 0;
};

}
}
