#include "realtime_bridge/audio/framer.hpp"

#include <stdexcept>

#include "realtime_bridge/logging.hpp"

namespace realtime_bridge {
namespace audio {

Framer::Framer(size_t frame_bytes, FrameSink sink)
    : frame_bytes_(frame_bytes),
      sink_(std::move(sink)) {
    if (frame_bytes_ == 0) {
        throw std::invalid_argument("frame size must be positive");
    }
    buffer_.reserve(frame_bytes_ * 4);
}

size_t Framer::feed(const std::string& turn_id, const std::vector<uint8_t>& bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!buffer_.empty() && buffer_turn_ != turn_id) {
        logging::debug(
            "Framer dropped partial frame from previous turn",
            {kv("previous_turn_id", buffer_turn_),
             kv("turn_id", turn_id),
             kv("bytes", buffer_.size())});
        buffer_.clear();
    }
    buffer_turn_ = turn_id;
    buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());

    size_t emitted = 0;
    size_t offset = 0;
    while (buffer_.size() - offset >= frame_bytes_) {
        AudioFrame frame;
        frame.seq = next_seq_++;
        frame.turn_id = turn_id;
        frame.payload.assign(buffer_.begin() + static_cast<std::ptrdiff_t>(offset),
                             buffer_.begin() + static_cast<std::ptrdiff_t>(offset + frame_bytes_));
        offset += frame_bytes_;
        ++emitted;
        if (sink_) {
            sink_(std::move(frame));
        }
    }
    if (offset > 0) {
        buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(offset));
    }
    return emitted;
}

size_t Framer::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto discarded = buffer_.size();
    buffer_.clear();
    buffer_turn_.clear();
    return discarded;
}

size_t Framer::pending_bytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_.size();
}

std::vector<uint8_t> Framer::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_;
}

uint64_t Framer::frames_emitted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_seq_;
}

}
}
