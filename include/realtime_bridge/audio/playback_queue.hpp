#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

#include "realtime_bridge/audio/frame.hpp"

namespace realtime_bridge {
namespace audio {

// Bounded single-producer/single-consumer queue between the framer and the
// clocked sender. push() blocks while the queue is full; frames leave the
// queue only through try_pop() or in bulk through flush().
class PlaybackQueue {
public:
    enum class PushResult {
        Queued,
        Flushed, // A flush happened while the producer was blocked.
        Closed
    };

    PlaybackQueue(size_t capacity,
                  std::chrono::milliseconds saturation_warn_interval,
                  std::string call_id = {});

    PushResult push(AudioFrame frame);
    std::optional<AudioFrame> try_pop();
    size_t flush();
    void close();

    size_t size() const;
    bool empty() const;
    size_t capacity() const;
    uint64_t saturation_events() const;

private:
    const size_t capacity_;
    const std::chrono::milliseconds saturation_warn_interval_;
    const std::string call_id_;

    mutable std::mutex mutex_;
    std::condition_variable not_full_;
    std::deque<AudioFrame> frames_;
    uint64_t generation_ = 0;
    uint64_t saturation_events_ = 0;
    bool closed_ = false;
};

}
}
