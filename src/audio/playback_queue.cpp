#include "realtime_bridge/audio/playback_queue.hpp"

#include <stdexcept>

#include "realtime_bridge/logging.hpp"
#include "realtime_bridge/metrics.hpp"

namespace realtime_bridge {
namespace audio {

PlaybackQueue::PlaybackQueue(size_t capacity,
                             std::chrono::milliseconds saturation_warn_interval,
                             std::string call_id)
    : capacity_(capacity),
      saturation_warn_interval_(saturation_warn_interval),
      call_id_(std::move(call_id)) {
    if (capacity_ == 0) {
        throw std::invalid_argument("playback queue capacity must be positive");
    }
}

PlaybackQueue::PushResult PlaybackQueue::push(AudioFrame frame) {
    std::unique_lock<std::mutex> lock(mutex_);
    const auto generation = generation_;
    auto blocked = [&]() {
        return !closed_ && generation == generation_ && frames_.size() >= capacity_;
    };

    if (blocked()) {
        ++saturation_events_;
        Metrics::instance().increment_event("playback_queue_saturated");
        logging::warn(
            "Playback queue saturated, producer blocked",
            {kv("call_id", call_id_),
             kv("capacity", capacity_),
             kv("turn_id", frame.turn_id)});
        const auto started = std::chrono::steady_clock::now();
        while (blocked()) {
            if (!not_full_.wait_for(lock, saturation_warn_interval_,
                                    [&]() { return !blocked(); })) {
                const auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - started);
                logging::warn(
                    "Playback queue still saturated, check PLAYBACK_QUEUE_MS",
                    {kv("call_id", call_id_),
                     kv("capacity", capacity_),
                     kv("waited", waited)});
            }
        }
    }

    if (closed_) {
        return PushResult::Closed;
    }
    if (generation != generation_) {
        return PushResult::Flushed;
    }
    frames_.push_back(std::move(frame));
    return PushResult::Queued;
}

std::optional<AudioFrame> PlaybackQueue::try_pop() {
    std::optional<AudioFrame> frame;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (frames_.empty()) {
            return std::nullopt;
        }
        frame = std::move(frames_.front());
        frames_.pop_front();
    }
    not_full_.notify_one();
    return frame;
}

size_t PlaybackQueue::flush() {
    std::deque<AudioFrame> discarded;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        discarded.swap(frames_);
        ++generation_;
    }
    not_full_.notify_all();
    return discarded.size();
}

void PlaybackQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    not_full_.notify_all();
}

size_t PlaybackQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_.size();
}

bool PlaybackQueue::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_.empty();
}

size_t PlaybackQueue::capacity() const {
    return capacity_;
}

uint64_t PlaybackQueue::saturation_events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return saturation_events_;
}

}
}
