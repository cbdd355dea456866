#include "realtime_bridge/telephony/media_stream_leg.hpp"

#include "realtime_bridge/logging.hpp"
#include "realtime_bridge/telephony/media_stream_protocol.hpp"

namespace realtime_bridge::telephony {

MediaStreamLeg::MediaStreamLeg(std::string stream_sid, SendFn send, CloseFn close)
    : stream_sid_(std::move(stream_sid)),
      send_(std::move(send)),
      close_(std::move(close)) {}

// Sends happen under the lock so a clear can never overtake a frame that
// was counted before it.
void MediaStreamLeg::send_frame(const audio::AudioFrame& frame) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (terminated_) {
        return;
    }
    ++frames_since_mark_;
    ++frames_sent_;
    send_(media_message(stream_sid_, frame.payload));
}

void MediaStreamLeg::mark_playback(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (terminated_ || frames_since_mark_ == 0) {
        return;
    }
    frames_since_mark_ = 0;
    outstanding_marks_.insert(name);
    send_(mark_message(stream_sid_, name));
}

void MediaStreamLeg::clear_buffered_audio() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (terminated_) {
        return;
    }
    // The far end echoes pending marks on clear; they are ignored.
    outstanding_marks_.clear();
    frames_since_mark_ = 0;
    send_(clear_message(stream_sid_));
}

bool MediaStreamLeg::downstream_drained() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_since_mark_ == 0 && outstanding_marks_.empty();
}

void MediaStreamLeg::terminate_call(const std::string& call_id, const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (terminated_) {
            return;
        }
        terminated_ = true;
    }
    logging::info(
        "Closing media stream",
        {kv("call_id", call_id),
         kv("stream_sid", stream_sid_),
         kv("reason", reason)});
    close_(reason);
}

bool MediaStreamLeg::acknowledge_mark(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    return outstanding_marks_.erase(name) > 0;
}

uint64_t MediaStreamLeg::frames_sent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_sent_;
}

}
