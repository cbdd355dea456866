#include "realtime_bridge/telephony/sip_leg.hpp"

#include <algorithm>

#include "realtime_bridge/audio/samples.hpp"
#include "realtime_bridge/logging.hpp"
#include "realtime_bridge/metrics.hpp"

namespace realtime_bridge::telephony {

SipLeg::SipLeg(audio::Encoding encoding, size_t max_buffered_frames, TerminateFn terminate)
    : encoding_(encoding),
      max_buffered_frames_(std::max<size_t>(1, max_buffered_frames)),
      terminate_(std::move(terminate)) {}

void SipLeg::set_on_mark(MarkFn cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_mark_ = std::move(cb);
}

void SipLeg::send_frame(const audio::AudioFrame& frame) {
    auto samples = audio::to_linear(frame.payload, encoding_);
    std::lock_guard<std::mutex> lock(mutex_);
    if (terminated_) {
        return;
    }
    if (buffer_.size() >= max_buffered_frames_) {
        // The media port stopped pulling frames.
        ++overflow_count_;
        Metrics::instance().increment_event("sip_jitter_overflow");
        if (const auto folded = overflow_log_.ready()) {
            logging::warn(
                "SIP jitter buffer full, dropping oldest frame",
                {kv("buffered", buffer_.size()),
                 kv("overflows", overflow_count_),
                 kv("since_last_warning", *folded)});
        }
        buffer_.pop_front();
    }
    buffer_.push_back(std::move(samples));
}

void SipLeg::mark_playback(const std::string& name) {
    MarkFn callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!buffer_.empty()) {
            pending_marks_.push_back(name);
            return;
        }
        callback = on_mark_;
    }
    if (callback) {
        callback(name);
    }
}

void SipLeg::clear_buffered_audio() {
    std::lock_guard<std::mutex> lock(mutex_);
    buffer_.clear();
    pending_marks_.clear();
}

bool SipLeg::downstream_drained() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_.empty();
}

void SipLeg::terminate_call(const std::string& call_id, const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (terminated_) {
            return;
        }
        terminated_ = true;
        buffer_.clear();
        pending_marks_.clear();
    }
    logging::info(
        "Hanging up SIP call",
        {kv("call_id", call_id),
         kv("reason", reason)});
    if (terminate_) {
        terminate_(reason);
    }
}

std::vector<int16_t> SipLeg::pull_frame() {
    std::vector<int16_t> frame;
    std::vector<std::string> completed;
    MarkFn callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (buffer_.empty()) {
            return frame;
        }
        frame = std::move(buffer_.front());
        buffer_.pop_front();
        if (buffer_.empty() && !pending_marks_.empty()) {
            completed.swap(pending_marks_);
            callback = on_mark_;
        }
    }
    if (callback) {
        for (const auto& name : completed) {
            callback(name);
        }
    }
    return frame;
}

std::vector<uint8_t> SipLeg::encode_inbound(const std::vector<int16_t>& samples) const {
    return audio::from_linear(samples, encoding_);
}

size_t SipLeg::buffered_frames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_.size();
}

uint64_t SipLeg::overflow_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return overflow_count_;
}

}
