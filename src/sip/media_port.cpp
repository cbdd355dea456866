#include "realtime_bridge/sip/media_port.hpp"

#include <algorithm>
#include <cstring>

#include "realtime_bridge/logging.hpp"
#include "realtime_bridge/metrics.hpp"

namespace realtime_bridge::sip {

MediaPort::MediaPort() {
    worker_ = std::thread([this]() { worker_loop(); });
}

MediaPort::~MediaPort() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stop_worker_ = true;
    }
    queue_cv_.notify_one();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void MediaPort::set_on_frame_received(FrameHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    on_frame_received_ = std::move(handler);
}

void MediaPort::set_on_frame_requested(FrameProvider handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    on_frame_requested_ = std::move(handler);
}

void MediaPort::onFrameRequested(pj::MediaFrame& frame) {
    frame.type = PJMEDIA_FRAME_TYPE_AUDIO;
    FrameProvider provider;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        provider = on_frame_requested_;
    }
    const auto data = provider ? provider() : std::vector<int16_t>{};
    if (data.empty() || frame.size == 0) {
        frame.size = 0;
        frame.buf.clear();
        return;
    }
    const auto max_samples = static_cast<size_t>(frame.size / sizeof(int16_t));
    const auto copy_samples = std::min(max_samples, data.size());
    frame.buf.assign(max_samples * sizeof(int16_t), 0);
    std::memcpy(frame.buf.data(), data.data(), copy_samples * sizeof(int16_t));
    frame.size = static_cast<unsigned>(frame.buf.size());
}

void MediaPort::onFrameReceived(pj::MediaFrame& frame) {
    if (frame.buf.empty() || frame.size == 0) {
        return;
    }
    const auto available_bytes = std::min(static_cast<size_t>(frame.size), frame.buf.size());
    std::vector<int16_t> samples(available_bytes / sizeof(int16_t));
    std::memcpy(samples.data(), frame.buf.data(), samples.size() * sizeof(int16_t));
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (frame_queue_.size() >= kMaxQueueSize) {
            frame_queue_.pop_front();
            ++dropped_frames_;
            Metrics::instance().increment_event("sip_inbound_dropped");
            if (const auto folded = drop_log_.ready()) {
                logging::warn(
                    "Inbound SIP audio backlog, dropping oldest frame",
                    {kv("dropped", dropped_frames_),
                     kv("since_last_warning", *folded)});
            }
        }
        frame_queue_.push_back(std::move(samples));
    }
    queue_cv_.notify_one();
}

uint64_t MediaPort::dropped_frames() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return dropped_frames_;
}

void MediaPort::worker_loop() {
    while (true) {
        std::vector<int16_t> samples;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this]() { return stop_worker_ || !frame_queue_.empty(); });
            if (stop_worker_) {
                break;
            }
            samples = std::move(frame_queue_.front());
            frame_queue_.pop_front();
        }
        FrameHandler handler;
        {
            std::lock_guard<std::mutex> lock(handler_mutex_);
            handler = on_frame_received_;
        }
        if (!handler) {
            continue;
        }
        try {
            handler(samples);
        } catch (const std::exception& ex) {
            logging::error("Inbound SIP frame handler failed", {kv("error", ex.what())});
        }
    }
}

}
