#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include <pjsua2.hpp>

#include "realtime_bridge/logging.hpp"

namespace realtime_bridge {
namespace sip {

// Conference bridge port between a SIP call and its session. Received
// frames are handed to a worker thread so the pjmedia clock never waits on
// session work; requested frames are served inline from the provider.
class MediaPort : public pj::AudioMediaPort {
public:
    using FrameHandler = std::function<void(const std::vector<int16_t>&)>;
    using FrameProvider = std::function<std::vector<int16_t>()>;

    MediaPort();
    ~MediaPort() override;

    void set_on_frame_received(FrameHandler handler);
    void set_on_frame_requested(FrameProvider handler);

    void onFrameRequested(pj::MediaFrame& frame) override;
    void onFrameReceived(pj::MediaFrame& frame) override;

    uint64_t dropped_frames() const;

private:
    void worker_loop();

    static constexpr size_t kMaxQueueSize = 64;

    FrameHandler on_frame_received_;
    FrameProvider on_frame_requested_;
    std::mutex handler_mutex_;

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<std::vector<int16_t>> frame_queue_;
    uint64_t dropped_frames_ = 0;
    logging::Throttle drop_log_{std::chrono::seconds(1)};
    std::thread worker_;
    bool stop_worker_{false};
};

}
}
