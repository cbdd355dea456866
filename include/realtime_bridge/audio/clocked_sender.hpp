#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include "realtime_bridge/audio/frame.hpp"
#include "realtime_bridge/audio/playback_queue.hpp"

namespace realtime_bridge {
namespace audio {

// Emits at most one frame per interval to the telephony leg. The next
// deadline advances by exactly one interval after every transmitted frame and
// re-anchors to now + interval after an idle cycle or when the sender fell a
// whole interval behind, so the output never bursts to catch up.
class ClockedSender {
public:
    using Clock = std::chrono::steady_clock;
    using TransmitFn = std::function<void(const AudioFrame&, Clock::time_point)>;
    using EventFn = std::function<void(Clock::time_point)>;
    using FailureFn = std::function<void(const std::string&)>;

    ClockedSender(PlaybackQueue& queue,
                  std::chrono::milliseconds interval,
                  TransmitFn transmit,
                  std::string call_id = {});
    ~ClockedSender();

    ClockedSender(const ClockedSender&) = delete;
    ClockedSender& operator=(const ClockedSender&) = delete;

    // Called on every cycle that found the queue empty.
    void set_on_idle(EventFn cb);
    // Called once on the first idle cycle after at least one frame went out.
    void set_on_drained(EventFn cb);
    void set_on_failure(FailureFn cb);

    void start();
    void stop();

    void anchor(Clock::time_point now);
    bool cycle(Clock::time_point now);

    // Safe to read from any thread while the worker runs.
    Clock::time_point next_deadline() const;
    bool idle() const;
    uint64_t frames_sent() const;
    uint64_t idle_cycles() const;

private:
    void run_loop();

    PlaybackQueue& queue_;
    const Clock::duration interval_;
    TransmitFn transmit_;
    EventFn on_idle_;
    EventFn on_drained_;
    FailureFn on_failure_;
    const std::string call_id_;

    std::atomic<Clock::time_point> next_deadline_{Clock::time_point{}};
    std::atomic<bool> idle_{true};
    std::atomic<uint64_t> frames_sent_{0};
    std::atomic<uint64_t> idle_cycles_{0};

    std::mutex run_mutex_;
    std::condition_variable run_cv_;
    bool running_ = false;
    std::thread worker_;
};

}
}
