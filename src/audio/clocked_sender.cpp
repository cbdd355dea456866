#include "realtime_bridge/audio/clocked_sender.hpp"

#include "realtime_bridge/logging.hpp"

namespace realtime_bridge {
namespace audio {

ClockedSender::ClockedSender(PlaybackQueue& queue,
                             std::chrono::milliseconds interval,
                             TransmitFn transmit,
                             std::string call_id)
    : queue_(queue),
      interval_(interval),
      transmit_(std::move(transmit)),
      call_id_(std::move(call_id)) {}

ClockedSender::~ClockedSender() {
    stop();
}

void ClockedSender::set_on_idle(EventFn cb) {
    on_idle_ = std::move(cb);
}

void ClockedSender::set_on_drained(EventFn cb) {
    on_drained_ = std::move(cb);
}

void ClockedSender::set_on_failure(FailureFn cb) {
    on_failure_ = std::move(cb);
}

void ClockedSender::start() {
    std::lock_guard<std::mutex> lock(run_mutex_);
    if (running_) {
        return;
    }
    running_ = true;
    anchor(Clock::now());
    worker_ = std::thread([this]() { run_loop(); });
}

void ClockedSender::stop() {
    {
        std::lock_guard<std::mutex> lock(run_mutex_);
        running_ = false;
    }
    run_cv_.notify_all();
    if (worker_.joinable()) {
        if (worker_.get_id() == std::this_thread::get_id()) {
            worker_.detach();
        } else {
            worker_.join();
        }
    }
}

void ClockedSender::anchor(Clock::time_point now) {
    next_deadline_ = now;
}

bool ClockedSender::cycle(Clock::time_point now) {
    auto deadline = next_deadline_.load();
    if (now < deadline) {
        return false;
    }

    auto frame = queue_.try_pop();
    if (frame) {
        if (now - deadline >= interval_) {
            logging::debug(
                "Clocked sender fell behind, re-anchoring",
                {kv("call_id", call_id_),
                 kv("lag", now - deadline)});
            deadline = now;
        }
        idle_ = false;
        if (transmit_) {
            transmit_(*frame, now);
        }
        ++frames_sent_;
        next_deadline_ = deadline + interval_;
        return true;
    }

    ++idle_cycles_;
    if (on_idle_) {
        on_idle_(now);
    }
    if (!idle_.exchange(true) && on_drained_) {
        on_drained_(now);
    }
    next_deadline_ = now + interval_;
    return false;
}

ClockedSender::Clock::time_point ClockedSender::next_deadline() const {
    return next_deadline_.load();
}

bool ClockedSender::idle() const {
    return idle_;
}

uint64_t ClockedSender::frames_sent() const {
    return frames_sent_;
}

uint64_t ClockedSender::idle_cycles() const {
    return idle_cycles_;
}

void ClockedSender::run_loop() {
    std::unique_lock<std::mutex> lock(run_mutex_);
    while (running_) {
        if (run_cv_.wait_until(lock, next_deadline_.load(), [this]() { return !running_; })) {
            break;
        }
        lock.unlock();
        try {
            cycle(Clock::now());
        } catch (const std::exception& ex) {
            logging::error(
                "Clocked sender failed",
                {kv("call_id", call_id_),
                 kv("error", ex.what())});
            if (on_failure_) {
                on_failure_(ex.what());
            }
            lock.lock();
            running_ = false;
            break;
        }
        lock.lock();
    }
}

}
}
