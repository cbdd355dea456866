#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "realtime_bridge/audio/clocked_sender.hpp"
#include "realtime_bridge/audio/frame.hpp"
#include "realtime_bridge/audio/framer.hpp"
#include "realtime_bridge/audio/playback_queue.hpp"
#include "realtime_bridge/channel/realtime_channel.hpp"
#include "realtime_bridge/channel/telephony_leg.hpp"
#include "realtime_bridge/session/barge_in_controller.hpp"
#include "realtime_bridge/session/call_profile.hpp"
#include "realtime_bridge/session/goodbye_detector.hpp"
#include "realtime_bridge/session/hangup_executor.hpp"
#include "realtime_bridge/session/silence_watchdog.hpp"
#include "realtime_bridge/session/turn_lifecycle.hpp"
#include "realtime_bridge/vad/voice_activity_monitor.hpp"

namespace realtime_bridge {

struct Config;

struct SessionConfig {
    audio::FrameFormat format;
    size_t playback_capacity_frames = 500;
    std::chrono::milliseconds saturation_warn_interval{1000};
    vad::VadConfig vad;
    BargeInConfig barge_in;
    HangupConfig hangup;
    WatchdogConfig watchdog;
    std::vector<std::string> goodbye_phrases;
    std::chrono::milliseconds timer_tick{50};
    // Off in tests, which drive pump_playback() and tick() by hand.
    bool run_threads = true;
};

SessionConfig make_session_config(const Config& config);

struct SessionSnapshot {
    std::string call_id;
    CallDirection direction = CallDirection::Inbound;
    std::optional<std::string> current_turn_id;
    std::string current_turn_status;
    HangupState hangup_state = HangupState::None;
    bool ai_speaking = false;
    bool caller_has_spoken = false;
    uint64_t turns = 0;
    uint64_t frames_sent = 0;
    uint64_t barge_ins = 0;
    size_t queued_frames = 0;
    int64_t age_ms = 0;
};

// All state of one call. Five tasks drive it: the telephony receiver
// (on_inbound_frame, on_playback_mark), the realtime event reader
// (handle_event), the playback feed that frames AI audio into the bounded
// queue, the clocked sender and the timer thread (tick). Create with
// std::make_shared; callbacks handed to the channel hold only a weak
// reference, so events arriving after destruction are ignored. Teardown
// requested by one of the session's own tasks runs on a separate thread
// that keeps the session alive until every worker is joined.
class CallSession : public std::enable_shared_from_this<CallSession> {
public:
    using Clock = std::chrono::steady_clock;
    using TeardownHandler = std::function<void(const std::string& call_id,
                                               const std::string& reason)>;

    CallSession(SessionConfig config,
                CallProfile profile,
                std::shared_ptr<TelephonyLeg> telephony,
                std::shared_ptr<RealtimeChannel> channel,
                Clock::time_point now = Clock::now());
    ~CallSession();

    CallSession(const CallSession&) = delete;
    CallSession& operator=(const CallSession&) = delete;

    void set_on_teardown(TeardownHandler cb);

    void start();
    void teardown(const std::string& reason);

    void on_inbound_frame(const std::vector<uint8_t>& payload, Clock::time_point now);
    void on_playback_mark(const std::string& name, Clock::time_point now);
    void handle_event(const RealtimeEvent& event, Clock::time_point now);

    // One clocked sender cycle; the sender thread does this on its own.
    bool pump_playback(Clock::time_point now);
    // Barge-in confirm timeout, hangup fallback and silence watchdog.
    void tick(Clock::time_point now);

    const std::string& call_id() const { return profile_.call_id; }
    const CallProfile& profile() const { return profile_; }
    bool closed() const { return closed_; }
    bool ai_speaking() const { return ai_speaking_; }
    SessionSnapshot snapshot() const;

    const TurnLifecycle& turns() const { return turns_; }
    const HangupExecutor& hangup() const { return hangup_; }
    const BargeInController& barge_in() const { return barge_in_; }
    const audio::PlaybackQueue& queue() const { return queue_; }
    const audio::ClockedSender& sender() const { return sender_; }

private:
    void on_frame_ready(audio::AudioFrame&& frame);
    void on_playback_drained(Clock::time_point now);
    void on_turn_started(const RealtimeEvent& event, Clock::time_point now);
    void on_audio_chunk(const RealtimeEvent& event, Clock::time_point now);
    void on_audio_done(const RealtimeEvent& event, Clock::time_point now);
    void on_turn_completed(const RealtimeEvent& event, Clock::time_point now);
    void on_turn_cancelled(const RealtimeEvent& event, Clock::time_point now);
    void on_turn_finished(const std::string& turn_id, Clock::time_point now);
    void enqueue_playback(const RealtimeEvent& event, Clock::time_point now);
    void apply_playback_event(const RealtimeEvent& event, Clock::time_point now);
    void feed_loop();
    void teardown_from_task(const std::string& reason);
    void on_transcript_final(const RealtimeEvent& event, Clock::time_point now);
    void note_turn_played(const std::string& turn_id, Clock::time_point now);
    void on_caller_activity(Clock::time_point now);
    void run_watchdog(Clock::time_point now);
    void timer_loop();
    void stop_workers();
    bool playback_drained() const;
    void touch_activity(Clock::time_point now);

    const SessionConfig config_;
    const CallProfile profile_;
    const Clock::time_point started_at_;
    std::shared_ptr<TelephonyLeg> telephony_;
    std::shared_ptr<RealtimeChannel> channel_;
    TeardownHandler on_teardown_;

    std::atomic<bool> ai_speaking_{false};
    std::atomic<bool> closed_{false};
    std::atomic<bool> started_{false};
    std::atomic<uint64_t> drain_marks_{0};

    TurnLifecycle turns_;
    audio::PlaybackQueue queue_;
    audio::Framer framer_;
    audio::ClockedSender sender_;
    HangupExecutor hangup_;
    BargeInController barge_in_;
    GoodbyeDetector goodbye_;
    vad::VoiceActivityMonitor vad_; // Inbound receiver only.

    mutable std::mutex state_mutex_;
    SilenceWatchdog watchdog_;
    Clock::time_point last_activity_;
    Clock::time_point last_inbound_frame_;
    Clock::time_point next_watchdog_poll_;
    bool caller_has_spoken_ = false;
    std::optional<std::string> greeting_turn_id_;
    std::optional<Clock::time_point> greeting_done_;

    std::mutex timer_mutex_;
    std::condition_variable timer_cv_;
    bool timer_running_ = false;
    std::thread timer_thread_;

    std::mutex feed_mutex_;
    std::condition_variable feed_cv_;
    std::deque<std::pair<RealtimeEvent, Clock::time_point>> feed_;
    bool feed_stopped_ = false;
    std::thread feed_thread_;
};

}
