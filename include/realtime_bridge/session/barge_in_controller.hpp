#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include "realtime_bridge/audio/framer.hpp"
#include "realtime_bridge/audio/playback_queue.hpp"
#include "realtime_bridge/channel/realtime_channel.hpp"
#include "realtime_bridge/channel/telephony_leg.hpp"
#include "realtime_bridge/session/hangup_executor.hpp"
#include "realtime_bridge/session/turn_lifecycle.hpp"

namespace realtime_bridge {

struct Config;

enum class ConfirmMode {
    Vad,
    Transcript
};

ConfirmMode parse_confirm_mode(const std::string& value);

struct BargeInConfig {
    bool enabled = true;
    ConfirmMode confirm_mode = ConfirmMode::Vad;
    std::chrono::milliseconds confirm_timeout{600};
    std::chrono::milliseconds cancel_cooldown{200};
    size_t min_transcript_chars = 2;

    static BargeInConfig from_config(const Config& config);
};

enum class BargeInOutcome {
    Confirmed,
    AwaitingConfirmation,
    NothingToInterrupt,
    Disabled,
    CoolingDown,
    Vetoed,
    NoCandidate
};

const char* barge_in_outcome_name(BargeInOutcome outcome);

// The single path from "caller is speaking over the AI" to cancelling the
// AI's turn. A candidate comes from the local VAD or the vendor's own speech
// detection; depending on the confirm mode it is acted on at once or after a
// caller transcript (with a timeout that confirms anyway).
class BargeInController {
public:
    using Clock = std::chrono::steady_clock;

    struct Targets {
        TurnLifecycle& turns;
        audio::PlaybackQueue& queue;
        audio::Framer& framer;
        TelephonyLeg& telephony;
        RealtimeChannel& channel;
        HangupExecutor& hangup;
        std::atomic<bool>& ai_speaking;
    };

    BargeInController(BargeInConfig config, Targets targets, std::string call_id = {});

    BargeInOutcome on_candidate(Clock::time_point now);
    BargeInOutcome on_caller_transcript(const std::string& text, Clock::time_point now);
    // Confirms a candidate that has waited longer than the confirm timeout.
    BargeInOutcome poll(Clock::time_point now);
    void on_cancel_rejected(const std::string& turn_id, const std::string& code);

    bool awaiting_confirmation() const;
    uint64_t confirmed_count() const;
    uint64_t cancels_sent() const;

private:
    bool interruptible() const;
    BargeInOutcome confirm(Clock::time_point candidate_ts, Clock::time_point now);

    const BargeInConfig config_;
    Targets targets_;
    const std::string call_id_;

    mutable std::mutex mutex_;
    std::optional<Clock::time_point> pending_since_;
    std::optional<Clock::time_point> last_confirmed_;
    uint64_t confirmed_count_ = 0;
    std::atomic<uint64_t> cancels_sent_{0};
};

}
