#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include "realtime_bridge/session/turn_lifecycle.hpp"

namespace realtime_bridge {

struct Config;

struct HangupConfig {
    // After audio done, give the downstream buffer this long to drain.
    std::chrono::milliseconds drain_fallback{3000};
    // After a request, give the turn this long to report audio done.
    std::chrono::milliseconds request_fallback{15000};

    static HangupConfig from_config(const Config& config);
};

enum class HangupTrigger {
    AudioDone,
    TranscriptRace,
    FallbackTimer,
    Watchdog
};

enum class HangupState {
    None,
    Pending,
    Executed
};

enum class HangupOutcome {
    Executed,
    NotRequested,
    TurnMismatch,
    UnknownTurn,
    TurnCancelled,
    AudioPending,
    PlaybackPending,
    AlreadyExecuted
};

const char* hangup_trigger_name(HangupTrigger trigger);
const char* hangup_state_name(HangupState state);
const char* hangup_outcome_name(HangupOutcome outcome);

// The only component allowed to terminate the telephony leg. Every trigger
// funnels into maybe_execute_hangup(), which re-checks all conditions and
// flips the state to Executed inside the same critical section, so the
// terminator runs at most once per call.
class HangupExecutor {
public:
    using Clock = std::chrono::steady_clock;
    using DrainedCheck = std::function<bool()>;
    using Terminator = std::function<void(const std::string& reason)>;

    HangupExecutor(HangupConfig config,
                   const TurnLifecycle& turns,
                   DrainedCheck playback_drained,
                   Terminator terminator,
                   std::string call_id = {});

    bool request_hangup(const std::string& turn_id,
                        Clock::time_point now,
                        const std::string& reason = "goodbye");
    bool withdraw_request(const std::string& turn_id);

    HangupOutcome maybe_execute_hangup(HangupTrigger trigger,
                                       const std::string& turn_id,
                                       Clock::time_point now);
    // Re-evaluates a pending request with the fallback relaxations.
    HangupOutcome poll_fallback(Clock::time_point now);
    // Watchdog path: only the idempotence guard applies.
    HangupOutcome force_hangup(const std::string& reason);

    HangupState state() const;
    bool executed() const;
    std::optional<std::string> requested_turn() const;
    std::string executed_via() const;
    std::string executed_reason() const;

private:
    struct Request {
        std::string turn_id;
        std::string reason;
        Clock::time_point requested_at;
    };

    HangupOutcome evaluate_locked(HangupTrigger trigger,
                                  const std::string& turn_id,
                                  Clock::time_point now) const;
    void terminate(const std::string& via, const std::string& reason);
    void log_skip(HangupTrigger trigger,
                  const std::string& turn_id,
                  HangupOutcome outcome) const;

    const HangupConfig config_;
    const TurnLifecycle& turns_;
    DrainedCheck playback_drained_;
    Terminator terminator_;
    const std::string call_id_;

    mutable std::mutex mutex_;
    HangupState state_ = HangupState::None;
    std::optional<Request> request_;
    std::string executed_via_;
    std::string executed_reason_;
};

}
