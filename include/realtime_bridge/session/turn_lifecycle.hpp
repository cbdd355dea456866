#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace realtime_bridge {

enum class TurnStatus {
    Active,
    CancelRequested,
    Cancelled,
    AudioDone,
    Completed
};

const char* turn_status_name(TurnStatus status);

struct Turn {
    using Clock = std::chrono::steady_clock;

    std::string turn_id;
    TurnStatus status = TurnStatus::Active;
    bool cancel_sent = false;
    Clock::time_point started_ts{};
    std::optional<Clock::time_point> audio_done_ts;
    uint64_t ordinal = 0;
};

// Tracks the AI's turns from the realtime channel's event stream. Handlers
// are idempotent and independent of arrival order between the audio and
// transcript streams. Only the current and the immediately previous turn are
// retained; events naming any other turn are reported as unknown.
class TurnLifecycle {
public:
    using Clock = Turn::Clock;

    enum class Result {
        Applied,
        Unchanged,
        UnknownTurn
    };

    explicit TurnLifecycle(std::string call_id = {});

    Result turn_started(const std::string& turn_id, Clock::time_point now);
    Result mark_audio_done(const std::string& turn_id, Clock::time_point now);
    // Check-and-set of cancel_sent. Returns true only for the caller that must
    // send the cancel request.
    bool mark_cancel_requested(const std::string& turn_id);
    Result mark_cancelled(const std::string& turn_id);
    // Completion also closes the audio stream of a turn that never reported
    // audio done.
    Result mark_completed(const std::string& turn_id, Clock::time_point now);

    bool is_cancelled(const std::string& turn_id) const;
    bool is_audio_done(const std::string& turn_id) const;
    bool is_known(const std::string& turn_id) const;
    // True while the current turn is generating audio.
    bool has_active_turn() const;
    std::optional<std::string> current_turn_id() const;
    std::optional<Turn> snapshot(const std::string& turn_id) const;
    std::optional<Turn> current() const;
    uint64_t turns_started() const;

private:
    Turn* find(const std::string& turn_id);
    const Turn* find(const std::string& turn_id) const;
    void log_transition(const Turn& turn, const char* event) const;

    const std::string call_id_;
    mutable std::mutex mutex_;
    std::optional<Turn> current_;
    std::optional<Turn> previous_;
    uint64_t turns_started_ = 0;
};

}
