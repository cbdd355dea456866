#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace realtime_bridge {

struct Config;

struct WatchdogConfig {
    std::chrono::milliseconds poll_interval{1000};
    std::chrono::milliseconds hard_silence{20000};
    std::chrono::milliseconds idle_after_greeting{30000};
    // Zero disables warnings.
    std::chrono::milliseconds warning_after{8000};
    int max_warnings = 2;
    std::string warning_prompt;
    std::chrono::milliseconds max_call_duration{1800000};
    std::chrono::milliseconds media_timeout{5000};

    static WatchdogConfig from_config(const Config& config);
};

struct WatchdogInputs {
    using Clock = std::chrono::steady_clock;

    Clock::time_point last_activity;
    Clock::time_point last_inbound_frame;
    // End of the first AI turn's playback, if it has finished.
    std::optional<Clock::time_point> greeting_done;
    bool caller_has_spoken = false;
    bool turn_active = false;
    bool playback_pending = false;
};

struct WatchdogVerdict {
    enum class Action {
        None,
        Warn,
        Hangup,
        Teardown
    };

    Action action = Action::None;
    std::string reason;
    int warning_number = 0;
};

const char* watchdog_action_name(WatchdogVerdict::Action action);

// Decides, on each poll, whether a silent call should be nudged or ended.
// Holds only the warning bookkeeping; every other input is passed in, so the
// rules can be driven with explicit time points.
class SilenceWatchdog {
public:
    using Clock = std::chrono::steady_clock;

    SilenceWatchdog(WatchdogConfig config, Clock::time_point call_start);

    WatchdogVerdict evaluate(const WatchdogInputs& inputs, Clock::time_point now);
    void note_caller_speech();

    const WatchdogConfig& config() const { return config_; }
    int warnings_sent() const { return warnings_sent_; }

private:
    const WatchdogConfig config_;
    const Clock::time_point call_start_;
    int warnings_sent_ = 0;
    std::optional<Clock::time_point> last_warning_;
};

}
