#include "realtime_bridge/session/silence_watchdog.hpp"

#include <algorithm>

#include "realtime_bridge/config.hpp"

namespace realtime_bridge {

WatchdogConfig WatchdogConfig::from_config(const Config& config) {
    WatchdogConfig result;
    result.poll_interval = std::chrono::milliseconds(config.watchdog_poll_ms);
    result.hard_silence = std::chrono::milliseconds(config.silence_hard_timeout_ms);
    result.idle_after_greeting = std::chrono::milliseconds(config.idle_after_greeting_ms);
    result.warning_after = std::chrono::milliseconds(config.silence_warning_ms);
    result.max_warnings = config.silence_max_warnings;
    result.warning_prompt = config.silence_warning_prompt;
    result.max_call_duration = std::chrono::milliseconds(config.max_call_duration_ms);
    result.media_timeout = std::chrono::milliseconds(config.media_timeout_ms);
    return result;
}

const char* watchdog_action_name(WatchdogVerdict::Action action) {
    switch (action) {
        case WatchdogVerdict::Action::None:
            return "none";
        case WatchdogVerdict::Action::Warn:
            return "warn";
        case WatchdogVerdict::Action::Hangup:
            return "hangup";
        case WatchdogVerdict::Action::Teardown:
            return "teardown";
    }
    return "unknown";
}

SilenceWatchdog::SilenceWatchdog(WatchdogConfig config, Clock::time_point call_start)
    : config_(std::move(config)),
      call_start_(call_start) {}

void SilenceWatchdog::note_caller_speech() {
    warnings_sent_ = 0;
    last_warning_.reset();
}

WatchdogVerdict SilenceWatchdog::evaluate(const WatchdogInputs& inputs,
                                          Clock::time_point now) {
    WatchdogVerdict verdict;
    if (config_.max_call_duration.count() > 0 &&
        now - call_start_ >= config_.max_call_duration) {
        verdict.action = WatchdogVerdict::Action::Hangup;
        verdict.reason = "max_duration";
        return verdict;
    }
    if (config_.media_timeout.count() > 0 &&
        now - inputs.last_inbound_frame >= config_.media_timeout) {
        verdict.action = WatchdogVerdict::Action::Teardown;
        verdict.reason = "media_timeout";
        return verdict;
    }
    if (inputs.turn_active || inputs.playback_pending) {
        return verdict;
    }

    // A caller who never spoke is judged by the idle-after-greeting rule
    // alone; the silence rules below apply to a conversation that went quiet.
    if (!inputs.caller_has_spoken) {
        const auto idle_since = inputs.greeting_done.value_or(call_start_);
        if (config_.idle_after_greeting.count() > 0 &&
            now - idle_since >= config_.idle_after_greeting) {
            verdict.action = WatchdogVerdict::Action::Hangup;
            verdict.reason = "no_answer";
        }
        return verdict;
    }

    const auto silence = now - inputs.last_activity;
    if (config_.hard_silence.count() > 0 && silence >= config_.hard_silence) {
        verdict.action = WatchdogVerdict::Action::Hangup;
        verdict.reason = "silence_timeout";
        return verdict;
    }

    if (config_.warning_after.count() <= 0 || config_.max_warnings <= 0) {
        return verdict;
    }
    auto quiet_since = inputs.last_activity;
    if (last_warning_) {
        quiet_since = std::max(quiet_since, *last_warning_);
    }
    if (now - quiet_since < config_.warning_after) {
        return verdict;
    }
    if (warnings_sent_ >= config_.max_warnings) {
        verdict.action = WatchdogVerdict::Action::Hangup;
        verdict.reason = "no_response";
        return verdict;
    }
    ++warnings_sent_;
    last_warning_ = now;
    verdict.action = WatchdogVerdict::Action::Warn;
    verdict.reason = "silence_warning";
    verdict.warning_number = warnings_sent_;
    return verdict;
}

}
