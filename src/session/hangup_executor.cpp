#include "realtime_bridge/session/hangup_executor.hpp"

#include "realtime_bridge/config.hpp"
#include "realtime_bridge/logging.hpp"
#include "realtime_bridge/metrics.hpp"

namespace realtime_bridge {

HangupConfig HangupConfig::from_config(const Config& config) {
    HangupConfig result;
    result.drain_fallback = std::chrono::milliseconds(config.hangup_drain_fallback_ms);
    result.request_fallback = std::chrono::milliseconds(config.hangup_request_fallback_ms);
    return result;
}

const char* hangup_trigger_name(HangupTrigger trigger) {
    switch (trigger) {
        case HangupTrigger::AudioDone:
            return "audio_done";
        case HangupTrigger::TranscriptRace:
            return "transcript_race";
        case HangupTrigger::FallbackTimer:
            return "fallback_timer";
        case HangupTrigger::Watchdog:
            return "watchdog";
    }
    return "unknown";
}

const char* hangup_state_name(HangupState state) {
    switch (state) {
        case HangupState::None:
            return "none";
        case HangupState::Pending:
            return "pending";
        case HangupState::Executed:
            return "executed";
    }
    return "unknown";
}

const char* hangup_outcome_name(HangupOutcome outcome) {
    switch (outcome) {
        case HangupOutcome::Executed:
            return "executed";
        case HangupOutcome::NotRequested:
            return "not_requested";
        case HangupOutcome::TurnMismatch:
            return "turn_mismatch";
        case HangupOutcome::UnknownTurn:
            return "unknown_turn";
        case HangupOutcome::TurnCancelled:
            return "turn_cancelled";
        case HangupOutcome::AudioPending:
            return "audio_pending";
        case HangupOutcome::PlaybackPending:
            return "playback_pending";
        case HangupOutcome::AlreadyExecuted:
            return "already_executed";
    }
    return "unknown";
}

HangupExecutor::HangupExecutor(HangupConfig config,
                               const TurnLifecycle& turns,
                               DrainedCheck playback_drained,
                               Terminator terminator,
                               std::string call_id)
    : config_(config),
      turns_(turns),
      playback_drained_(std::move(playback_drained)),
      terminator_(std::move(terminator)),
      call_id_(std::move(call_id)) {}

bool HangupExecutor::request_hangup(const std::string& turn_id,
                                    Clock::time_point now,
                                    const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == HangupState::Executed) {
        return false;
    }
    if (request_ && request_->turn_id == turn_id) {
        return false;
    }
    if (request_) {
        logging::info(
            "Hangup request replaced",
            {kv("call_id", call_id_),
             kv("previous_turn_id", request_->turn_id),
             kv("turn_id", turn_id)});
    }
    request_ = Request{turn_id, reason, now};
    state_ = HangupState::Pending;
    Metrics::instance().increment_event("hangup_requested");
    logging::info(
        "Hangup requested",
        {kv("call_id", call_id_),
         kv("turn_id", turn_id),
         kv("reason", reason)});
    return true;
}

bool HangupExecutor::withdraw_request(const std::string& turn_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != HangupState::Pending || !request_ || request_->turn_id != turn_id) {
        return false;
    }
    request_.reset();
    state_ = HangupState::None;
    Metrics::instance().increment_event("hangup_withdrawn");
    logging::info(
        "Hangup request withdrawn",
        {kv("call_id", call_id_),
         kv("turn_id", turn_id)});
    return true;
}

HangupOutcome HangupExecutor::evaluate_locked(HangupTrigger trigger,
                                              const std::string& turn_id,
                                              Clock::time_point now) const {
    if (state_ == HangupState::Executed) {
        return HangupOutcome::AlreadyExecuted;
    }
    if (!request_) {
        return HangupOutcome::NotRequested;
    }
    if (request_->turn_id != turn_id) {
        return HangupOutcome::TurnMismatch;
    }
    const auto turn = turns_.snapshot(turn_id);
    if (!turn) {
        return HangupOutcome::UnknownTurn;
    }
    if (turn->status == TurnStatus::CancelRequested ||
        turn->status == TurnStatus::Cancelled) {
        return HangupOutcome::TurnCancelled;
    }

    const bool fallback = trigger == HangupTrigger::FallbackTimer;
    const bool request_expired =
        fallback && now - request_->requested_at >= config_.request_fallback;
    if (!turn->audio_done_ts && !request_expired) {
        return HangupOutcome::AudioPending;
    }

    const bool drain_expired =
        fallback && (request_expired ||
                     (turn->audio_done_ts &&
                      now - *turn->audio_done_ts >= config_.drain_fallback));
    if (!drain_expired && playback_drained_ && !playback_drained_()) {
        return HangupOutcome::PlaybackPending;
    }
    return HangupOutcome::Executed;
}

HangupOutcome HangupExecutor::maybe_execute_hangup(HangupTrigger trigger,
                                                   const std::string& turn_id,
                                                   Clock::time_point now) {
    std::string reason;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto outcome = evaluate_locked(trigger, turn_id, now);
        if (outcome != HangupOutcome::Executed) {
            log_skip(trigger, turn_id, outcome);
            return outcome;
        }
        state_ = HangupState::Executed;
        executed_via_ = hangup_trigger_name(trigger);
        reason = request_->reason;
        executed_reason_ = reason;
    }
    logging::info(
        "Hangup executed",
        {kv("call_id", call_id_),
         kv("turn_id", turn_id),
         kv("via", hangup_trigger_name(trigger)),
         kv("reason", reason)});
    terminate(hangup_trigger_name(trigger), reason);
    return HangupOutcome::Executed;
}

HangupOutcome HangupExecutor::poll_fallback(Clock::time_point now) {
    std::string turn_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != HangupState::Pending || !request_) {
            return HangupOutcome::NotRequested;
        }
        turn_id = request_->turn_id;
    }
    return maybe_execute_hangup(HangupTrigger::FallbackTimer, turn_id, now);
}

HangupOutcome HangupExecutor::force_hangup(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == HangupState::Executed) {
            log_skip(HangupTrigger::Watchdog, {}, HangupOutcome::AlreadyExecuted);
            return HangupOutcome::AlreadyExecuted;
        }
        state_ = HangupState::Executed;
        executed_via_ = hangup_trigger_name(HangupTrigger::Watchdog);
        executed_reason_ = reason;
    }
    logging::info(
        "Hangup executed",
        {kv("call_id", call_id_),
         kv("via", hangup_trigger_name(HangupTrigger::Watchdog)),
         kv("reason", reason)});
    terminate(hangup_trigger_name(HangupTrigger::Watchdog), reason);
    return HangupOutcome::Executed;
}

void HangupExecutor::terminate(const std::string& via, const std::string& reason) {
    Metrics::instance().increment_event("hangup_executed");
    Metrics::instance().increment_event("hangup_via_" + via);
    if (!terminator_) {
        return;
    }
    try {
        terminator_(reason);
    } catch (const std::exception& ex) {
        logging::error(
            "Hangup terminator failed",
            {kv("call_id", call_id_),
             kv("via", via),
             kv("error", ex.what())});
    }
}

void HangupExecutor::log_skip(HangupTrigger trigger,
                              const std::string& turn_id,
                              HangupOutcome outcome) const {
    if (outcome == HangupOutcome::NotRequested) {
        return;
    }
    // The fallback timer re-evaluates on every tick.
    const bool periodic = trigger == HangupTrigger::FallbackTimer;
    if (!periodic) {
        Metrics::instance().increment_event("hangup_skipped");
    }
    const auto level = periodic ? spdlog::level::trace : spdlog::level::debug;
    logging::log(
        level,
        "Hangup skipped",
        {kv("call_id", call_id_),
         kv("turn_id", turn_id),
         kv("via", hangup_trigger_name(trigger)),
         kv("reason", hangup_outcome_name(outcome))});
}

HangupState HangupExecutor::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool HangupExecutor::executed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == HangupState::Executed;
}

std::optional<std::string> HangupExecutor::requested_turn() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!request_) {
        return std::nullopt;
    }
    return request_->turn_id;
}

std::string HangupExecutor::executed_via() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return executed_via_;
}

std::string HangupExecutor::executed_reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return executed_reason_;
}

}
