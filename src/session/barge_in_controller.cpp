#include "realtime_bridge/session/barge_in_controller.hpp"

#include <algorithm>
#include <stdexcept>

#include "realtime_bridge/config.hpp"
#include "realtime_bridge/logging.hpp"
#include "realtime_bridge/metrics.hpp"
#include "realtime_bridge/utils/text.hpp"

namespace realtime_bridge {

namespace {

long long to_ms(std::chrono::steady_clock::duration value) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(value).count();
}

}

ConfirmMode parse_confirm_mode(const std::string& value) {
    const auto normalized = utils::normalize_text(value);
    if (normalized == "vad") {
        return ConfirmMode::Vad;
    }
    if (normalized == "transcript") {
        return ConfirmMode::Transcript;
    }
    throw std::runtime_error("Unsupported barge-in confirm mode: " + value);
}

BargeInConfig BargeInConfig::from_config(const Config& config) {
    BargeInConfig result;
    result.enabled = config.barge_in_enabled;
    result.confirm_mode = parse_confirm_mode(config.barge_in_confirm_mode);
    result.confirm_timeout = std::chrono::milliseconds(config.barge_in_confirm_timeout_ms);
    result.cancel_cooldown = std::chrono::milliseconds(config.barge_in_cancel_cooldown_ms);
    result.min_transcript_chars =
        static_cast<size_t>(std::max(0, config.barge_in_min_transcript_chars));
    return result;
}

const char* barge_in_outcome_name(BargeInOutcome outcome) {
    switch (outcome) {
        case BargeInOutcome::Confirmed:
            return "confirmed";
        case BargeInOutcome::AwaitingConfirmation:
            return "awaiting_confirmation";
        case BargeInOutcome::NothingToInterrupt:
            return "nothing_to_interrupt";
        case BargeInOutcome::Disabled:
            return "disabled";
        case BargeInOutcome::CoolingDown:
            return "cooling_down";
        case BargeInOutcome::Vetoed:
            return "vetoed";
        case BargeInOutcome::NoCandidate:
            return "no_candidate";
    }
    return "unknown";
}

BargeInController::BargeInController(BargeInConfig config,
                                     Targets targets,
                                     std::string call_id)
    : config_(config),
      targets_(targets),
      call_id_(std::move(call_id)) {}

bool BargeInController::interruptible() const {
    return targets_.ai_speaking.load() || targets_.turns.has_active_turn();
}

BargeInOutcome BargeInController::on_candidate(Clock::time_point now) {
    if (!config_.enabled) {
        return BargeInOutcome::Disabled;
    }
    if (!interruptible()) {
        return BargeInOutcome::NothingToInterrupt;
    }
    Metrics::instance().increment_event("barge_in_candidate");
    logging::info(
        "Barge-in candidate",
        {kv("call_id", call_id_),
         kv("turn_id", targets_.turns.current_turn_id().value_or("")),
         kv("mode", config_.confirm_mode == ConfirmMode::Vad ? "vad" : "transcript")});

    if (config_.confirm_mode == ConfirmMode::Vad) {
        return confirm(now, now);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (!pending_since_) {
        pending_since_ = now;
    }
    return BargeInOutcome::AwaitingConfirmation;
}

BargeInOutcome BargeInController::on_caller_transcript(const std::string& text,
                                                       Clock::time_point now) {
    Clock::time_point candidate_ts;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!pending_since_) {
            return BargeInOutcome::NoCandidate;
        }
        candidate_ts = *pending_since_;
        pending_since_.reset();
    }

    const auto normalized = utils::normalize_text(utils::strip_punctuation(text));
    if (normalized.size() < config_.min_transcript_chars) {
        Metrics::instance().increment_event("barge_in_vetoed");
        logging::info(
            "Barge-in vetoed",
            {kv("call_id", call_id_),
             kv("transcript_chars", normalized.size())});
        return BargeInOutcome::Vetoed;
    }
    if (!interruptible()) {
        return BargeInOutcome::NothingToInterrupt;
    }
    return confirm(candidate_ts, now);
}

BargeInOutcome BargeInController::poll(Clock::time_point now) {
    Clock::time_point candidate_ts;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!pending_since_) {
            return BargeInOutcome::NoCandidate;
        }
        if (now - *pending_since_ < config_.confirm_timeout) {
            return BargeInOutcome::AwaitingConfirmation;
        }
        candidate_ts = *pending_since_;
        pending_since_.reset();
    }
    if (!interruptible()) {
        return BargeInOutcome::NothingToInterrupt;
    }
    logging::info(
        "Barge-in confirmation timed out, confirming",
        {kv("call_id", call_id_),
         kv("waited_ms", to_ms(now - candidate_ts))});
    return confirm(candidate_ts, now);
}

BargeInOutcome BargeInController::confirm(Clock::time_point candidate_ts,
                                          Clock::time_point now) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (last_confirmed_ && now - *last_confirmed_ < config_.cancel_cooldown) {
            logging::debug(
                "Barge-in suppressed by cooldown",
                {kv("call_id", call_id_),
                 kv("since_last_ms", to_ms(now - *last_confirmed_))});
            return BargeInOutcome::CoolingDown;
        }
        last_confirmed_ = now;
        ++confirmed_count_;
    }

    const auto turn_id = targets_.turns.current_turn_id();
    bool cancel_sent = false;
    if (turn_id && targets_.turns.mark_cancel_requested(*turn_id)) {
        try {
            targets_.channel.request_cancel(*turn_id);
            cancel_sent = true;
            ++cancels_sent_;
            Metrics::instance().increment_event("cancel_sent");
        } catch (const std::exception& ex) {
            logging::error(
                "Failed to send cancel",
                {kv("call_id", call_id_),
                 kv("turn_id", *turn_id),
                 kv("error", ex.what())});
        }
    }

    const auto dropped_frames = targets_.queue.flush();
    targets_.telephony.clear_buffered_audio();
    const auto dropped_bytes = targets_.framer.reset();
    targets_.ai_speaking = false;
    if (turn_id) {
        targets_.hangup.withdraw_request(*turn_id);
    }

    const auto latency = now - candidate_ts;
    Metrics::instance().increment_event("barge_in_confirmed");
    Metrics::instance().observe_latency(
        "barge_in_confirm",
        std::chrono::duration_cast<std::chrono::duration<double>>(latency).count());
    logging::info(
        "Barge-in confirmed",
        {kv("call_id", call_id_),
         kv("turn_id", turn_id.value_or("")),
         kv("cancel_sent", cancel_sent),
         kv("dropped_frames", dropped_frames),
         kv("dropped_bytes", dropped_bytes),
         kv("confirm_ms", to_ms(latency))});
    return BargeInOutcome::Confirmed;
}

void BargeInController::on_cancel_rejected(const std::string& turn_id,
                                           const std::string& code) {
    Metrics::instance().increment_event("cancel_rejected");
    logging::debug(
        "Cancel rejected, turn already finished",
        {kv("call_id", call_id_),
         kv("turn_id", turn_id),
         kv("code", code)});
}

bool BargeInController::awaiting_confirmation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_since_.has_value();
}

uint64_t BargeInController::confirmed_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return confirmed_count_;
}

uint64_t BargeInController::cancels_sent() const {
    return cancels_sent_;
}

}
