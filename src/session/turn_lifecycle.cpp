#include "realtime_bridge/session/turn_lifecycle.hpp"

#include "realtime_bridge/logging.hpp"
#include "realtime_bridge/metrics.hpp"

namespace realtime_bridge {

const char* turn_status_name(TurnStatus status) {
    switch (status) {
        case TurnStatus::Active:
            return "active";
        case TurnStatus::CancelRequested:
            return "cancel_requested";
        case TurnStatus::Cancelled:
            return "cancelled";
        case TurnStatus::AudioDone:
            return "audio_done";
        case TurnStatus::Completed:
            return "completed";
    }
    return "unknown";
}

TurnLifecycle::TurnLifecycle(std::string call_id)
    : call_id_(std::move(call_id)) {}

Turn* TurnLifecycle::find(const std::string& turn_id) {
    if (current_ && current_->turn_id == turn_id) {
        return &*current_;
    }
    if (previous_ && previous_->turn_id == turn_id) {
        return &*previous_;
    }
    return nullptr;
}

const Turn* TurnLifecycle::find(const std::string& turn_id) const {
    if (current_ && current_->turn_id == turn_id) {
        return &*current_;
    }
    if (previous_ && previous_->turn_id == turn_id) {
        return &*previous_;
    }
    return nullptr;
}

void TurnLifecycle::log_transition(const Turn& turn, const char* event) const {
    logging::info(
        event,
        {kv("call_id", call_id_),
         kv("turn_id", turn.turn_id),
         kv("status", turn_status_name(turn.status))});
}

TurnLifecycle::Result TurnLifecycle::turn_started(const std::string& turn_id,
                                                  Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (find(turn_id)) {
        return Result::Unchanged;
    }
    if (current_) {
        previous_ = std::move(current_);
    }
    Turn turn;
    turn.turn_id = turn_id;
    turn.started_ts = now;
    turn.ordinal = ++turns_started_;
    current_ = std::move(turn);
    Metrics::instance().increment_event("turn_created");
    log_transition(*current_, "Turn created");
    return Result::Applied;
}

TurnLifecycle::Result TurnLifecycle::mark_audio_done(const std::string& turn_id,
                                                     Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* turn = find(turn_id);
    if (!turn) {
        return Result::UnknownTurn;
    }
    if (turn->audio_done_ts) {
        return Result::Unchanged;
    }
    turn->audio_done_ts = now;
    if (turn->status == TurnStatus::Active) {
        turn->status = TurnStatus::AudioDone;
    }
    log_transition(*turn, "Turn audio done");
    return Result::Applied;
}

bool TurnLifecycle::mark_cancel_requested(const std::string& turn_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* turn = find(turn_id);
    if (!turn || turn->cancel_sent) {
        return false;
    }
    if (turn->status != TurnStatus::Active && turn->status != TurnStatus::AudioDone) {
        return false;
    }
    turn->cancel_sent = true;
    turn->status = TurnStatus::CancelRequested;
    log_transition(*turn, "Turn cancel requested");
    return true;
}

TurnLifecycle::Result TurnLifecycle::mark_cancelled(const std::string& turn_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* turn = find(turn_id);
    if (!turn) {
        return Result::UnknownTurn;
    }
    if (turn->status == TurnStatus::Cancelled) {
        return Result::Unchanged;
    }
    turn->status = TurnStatus::Cancelled;
    Metrics::instance().increment_event("turn_cancelled");
    log_transition(*turn, "Turn cancelled");
    return Result::Applied;
}

TurnLifecycle::Result TurnLifecycle::mark_completed(const std::string& turn_id,
                                                    Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* turn = find(turn_id);
    if (!turn) {
        return Result::UnknownTurn;
    }
    if (!turn->audio_done_ts) {
        turn->audio_done_ts = now;
    }
    switch (turn->status) {
        case TurnStatus::CancelRequested:
            // The vendor finished the turn after our cancel landed.
            turn->status = TurnStatus::Cancelled;
            Metrics::instance().increment_event("turn_cancelled");
            log_transition(*turn, "Turn cancelled");
            return Result::Applied;
        case TurnStatus::Active:
        case TurnStatus::AudioDone:
            turn->status = TurnStatus::Completed;
            Metrics::instance().increment_event("turn_completed");
            log_transition(*turn, "Turn completed");
            return Result::Applied;
        case TurnStatus::Cancelled:
        case TurnStatus::Completed:
            break;
    }
    return Result::Unchanged;
}

bool TurnLifecycle::is_cancelled(const std::string& turn_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto* turn = find(turn_id);
    return turn && (turn->status == TurnStatus::CancelRequested ||
                    turn->status == TurnStatus::Cancelled);
}

bool TurnLifecycle::is_audio_done(const std::string& turn_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto* turn = find(turn_id);
    return turn && turn->audio_done_ts.has_value();
}

bool TurnLifecycle::is_known(const std::string& turn_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return find(turn_id) != nullptr;
}

bool TurnLifecycle::has_active_turn() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_ && current_->status == TurnStatus::Active;
}

std::optional<std::string> TurnLifecycle::current_turn_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!current_) {
        return std::nullopt;
    }
    return current_->turn_id;
}

std::optional<Turn> TurnLifecycle::snapshot(const std::string& turn_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto* turn = find(turn_id);
    if (!turn) {
        return std::nullopt;
    }
    return *turn;
}

std::optional<Turn> TurnLifecycle::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

uint64_t TurnLifecycle::turns_started() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return turns_started_;
}

}
