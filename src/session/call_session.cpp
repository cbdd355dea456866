#include "realtime_bridge/session/call_session.hpp"

#include <algorithm>

#include "realtime_bridge/config.hpp"
#include "realtime_bridge/logging.hpp"
#include "realtime_bridge/metrics.hpp"
#include "realtime_bridge/utils/async.hpp"

namespace realtime_bridge {

SessionConfig make_session_config(const Config& config) {
    SessionConfig result;
    result.format = audio::FrameFormat::from_config(config);
    result.playback_capacity_frames = static_cast<size_t>(
        std::max(1, config.playback_queue_ms / std::max(1, config.frame_ms)));
    result.saturation_warn_interval =
        std::chrono::milliseconds(config.playback_saturation_warn_ms);
    result.vad = vad::VadConfig::from_config(config);
    result.barge_in = BargeInConfig::from_config(config);
    result.hangup = HangupConfig::from_config(config);
    result.watchdog = WatchdogConfig::from_config(config);
    result.goodbye_phrases = config.goodbye_phrases;
    return result;
}

CallSession::CallSession(SessionConfig config,
                         CallProfile profile,
                         std::shared_ptr<TelephonyLeg> telephony,
                         std::shared_ptr<RealtimeChannel> channel,
                         Clock::time_point now)
    : config_(std::move(config)),
      profile_(std::move(profile)),
      started_at_(now),
      telephony_(std::move(telephony)),
      channel_(std::move(channel)),
      turns_(profile_.call_id),
      queue_(config_.playback_capacity_frames,
             config_.saturation_warn_interval,
             profile_.call_id),
      framer_(config_.format.frame_bytes(),
              [this](audio::AudioFrame&& frame) { on_frame_ready(std::move(frame)); }),
      sender_(queue_,
              config_.format.frame_duration,
              [this](const audio::AudioFrame& frame, Clock::time_point at) {
                  telephony_->send_frame(frame);
                  touch_activity(at);
              },
              profile_.call_id),
      hangup_(config_.hangup,
              turns_,
              [this]() { return playback_drained(); },
              [this](const std::string& reason) {
                  telephony_->terminate_call(profile_.call_id, reason);
              },
              profile_.call_id),
      barge_in_(config_.barge_in,
                BargeInController::Targets{turns_, queue_, framer_, *telephony_, *channel_,
                                           hangup_, ai_speaking_},
                profile_.call_id),
      goodbye_(config_.goodbye_phrases),
      vad_(config_.vad, now),
      watchdog_(config_.watchdog, now),
      last_activity_(now),
      last_inbound_frame_(now),
      next_watchdog_poll_(now + config_.watchdog.poll_interval) {
    sender_.set_on_drained([this](Clock::time_point at) { on_playback_drained(at); });
    sender_.set_on_failure([this](const std::string& error) {
        teardown_from_task("sender_failed: " + error);
    });
    sender_.anchor(now);
}

CallSession::~CallSession() {
    on_teardown_ = nullptr;
    teardown("destroyed");
}

void CallSession::set_on_teardown(TeardownHandler cb) {
    on_teardown_ = std::move(cb);
}

void CallSession::start() {
    if (started_.exchange(true)) {
        return;
    }
    Metrics::instance().session_opened();
    logging::info(
        "Call session started",
        {kv("call_id", profile_.call_id),
         kv("direction", direction_name(profile_.direction)),
         kv("frame_bytes", config_.format.frame_bytes()),
         kv("queue_capacity", queue_.capacity())});

    if (config_.run_threads) {
        // teardown() sets closed_ before it takes timer_mutex_ to stop the threads.
        std::lock_guard<std::mutex> lock(timer_mutex_);
        if (closed_) {
            return;
        }
        sender_.start();
        timer_running_ = true;
        timer_thread_ = std::thread([this]() { timer_loop(); });
        feed_thread_ = std::thread([this]() { feed_loop(); });
    }

    std::weak_ptr<CallSession> weak = weak_from_this();
    try {
        channel_->connect(
            profile_,
            [weak](const RealtimeEvent& event) {
                if (auto self = weak.lock()) {
                    self->handle_event(event, Clock::now());
                }
            },
            [weak](const std::string& reason) {
                if (auto self = weak.lock()) {
                    self->teardown_from_task("realtime_closed: " + reason);
                }
            });
    } catch (const std::exception& ex) {
        logging::error(
            "Realtime channel connect failed",
            {kv("call_id", profile_.call_id),
             kv("error", ex.what())});
        teardown("realtime_connect_failed");
    }
}

void CallSession::teardown(const std::string& reason) {
    if (closed_.exchange(true)) {
        return;
    }
    logging::info(
        "Call session closing",
        {kv("call_id", profile_.call_id),
         kv("reason", reason),
         kv("hangup_state", hangup_state_name(hangup_.state())),
         kv("frames_sent", sender_.frames_sent())});
    queue_.close();
    stop_workers();
    try {
        channel_->close();
    } catch (const std::exception& ex) {
        logging::warn(
            "Realtime channel close failed",
            {kv("call_id", profile_.call_id),
             kv("error", ex.what())});
    }
    if (started_) {
        Metrics::instance().session_closed();
    }
    if (on_teardown_) {
        on_teardown_(profile_.call_id, reason);
    }
}

void CallSession::teardown_from_task(const std::string& reason) {
    if (!config_.run_threads) {
        teardown(reason);
        return;
    }
    auto self = weak_from_this().lock();
    if (!self || closed_) {
        return;
    }
    utils::run_async([self, reason]() { self->teardown(reason); });
}

void CallSession::on_inbound_frame(const std::vector<uint8_t>& payload,
                                   Clock::time_point now) {
    if (closed_) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        last_inbound_frame_ = now;
    }
    try {
        channel_->send_audio(payload);
    } catch (const std::exception& ex) {
        logging::warn(
            "Failed to forward caller audio",
            {kv("call_id", profile_.call_id),
             kv("error", ex.what())});
    }

    std::optional<Clock::time_point> turn_started;
    if (const auto current = turns_.current()) {
        turn_started = current->started_ts;
    }
    const auto result = vad_.process(payload, now, ai_speaking_, turn_started);
    if (result.speech_started) {
        logging::debug(
            "Caller speech started",
            {kv("call_id", profile_.call_id),
             kv("rms", result.rms),
             kv("ai_speaking", ai_speaking_.load())});
        on_caller_activity(now);
    } else if (result.above_threshold && vad_.speaking()) {
        touch_activity(now);
    }
    if (result.barge_in_candidate) {
        barge_in_.on_candidate(now);
    }
    if (result.speech_ended) {
        logging::debug("Caller speech ended", {kv("call_id", profile_.call_id)});
    }
}

void CallSession::on_playback_mark(const std::string& name, Clock::time_point now) {
    logging::trace(
        "Playback mark acknowledged",
        {kv("call_id", profile_.call_id),
         kv("mark", name)});
    if (const auto turn_id = hangup_.requested_turn()) {
        hangup_.maybe_execute_hangup(HangupTrigger::AudioDone, *turn_id, now);
    }
}

void CallSession::handle_event(const RealtimeEvent& event, Clock::time_point now) {
    if (closed_) {
        return;
    }
    try {
        switch (event.type) {
            case RealtimeEventType::TurnStarted:
                on_turn_started(event, now);
                break;
            case RealtimeEventType::AudioChunk:
            case RealtimeEventType::AudioDone:
            case RealtimeEventType::TurnCompleted:
                enqueue_playback(event, now);
                break;
            case RealtimeEventType::TranscriptFinal:
                on_transcript_final(event, now);
                break;
            case RealtimeEventType::TurnCancelled:
                on_turn_cancelled(event, now);
                break;
            case RealtimeEventType::CallerSpeechStarted:
                on_caller_activity(now);
                barge_in_.on_candidate(now);
                break;
            case RealtimeEventType::CallerTranscript:
                logging::debug(
                    "Caller transcript",
                    {kv("call_id", profile_.call_id),
                     text_kv("text", event.text)});
                on_caller_activity(now);
                barge_in_.on_caller_transcript(event.text, now);
                break;
            case RealtimeEventType::CancelRejected:
                barge_in_.on_cancel_rejected(event.turn_id, event.error_code);
                break;
            case RealtimeEventType::Error:
                logging::warn(
                    "Realtime channel error",
                    {kv("call_id", profile_.call_id),
                     kv("code", event.error_code),
                     kv("message", event.text)});
                break;
        }
    } catch (const std::exception& ex) {
        logging::error(
            "Realtime event handling failed",
            {kv("call_id", profile_.call_id),
             kv("event", realtime_event_name(event.type)),
             kv("error", ex.what())});
        teardown_from_task("event_failed");
    }
}

void CallSession::enqueue_playback(const RealtimeEvent& event, Clock::time_point now) {
    if (!config_.run_threads) {
        apply_playback_event(event, now);
        return;
    }
    {
        std::lock_guard<std::mutex> lock(feed_mutex_);
        if (feed_stopped_) {
            return;
        }
        feed_.emplace_back(event, now);
    }
    feed_cv_.notify_one();
}

// Runs on the playback feed, or inline when the session owns no threads.
void CallSession::apply_playback_event(const RealtimeEvent& event, Clock::time_point now) {
    if (closed_) {
        return;
    }
    switch (event.type) {
        case RealtimeEventType::AudioChunk:
            on_audio_chunk(event, now);
            break;
        case RealtimeEventType::AudioDone:
            on_audio_done(event, now);
            break;
        case RealtimeEventType::TurnCompleted:
            on_turn_completed(event, now);
            break;
        case RealtimeEventType::TurnCancelled:
            on_turn_finished(event.turn_id, now);
            break;
        default:
            break;
    }
}

void CallSession::feed_loop() {
    std::unique_lock<std::mutex> lock(feed_mutex_);
    while (true) {
        feed_cv_.wait(lock, [this]() { return feed_stopped_ || !feed_.empty(); });
        if (feed_stopped_) {
            break;
        }
        auto item = std::move(feed_.front());
        feed_.pop_front();
        lock.unlock();
        try {
            apply_playback_event(item.first, item.second);
        } catch (const std::exception& ex) {
            logging::error(
                "Playback feed failed",
                {kv("call_id", profile_.call_id),
                 kv("event", realtime_event_name(item.first.type)),
                 kv("error", ex.what())});
            teardown_from_task("playback_feed_failed");
            return;
        }
        lock.lock();
    }
}

void CallSession::on_turn_started(const RealtimeEvent& event, Clock::time_point now) {
    if (turns_.turn_started(event.turn_id, now) != TurnLifecycle::Result::Applied) {
        return;
    }
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!greeting_turn_id_) {
        greeting_turn_id_ = event.turn_id;
    }
}

void CallSession::on_audio_chunk(const RealtimeEvent& event, Clock::time_point now) {
    if (turns_.is_cancelled(event.turn_id)) {
        Metrics::instance().increment_event("audio_dropped_cancelled");
        logging::trace(
            "Audio for cancelled turn dropped",
            {kv("call_id", profile_.call_id),
             kv("turn_id", event.turn_id),
             kv("bytes", event.audio.size())});
        return;
    }
    if (!turns_.is_known(event.turn_id)) {
        logging::warn(
            "Audio for unknown turn ignored",
            {kv("call_id", profile_.call_id),
             kv("turn_id", event.turn_id)});
        return;
    }
    ai_speaking_ = true;
    touch_activity(now);
    framer_.feed(event.turn_id, event.audio);
}

void CallSession::on_audio_done(const RealtimeEvent& event, Clock::time_point now) {
    const auto result = turns_.mark_audio_done(event.turn_id, now);
    if (result == TurnLifecycle::Result::UnknownTurn) {
        logging::warn(
            "Audio done for unknown turn ignored",
            {kv("call_id", profile_.call_id),
             kv("turn_id", event.turn_id)});
        return;
    }
    const auto discarded = framer_.reset();
    if (discarded > 0) {
        logging::trace(
            "Partial frame discarded at end of audio",
            {kv("call_id", profile_.call_id),
             kv("turn_id", event.turn_id),
             kv("bytes", discarded)});
    }
    // Everything was already sent; the drain callback fired before this.
    if (queue_.empty() && sender_.idle()) {
        note_turn_played(event.turn_id, now);
    }
    hangup_.maybe_execute_hangup(HangupTrigger::AudioDone, event.turn_id, now);
}

void CallSession::on_turn_completed(const RealtimeEvent& event, Clock::time_point now) {
    if (turns_.mark_completed(event.turn_id, now) == TurnLifecycle::Result::UnknownTurn) {
        logging::warn(
            "Completion for unknown turn ignored",
            {kv("call_id", profile_.call_id),
             kv("turn_id", event.turn_id)});
        return;
    }
    on_turn_finished(event.turn_id, now);
    hangup_.maybe_execute_hangup(HangupTrigger::AudioDone, event.turn_id, now);
}

void CallSession::on_turn_cancelled(const RealtimeEvent& event, Clock::time_point now) {
    const bool requested_locally = turns_.is_cancelled(event.turn_id);
    const auto result = turns_.mark_cancelled(event.turn_id);
    if (result == TurnLifecycle::Result::UnknownTurn) {
        logging::warn(
            "Cancel for unknown turn ignored",
            {kv("call_id", profile_.call_id),
             kv("turn_id", event.turn_id)});
        return;
    }
    if (result == TurnLifecycle::Result::Applied) {
        if (!requested_locally) {
            Metrics::instance().increment_event("turn_cancelled_by_vendor");
        }
        logging::info(
            "Realtime turn cancelled",
            {kv("call_id", profile_.call_id),
             kv("turn_id", event.turn_id),
             kv("requested_locally", requested_locally)});
    }
    // Behind any audio of the turn still waiting to be framed.
    enqueue_playback(event, now);
}

// A turn that will send no more audio. Playback state settles here when its
// audio already drained before the end was announced.
void CallSession::on_turn_finished(const std::string& turn_id, Clock::time_point now) {
    const auto current = turns_.current();
    if (!current || current->turn_id != turn_id) {
        return;
    }
    const auto discarded = framer_.reset();
    if (discarded > 0) {
        logging::trace(
            "Partial frame discarded at end of turn",
            {kv("call_id", profile_.call_id),
             kv("turn_id", turn_id),
             kv("bytes", discarded)});
    }
    if (queue_.empty() && sender_.idle()) {
        note_turn_played(turn_id, now);
    }
}

void CallSession::on_transcript_final(const RealtimeEvent& event, Clock::time_point now) {
    logging::debug(
        "AI transcript",
        {kv("call_id", profile_.call_id),
         kv("turn_id", event.turn_id),
         text_kv("text", event.text)});
    if (!turns_.is_known(event.turn_id)) {
        logging::warn(
            "Transcript for unknown turn ignored",
            {kv("call_id", profile_.call_id),
             kv("turn_id", event.turn_id)});
        return;
    }
    const auto phrase = goodbye_.matched_phrase(event.text);
    if (!phrase) {
        return;
    }
    if (turns_.is_cancelled(event.turn_id)) {
        logging::info(
            "Goodbye in interrupted turn ignored",
            {kv("call_id", profile_.call_id),
             kv("turn_id", event.turn_id)});
        return;
    }
    logging::info(
        "Goodbye detected",
        {kv("call_id", profile_.call_id),
         kv("turn_id", event.turn_id),
         kv("phrase", *phrase)});
    hangup_.request_hangup(event.turn_id, now, "goodbye");
    if (turns_.is_audio_done(event.turn_id)) {
        hangup_.maybe_execute_hangup(HangupTrigger::TranscriptRace, event.turn_id, now);
    }
}

void CallSession::on_frame_ready(audio::AudioFrame&& frame) {
    if (turns_.is_cancelled(frame.turn_id)) {
        return;
    }
    const auto result = queue_.push(std::move(frame));
    if (result == audio::PlaybackQueue::PushResult::Flushed) {
        logging::trace("Frame discarded by playback flush", {kv("call_id", profile_.call_id)});
    }
}

void CallSession::on_playback_drained(Clock::time_point now) {
    telephony_->mark_playback("drain-" + std::to_string(++drain_marks_));

    const auto current = turns_.current();
    if (current && (current->audio_done_ts || current->status != TurnStatus::Active)) {
        note_turn_played(current->turn_id, now);
    }
    if (const auto turn_id = hangup_.requested_turn()) {
        hangup_.maybe_execute_hangup(HangupTrigger::AudioDone, *turn_id, now);
    }
}

void CallSession::note_turn_played(const std::string& turn_id, Clock::time_point now) {
    ai_speaking_ = false;
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (greeting_turn_id_ && *greeting_turn_id_ == turn_id && !greeting_done_) {
        greeting_done_ = now;
        logging::info(
            "Greeting playback finished",
            {kv("call_id", profile_.call_id),
             kv("turn_id", turn_id)});
    }
}

void CallSession::on_caller_activity(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    caller_has_spoken_ = true;
    last_activity_ = std::max(last_activity_, now);
    watchdog_.note_caller_speech();
}

void CallSession::touch_activity(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    last_activity_ = std::max(last_activity_, now);
}

bool CallSession::playback_drained() const {
    return queue_.empty() && telephony_->downstream_drained();
}

bool CallSession::pump_playback(Clock::time_point now) {
    if (closed_) {
        return false;
    }
    return sender_.cycle(now);
}

void CallSession::tick(Clock::time_point now) {
    if (closed_) {
        return;
    }
    barge_in_.poll(now);
    hangup_.poll_fallback(now);

    bool watchdog_due = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (now >= next_watchdog_poll_) {
            next_watchdog_poll_ = now + config_.watchdog.poll_interval;
            watchdog_due = true;
        }
    }
    if (watchdog_due) {
        run_watchdog(now);
    }
}

void CallSession::run_watchdog(Clock::time_point now) {
    if (hangup_.executed()) {
        return;
    }
    WatchdogInputs inputs;
    inputs.turn_active = turns_.has_active_turn();
    inputs.playback_pending = ai_speaking_ || !playback_drained();

    WatchdogVerdict verdict;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        inputs.last_activity = last_activity_;
        inputs.last_inbound_frame = last_inbound_frame_;
        inputs.greeting_done = greeting_done_;
        inputs.caller_has_spoken = caller_has_spoken_;
        verdict = watchdog_.evaluate(inputs, now);
    }

    switch (verdict.action) {
        case WatchdogVerdict::Action::None:
            return;
        case WatchdogVerdict::Action::Warn:
            Metrics::instance().increment_event("silence_warning");
            logging::info(
                "Silence warning",
                {kv("call_id", profile_.call_id),
                 kv("warning", verdict.warning_number),
                 kv("max_warnings", config_.watchdog.max_warnings)});
            if (!config_.watchdog.warning_prompt.empty()) {
                try {
                    channel_->request_checkin(config_.watchdog.warning_prompt);
                } catch (const std::exception& ex) {
                    logging::warn(
                        "Check-in request failed",
                        {kv("call_id", profile_.call_id),
                         kv("error", ex.what())});
                }
            }
            return;
        case WatchdogVerdict::Action::Hangup:
            Metrics::instance().increment_event("watchdog_" + verdict.reason);
            logging::info(
                "Watchdog terminating call",
                {kv("call_id", profile_.call_id),
                 kv("reason", verdict.reason)});
            hangup_.force_hangup(verdict.reason);
            return;
        case WatchdogVerdict::Action::Teardown:
            Metrics::instance().increment_event("watchdog_" + verdict.reason);
            logging::warn(
                "Watchdog tearing down session",
                {kv("call_id", profile_.call_id),
                 kv("reason", verdict.reason)});
            teardown_from_task(verdict.reason);
            return;
    }
}

void CallSession::timer_loop() {
    std::unique_lock<std::mutex> lock(timer_mutex_);
    while (timer_running_) {
        if (timer_cv_.wait_for(lock, config_.timer_tick, [this]() { return !timer_running_; })) {
            break;
        }
        lock.unlock();
        try {
            tick(Clock::now());
        } catch (const std::exception& ex) {
            logging::error(
                "Session timer failed",
                {kv("call_id", profile_.call_id),
                 kv("error", ex.what())});
            teardown_from_task("timer_failed");
            return;
        }
        lock.lock();
    }
}

void CallSession::stop_workers() {
    {
        std::lock_guard<std::mutex> lock(timer_mutex_);
        timer_running_ = false;
    }
    timer_cv_.notify_all();
    {
        std::lock_guard<std::mutex> lock(feed_mutex_);
        feed_stopped_ = true;
        feed_.clear();
    }
    feed_cv_.notify_all();
    sender_.stop();
    for (auto* worker : {&timer_thread_, &feed_thread_}) {
        if (!worker->joinable()) {
            continue;
        }
        if (worker->get_id() == std::this_thread::get_id()) {
            worker->detach();
        } else {
            worker->join();
        }
    }
}

SessionSnapshot CallSession::snapshot() const {
    SessionSnapshot result;
    result.call_id = profile_.call_id;
    result.direction = profile_.direction;
    if (const auto current = turns_.current()) {
        result.current_turn_id = current->turn_id;
        result.current_turn_status = turn_status_name(current->status);
    }
    result.hangup_state = hangup_.state();
    result.ai_speaking = ai_speaking_;
    result.turns = turns_.turns_started();
    result.frames_sent = sender_.frames_sent();
    result.barge_ins = barge_in_.confirmed_count();
    result.queued_frames = queue_.size();
    result.age_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        Clock::now() - started_at_).count();
    std::lock_guard<std::mutex> lock(state_mutex_);
    result.caller_has_spoken = caller_has_spoken_;
    return result;
}

}
