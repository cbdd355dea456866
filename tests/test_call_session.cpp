#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"
#include "realtime_bridge/audio/samples.hpp"
#include "realtime_bridge/metrics.hpp"
#include "realtime_bridge/session/call_session.hpp"
#include "realtime_bridge/session/session_registry.hpp"

#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace realtime_bridge;
using namespace std::chrono_literals;
using Clock = std::chrono::steady_clock;

namespace {

// Waits on a condition set by the session's own threads.
template <typename Predicate>
bool eventually(Predicate done, std::chrono::milliseconds limit = 2000ms) {
    const auto deadline = Clock::now() + limit;
    while (!done()) {
        if (Clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(2ms);
    }
    return true;
}

SessionConfig test_config() {
    SessionConfig config;
    config.playback_capacity_frames = 100;
    config.saturation_warn_interval = 100ms;
    config.run_threads = false;
    config.goodbye_phrases = {"goodbye", "have a great day"};
    config.vad.speech_frames = 4;
    config.vad.initial_adapt_frames = 0;
    config.vad.calibration_window = 0ms;
    config.vad.echo_rms_multiplier = 1.0;
    config.vad.echo_extra_frames = 0;
    config.watchdog.media_timeout = 0ms;
    config.watchdog.warning_prompt = "Are you still there?";
    return config;
}

RealtimeEvent event(RealtimeEventType type, const std::string& turn_id, std::string text = {}) {
    RealtimeEvent result;
    result.type = type;
    result.turn_id = turn_id;
    result.text = std::move(text);
    return result;
}

RealtimeEvent audio_chunk(const std::string& turn_id, size_t bytes) {
    auto result = event(RealtimeEventType::AudioChunk, turn_id);
    result.audio.assign(bytes, 0x7F);
    return result;
}

std::vector<uint8_t> loud_frame() {
    return audio::from_linear(std::vector<int16_t>(160, 8000), audio::Encoding::Mulaw);
}

std::vector<uint8_t> silent_frame() {
    return std::vector<uint8_t>(160, 0xFF);
}

struct Scenario {
    explicit Scenario(SessionConfig config = test_config()) {
        CallProfile profile;
        profile.call_id = "CA100";
        session = std::make_shared<CallSession>(config, profile, telephony, channel, t0);
        session->set_on_teardown([this](const std::string&, const std::string& reason) {
            teardown_reasons.push_back(reason);
        });
        session->start();
    }

    void send(const RealtimeEvent& e, Clock::time_point at) { session->handle_event(e, at); }

    // Runs the clocked sender until the queue is empty and the drain fired.
    Clock::time_point play_out(Clock::time_point from) {
        auto now = from;
        while (session->pump_playback(now) || !session->sender().idle()) {
            now += 20ms;
        }
        return now;
    }

    const Clock::time_point t0 = Clock::time_point{} + 100s;
    std::shared_ptr<testing::FakeTelephonyLeg> telephony =
        std::make_shared<testing::FakeTelephonyLeg>();
    std::shared_ptr<testing::FakeRealtimeChannel> channel =
        std::make_shared<testing::FakeRealtimeChannel>();
    std::shared_ptr<CallSession> session;
    std::vector<std::string> teardown_reasons;
};

}

TEST_CASE("Session connects the channel with the call profile") {
    Scenario s;
    REQUIRE(s.channel->connected);
    REQUIRE(s.channel->connected_profile.call_id == "CA100");
    REQUIRE(s.channel->event_handler);
}

TEST_CASE("AI audio is framed and played at the frame clock") {
    Scenario s;
    s.send(event(RealtimeEventType::TurnStarted, "r1"), s.t0);
    s.send(audio_chunk("r1", 500), s.t0);
    REQUIRE(s.session->ai_speaking());
    REQUIRE(s.session->queue().size() == 3);

    REQUIRE(s.session->pump_playback(s.t0));
    REQUIRE_FALSE(s.session->pump_playback(s.t0 + 10ms));
    REQUIRE(s.session->pump_playback(s.t0 + 20ms));
    REQUIRE(s.telephony->frame_count() == 2);

    const auto& frames = s.telephony->frames;
    REQUIRE(frames[0].seq < frames[1].seq);
    REQUIRE(frames[0].payload.size() == 160);
}

TEST_CASE("Normal farewell hangs up via audio_done after the downstream drains") {
    Scenario s;
    s.telephony->drained = false;
    s.send(event(RealtimeEventType::TurnStarted, "r1"), s.t0);
    s.send(audio_chunk("r1", 480), s.t0);
    s.send(event(RealtimeEventType::TranscriptFinal, "r1", "Thanks for calling. Goodbye!"), s.t0);
    REQUIRE(s.session->hangup().state() == HangupState::Pending);

    s.send(event(RealtimeEventType::AudioDone, "r1"), s.t0 + 10ms);
    REQUIRE(s.telephony->termination_count() == 0);

    const auto drained_at = s.play_out(s.t0 + 10ms);
    REQUIRE(s.telephony->frame_count() == 3);
    REQUIRE(s.telephony->marks == std::vector<std::string>{"drain-1"});
    REQUIRE(s.telephony->termination_count() == 0);

    s.telephony->drained = true;
    s.session->on_playback_mark("drain-1", drained_at + 60ms);
    REQUIRE(s.telephony->terminations == std::vector<std::string>{"goodbye"});
    REQUIRE(s.telephony->terminated_call_id == "CA100");
    REQUIRE(s.session->hangup().executed_via() == "audio_done");

    s.send(event(RealtimeEventType::TurnCompleted, "r1"), drained_at + 100ms);
    REQUIRE(s.telephony->termination_count() == 1);
}

TEST_CASE("Race farewell hangs up via transcript_race when audio finished first") {
    Scenario s;
    s.send(event(RealtimeEventType::TurnStarted, "r1"), s.t0);
    s.send(audio_chunk("r1", 320), s.t0);
    s.send(event(RealtimeEventType::AudioDone, "r1"), s.t0);
    const auto drained_at = s.play_out(s.t0);
    REQUIRE(s.telephony->termination_count() == 0);
    REQUIRE_FALSE(s.session->ai_speaking());

    s.send(event(RealtimeEventType::TranscriptFinal, "r1", "Have a great day."), drained_at);
    REQUIRE(s.telephony->termination_count() == 1);
    REQUIRE(s.session->hangup().executed_via() == "transcript_race");
}

TEST_CASE("Interrupted farewell never hangs up") {
    Scenario s;
    s.send(event(RealtimeEventType::TurnStarted, "r1"), s.t0);
    s.send(audio_chunk("r1", 1600), s.t0);
    s.send(event(RealtimeEventType::TranscriptFinal, "r1", "Okay, goodbye!"), s.t0);
    REQUIRE(s.session->hangup().state() == HangupState::Pending);
    s.session->pump_playback(s.t0);

    s.send(event(RealtimeEventType::CallerSpeechStarted, ""), s.t0 + 100ms);
    REQUIRE(s.channel->cancels == std::vector<std::string>{"r1"});
    REQUIRE(s.session->queue().empty());
    REQUIRE(s.telephony->clears == 1);
    REQUIRE(s.session->hangup().state() == HangupState::None);

    // Late audio of the cancelled turn is dropped.
    s.send(audio_chunk("r1", 1600), s.t0 + 120ms);
    REQUIRE(s.session->queue().empty());

    s.send(event(RealtimeEventType::AudioDone, "r1"), s.t0 + 150ms);
    s.send(event(RealtimeEventType::TurnCompleted, "r1"), s.t0 + 160ms);
    s.play_out(s.t0 + 200ms);
    s.session->tick(s.t0 + 20s);
    REQUIRE(s.telephony->termination_count() == 0);
    REQUIRE(s.session->turns().current()->status == TurnStatus::Cancelled);
}

TEST_CASE("Goodbye in an already interrupted turn is ignored") {
    Scenario s;
    s.send(event(RealtimeEventType::TurnStarted, "r1"), s.t0);
    s.send(audio_chunk("r1", 800), s.t0);
    s.send(event(RealtimeEventType::CallerSpeechStarted, ""), s.t0 + 50ms);
    s.send(event(RealtimeEventType::TranscriptFinal, "r1", "Goodbye"), s.t0 + 60ms);
    REQUIRE(s.session->hangup().state() == HangupState::None);
}

TEST_CASE("Local VAD issues the cancel on the Nth loud caller frame") {
    Scenario s;
    s.send(event(RealtimeEventType::TurnStarted, "r1"), s.t0);
    s.send(audio_chunk("r1", 1600), s.t0);

    auto now = s.t0 + 2s;
    for (int i = 0; i < 3; ++i) {
        s.session->on_inbound_frame(loud_frame(), now);
        now += 20ms;
    }
    REQUIRE(s.channel->cancels.empty());
    s.session->on_inbound_frame(loud_frame(), now);
    REQUIRE(s.channel->cancels.size() == 1);
    REQUIRE(s.channel->audio_sent.size() == 4);
    REQUIRE(s.session->barge_in().confirmed_count() == 1);
}

TEST_CASE("Voicemail: no caller speech after the greeting ends the call") {
    Scenario s;
    s.send(event(RealtimeEventType::TurnStarted, "greeting"), s.t0);
    s.send(audio_chunk("greeting", 1600), s.t0);
    s.send(event(RealtimeEventType::AudioDone, "greeting"), s.t0 + 100ms);
    s.send(event(RealtimeEventType::TurnCompleted, "greeting"), s.t0 + 100ms);
    const auto greeting_done = s.play_out(s.t0 + 100ms);

    auto now = greeting_done;
    for (int i = 0; i < 29; ++i) {
        now += 1s;
        s.session->on_inbound_frame(silent_frame(), now);
        s.session->tick(now);
    }
    REQUIRE(s.telephony->termination_count() == 0);

    s.session->tick(greeting_done + 30s);
    REQUIRE(s.telephony->terminations == std::vector<std::string>{"no_answer"});
    REQUIRE(s.session->hangup().executed_via() == "watchdog");
    REQUIRE_FALSE(s.session->snapshot().caller_has_spoken);
}

TEST_CASE("Silence after conversation sends a check-in prompt") {
    Scenario s;
    s.send(event(RealtimeEventType::CallerTranscript, "", "hello there"), s.t0);
    s.session->tick(s.t0 + 7s);
    REQUIRE(s.channel->checkins.empty());
    s.session->tick(s.t0 + 8s);
    REQUIRE(s.channel->checkins == std::vector<std::string>{"Are you still there?"});
    REQUIRE(s.telephony->termination_count() == 0);
}

TEST_CASE("Missing inbound media tears the session down") {
    auto config = test_config();
    config.watchdog.media_timeout = 5s;
    Scenario s(config);
    s.session->on_inbound_frame(silent_frame(), s.t0 + 1s);
    s.session->tick(s.t0 + 5s);
    REQUIRE_FALSE(s.session->closed());
    s.session->tick(s.t0 + 6s);
    REQUIRE(s.session->closed());
    REQUIRE(s.teardown_reasons == std::vector<std::string>{"media_timeout"});
    REQUIRE(s.channel->closes == 1);

    s.session->teardown("again");
    REQUIRE(s.teardown_reasons.size() == 1);
}

TEST_CASE("Failed realtime connect tears the session down") {
    CallProfile profile;
    profile.call_id = "CA200";
    auto telephony = std::make_shared<testing::FakeTelephonyLeg>();
    auto channel = std::make_shared<testing::FakeRealtimeChannel>();
    channel->fail_connect = true;
    auto session = std::make_shared<CallSession>(test_config(), profile, telephony, channel);
    std::string reason;
    session->set_on_teardown([&](const std::string&, const std::string& r) { reason = r; });
    session->start();
    REQUIRE(session->closed());
    REQUIRE(reason == "realtime_connect_failed");
}

TEST_CASE("Turn completed without audio done stops AI speaking") {
    Scenario s;
    s.send(event(RealtimeEventType::CallerTranscript, "", "hello there"), s.t0);
    s.send(event(RealtimeEventType::TurnStarted, "r1"), s.t0);
    s.send(audio_chunk("r1", 320), s.t0);
    const auto drained_at = s.play_out(s.t0);
    REQUIRE(s.session->ai_speaking());

    s.send(event(RealtimeEventType::TurnCompleted, "r1"), drained_at);
    REQUIRE_FALSE(s.session->ai_speaking());

    s.session->tick(drained_at + 9s);
    REQUIRE(s.channel->checkins == std::vector<std::string>{"Are you still there?"});
}

TEST_CASE("Cancel from the realtime side settles playback without a local barge-in") {
    Scenario s;
    const auto vendor_cancels = Metrics::instance().event_count("turn_cancelled_by_vendor");
    s.send(event(RealtimeEventType::TurnStarted, "r1"), s.t0);
    s.send(audio_chunk("r1", 500), s.t0);
    REQUIRE(s.session->pump_playback(s.t0));

    s.send(event(RealtimeEventType::TurnCancelled, "r1"), s.t0 + 10ms);
    REQUIRE(s.channel->cancels.empty());
    REQUIRE(s.session->barge_in().confirmed_count() == 0);
    REQUIRE(s.session->turns().current()->status == TurnStatus::Cancelled);
    REQUIRE(Metrics::instance().event_count("turn_cancelled_by_vendor") == vendor_cancels + 1);

    s.play_out(s.t0 + 20ms);
    REQUIRE(s.telephony->frame_count() == 3);
    REQUIRE_FALSE(s.session->ai_speaking());

    s.send(audio_chunk("r1", 480), s.t0 + 200ms);
    REQUIRE(s.session->queue().empty());
    REQUIRE_FALSE(s.session->ai_speaking());
}

TEST_CASE("Cancel confirming a local barge-in is not counted as a realtime-side cancel") {
    Scenario s;
    const auto vendor_cancels = Metrics::instance().event_count("turn_cancelled_by_vendor");
    s.send(event(RealtimeEventType::TurnStarted, "r1"), s.t0);
    s.send(audio_chunk("r1", 1600), s.t0);
    s.send(event(RealtimeEventType::CallerSpeechStarted, ""), s.t0 + 100ms);
    REQUIRE(s.channel->cancels == std::vector<std::string>{"r1"});

    s.send(event(RealtimeEventType::TurnCancelled, "r1"), s.t0 + 150ms);
    REQUIRE(s.session->turns().current()->status == TurnStatus::Cancelled);
    REQUIRE(Metrics::instance().event_count("turn_cancelled_by_vendor") == vendor_cancels);
}

TEST_CASE("Teardown requested by the session timer completes and releases the session") {
    auto config = test_config();
    config.run_threads = true;
    config.timer_tick = 2ms;
    config.watchdog.poll_interval = 5ms;
    config.watchdog.media_timeout = 20ms;
    CallProfile profile;
    profile.call_id = "CA300";
    auto telephony = std::make_shared<testing::FakeTelephonyLeg>();
    auto channel = std::make_shared<testing::FakeRealtimeChannel>();
    auto session = std::make_shared<CallSession>(config, profile, telephony, channel);

    auto reason = std::make_shared<std::promise<std::string>>();
    auto done = reason->get_future();
    session->set_on_teardown([reason](const std::string&, const std::string& r) {
        reason->set_value(r);
    });
    session->start();

    REQUIRE(done.wait_for(2s) == std::future_status::ready);
    REQUIRE(done.get() == "media_timeout");
    REQUIRE(session->closed());
    REQUIRE(channel->closes == 1);

    std::weak_ptr<CallSession> weak = session;
    session.reset();
    REQUIRE(eventually([&]() { return weak.expired(); }));
}

TEST_CASE("Event reader is not blocked while the playback queue is full") {
    auto config = test_config();
    config.run_threads = true;
    config.playback_capacity_frames = 4;
    CallProfile profile;
    profile.call_id = "CA400";
    auto telephony = std::make_shared<testing::FakeTelephonyLeg>();
    auto channel = std::make_shared<testing::FakeRealtimeChannel>();
    auto session = std::make_shared<CallSession>(config, profile, telephony, channel);
    session->start();

    const auto saturated = Metrics::instance().event_count("playback_queue_saturated");
    const auto started = Clock::now();
    session->handle_event(event(RealtimeEventType::TurnStarted, "r1"), Clock::now());
    session->handle_event(audio_chunk("r1", 160 * 50), Clock::now());
    session->handle_event(audio_chunk("r1", 160 * 50), Clock::now());
    REQUIRE(Clock::now() - started < 500ms);

    session->on_inbound_frame(silent_frame(), Clock::now());
    {
        std::lock_guard<std::mutex> lock(channel->mutex);
        REQUIRE(channel->audio_sent.size() == 1);
    }

    REQUIRE(eventually([&]() {
        return Metrics::instance().event_count("playback_queue_saturated") > saturated;
    }));
    REQUIRE(session->ai_speaking());

    session->handle_event(event(RealtimeEventType::CallerSpeechStarted, ""), Clock::now());
    {
        std::lock_guard<std::mutex> lock(channel->mutex);
        REQUIRE(channel->cancels == std::vector<std::string>{"r1"});
    }
    REQUIRE(eventually([&]() { return session->queue().empty(); }));
    REQUIRE(telephony->frame_count() < 100);

    session->teardown("test");
    REQUIRE(session->closed());
}

TEST_CASE("Events for unknown turns are ignored") {
    Scenario s;
    s.send(audio_chunk("ghost", 480), s.t0);
    s.send(event(RealtimeEventType::AudioDone, "ghost"), s.t0);
    s.send(event(RealtimeEventType::TranscriptFinal, "ghost", "goodbye"), s.t0);
    REQUIRE(s.session->queue().empty());
    REQUIRE(s.session->hangup().state() == HangupState::None);
    REQUIRE_FALSE(s.session->closed());
}

TEST_CASE("Registry tracks sessions by call id") {
    Scenario a;
    SessionRegistry registry(1);
    REQUIRE(registry.add(a.session));
    REQUIRE(registry.full());
    REQUIRE_FALSE(registry.add(a.session));
    REQUIRE(registry.find("CA100") == a.session);

    a.send(event(RealtimeEventType::TurnStarted, "r1"), a.t0);
    const nlohmann::json listing = registry.snapshots();
    REQUIRE(listing.size() == 1);
    REQUIRE(listing[0]["call_id"] == "CA100");
    REQUIRE(listing[0]["current_turn_id"] == "r1");
    REQUIRE(listing[0]["hangup_state"] == "none");

    REQUIRE(registry.remove("CA100") == a.session);
    REQUIRE(registry.remove("CA100") == nullptr);
    REQUIRE(registry.size() == 0);
}
