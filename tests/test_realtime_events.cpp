#include <catch2/catch_test_macros.hpp>

#include <websocketpp/base64/base64.hpp>

#include "realtime_bridge/channel/errors.hpp"
#include "realtime_bridge/channel/realtime_events.hpp"

using namespace realtime_bridge;
using nlohmann::json;

TEST_CASE("Response lifecycle messages map to turn events") {
    auto created = realtime_events::parse(
        {{"type", "response.created"}, {"response", {{"id", "resp_1"}, {"status", "in_progress"}}}});
    REQUIRE(created);
    REQUIRE(created->type == RealtimeEventType::TurnStarted);
    REQUIRE(created->turn_id == "resp_1");

    auto completed = realtime_events::parse(
        {{"type", "response.done"}, {"response", {{"id", "resp_1"}, {"status", "completed"}}}});
    REQUIRE(completed->type == RealtimeEventType::TurnCompleted);

    auto cancelled = realtime_events::parse(
        {{"type", "response.done"}, {"response", {{"id", "resp_1"}, {"status", "cancelled"}}}});
    REQUIRE(cancelled->type == RealtimeEventType::TurnCancelled);
    REQUIRE(cancelled->turn_id == "resp_1");
}

TEST_CASE("Audio deltas are base64 decoded") {
    const std::string raw("\x01\x02\xff", 3);
    auto chunk = realtime_events::parse({{"type", "response.audio.delta"},
                                         {"response_id", "resp_2"},
                                         {"delta", websocketpp::base64_encode(raw)}});
    REQUIRE(chunk->type == RealtimeEventType::AudioChunk);
    REQUIRE(chunk->turn_id == "resp_2");
    REQUIRE(chunk->audio == std::vector<uint8_t>{0x01, 0x02, 0xff});

    auto renamed = realtime_events::parse(
        {{"type", "response.output_audio.done"}, {"response_id", "resp_2"}});
    REQUIRE(renamed->type == RealtimeEventType::AudioDone);
}

TEST_CASE("Transcripts carry their text") {
    auto ai = realtime_events::parse({{"type", "response.audio_transcript.done"},
                                      {"response_id", "resp_3"},
                                      {"transcript", "Goodbye!"}});
    REQUIRE(ai->type == RealtimeEventType::TranscriptFinal);
    REQUIRE(ai->text == "Goodbye!");

    auto caller = realtime_events::parse(
        {{"type", "conversation.item.input_audio_transcription.completed"},
         {"transcript", "wait"}});
    REQUIRE(caller->type == RealtimeEventType::CallerTranscript);
    REQUIRE(caller->text == "wait");

    auto speech = realtime_events::parse({{"type", "input_audio_buffer.speech_started"}});
    REQUIRE(speech->type == RealtimeEventType::CallerSpeechStarted);
}

TEST_CASE("Cancel of an idle response is reported as rejected") {
    auto rejected = realtime_events::parse(
        {{"type", "error"},
         {"error", {{"code", "response_cancel_not_active"}, {"message", "no response"}}}});
    REQUIRE(rejected->type == RealtimeEventType::CancelRejected);
    REQUIRE(rejected->error_code == "response_cancel_not_active");

    auto other = realtime_events::parse(
        {{"type", "error"}, {"error", {{"code", "rate_limited"}}}});
    REQUIRE(other->type == RealtimeEventType::Error);
}

TEST_CASE("Unhandled and malformed messages") {
    REQUIRE_FALSE(realtime_events::parse({{"type", "session.updated"}}));
    REQUIRE_THROWS_AS(realtime_events::parse(json::array()), ChannelProtocolError);
    REQUIRE_THROWS_AS(realtime_events::parse({{"type", "response.created"}}),
                      ChannelProtocolError);
}

TEST_CASE("Session update keeps interruption decisions local") {
    RealtimeOptions options;
    options.instructions = "Be brief.";
    CallProfile profile;
    profile.voice = "verse";

    const auto message = realtime_events::session_update(options, profile);
    REQUIRE(message["type"] == "session.update");
    const auto& session = message["session"];
    REQUIRE(session["voice"] == "verse");
    REQUIRE(session["instructions"] == "Be brief.");
    REQUIRE(session["input_audio_format"] == "g711_ulaw");
    REQUIRE(session["turn_detection"]["interrupt_response"] == false);
    REQUIRE(session["input_audio_transcription"]["model"] == "whisper-1");
}

TEST_CASE("Client message builders") {
    const auto append = realtime_events::audio_append({0x10, 0x20});
    REQUIRE(append["type"] == "input_audio_buffer.append");
    REQUIRE(websocketpp::base64_decode(append["audio"].get<std::string>()) ==
            std::string("\x10\x20", 2));

    REQUIRE(realtime_events::response_cancel("resp_9")["response_id"] == "resp_9");
    REQUIRE_FALSE(realtime_events::response_cancel("").contains("response_id"));
    REQUIRE(realtime_events::response_create()["type"] == "response.create");

    const auto checkin = realtime_events::system_message("Still there?");
    REQUIRE(checkin["item"]["role"] == "system");
    REQUIRE(checkin["item"]["content"][0]["text"] == "Still there?");
}
