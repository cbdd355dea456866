#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>
#include <websocketpp/base64/base64.hpp>

#include "realtime_bridge/audio/samples.hpp"
#include "realtime_bridge/channel/errors.hpp"
#include "realtime_bridge/telephony/media_stream_leg.hpp"
#include "realtime_bridge/telephony/media_stream_protocol.hpp"
#include "realtime_bridge/telephony/sip_leg.hpp"

#include <string>
#include <vector>

using namespace realtime_bridge;
using namespace realtime_bridge::telephony;
using nlohmann::json;

namespace {

audio::AudioFrame mulaw_frame(uint64_t seq) {
    audio::AudioFrame frame;
    frame.seq = seq;
    frame.payload.assign(160, 0xFF);
    return frame;
}

}

TEST_CASE("Start message yields the call profile") {
    const json start = {
        {"event", "start"},
        {"streamSid", "MZ1"},
        {"start",
         {{"callSid", "CA1"},
          {"mediaFormat", {{"encoding", "audio/x-mulaw"}, {"sampleRate", 8000}}},
          {"customParameters",
           {{"direction", "outbound"}, {"voice", "verse"}, {"from", "+100"}, {"to", "+200"}}}}}};
    const auto message = parse_stream_message(start.dump());
    REQUIRE(message.kind == StreamMessage::Kind::Start);
    REQUIRE(message.stream_sid == "MZ1");
    REQUIRE(message.media_encoding == "audio/x-mulaw");
    REQUIRE(message.sample_rate == 8000);

    const auto profile = make_call_profile(message);
    REQUIRE(profile.call_id == "CA1");
    REQUIRE(profile.direction == CallDirection::Outbound);
    REQUIRE(profile.voice == "verse");
    REQUIRE(profile.caller == "+100");
    REQUIRE(profile.callee == "+200");
}

TEST_CASE("Media and mark messages") {
    const std::string raw("\x7f\xff", 2);
    const json media = {{"event", "media"},
                        {"streamSid", "MZ1"},
                        {"media", {{"track", "inbound"}, {"payload", websocketpp::base64_encode(raw)}}}};
    const auto parsed = parse_stream_message(media.dump());
    REQUIRE(parsed.kind == StreamMessage::Kind::Media);
    REQUIRE(parsed.track == "inbound");
    REQUIRE(parsed.payload == std::vector<uint8_t>{0x7f, 0xff});

    const auto mark = parse_stream_message(mark_message("MZ1", "drain-3"));
    REQUIRE(mark.kind == StreamMessage::Kind::Mark);
    REQUIRE(mark.mark_name == "drain-3");

    const auto outbound = json::parse(media_message("MZ1", {0x01}));
    REQUIRE(outbound["event"] == "media");
    REQUIRE(websocketpp::base64_decode(outbound["media"]["payload"].get<std::string>()) ==
            std::string("\x01", 1));
    REQUIRE(json::parse(clear_message("MZ1"))["event"] == "clear");
}

TEST_CASE("Malformed media stream messages are rejected") {
    REQUIRE_THROWS_AS(parse_stream_message("[1,2]"), ChannelProtocolError);
    REQUIRE_THROWS_AS(parse_stream_message(R"({"event":"media"})"), ChannelProtocolError);
    REQUIRE_THROWS(parse_stream_message("not json"));
    REQUIRE(parse_stream_message(R"({"event":"dtmf"})").kind == StreamMessage::Kind::Unknown);
}

TEST_CASE("Media stream leg is drained only after its marks come back") {
    std::vector<std::string> sent;
    std::vector<std::string> closed;
    MediaStreamLeg leg(
        "MZ1",
        [&](const std::string& text) { sent.push_back(text); },
        [&](const std::string& reason) { closed.push_back(reason); });

    REQUIRE(leg.downstream_drained());
    leg.send_frame(mulaw_frame(1));
    REQUIRE_FALSE(leg.downstream_drained());

    leg.mark_playback("drain-1");
    REQUIRE_FALSE(leg.downstream_drained());
    REQUIRE_FALSE(leg.acknowledge_mark("unknown"));
    REQUIRE(leg.acknowledge_mark("drain-1"));
    REQUIRE_FALSE(leg.acknowledge_mark("drain-1"));
    REQUIRE(leg.downstream_drained());

    // Nothing played since the last mark, so no new mark goes out.
    leg.mark_playback("drain-2");
    REQUIRE(sent.size() == 2);
    REQUIRE(leg.frames_sent() == 1);
}

TEST_CASE("Media stream leg clear forgets outstanding marks") {
    std::vector<std::string> sent;
    MediaStreamLeg leg(
        "MZ1", [&](const std::string& text) { sent.push_back(text); },
        [](const std::string&) {});
    leg.send_frame(mulaw_frame(1));
    leg.mark_playback("drain-1");
    leg.clear_buffered_audio();
    REQUIRE(leg.downstream_drained());
    REQUIRE(json::parse(sent.back())["event"] == "clear");
}

TEST_CASE("Media stream leg terminates once and then goes quiet") {
    std::vector<std::string> sent;
    std::vector<std::string> closed;
    MediaStreamLeg leg(
        "MZ1", [&](const std::string& text) { sent.push_back(text); },
        [&](const std::string& reason) { closed.push_back(reason); });
    leg.terminate_call("CA1", "goodbye");
    leg.terminate_call("CA1", "no_answer");
    REQUIRE(closed == std::vector<std::string>{"goodbye"});

    leg.send_frame(mulaw_frame(1));
    REQUIRE(sent.empty());
}

TEST_CASE("SIP leg completes marks when the media port empties its buffer") {
    std::vector<std::string> marks;
    SipLeg leg(audio::Encoding::Mulaw, 4, nullptr);
    leg.set_on_mark([&](const std::string& name) { marks.push_back(name); });

    leg.send_frame(mulaw_frame(1));
    leg.send_frame(mulaw_frame(2));
    leg.mark_playback("drain-1");
    REQUIRE(marks.empty());
    REQUIRE_FALSE(leg.downstream_drained());

    REQUIRE(leg.pull_frame().size() == 160);
    REQUIRE(marks.empty());
    const auto last = leg.pull_frame();
    REQUIRE(last.size() == 160);
    REQUIRE(last[0] == 0);
    REQUIRE(marks == std::vector<std::string>{"drain-1"});
    REQUIRE(leg.downstream_drained());
    REQUIRE(leg.pull_frame().empty());

    leg.mark_playback("drain-2");
    REQUIRE(marks.size() == 2);
}

TEST_CASE("SIP leg drops the oldest frame when the port stops pulling") {
    SipLeg leg(audio::Encoding::Mulaw, 2, nullptr);
    for (uint64_t seq = 1; seq <= 3; ++seq) {
        leg.send_frame(mulaw_frame(seq));
    }
    REQUIRE(leg.buffered_frames() == 2);
    REQUIRE(leg.overflow_count() == 1);

    leg.clear_buffered_audio();
    REQUIRE(leg.downstream_drained());
}

TEST_CASE("SIP leg hangs up once and encodes caller audio") {
    std::vector<std::string> reasons;
    SipLeg leg(audio::Encoding::Mulaw, 4,
               [&](const std::string& reason) { reasons.push_back(reason); });
    leg.terminate_call("7", "goodbye");
    leg.terminate_call("7", "goodbye");
    REQUIRE(reasons.size() == 1);

    const auto encoded = leg.encode_inbound(std::vector<int16_t>(160, 0));
    REQUIRE(encoded == std::vector<uint8_t>(160, 0xFF));
}
