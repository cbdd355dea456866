#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "realtime_bridge/session/call_profile.hpp"

namespace realtime_bridge {
namespace telephony {

// Twilio-style media stream messages.
struct StreamMessage {
    enum class Kind {
        Connected,
        Start,
        Media,
        Mark,
        Stop,
        Unknown
    };

    Kind kind = Kind::Unknown;
    std::string event;
    std::string stream_sid;
    // start
    std::string call_sid;
    CallDirection direction = CallDirection::Inbound;
    std::string instructions;
    std::string voice;
    std::string caller;
    std::string callee;
    std::string media_encoding;
    int sample_rate = 0;
    // media
    std::string track;
    std::vector<uint8_t> payload;
    // mark
    std::string mark_name;
};

// Throws ChannelProtocolError (or a json parse error) on malformed input.
StreamMessage parse_stream_message(const std::string& text);
CallProfile make_call_profile(const StreamMessage& start);

std::string media_message(const std::string& stream_sid, const std::vector<uint8_t>& payload);
std::string mark_message(const std::string& stream_sid, const std::string& name);
std::string clear_message(const std::string& stream_sid);

}
}
