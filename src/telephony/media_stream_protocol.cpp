#include "realtime_bridge/telephony/media_stream_protocol.hpp"

#include <nlohmann/json.hpp>
#include <websocketpp/base64/base64.hpp>

#include "realtime_bridge/channel/errors.hpp"

namespace realtime_bridge::telephony {

namespace {

const nlohmann::json& require_object(const nlohmann::json& message, const char* key) {
    if (!message.contains(key) || !message[key].is_object()) {
        throw ChannelProtocolError(std::string("media stream message lacks ") + key);
    }
    return message[key];
}

std::string parameter(const nlohmann::json& params, const char* key) {
    if (!params.is_object() || !params.contains(key) || !params[key].is_string()) {
        return {};
    }
    return params[key].get<std::string>();
}

}

StreamMessage parse_stream_message(const std::string& text) {
    const auto message = nlohmann::json::parse(text);
    if (!message.is_object()) {
        throw ChannelProtocolError("media stream message is not an object");
    }
    StreamMessage result;
    result.event = message.value("event", "");
    result.stream_sid = message.value("streamSid", "");

    if (result.event == "connected") {
        result.kind = StreamMessage::Kind::Connected;
    } else if (result.event == "start") {
        result.kind = StreamMessage::Kind::Start;
        const auto& start = require_object(message, "start");
        if (result.stream_sid.empty()) {
            result.stream_sid = start.value("streamSid", "");
        }
        result.call_sid = start.value("callSid", "");
        const auto params = start.value("customParameters", nlohmann::json::object());
        result.direction = parse_direction(parameter(params, "direction"));
        result.instructions = parameter(params, "instructions");
        result.voice = parameter(params, "voice");
        result.caller = parameter(params, "from");
        result.callee = parameter(params, "to");
        const auto format = start.value("mediaFormat", nlohmann::json::object());
        if (format.is_object()) {
            result.media_encoding = format.value("encoding", "");
            result.sample_rate = format.value("sampleRate", 0);
        }
    } else if (result.event == "media") {
        result.kind = StreamMessage::Kind::Media;
        const auto& media = require_object(message, "media");
        result.track = media.value("track", "inbound");
        const auto decoded = websocketpp::base64_decode(media.value("payload", ""));
        result.payload.assign(decoded.begin(), decoded.end());
    } else if (result.event == "mark") {
        result.kind = StreamMessage::Kind::Mark;
        result.mark_name = require_object(message, "mark").value("name", "");
    } else if (result.event == "stop") {
        result.kind = StreamMessage::Kind::Stop;
    }
    return result;
}

CallProfile make_call_profile(const StreamMessage& start) {
    CallProfile profile;
    profile.call_id = start.call_sid.empty() ? start.stream_sid : start.call_sid;
    profile.direction = start.direction;
    profile.instructions = start.instructions;
    profile.voice = start.voice;
    profile.caller = start.caller;
    profile.callee = start.callee;
    return profile;
}

std::string media_message(const std::string& stream_sid, const std::vector<uint8_t>& payload) {
    nlohmann::json message = {
        {"event", "media"},
        {"streamSid", stream_sid},
        {"media", {{"payload", websocketpp::base64_encode(payload.data(), payload.size())}}}};
    return message.dump();
}

std::string mark_message(const std::string& stream_sid, const std::string& name) {
    nlohmann::json message = {
        {"event", "mark"},
        {"streamSid", stream_sid},
        {"mark", {{"name", name}}}};
    return message.dump();
}

std::string clear_message(const std::string& stream_sid) {
    nlohmann::json message = {{"event", "clear"}, {"streamSid", stream_sid}};
    return message.dump();
}

}
