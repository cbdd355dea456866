#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "realtime_bridge/audio/frame.hpp"
#include "realtime_bridge/channel/realtime_channel.hpp"
#include "realtime_bridge/session/call_profile.hpp"

namespace realtime_bridge {

struct Config;

struct RealtimeOptions {
    std::string url;
    std::string api_key;
    std::string voice = "alloy";
    std::string instructions;
    std::string transcription_model = "whisper-1";
    audio::Encoding encoding = audio::Encoding::Mulaw;
    std::chrono::milliseconds open_timeout{5000};
    std::chrono::milliseconds ping_interval{5000};
    std::chrono::milliseconds pong_timeout{10000};

    static RealtimeOptions from_config(const Config& config);
};

namespace realtime_events {

// Maps one server message of the OpenAI realtime protocol to an engine
// event. Messages the engine does not act on yield std::nullopt.
std::optional<RealtimeEvent> parse(const nlohmann::json& message);

nlohmann::json session_update(const RealtimeOptions& options, const CallProfile& profile);
nlohmann::json audio_append(const std::vector<uint8_t>& payload);
nlohmann::json response_cancel(const std::string& turn_id);
nlohmann::json response_create();
nlohmann::json system_message(const std::string& text);

}

}
