#include "realtime_bridge/channel/realtime_events.hpp"

#include <websocketpp/base64/base64.hpp>

#include "realtime_bridge/channel/errors.hpp"
#include "realtime_bridge/config.hpp"

namespace realtime_bridge {

RealtimeOptions RealtimeOptions::from_config(const Config& config) {
    RealtimeOptions options;
    options.url = config.realtime_url;
    options.api_key = config.realtime_api_key;
    options.voice = config.realtime_voice;
    options.instructions = config.realtime_instructions;
    options.transcription_model = config.realtime_transcription_model;
    options.encoding = audio::parse_encoding(config.audio_encoding);
    options.open_timeout = std::chrono::milliseconds(config.realtime_open_timeout_ms);
    options.ping_interval = std::chrono::milliseconds(config.realtime_ping_interval_ms);
    options.pong_timeout = std::chrono::milliseconds(config.realtime_pong_timeout_ms);
    return options;
}

const char* realtime_event_name(RealtimeEventType type) {
    switch (type) {
        case RealtimeEventType::TurnStarted:
            return "turn_started";
        case RealtimeEventType::AudioChunk:
            return "audio_chunk";
        case RealtimeEventType::AudioDone:
            return "audio_done";
        case RealtimeEventType::TranscriptFinal:
            return "transcript_final";
        case RealtimeEventType::TurnCancelled:
            return "turn_cancelled";
        case RealtimeEventType::TurnCompleted:
            return "turn_completed";
        case RealtimeEventType::CallerSpeechStarted:
            return "caller_speech_started";
        case RealtimeEventType::CallerTranscript:
            return "caller_transcript";
        case RealtimeEventType::CancelRejected:
            return "cancel_rejected";
        case RealtimeEventType::Error:
            return "error";
    }
    return "unknown";
}

namespace realtime_events {

namespace {

const char* audio_format(audio::Encoding encoding) {
    return encoding == audio::Encoding::Mulaw ? "g711_ulaw" : "pcm16";
}

RealtimeEvent make_event(RealtimeEventType type, std::string turn_id) {
    RealtimeEvent event;
    event.type = type;
    event.turn_id = std::move(turn_id);
    return event;
}

std::string nested_response_id(const nlohmann::json& message) {
    if (!message.contains("response") || !message["response"].is_object()) {
        throw ChannelProtocolError("response object missing");
    }
    return message["response"].value("id", "");
}

bool is_one_of(const std::string& type, const char* a, const char* b) {
    return type == a || type == b;
}

}

std::optional<RealtimeEvent> parse(const nlohmann::json& message) {
    if (!message.is_object()) {
        throw ChannelProtocolError("event is not an object");
    }
    const auto type = message.value("type", "");

    if (type == "response.created") {
        return make_event(RealtimeEventType::TurnStarted, nested_response_id(message));
    }
    if (is_one_of(type, "response.audio.delta", "response.output_audio.delta")) {
        auto event = make_event(RealtimeEventType::AudioChunk,
                                message.value("response_id", ""));
        const auto decoded = websocketpp::base64_decode(message.value("delta", ""));
        event.audio.assign(decoded.begin(), decoded.end());
        return event;
    }
    if (is_one_of(type, "response.audio.done", "response.output_audio.done")) {
        return make_event(RealtimeEventType::AudioDone, message.value("response_id", ""));
    }
    if (is_one_of(type, "response.audio_transcript.done",
                  "response.output_audio_transcript.done")) {
        auto event = make_event(RealtimeEventType::TranscriptFinal,
                                message.value("response_id", ""));
        event.text = message.value("transcript", "");
        return event;
    }
    if (type == "response.done") {
        const auto turn_id = nested_response_id(message);
        const auto status = message["response"].value("status", "");
        return make_event(status == "cancelled" ? RealtimeEventType::TurnCancelled
                                                : RealtimeEventType::TurnCompleted,
                          turn_id);
    }
    if (type == "input_audio_buffer.speech_started") {
        return make_event(RealtimeEventType::CallerSpeechStarted, {});
    }
    if (type == "conversation.item.input_audio_transcription.completed") {
        auto event = make_event(RealtimeEventType::CallerTranscript, {});
        event.text = message.value("transcript", "");
        return event;
    }
    if (type == "error") {
        const auto error = message.value("error", nlohmann::json::object());
        const auto code = error.is_object() ? error.value("code", "") : std::string();
        auto event = make_event(code == "response_cancel_not_active"
                                    ? RealtimeEventType::CancelRejected
                                    : RealtimeEventType::Error,
                                {});
        event.error_code = code;
        event.text = error.is_object() ? error.value("message", "") : std::string();
        return event;
    }
    return std::nullopt;
}

nlohmann::json session_update(const RealtimeOptions& options, const CallProfile& profile) {
    const auto& instructions =
        profile.instructions.empty() ? options.instructions : profile.instructions;
    const auto& voice = profile.voice.empty() ? options.voice : profile.voice;
    nlohmann::json session = {
        {"modalities", {"audio", "text"}},
        {"voice", voice},
        {"input_audio_format", audio_format(options.encoding)},
        {"output_audio_format", audio_format(options.encoding)},
        // Interruptions are decided locally.
        {"turn_detection",
         {{"type", "server_vad"},
          {"create_response", true},
          {"interrupt_response", false}}}};
    if (!instructions.empty()) {
        session["instructions"] = instructions;
    }
    if (!options.transcription_model.empty()) {
        session["input_audio_transcription"] = {{"model", options.transcription_model}};
    }
    return {{"type", "session.update"}, {"session", session}};
}

nlohmann::json audio_append(const std::vector<uint8_t>& payload) {
    return {{"type", "input_audio_buffer.append"},
            {"audio", websocketpp::base64_encode(payload.data(), payload.size())}};
}

nlohmann::json response_cancel(const std::string& turn_id) {
    nlohmann::json message = {{"type", "response.cancel"}};
    if (!turn_id.empty()) {
        message["response_id"] = turn_id;
    }
    return message;
}

nlohmann::json response_create() {
    return {{"type", "response.create"}};
}

nlohmann::json system_message(const std::string& text) {
    return {{"type", "conversation.item.create"},
            {"item",
             {{"type", "message"},
              {"role", "system"},
              {"content", nlohmann::json::array({{{"type", "input_text"}, {"text", text}}})}}}};
}

}

}
