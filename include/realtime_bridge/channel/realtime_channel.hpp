#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "realtime_bridge/session/call_profile.hpp"

namespace realtime_bridge {

enum class RealtimeEventType {
    TurnStarted,
    AudioChunk,
    AudioDone,
    TranscriptFinal,
    TurnCancelled,
    TurnCompleted,
    CallerSpeechStarted,
    CallerTranscript,
    CancelRejected,
    Error
};

const char* realtime_event_name(RealtimeEventType type);

struct RealtimeEvent {
    RealtimeEventType type = RealtimeEventType::Error;
    std::string turn_id;
    std::vector<uint8_t> audio;
    std::string text;
    std::string error_code;
};

// Duplex session with a conversational AI vendor. Events are delivered on
// the channel's own thread; no ordering holds between event types beyond
// turn_started preceding the other events of the same turn.
class RealtimeChannel {
public:
    using EventHandler = std::function<void(const RealtimeEvent&)>;
    using CloseHandler = std::function<void(const std::string& reason)>;

    virtual ~RealtimeChannel() = default;

    virtual void connect(const CallProfile& profile,
                         EventHandler on_event,
                         CloseHandler on_close) = 0;
    virtual void send_audio(const std::vector<uint8_t>& payload) = 0;
    virtual void request_cancel(const std::string& turn_id) = 0;
    // Injects a system prompt asking the AI to check on a silent caller.
    virtual void request_checkin(const std::string& text) = 0;
    virtual void close() = 0;
};

}
