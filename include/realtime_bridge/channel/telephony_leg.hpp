#pragma once

#include <string>

#include "realtime_bridge/audio/frame.hpp"

namespace realtime_bridge {

// Outbound side of a telephony media connection. Implementations must be
// safe to call from the clocked sender, the realtime event reader and the
// session timer thread concurrently.
class TelephonyLeg {
public:
    virtual ~TelephonyLeg() = default;

    virtual void send_frame(const audio::AudioFrame& frame) = 0;
    // Asks the far end to acknowledge once everything sent so far has played.
    virtual void mark_playback(const std::string& name) = 0;
    virtual void clear_buffered_audio() = 0;
    // True when no audio sent by us is still buffered downstream.
    virtual bool downstream_drained() const = 0;
    virtual void terminate_call(const std::string& call_id, const std::string& reason) = 0;
};

}
