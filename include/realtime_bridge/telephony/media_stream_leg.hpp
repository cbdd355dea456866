#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <set>
#include <string>

#include "realtime_bridge/channel/telephony_leg.hpp"

namespace realtime_bridge {
namespace telephony {

// TelephonyLeg over one media stream WebSocket. The far end plays what we
// send from its own buffer; marks it echoes back tell us how far playback
// has got, so the leg counts as drained only when no frame was sent since
// the last mark and every mark has been acknowledged.
class MediaStreamLeg : public TelephonyLeg {
public:
    using SendFn = std::function<void(const std::string& text)>;
    using CloseFn = std::function<void(const std::string& reason)>;

    MediaStreamLeg(std::string stream_sid, SendFn send, CloseFn close);

    void send_frame(const audio::AudioFrame& frame) override;
    void mark_playback(const std::string& name) override;
    void clear_buffered_audio() override;
    bool downstream_drained() const override;
    void terminate_call(const std::string& call_id, const std::string& reason) override;

    // Returns false for a mark we did not send or already saw.
    bool acknowledge_mark(const std::string& name);
    uint64_t frames_sent() const;

private:
    const std::string stream_sid_;
    SendFn send_;
    CloseFn close_;

    mutable std::mutex mutex_;
    std::set<std::string> outstanding_marks_;
    uint64_t frames_since_mark_ = 0;
    uint64_t frames_sent_ = 0;
    bool terminated_ = false;
};

}
}
