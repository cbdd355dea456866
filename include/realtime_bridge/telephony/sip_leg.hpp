#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "realtime_bridge/audio/frame.hpp"
#include "realtime_bridge/channel/telephony_leg.hpp"
#include "realtime_bridge/logging.hpp"

namespace realtime_bridge {
namespace telephony {

// TelephonyLeg for a SIP call. Frames wait in a small jitter buffer until
// the media port pulls them; marks complete when that buffer runs empty.
class SipLeg : public TelephonyLeg {
public:
    using TerminateFn = std::function<void(const std::string& reason)>;
    using MarkFn = std::function<void(const std::string& name)>;

    SipLeg(audio::Encoding encoding, size_t max_buffered_frames, TerminateFn terminate);

    void set_on_mark(MarkFn cb);

    void send_frame(const audio::AudioFrame& frame) override;
    void mark_playback(const std::string& name) override;
    void clear_buffered_audio() override;
    bool downstream_drained() const override;
    void terminate_call(const std::string& call_id, const std::string& reason) override;

    // Media port side: next frame as linear samples, empty when idle.
    std::vector<int16_t> pull_frame();
    // Media port side: caller samples in the session's encoding.
    std::vector<uint8_t> encode_inbound(const std::vector<int16_t>& samples) const;
    size_t buffered_frames() const;
    uint64_t overflow_count() const;

private:
    const audio::Encoding encoding_;
    const size_t max_buffered_frames_;
    TerminateFn terminate_;

    mutable std::mutex mutex_;
    MarkFn on_mark_;
    std::deque<std::vector<int16_t>> buffer_;
    std::vector<std::string> pending_marks_;
    uint64_t overflow_count_ = 0;
    logging::Throttle overflow_log_{std::chrono::seconds(1)};
    bool terminated_ = false;
};

}
}
