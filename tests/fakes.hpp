#pragma once

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

#include "realtime_bridge/channel/errors.hpp"
#include "realtime_bridge/channel/realtime_channel.hpp"
#include "realtime_bridge/channel/telephony_leg.hpp"

namespace realtime_bridge {
namespace testing {

class FakeTelephonyLeg : public TelephonyLeg {
public:
    void send_frame(const audio::AudioFrame& frame) override {
        std::lock_guard<std::mutex> lock(mutex);
        frames.push_back(frame);
    }
    void mark_playback(const std::string& name) override {
        std::lock_guard<std::mutex> lock(mutex);
        marks.push_back(name);
    }
    void clear_buffered_audio() override { ++clears; }
    bool downstream_drained() const override { return drained; }
    void terminate_call(const std::string& call_id, const std::string& reason) override {
        std::lock_guard<std::mutex> lock(mutex);
        terminated_call_id = call_id;
        terminations.push_back(reason);
    }

    size_t frame_count() {
        std::lock_guard<std::mutex> lock(mutex);
        return frames.size();
    }
    size_t termination_count() {
        std::lock_guard<std::mutex> lock(mutex);
        return terminations.size();
    }

    std::mutex mutex;
    std::vector<audio::AudioFrame> frames;
    std::vector<std::string> marks;
    std::vector<std::string> terminations;
    std::string terminated_call_id;
    std::atomic<int> clears{0};
    std::atomic<bool> drained{true};
};

class FakeRealtimeChannel : public RealtimeChannel {
public:
    void connect(const CallProfile& profile, EventHandler on_event, CloseHandler on_close) override {
        if (fail_connect) {
            throw ChannelConnectError("refused");
        }
        connected_profile = profile;
        event_handler = std::move(on_event);
        close_handler = std::move(on_close);
        connected = true;
    }
    void send_audio(const std::vector<uint8_t>& payload) override {
        std::lock_guard<std::mutex> lock(mutex);
        audio_sent.push_back(payload);
    }
    void request_cancel(const std::string& turn_id) override {
        std::lock_guard<std::mutex> lock(mutex);
        cancels.push_back(turn_id);
    }
    void request_checkin(const std::string& text) override {
        std::lock_guard<std::mutex> lock(mutex);
        checkins.push_back(text);
    }
    void close() override { ++closes; }

    std::mutex mutex;
    CallProfile connected_profile;
    EventHandler event_handler;
    CloseHandler close_handler;
    std::vector<std::vector<uint8_t>> audio_sent;
    std::vector<std::string> cancels;
    std::vector<std::string> checkins;
    std::atomic<int> closes{0};
    bool connected = false;
    bool fail_connect = false;
};

}
}
