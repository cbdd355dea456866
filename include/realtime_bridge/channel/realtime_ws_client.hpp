#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "realtime_bridge/channel/realtime_channel.hpp"
#include "realtime_bridge/channel/realtime_events.hpp"

namespace realtime_bridge {

// RealtimeChannel over the OpenAI realtime WebSocket protocol. One TLS
// client and one network thread per call. connect() blocks until the
// handshake completes or the open timeout expires.
class RealtimeWsClient : public RealtimeChannel {
public:
    explicit RealtimeWsClient(RealtimeOptions options);
    ~RealtimeWsClient() override;

    void connect(const CallProfile& profile,
                 EventHandler on_event,
                 CloseHandler on_close) override;
    void send_audio(const std::vector<uint8_t>& payload) override;
    void request_cancel(const std::string& turn_id) override;
    void request_checkin(const std::string& text) override;
    void close() override;

private:
    struct WsState;

    void send_json(const nlohmann::json& payload);
    void handle_message(const std::string& payload);
    void schedule_ping();
    void notify_closed(const std::string& reason);

    const RealtimeOptions options_;
    CallProfile profile_;
    EventHandler on_event_;
    CloseHandler on_close_;
    std::atomic<bool> running_{false};
    std::atomic<bool> close_notified_{false};
    std::thread worker_;

    std::mutex ws_mutex_;
    std::condition_variable open_cv_;
    bool open_ = false;
    bool failed_ = false;
    std::string fail_reason_;
    std::unique_ptr<WsState> ws_state_;
};

}
