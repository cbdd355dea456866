#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "realtime_bridge/channel/telephony_leg.hpp"
#include "realtime_bridge/session/call_profile.hpp"
#include "realtime_bridge/session/call_session.hpp"
#include "realtime_bridge/session/session_registry.hpp"
#include "realtime_bridge/telephony/media_stream_leg.hpp"
#include "realtime_bridge/telephony/media_stream_protocol.hpp"

namespace realtime_bridge {

// Accepts media stream WebSockets from the telephony provider. Each stream
// becomes one CallSession on its `start` message and is torn down on `stop`
// or when the socket closes.
class MediaStreamServer {
public:
    using SessionFactory = std::function<std::shared_ptr<CallSession>(
        const CallProfile& profile, std::shared_ptr<TelephonyLeg> leg)>;

    MediaStreamServer(int port, SessionRegistry& registry, SessionFactory factory);
    ~MediaStreamServer();

    void start();
    void stop();

private:
    using Handle = std::weak_ptr<void>;

    struct Stream {
        std::shared_ptr<telephony::MediaStreamLeg> leg;
        std::shared_ptr<CallSession> session;
        std::string call_id;
    };
    struct ServerState;

    void handle_message(const Handle& hdl, const std::string& payload);
    void handle_start(const Handle& hdl, const telephony::StreamMessage& message);
    void finish_stream(const Handle& hdl, const std::string& reason);
    void close_connection(const Handle& hdl, const std::string& reason);
    void send_text(const Handle& hdl, const std::string& text);
    std::shared_ptr<Stream> find_stream(const Handle& hdl);

    const int port_;
    SessionRegistry& registry_;
    SessionFactory factory_;
    std::unique_ptr<ServerState> state_;
    std::thread server_thread_;

    std::mutex streams_mutex_;
    std::map<Handle, std::shared_ptr<Stream>, std::owner_less<Handle>> streams_;
};

}
