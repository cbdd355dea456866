#pragma once

#include <atomic>
#include <memory>

#include "realtime_bridge/channel/realtime_events.hpp"
#include "realtime_bridge/config.hpp"
#include "realtime_bridge/server/media_stream_server.hpp"
#include "realtime_bridge/server/rest_server.hpp"
#include "realtime_bridge/session/call_session.hpp"
#include "realtime_bridge/session/session_registry.hpp"
#include "realtime_bridge/sip/user_agent.hpp"

namespace realtime_bridge {

// Process wiring: session factory, transports and the REST surface.
class BridgeApp {
public:
    explicit BridgeApp(Config config);
    ~BridgeApp();

    void init();
    // Blocks until stop(); drives pjsip when the SIP leg is enabled.
    void run();
    // Only sets a flag; safe from a signal handler.
    void stop();

private:
    std::shared_ptr<CallSession> create_session(const CallProfile& profile,
                                                std::shared_ptr<TelephonyLeg> leg);
    void shutdown();

    Config config_;
    SessionConfig session_config_;
    RealtimeOptions realtime_options_;
    SessionRegistry registry_;
    std::unique_ptr<MediaStreamServer> media_server_;
    std::unique_ptr<sip::SipUserAgent> sip_agent_;
    std::unique_ptr<RestServer> rest_server_;

    std::atomic<bool> quitting_{false};
    bool shut_down_ = false;
};

}
