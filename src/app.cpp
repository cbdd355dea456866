#include "realtime_bridge/app.hpp"

#include <chrono>
#include <thread>

#include "realtime_bridge/channel/realtime_ws_client.hpp"
#include "realtime_bridge/logging.hpp"

namespace realtime_bridge {

BridgeApp::BridgeApp(Config config)
    : config_(std::move(config)),
      session_config_(make_session_config(config_)),
      realtime_options_(RealtimeOptions::from_config(config_)),
      registry_(static_cast<size_t>(config_.media_stream_max_sessions)) {}

BridgeApp::~BridgeApp() {
    shutdown();
}

void BridgeApp::init() {
    auto factory = [this](const CallProfile& profile, std::shared_ptr<TelephonyLeg> leg) {
        return create_session(profile, std::move(leg));
    };

    if (session_config_.format.encoding == audio::Encoding::Mulaw) {
        media_server_ = std::make_unique<MediaStreamServer>(
            config_.media_stream_port, registry_, factory);
        media_server_->start();
    } else {
        logging::warn(
            "Media stream server disabled (requires mulaw)",
            {kv("encoding", audio::encoding_name(session_config_.format.encoding))});
    }

    if (config_.sip_enabled) {
        sip_agent_ = std::make_unique<sip::SipUserAgent>(config_, registry_, factory);
        sip_agent_->init();
    }

    rest_server_ = std::make_unique<RestServer>(config_, registry_);
    rest_server_->start();
}

void BridgeApp::run() {
    if (sip_agent_) {
        int consecutive_empty_cycles = 0;
        while (!quitting_) {
            const auto processed = sip_agent_->handle_events();
            if (processed == 0) {
                ++consecutive_empty_cycles;
                const auto delay = consecutive_empty_cycles > 10 ? config_.events_delay * 2
                                                                 : config_.events_delay;
                std::this_thread::sleep_for(std::chrono::duration<double>(delay));
            } else {
                consecutive_empty_cycles = 0;
            }
        }
    } else {
        while (!quitting_) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    }
    shutdown();
}

void BridgeApp::stop() {
    quitting_ = true;
}

std::shared_ptr<CallSession> BridgeApp::create_session(const CallProfile& profile,
                                                       std::shared_ptr<TelephonyLeg> leg) {
    auto channel = std::make_shared<RealtimeWsClient>(realtime_options_);
    return std::make_shared<CallSession>(session_config_, profile, std::move(leg), std::move(channel));
}

void BridgeApp::shutdown() {
    if (shut_down_) {
        return;
    }
    shut_down_ = true;
    logging::info("Shutting down", {kv("active_sessions", registry_.size())});
    if (rest_server_) {
        rest_server_->stop();
    }
    if (media_server_) {
        media_server_->stop();
    }
    if (sip_agent_) {
        sip_agent_->shutdown();
    }
    registry_.close_all("shutdown");
}

}
