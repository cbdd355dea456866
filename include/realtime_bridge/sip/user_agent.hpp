#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <pjsua2.hpp>

#include "realtime_bridge/channel/telephony_leg.hpp"
#include "realtime_bridge/config.hpp"
#include "realtime_bridge/session/call_profile.hpp"
#include "realtime_bridge/session/call_session.hpp"
#include "realtime_bridge/session/session_registry.hpp"

namespace realtime_bridge {
namespace sip {

class SipAccount;
class SipCall;

// Owns the pjsua2 endpoint and the registered account. Inbound calls are
// answered and bridged to a new CallSession each.
class SipUserAgent {
public:
    using SessionFactory = std::function<std::shared_ptr<CallSession>(
        const CallProfile& profile, std::shared_ptr<TelephonyLeg> leg)>;

    SipUserAgent(const Config& config, SessionRegistry& registry, SessionFactory factory);
    ~SipUserAgent();

    void init();
    // Polls pjsip once; returns the number of processed events.
    int handle_events();
    void shutdown();

    const Config& config() const { return config_; }

private:
    friend class SipAccount;
    friend class SipCall;

    void handle_incoming_call(SipAccount& account, int pj_call_id);
    void handle_call_disconnected(int pj_call_id, int status_code);
    void abandon_call(int pj_call_id, const std::shared_ptr<CallSession>& session);

    const Config& config_;
    SessionRegistry& registry_;
    SessionFactory factory_;
    std::unique_ptr<pj::Endpoint> endpoint_;
    std::unique_ptr<SipAccount> account_;
    std::mutex calls_mutex_;
    std::unordered_map<int, std::shared_ptr<SipCall>> calls_;
};

}
}
