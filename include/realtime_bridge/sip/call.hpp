#pragma once

#include <atomic>
#include <memory>
#include <string>

#include <pjsua2.hpp>

#include "realtime_bridge/session/call_session.hpp"
#include "realtime_bridge/sip/media_port.hpp"
#include "realtime_bridge/telephony/sip_leg.hpp"

namespace realtime_bridge {
namespace sip {

class SipUserAgent;

// A pjsua2 call bridged to one CallSession through a SipLeg.
class SipCall : public pj::Call, public std::enable_shared_from_this<SipCall> {
public:
    SipCall(SipUserAgent& agent,
            pj::Account& account,
            int call_id = PJSUA_INVALID_ID);
    ~SipCall() override;

    void attach(std::shared_ptr<CallSession> session,
                std::shared_ptr<telephony::SipLeg> leg);
    const std::shared_ptr<CallSession>& session() const { return session_; }

    void answer(int status_code);
    void hangup(int status_code);
    // Hangs up from a worker thread; safe to call from session threads.
    void hangup_async(const std::string& reason);
    bool disconnected() const { return disconnected_; }

    void onCallState(pj::OnCallStateParam& prm) override;
    void onCallMediaState(pj::OnCallMediaStateParam& prm) override;

private:
    void open_media();
    void close_media();

    SipUserAgent& agent_;
    std::shared_ptr<CallSession> session_;
    std::shared_ptr<telephony::SipLeg> leg_;
    std::unique_ptr<pj::AudioMedia> audio_media_;
    std::unique_ptr<MediaPort> media_port_;
    std::atomic<bool> media_active_{false};
    std::atomic<bool> disconnected_{false};
    std::atomic<bool> hangup_sent_{false};
};

}
}
