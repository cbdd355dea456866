#pragma once

#include <pjsua2.hpp>

namespace realtime_bridge {
namespace sip {

class SipUserAgent;

class SipAccount : public pj::Account {
public:
    explicit SipAccount(SipUserAgent& agent);

    void onRegState(pj::OnRegStateParam& prm) override;
    void onIncomingCall(pj::OnIncomingCallParam& iprm) override;

private:
    SipUserAgent& agent_;
};

}
}
