#include "realtime_bridge/sip/account.hpp"

#include <typeinfo>

#include "realtime_bridge/logging.hpp"
#include "realtime_bridge/sip/user_agent.hpp"

namespace realtime_bridge::sip {

SipAccount::SipAccount(SipUserAgent& agent) : agent_(agent) {}

void SipAccount::onRegState(pj::OnRegStateParam& prm) {
    try {
        const int status_code = static_cast<int>(prm.code);
        if (status_code == 200) {
            logging::info("SIP registration successful");
        } else if (status_code / 100 == 5) {
            logging::error("SIP registration server error",
                           {kv("status", status_code),
                            kv("reason", prm.reason)});
        } else if (status_code == 408) {
            logging::warn("SIP registration timeout",
                          {kv("status", status_code),
                           kv("reason", prm.reason)});
        } else if (status_code != 0) {
            logging::warn("SIP registration failed",
                          {kv("status", status_code),
                           kv("reason", prm.reason)});
        }
    } catch (const std::exception& ex) {
        logging::error(
            "Exception in onRegState",
            {kv("error_type", typeid(ex).name()),
             kv("error", ex.what())});
    }
}

void SipAccount::onIncomingCall(pj::OnIncomingCallParam& iprm) {
    logging::info("Incoming SIP call", {kv("pj_call_id", iprm.callId)});
    agent_.handle_incoming_call(*this, iprm.callId);
}

}
