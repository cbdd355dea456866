#include "realtime_bridge/sip/user_agent.hpp"

#include "realtime_bridge/audio/frame.hpp"
#include "realtime_bridge/logging.hpp"
#include "realtime_bridge/metrics.hpp"
#include "realtime_bridge/sip/account.hpp"
#include "realtime_bridge/sip/call.hpp"
#include "realtime_bridge/sip/pj_thread.hpp"
#include "realtime_bridge/telephony/sip_leg.hpp"
#include "realtime_bridge/utils/async.hpp"

namespace realtime_bridge::sip {

namespace {

// Twenty frames of jitter buffer between the clocked sender and pjmedia.
constexpr size_t kSipBufferedFrames = 20;

std::string disconnect_reason(int code) {
    switch (code) {
        case PJSIP_SC_OK:
            return "caller_hangup";
        case PJSIP_SC_BUSY_HERE:
            return "busy";
        case PJSIP_SC_REQUEST_TERMINATED:
            return "canceled";
        case PJSIP_SC_REQUEST_TIMEOUT:
        case PJSIP_SC_TEMPORARILY_UNAVAILABLE:
            return "noanswer";
        case PJSIP_SC_SERVICE_UNAVAILABLE:
        case PJSIP_SC_SERVER_TIMEOUT:
            return "network_error";
        default:
            return "telephony_disconnected";
    }
}

}

SipUserAgent::SipUserAgent(const Config& config, SessionRegistry& registry, SessionFactory factory)
    : config_(config),
      registry_(registry),
      factory_(std::move(factory)) {}

SipUserAgent::~SipUserAgent() {
    shutdown();
}

void SipUserAgent::init() {
    endpoint_ = std::make_unique<pj::Endpoint>();
    endpoint_->libCreate();

    pj::EpConfig ep_cfg;
    ep_cfg.uaConfig.threadCnt = 1;
    ep_cfg.uaConfig.maxCalls = static_cast<unsigned>(config_.media_stream_max_sessions);
    ep_cfg.medConfig.threadCnt = 1;
    ep_cfg.medConfig.hasIoqueue = true;
    ep_cfg.medConfig.noVad = true;
    ep_cfg.medConfig.ecTailLen = static_cast<unsigned>(config_.ec_tail_len);
    ep_cfg.medConfig.clockRate = static_cast<unsigned>(config_.audio_sample_rate);
    ep_cfg.medConfig.sndAutoCloseTime = -1;
    ep_cfg.logConfig.level = static_cast<unsigned>(config_.pjsip_log_level);
    ep_cfg.logConfig.consoleLevel = static_cast<unsigned>(config_.pjsip_console_log_level);
    if (config_.log_filename) {
        ep_cfg.logConfig.filename = *config_.log_filename;
    }
    endpoint_->libInit(ep_cfg);

    if (config_.sip_null_device) {
        endpoint_->audDevManager().setNullDev();
    }
    pj::TransportConfig sip_tp_config;
    sip_tp_config.port = static_cast<unsigned>(config_.sip_port);
    endpoint_->transportCreate(PJSIP_TRANSPORT_UDP, sip_tp_config);
    if (config_.sip_use_tcp) {
        endpoint_->transportCreate(PJSIP_TRANSPORT_TCP, sip_tp_config);
    }
    endpoint_->libStart();

    pj::AccountConfig account_cfg;
    account_cfg.idUri = "sip:" + config_.sip_user + "@" + config_.sip_domain;
    account_cfg.regConfig.registrarUri =
        "sip:" + config_.sip_domain + (config_.sip_use_tcp ? ";transport=tcp" : "");
    const auto login = config_.sip_login.empty() ? config_.sip_user : config_.sip_login;
    pj::AuthCredInfo cred("digest", "*", login, 0, config_.sip_password);
    account_cfg.sipConfig.authCreds.push_back(cred);

    account_ = std::make_unique<SipAccount>(*this);
    account_->create(account_cfg);
    logging::info(
        "SIP user agent started",
        {kv("user", config_.sip_user),
         kv("domain", config_.sip_domain),
         kv("port", config_.sip_port)});
}

int SipUserAgent::handle_events() {
    if (!endpoint_) {
        return 0;
    }
    try {
        const auto delay_ms = static_cast<unsigned>(config_.events_delay * 1000.0);
        return endpoint_->libHandleEvents(delay_ms);
    } catch (const pj::Error& err) {
        logging::error("PJSIP handle events error",
                       {kv("reason", err.reason),
                        kv("status", err.status)});
    } catch (const std::exception& ex) {
        logging::error("PJSIP handle events exception", {kv("error", ex.what())});
    }
    return 0;
}

void SipUserAgent::shutdown() {
    std::unordered_map<int, std::shared_ptr<SipCall>> calls;
    {
        std::lock_guard<std::mutex> lock(calls_mutex_);
        calls.swap(calls_);
    }
    for (auto& entry : calls) {
        if (const auto& session = entry.second->session()) {
            registry_.remove(session->call_id());
            session->teardown("shutdown");
        }
    }
    calls.clear();
    if (account_) {
        account_->shutdown();
        account_.reset();
    }
    if (endpoint_) {
        endpoint_->libDestroy();
        endpoint_.reset();
    }
}

void SipUserAgent::handle_incoming_call(SipAccount& account, int pj_call_id) {
    auto call = std::make_shared<SipCall>(*this, account, pj_call_id);
    std::shared_ptr<CallSession> session;
    try {
        if (registry_.full()) {
            logging::warn("Inbound SIP call rejected (capacity)", {kv("pj_call_id", pj_call_id)});
            Metrics::instance().increment_event("sip_call_rejected");
            call->hangup(PJSIP_SC_BUSY_HERE);
            return;
        }
        call->answer(PJSIP_SC_RINGING);

        const auto info = call->getInfo();
        CallProfile profile;
        profile.call_id = info.callIdString;
        profile.direction = CallDirection::Inbound;
        profile.caller = info.remoteUri;
        profile.callee = info.localUri;

        std::weak_ptr<SipCall> weak_call = call;
        auto leg = std::make_shared<telephony::SipLeg>(
            audio::parse_encoding(config_.audio_encoding),
            kSipBufferedFrames,
            [weak_call](const std::string& reason) {
                if (auto target = weak_call.lock()) {
                    target->hangup_async(reason);
                }
            });
        session = factory_(profile, leg);
        if (!registry_.add(session)) {
            session.reset();
            call->hangup(PJSIP_SC_BUSY_HERE);
            return;
        }
        session->set_on_teardown([weak_call](const std::string&, const std::string& reason) {
            if (auto target = weak_call.lock()) {
                target->hangup_async(reason);
            }
        });
        call->attach(session, leg);
        {
            std::lock_guard<std::mutex> lock(calls_mutex_);
            calls_[pj_call_id] = call;
        }
        call->answer(PJSIP_SC_OK);
        logging::info(
            "SIP call answered",
            {kv("call_id", profile.call_id),
             kv("caller", profile.caller)});
        utils::run_async([session]() { session->start(); });
    } catch (const pj::Error& err) {
        logging::error(
            "Inbound SIP call failed",
            {kv("reason", err.reason),
             kv("status", err.status),
             kv("pj_call_id", pj_call_id)});
        abandon_call(pj_call_id, session);
    } catch (const std::exception& ex) {
        logging::error(
            "Inbound SIP call failed",
            {kv("error", ex.what()),
             kv("pj_call_id", pj_call_id)});
        try {
            call->hangup(PJSIP_SC_INTERNAL_SERVER_ERROR);
        } catch (const pj::Error& err) {
            logging::debug("SIP hangup after failure skipped", {kv("reason", err.reason)});
        }
        abandon_call(pj_call_id, session);
    }
}

void SipUserAgent::abandon_call(int pj_call_id, const std::shared_ptr<CallSession>& session) {
    {
        std::lock_guard<std::mutex> lock(calls_mutex_);
        calls_.erase(pj_call_id);
    }
    if (session) {
        registry_.remove(session->call_id());
        session->teardown("sip_setup_failed");
    }
}

void SipUserAgent::handle_call_disconnected(int pj_call_id, int status_code) {
    std::shared_ptr<SipCall> call;
    {
        std::lock_guard<std::mutex> lock(calls_mutex_);
        auto it = calls_.find(pj_call_id);
        if (it == calls_.end()) {
            return;
        }
        call = std::move(it->second);
        calls_.erase(it);
    }
    if (const auto& session = call->session()) {
        registry_.remove(session->call_id());
        session->teardown(disconnect_reason(status_code));
    }
    // The pj::Call may be inside its own callback; release it off this stack.
    utils::run_async([call]() mutable {
        ensure_pj_thread_registered("rtbridge_release");
        call.reset();
    });
}

}
