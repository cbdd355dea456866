#include "realtime_bridge/sip/call.hpp"

#include <chrono>

#include "realtime_bridge/logging.hpp"
#include "realtime_bridge/metrics.hpp"
#include "realtime_bridge/sip/pj_thread.hpp"
#include "realtime_bridge/sip/user_agent.hpp"
#include "realtime_bridge/utils/async.hpp"

namespace realtime_bridge::sip {

SipCall::SipCall(SipUserAgent& agent, pj::Account& account, int call_id)
    : pj::Call(account, call_id),
      agent_(agent) {}

SipCall::~SipCall() {
    close_media();
}

void SipCall::attach(std::shared_ptr<CallSession> session,
                     std::shared_ptr<telephony::SipLeg> leg) {
    session_ = std::move(session);
    leg_ = std::move(leg);
    std::weak_ptr<CallSession> weak_session = session_;
    leg_->set_on_mark([weak_session](const std::string& name) {
        if (auto session = weak_session.lock()) {
            session->on_playback_mark(name, std::chrono::steady_clock::now());
        }
    });
}

void SipCall::answer(int status_code) {
    pj::CallOpParam prm(true);
    prm.statusCode = static_cast<pjsip_status_code>(status_code);
    pj::Call::answer(prm);
}

void SipCall::hangup(int status_code) {
    if (hangup_sent_.exchange(true)) {
        return;
    }
    pj::CallOpParam prm(true);
    prm.statusCode = static_cast<pjsip_status_code>(status_code);
    pj::Call::hangup(prm);
}

void SipCall::hangup_async(const std::string& reason) {
    if (disconnected_ || hangup_sent_) {
        return;
    }
    std::weak_ptr<SipCall> weak_call = shared_from_this();
    utils::run_async([weak_call, reason]() {
        ensure_pj_thread_registered("rtbridge_hangup");
        auto call = weak_call.lock();
        if (!call || call->disconnected()) {
            return;
        }
        try {
            logging::debug(
                "Sending SIP BYE",
                {kv("call_id", call->session() ? call->session()->call_id() : ""),
                 kv("reason", reason)});
            call->hangup(PJSIP_SC_OK);
        } catch (const pj::Error& err) {
            logging::warn(
                "SIP hangup failed",
                {kv("reason", err.reason),
                 kv("status", err.status)});
        }
    });
}

void SipCall::onCallState(pj::OnCallStateParam& prm) {
    (void)prm;
    try {
        const auto info = getInfo();
        logging::debug(
            "Call state changed",
            {kv("call_id", info.callIdString),
             kv("uri", info.remoteUri),
             kv("state", static_cast<int>(info.state)),
             kv("state_text", info.stateText)});
        if (info.state == PJSIP_INV_STATE_CONFIRMED) {
            open_media();
        }
        if (info.state == PJSIP_INV_STATE_DISCONNECTED) {
            disconnected_ = true;
            close_media();
            agent_.handle_call_disconnected(getId(), info.lastStatusCode);
        }
    } catch (const std::exception& ex) {
        logging::error(
            "Call state handler exception",
            {kv("error", ex.what())});
    }
}

void SipCall::onCallMediaState(pj::OnCallMediaStateParam& prm) {
    (void)prm;
    try {
        if (!media_active_) {
            open_media();
        }
    } catch (const std::exception& ex) {
        logging::error(
            "Call media handler exception",
            {kv("error", ex.what())});
    }
}

void SipCall::open_media() {
    if (media_active_ || !session_ || !leg_) {
        return;
    }
    try {
        audio_media_ = std::make_unique<pj::AudioMedia>(getAudioMedia(-1));
    } catch (const pj::Error& ex) {
        logging::error(
            "Call media not available",
            {kv("reason", ex.reason),
             kv("status", ex.status),
             kv("call_id", session_->call_id())});
        return;
    }

    const auto& config = agent_.config();
    pj::MediaFormatAudio format;
    format.type = PJMEDIA_TYPE_AUDIO;
    format.clockRate = static_cast<unsigned>(config.audio_sample_rate);
    format.channelCount = 1;
    format.bitsPerSample = 16;
    format.frameTimeUsec = static_cast<unsigned>(config.frame_ms * 1000);

    media_port_ = std::make_unique<MediaPort>();
    media_port_->createPort("rtbridge/" + session_->call_id(), format);

    auto leg = leg_;
    std::weak_ptr<CallSession> weak_session = session_;
    media_port_->set_on_frame_requested([leg]() { return leg->pull_frame(); });
    media_port_->set_on_frame_received([leg, weak_session](const std::vector<int16_t>& samples) {
        if (auto session = weak_session.lock()) {
            session->on_inbound_frame(leg->encode_inbound(samples),
                                      std::chrono::steady_clock::now());
        }
    });

    try {
        audio_media_->startTransmit(*media_port_);
        media_port_->startTransmit(*audio_media_);
        media_active_ = true;
        logging::info("Call media attached", {kv("call_id", session_->call_id())});
    } catch (const pj::Error& ex) {
        logging::error("Failed to attach media port",
                       {kv("reason", ex.reason),
                        kv("status", ex.status),
                        kv("call_id", session_->call_id())});
    }
}

void SipCall::close_media() {
    if (media_port_) {
        media_port_->set_on_frame_received(nullptr);
        media_port_->set_on_frame_requested(nullptr);
        if (media_port_->dropped_frames() > 0) {
            logging::warn("Inbound SIP frames dropped",
                          {kv("count", media_port_->dropped_frames())});
        }
    }
    media_port_.reset();
    audio_media_.reset();
    media_active_ = false;
}

}
