#include "realtime_bridge/vad/voice_activity_monitor.hpp"

#include <algorithm>

#include "realtime_bridge/audio/samples.hpp"
#include "realtime_bridge/config.hpp"

namespace realtime_bridge {
namespace vad {

VadConfig VadConfig::from_config(const Config& config) {
    VadConfig cfg;
    cfg.frame_duration = std::chrono::milliseconds(config.frame_ms);
    cfg.encoding = audio::parse_encoding(config.audio_encoding);
    cfg.min_rms = config.vad_min_rms;
    cfg.noise_multiplier = config.vad_noise_multiplier;
    cfg.speech_frames = config.vad_speech_frames;
    cfg.release_frames = config.vad_release_frames;
    cfg.decay_step = config.vad_decay_step;
    cfg.noise_alpha = config.vad_noise_alpha;
    cfg.initial_adapt_frames = config.vad_initial_adapt_frames;
    cfg.calibration_window = std::chrono::milliseconds(config.vad_calibration_ms);
    cfg.calibration_min_since_turn =
        std::chrono::milliseconds(config.vad_calibration_min_since_turn_ms);
    cfg.calibration_min_speech = std::chrono::milliseconds(config.vad_calibration_min_speech_ms);
    cfg.echo_rms_multiplier = config.vad_echo_rms_multiplier;
    cfg.echo_extra_frames = config.vad_echo_extra_frames;
    return cfg;
}

VoiceActivityMonitor::VoiceActivityMonitor(VadConfig config, Clock::time_point call_start)
    : config_(config),
      call_start_(call_start) {
    config_.speech_frames = std::max(1, config_.speech_frames);
    config_.release_frames = std::max(1, config_.release_frames);
    config_.decay_step = std::max(1, config_.decay_step);
    initial_energy_samples_.reserve(static_cast<size_t>(std::max(0, config_.initial_adapt_frames)));
    if (config_.initial_adapt_frames <= 0) {
        calibrated_ = true;
    }
}

VadResult VoiceActivityMonitor::process(const std::vector<uint8_t>& payload,
                                        Clock::time_point now,
                                        bool ai_speaking,
                                        std::optional<Clock::time_point> turn_started) {
    return process_rms(audio::frame_rms(payload, config_.encoding), now, ai_speaking,
                       turn_started);
}

VadResult VoiceActivityMonitor::process_rms(double rms,
                                            Clock::time_point now,
                                            bool ai_speaking,
                                            std::optional<Clock::time_point> turn_started) {
    VadResult result;
    result.rms = rms;
    result.above_threshold = rms >= threshold(ai_speaking);

    const int required = required_frames(ai_speaking);
    if (result.above_threshold) {
        if (speech_counter_ == 0) {
            run_start_ = now;
        }
        speech_counter_ = std::min(speech_counter_ + 1, required + config_.release_frames);
        quiet_frames_ = 0;
    } else {
        update_noise_floor(rms, ai_speaking);
        speech_counter_ = std::max(0, speech_counter_ - config_.decay_step);
        if (speech_counter_ == 0) {
            run_start_.reset();
        }
        ++quiet_frames_;
    }

    if (!speaking_ && result.above_threshold && speech_counter_ >= required) {
        speaking_ = true;
        candidate_fired_ = false;
        result.speech_started = true;
    }

    if (speaking_ && !candidate_fired_ && result.above_threshold &&
        speech_counter_ >= required && barge_in_gate(now, turn_started)) {
        candidate_fired_ = true;
        result.barge_in_candidate = true;
    }

    if (speaking_ && quiet_frames_ >= config_.release_frames) {
        speaking_ = false;
        candidate_fired_ = false;
        speech_counter_ = 0;
        run_start_.reset();
        result.speech_ended = true;
    }
    return result;
}

void VoiceActivityMonitor::update_noise_floor(double rms, bool ai_speaking) {
    if (!calibrated_) {
        initial_energy_samples_.push_back(rms);
        if (static_cast<int>(initial_energy_samples_.size()) >= config_.initial_adapt_frames) {
            auto sorted = initial_energy_samples_;
            std::sort(sorted.begin(), sorted.end());
            noise_floor_ = sorted[sorted.size() / 10];
            calibrated_ = true;
            initial_energy_samples_.clear();
        }
        return;
    }
    // Echo of the AI's voice is not line noise.
    if (ai_speaking || speaking_) {
        return;
    }
    noise_floor_ = (1.0 - config_.noise_alpha) * noise_floor_ + config_.noise_alpha * rms;
}

bool VoiceActivityMonitor::barge_in_gate(Clock::time_point now,
                                         std::optional<Clock::time_point> turn_started) const {
    if (now - call_start_ >= config_.calibration_window) {
        return true;
    }
    if (turn_started && now - *turn_started < config_.calibration_min_since_turn) {
        return false;
    }
    if (!run_start_) {
        return false;
    }
    // The frame that moved the counter is itself speech, so count it in.
    return (now - *run_start_) + config_.frame_duration >= config_.calibration_min_speech;
}

bool VoiceActivityMonitor::speaking() const {
    return speaking_;
}

bool VoiceActivityMonitor::calibrated() const {
    return calibrated_;
}

double VoiceActivityMonitor::noise_floor() const {
    return noise_floor_;
}

double VoiceActivityMonitor::threshold(bool ai_speaking) const {
    double value = std::max(config_.min_rms, noise_floor_ * config_.noise_multiplier);
    if (ai_speaking) {
        value *= config_.echo_rms_multiplier;
    }
    return value;
}

int VoiceActivityMonitor::required_frames(bool ai_speaking) const {
    return config_.speech_frames + (ai_speaking ? std::max(0, config_.echo_extra_frames) : 0);
}

int VoiceActivityMonitor::speech_counter() const {
    return speech_counter_;
}

}
}
