#pragma once

#include <chrono>
#include <optional>
#include <vector>

#include "realtime_bridge/audio/frame.hpp"

namespace realtime_bridge {

struct Config;

namespace vad {

struct VadConfig {
    std::chrono::milliseconds frame_duration{20};
    audio::Encoding encoding = audio::Encoding::Mulaw;

    double min_rms = 180.0;
    double noise_multiplier = 2.5;
    int speech_frames = 6;
    int release_frames = 15;
    int decay_step = 1;
    double noise_alpha = 0.05;
    int initial_adapt_frames = 25;

    std::chrono::milliseconds calibration_window{4000};
    std::chrono::milliseconds calibration_min_since_turn{1200};
    std::chrono::milliseconds calibration_min_speech{300};

    double echo_rms_multiplier = 1.4;
    int echo_extra_frames = 3;

    static VadConfig from_config(const Config& config);
};

struct VadResult {
    double rms = 0.0;
    bool above_threshold = false;
    bool speech_started = false;
    bool speech_ended = false;
    bool barge_in_candidate = false;
};

// Energy-based voice activity detection for inbound caller frames.
//
// A speech segment starts after `speech_frames` above-threshold frames; the
// counter decays by `decay_step` on quiet frames instead of resetting, so a
// short pause inside a word does not restart the count. While the AI is
// speaking the threshold and the required count are raised to keep line
// echo of the AI's own voice from triggering. During the calibration window
// at the start of the call a barge-in candidate additionally needs a minimum
// time since the AI turn started and a minimum continuous speech duration.
class VoiceActivityMonitor {
public:
    using Clock = std::chrono::steady_clock;

    VoiceActivityMonitor(VadConfig config, Clock::time_point call_start);

    VadResult process(const std::vector<uint8_t>& payload,
                      Clock::time_point now,
                      bool ai_speaking,
                      std::optional<Clock::time_point> turn_started);
    VadResult process_rms(double rms,
                          Clock::time_point now,
                          bool ai_speaking,
                          std::optional<Clock::time_point> turn_started);

    bool speaking() const;
    bool calibrated() const;
    double noise_floor() const;
    double threshold(bool ai_speaking) const;
    int required_frames(bool ai_speaking) const;
    int speech_counter() const;

private:
    void update_noise_floor(double rms, bool ai_speaking);
    bool barge_in_gate(Clock::time_point now,
                       std::optional<Clock::time_point> turn_started) const;

    VadConfig config_;
    Clock::time_point call_start_;
    std::vector<double> initial_energy_samples_;
    double noise_floor_ = 0.0;
    bool calibrated_ = false;
    int speech_counter_ = 0;
    int quiet_frames_ = 0;
    bool speaking_ = false;
    bool candidate_fired_ = false;
    std::optional<Clock::time_point> run_start_;
};

}
}
