#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace realtime_bridge {

struct Config {
    std::string log_level = "INFO";
    std::optional<std::string> log_filename;
    std::optional<std::filesystem::path> logs_dir;
    std::string log_name = "realtime_bridge";

    int media_stream_port = 8080;
    int rest_api_port = 8000;
    int media_stream_max_sessions = 64;

    bool sip_enabled = false;
    std::string sip_user;
    std::string sip_login;
    std::string sip_domain;
    std::string sip_password;
    int sip_port = 5060;
    bool sip_use_tcp = true;
    bool sip_null_device = true;
    int pjsip_log_level = 1;
    int pjsip_console_log_level = 1;
    int ec_tail_len = 200;
    double events_delay = 0.010;

    std::string realtime_url;
    std::string realtime_api_key;
    std::string realtime_voice = "alloy";
    std::string realtime_instructions;
    std::string realtime_transcription_model = "whisper-1";
    int realtime_open_timeout_ms = 5000;
    int realtime_ping_interval_ms = 5000;
    int realtime_pong_timeout_ms = 10000;

    std::string audio_encoding = "mulaw";
    int audio_sample_rate = 8000;
    int frame_ms = 20;

    int playback_queue_ms = 10000;
    int playback_saturation_warn_ms = 1000;

    double vad_min_rms = 180.0;
    double vad_noise_multiplier = 2.5;
    int vad_speech_frames = 6;
    int vad_release_frames = 15;
    int vad_decay_step = 1;
    double vad_noise_alpha = 0.05;
    int vad_initial_adapt_frames = 25;
    int vad_calibration_ms = 4000;
    int vad_calibration_min_since_turn_ms = 1200;
    int vad_calibration_min_speech_ms = 300;
    double vad_echo_rms_multiplier = 1.4;
    int vad_echo_extra_frames = 3;

    bool barge_in_enabled = true;
    std::string barge_in_confirm_mode = "vad";
    int barge_in_confirm_timeout_ms = 600;
    int barge_in_cancel_cooldown_ms = 200;
    int barge_in_min_transcript_chars = 2;

    std::vector<std::string> goodbye_phrases;
    int hangup_drain_fallback_ms = 3000;
    int hangup_request_fallback_ms = 15000;

    int watchdog_poll_ms = 1000;
    int silence_hard_timeout_ms = 20000;
    int idle_after_greeting_ms = 30000;
    int silence_warning_ms = 8000;
    int silence_max_warnings = 2;
    std::string silence_warning_prompt;
    int max_call_duration_ms = 1800000;
    int media_timeout_ms = 5000;

    static Config load();
    void validate() const;
};

}
