#include "realtime_bridge/config.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace realtime_bridge {

namespace {

const char* kDefaultRealtimeUrl =
    "wss://api.openai.com/v1/realtime?model=gpt-4o-realtime-preview";

const char* kDefaultGoodbyePhrases = "goodbye,good bye,bye,bye bye,have a great day,"
                                     "have a nice day,take care";

const char* kDefaultWarningPrompt =
    "The caller has been silent for a while. Briefly ask if they are still on the line.";

std::string get_env_str(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : fallback;
}

std::optional<std::string> get_env_optional(const char* name) {
    const char* value = std::getenv(name);
    if (!value) {
        return std::nullopt;
    }
    std::string result(value);
    if (result.empty()) {
        return std::nullopt;
    }
    return result;
}

bool get_env_bool(const char* name, bool fallback) {
    const char* value = std::getenv(name);
    if (!value) {
        return fallback;
    }
    std::string normalized(value);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return normalized == "true" || normalized == "1";
}

int get_env_int(const char* name, int fallback) {
    const char* value = std::getenv(name);
    return value ? std::stoi(value) : fallback;
}

double get_env_double(const char* name, double fallback) {
    const char* value = std::getenv(name);
    return value ? std::stod(value) : fallback;
}

std::string trim(std::string value) {
    auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(),
                                            [&](unsigned char ch) { return !is_space(ch); }));
    value.erase(std::find_if(value.rbegin(), value.rend(),
                             [&](unsigned char ch) { return !is_space(ch); }).base(),
                value.end());
    return value;
}

std::vector<std::string> split_csv(const std::string& raw) {
    std::vector<std::string> result;
    std::stringstream stream(raw);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }
    return result;
}

std::string read_text_file(const std::filesystem::path& path) {
    std::ifstream stream(path);
    if (!stream.is_open()) {
        throw std::runtime_error("cannot open " + path.string());
    }
    std::ostringstream content;
    content << stream.rdbuf();
    return content.str();
}

std::string timestamp_suffix() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_value{};
    localtime_r(&time_t, &tm_value);
    std::ostringstream stream;
    stream << std::put_time(&tm_value, "%Y%m%d_%H%M%S");
    return stream.str();
}

std::string strip_quotes(std::string value) {
    if (value.size() < 2) {
        return value;
    }
    if ((value.front() == '"' && value.back() == '"') ||
        (value.front() == '\'' && value.back() == '\'')) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

void load_dotenv() {
    const std::filesystem::path dotenv_path = std::filesystem::current_path() / ".env";
    if (!std::filesystem::exists(dotenv_path)) {
        return;
    }

    std::ifstream stream(dotenv_path);
    if (!stream.is_open()) {
        return;
    }

    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty() || line.rfind("#", 0) == 0) {
            continue;
        }

        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }

        const auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));
        if (key.empty()) {
            continue;
        }
        // Real environment wins over .env.
        setenv(key.c_str(), strip_quotes(value).c_str(), 0);
    }
}

void require_positive(int value, const char* name) {
    if (value <= 0) {
        throw std::runtime_error(std::string(name) + " must be positive");
    }
}

}

Config Config::load() {
    load_dotenv();
    Config config;

    config.log_level = get_env_str("LOG_LEVEL", "INFO");
    const auto log_filename_raw = get_env_str("LOG_FILENAME", "");
    if (!log_filename_raw.empty()) {
        const std::filesystem::path log_path(log_filename_raw);
        const auto stamped = log_path.stem().string() + "_" + timestamp_suffix() +
                             log_path.extension().string();
        if (const auto log_dir = get_env_optional("LOGS_DIR")) {
            config.logs_dir = std::filesystem::path(*log_dir);
            config.log_filename = (std::filesystem::path(*log_dir) / stamped).string();
        } else {
            config.log_filename = stamped;
        }
    }
    config.log_name = get_env_str("LOG_NAME", "realtime_bridge");

    config.media_stream_port = get_env_int("MEDIA_STREAM_PORT", 8080);
    config.rest_api_port = get_env_int("REST_API_PORT", 8000);
    config.media_stream_max_sessions = get_env_int("MEDIA_STREAM_MAX_SESSIONS", 64);

    config.sip_enabled = get_env_bool("SIP_ENABLED", false);
    config.sip_user = get_env_str("SIP_USER", "");
    config.sip_login = get_env_str("SIP_LOGIN", config.sip_user);
    config.sip_domain = get_env_str("SIP_DOMAIN", "");
    config.sip_password = get_env_str("SIP_PASSWORD", "");
    config.sip_port = get_env_int("SIP_PORT", 5060);
    config.sip_use_tcp = get_env_bool("SIP_USE_TCP", true);
    config.sip_null_device = get_env_bool("SIP_NULL_DEVICE", true);
    config.pjsip_log_level = get_env_int("PJSIP_LOG_LEVEL", 1);
    const int default_console_level = config.log_filename ? 0 : config.pjsip_log_level;
    config.pjsip_console_log_level =
        get_env_int("PJSIP_CONSOLE_LOG_LEVEL", default_console_level);
    config.ec_tail_len = get_env_int("EC_TAIL_LEN", 200);
    config.events_delay = get_env_double("EVENTS_DELAY", 0.010);

    config.realtime_url = get_env_str("REALTIME_URL", kDefaultRealtimeUrl);
    config.realtime_api_key = get_env_str("REALTIME_API_KEY", "");
    config.realtime_voice = get_env_str("REALTIME_VOICE", "alloy");
    config.realtime_instructions = get_env_str("REALTIME_INSTRUCTIONS", "");
    if (const auto instructions_file = get_env_optional("REALTIME_INSTRUCTIONS_FILE")) {
        config.realtime_instructions = read_text_file(*instructions_file);
    }
    config.realtime_transcription_model =
        get_env_str("REALTIME_TRANSCRIPTION_MODEL", "whisper-1");
    config.realtime_open_timeout_ms = get_env_int("REALTIME_OPEN_TIMEOUT_MS", 5000);
    config.realtime_ping_interval_ms = get_env_int("REALTIME_PING_INTERVAL_MS", 5000);
    config.realtime_pong_timeout_ms = get_env_int("REALTIME_PONG_TIMEOUT_MS", 10000);

    config.audio_encoding = get_env_str("AUDIO_ENCODING", "mulaw");
    config.audio_sample_rate = get_env_int("AUDIO_SAMPLE_RATE", 8000);
    config.frame_ms = get_env_int("FRAME_MS", 20);

    config.playback_queue_ms = get_env_int("PLAYBACK_QUEUE_MS", 10000);
    config.playback_saturation_warn_ms = get_env_int("PLAYBACK_SATURATION_WARN_MS", 1000);

    config.vad_min_rms = get_env_double("VAD_MIN_RMS", 180.0);
    config.vad_noise_multiplier = get_env_double("VAD_NOISE_MULTIPLIER", 2.5);
    config.vad_speech_frames = get_env_int("VAD_SPEECH_FRAMES", 6);
    config.vad_release_frames = get_env_int("VAD_RELEASE_FRAMES", 15);
    config.vad_decay_step = get_env_int("VAD_DECAY_STEP", 1);
    config.vad_noise_alpha = get_env_double("VAD_NOISE_ALPHA", 0.05);
    config.vad_initial_adapt_frames = get_env_int("VAD_INITIAL_ADAPT_FRAMES", 25);
    config.vad_calibration_ms = get_env_int("VAD_CALIBRATION_MS", 4000);
    config.vad_calibration_min_since_turn_ms =
        get_env_int("VAD_CALIBRATION_MIN_SINCE_TURN_MS", 1200);
    config.vad_calibration_min_speech_ms = get_env_int("VAD_CALIBRATION_MIN_SPEECH_MS", 300);
    config.vad_echo_rms_multiplier = get_env_double("VAD_ECHO_RMS_MULTIPLIER", 1.4);
    config.vad_echo_extra_frames = get_env_int("VAD_ECHO_EXTRA_FRAMES", 3);

    config.barge_in_enabled = get_env_bool("BARGE_IN_ENABLED", true);
    config.barge_in_confirm_mode = get_env_str("BARGE_IN_CONFIRM_MODE", "vad");
    config.barge_in_confirm_timeout_ms = get_env_int("BARGE_IN_CONFIRM_TIMEOUT_MS", 600);
    config.barge_in_cancel_cooldown_ms = get_env_int("BARGE_IN_CANCEL_COOLDOWN_MS", 200);
    config.barge_in_min_transcript_chars = get_env_int("BARGE_IN_MIN_TRANSCRIPT_CHARS", 2);

    config.goodbye_phrases = split_csv(get_env_str("GOODBYE_PHRASES", kDefaultGoodbyePhrases));
    config.hangup_drain_fallback_ms = get_env_int("HANGUP_DRAIN_FALLBACK_MS", 3000);
    config.hangup_request_fallback_ms = get_env_int("HANGUP_REQUEST_FALLBACK_MS", 15000);

    config.watchdog_poll_ms = get_env_int("WATCHDOG_POLL_MS", 1000);
    config.silence_hard_timeout_ms = get_env_int("SILENCE_HARD_TIMEOUT_MS", 20000);
    config.idle_after_greeting_ms = get_env_int("IDLE_AFTER_GREETING_MS", 30000);
    config.silence_warning_ms = get_env_int("SILENCE_WARNING_MS", 8000);
    config.silence_max_warnings = get_env_int("SILENCE_MAX_WARNINGS", 2);
    config.silence_warning_prompt = get_env_str("SILENCE_WARNING_PROMPT", kDefaultWarningPrompt);
    config.max_call_duration_ms = get_env_int("MAX_CALL_DURATION_MS", 1800000);
    config.media_timeout_ms = get_env_int("MEDIA_TIMEOUT_MS", 5000);

    return config;
}

void Config::validate() const {
    if (realtime_api_key.empty()) {
        throw std::runtime_error("REALTIME_API_KEY is required");
    }
    if (realtime_url.rfind("wss://", 0) != 0) {
        throw std::runtime_error("REALTIME_URL must be a wss:// URL");
    }
    if (sip_enabled) {
        if (sip_user.empty()) {
            throw std::runtime_error("SIP_USER is required");
        }
        if (sip_domain.empty()) {
            throw std::runtime_error("SIP_DOMAIN is required");
        }
        if (sip_password.empty()) {
            throw std::runtime_error("SIP_PASSWORD is required");
        }
        require_positive(sip_port, "SIP_PORT");
    }
    if (audio_encoding != "mulaw" && audio_encoding != "pcm16") {
        throw std::runtime_error("AUDIO_ENCODING must be mulaw or pcm16");
    }
    if (barge_in_confirm_mode != "vad" && barge_in_confirm_mode != "transcript") {
        throw std::runtime_error("BARGE_IN_CONFIRM_MODE must be vad or transcript");
    }
    require_positive(media_stream_port, "MEDIA_STREAM_PORT");
    require_positive(rest_api_port, "REST_API_PORT");
    require_positive(media_stream_max_sessions, "MEDIA_STREAM_MAX_SESSIONS");
    require_positive(audio_sample_rate, "AUDIO_SAMPLE_RATE");
    require_positive(frame_ms, "FRAME_MS");
    require_positive(vad_speech_frames, "VAD_SPEECH_FRAMES");
    require_positive(vad_release_frames, "VAD_RELEASE_FRAMES");
    require_positive(watchdog_poll_ms, "WATCHDOG_POLL_MS");
    require_positive(media_timeout_ms, "MEDIA_TIMEOUT_MS");
    // Steady-state capacity must cover several seconds of audio.
    if (playback_queue_ms < 3000) {
        throw std::runtime_error("PLAYBACK_QUEUE_MS must be at least 3000");
    }
    if (silence_warning_ms > 0 && silence_warning_ms >= silence_hard_timeout_ms) {
        throw std::runtime_error("SILENCE_WARNING_MS must be below SILENCE_HARD_TIMEOUT_MS");
    }
    if (goodbye_phrases.empty()) {
        throw std::runtime_error("GOODBYE_PHRASES must not be empty");
    }
}

}
