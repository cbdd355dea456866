#include <catch2/catch_test_macros.hpp>

#include "realtime_bridge/audio/samples.hpp"
#include "realtime_bridge/vad/voice_activity_monitor.hpp"

#include <chrono>
#include <optional>
#include <vector>

using namespace realtime_bridge;
using namespace std::chrono_literals;
using Clock = std::chrono::steady_clock;

namespace {

constexpr double kLoud = 2000.0;
constexpr double kQuiet = 50.0;

vad::VadConfig test_config() {
    vad::VadConfig config;
    config.min_rms = 180.0;
    config.speech_frames = 3;
    config.release_frames = 4;
    config.initial_adapt_frames = 0;
    config.calibration_window = 0ms;
    config.echo_rms_multiplier = 1.4;
    config.echo_extra_frames = 3;
    return config;
}

}

TEST_CASE("Speech starts after consecutive loud frames and ends after release") {
    const auto t0 = Clock::time_point{} + 10s;
    vad::VoiceActivityMonitor monitor(test_config(), t0);

    REQUIRE_FALSE(monitor.process_rms(kQuiet, t0, false, std::nullopt).above_threshold);
    REQUIRE_FALSE(monitor.process_rms(kLoud, t0 + 20ms, false, std::nullopt).speech_started);
    REQUIRE_FALSE(monitor.process_rms(kLoud, t0 + 40ms, false, std::nullopt).speech_started);
    const auto started = monitor.process_rms(kLoud, t0 + 60ms, false, std::nullopt);
    REQUIRE(started.speech_started);
    REQUIRE(started.barge_in_candidate);
    REQUIRE(monitor.speaking());

    // One candidate per speech segment.
    REQUIRE_FALSE(monitor.process_rms(kLoud, t0 + 80ms, false, std::nullopt).barge_in_candidate);

    for (int i = 0; i < 3; ++i) {
        REQUIRE_FALSE(monitor.process_rms(kQuiet, t0 + 100ms + i * 20ms, false, std::nullopt)
                          .speech_ended);
    }
    REQUIRE(monitor.process_rms(kQuiet, t0 + 160ms, false, std::nullopt).speech_ended);
    REQUIRE_FALSE(monitor.speaking());
}

TEST_CASE("A short dip decays the counter instead of resetting it") {
    const auto t0 = Clock::time_point{} + 10s;
    vad::VoiceActivityMonitor monitor(test_config(), t0);

    monitor.process_rms(kLoud, t0, false, std::nullopt);
    monitor.process_rms(kLoud, t0 + 20ms, false, std::nullopt);
    monitor.process_rms(kQuiet, t0 + 40ms, false, std::nullopt);
    REQUIRE(monitor.speech_counter() == 1);
    REQUIRE_FALSE(monitor.process_rms(kLoud, t0 + 60ms, false, std::nullopt).speech_started);
    REQUIRE(monitor.process_rms(kLoud, t0 + 80ms, false, std::nullopt).speech_started);
}

TEST_CASE("Echo guard raises threshold and frame count while the AI speaks") {
    const auto t0 = Clock::time_point{} + 10s;
    vad::VoiceActivityMonitor monitor(test_config(), t0);

    REQUIRE(monitor.threshold(true) > monitor.threshold(false));
    REQUIRE(monitor.required_frames(true) == 6);
    REQUIRE_FALSE(monitor.process_rms(200.0, t0, true, std::nullopt).above_threshold);
    REQUIRE(monitor.process_rms(200.0, t0 + 20ms, false, std::nullopt).above_threshold);

    vad::VoiceActivityMonitor echo(test_config(), t0);
    for (int i = 0; i < 5; ++i) {
        REQUIRE_FALSE(echo.process_rms(kLoud, t0 + i * 20ms, true, std::nullopt).speech_started);
    }
    REQUIRE(echo.process_rms(kLoud, t0 + 100ms, true, std::nullopt).barge_in_candidate);
}

TEST_CASE("Calibration window gates barge-in candidates") {
    auto config = test_config();
    config.calibration_window = 4000ms;
    config.calibration_min_since_turn = 1200ms;
    config.calibration_min_speech = 300ms;
    const auto t0 = Clock::time_point{} + 10s;

    SECTION("too soon after the AI turn started") {
        vad::VoiceActivityMonitor monitor(config, t0);
        const auto turn_started = t0 + 500ms;
        bool candidate = false;
        for (int i = 0; i < 20; ++i) {
            candidate |= monitor.process_rms(kLoud, t0 + 1000ms + i * 20ms, true, turn_started)
                             .barge_in_candidate;
        }
        REQUIRE(monitor.speaking());
        REQUIRE_FALSE(candidate);
    }

    SECTION("sustained speech long enough into the turn") {
        vad::VoiceActivityMonitor monitor(config, t0);
        const auto turn_started = t0;
        int candidate_frame = -1;
        for (int i = 0; i < 20; ++i) {
            if (monitor.process_rms(kLoud, t0 + 2000ms + i * 20ms, false, turn_started)
                    .barge_in_candidate) {
                candidate_frame = i;
                break;
            }
        }
        REQUIRE(candidate_frame == 14);
    }

    SECTION("after the window only the counter matters") {
        vad::VoiceActivityMonitor monitor(config, t0);
        const auto start = t0 + 5000ms;
        monitor.process_rms(kLoud, start, false, start);
        monitor.process_rms(kLoud, start + 20ms, false, start);
        REQUIRE(monitor.process_rms(kLoud, start + 40ms, false, start).barge_in_candidate);
    }
}

TEST_CASE("Initial frames calibrate the noise floor") {
    auto config = test_config();
    config.initial_adapt_frames = 10;
    const auto t0 = Clock::time_point{} + 10s;
    vad::VoiceActivityMonitor monitor(config, t0);
    for (int i = 0; i < 10; ++i) {
        monitor.process_rms(100.0, t0 + i * 20ms, false, std::nullopt);
    }
    REQUIRE(monitor.calibrated());
    REQUIRE(monitor.noise_floor() == 100.0);
    REQUIRE(monitor.threshold(false) == 250.0);
}

TEST_CASE("process() measures the payload in the configured encoding") {
    const auto t0 = Clock::time_point{} + 10s;
    vad::VoiceActivityMonitor monitor(test_config(), t0);
    const auto loud = audio::from_linear(std::vector<int16_t>(160, 3000), audio::Encoding::Mulaw);
    const auto silence = std::vector<uint8_t>(160, 0xFF);
    REQUIRE(monitor.process(loud, t0, false, std::nullopt).above_threshold);
    REQUIRE_FALSE(monitor.process(silence, t0 + 20ms, false, std::nullopt).above_threshold);
}
