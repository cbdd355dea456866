#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <stdexcept>

#include "realtime_bridge/config.hpp"
#include "realtime_bridge/session/call_session.hpp"

using namespace realtime_bridge;

namespace {

Config valid_config() {
    Config config;
    config.realtime_url = "wss://realtime.example.com/v1";
    config.realtime_api_key = "sk-test";
    config.goodbye_phrases = {"goodbye"};
    return config;
}

struct ScopedEnv {
    ScopedEnv(const char* name, const char* value) : name_(name) { setenv(name, value, 1); }
    ~ScopedEnv() { unsetenv(name_); }
    const char* name_;
};

}

TEST_CASE("A complete configuration validates") {
    REQUIRE_NOTHROW(valid_config().validate());
}

TEST_CASE("Realtime endpoint must use TLS and carry a key") {
    auto config = valid_config();
    config.realtime_url = "ws://realtime.example.com/v1";
    REQUIRE_THROWS_AS(config.validate(), std::runtime_error);

    config = valid_config();
    config.realtime_api_key.clear();
    REQUIRE_THROWS_AS(config.validate(), std::runtime_error);
}

TEST_CASE("Invalid tunables are rejected") {
    auto config = valid_config();
    config.audio_encoding = "opus";
    REQUIRE_THROWS(config.validate());

    config = valid_config();
    config.barge_in_confirm_mode = "whenever";
    REQUIRE_THROWS(config.validate());

    config = valid_config();
    config.playback_queue_ms = 1000;
    REQUIRE_THROWS(config.validate());

    config = valid_config();
    config.silence_warning_ms = config.silence_hard_timeout_ms;
    REQUIRE_THROWS(config.validate());

    config = valid_config();
    config.sip_enabled = true;
    REQUIRE_THROWS(config.validate());
    config.sip_user = "1001";
    config.sip_domain = "pbx.example.com";
    config.sip_password = "secret";
    REQUIRE_NOTHROW(config.validate());
}

TEST_CASE("Environment overrides defaults") {
    ScopedEnv phrases("GOODBYE_PHRASES", " bye now , , see you ");
    ScopedEnv frames("VAD_SPEECH_FRAMES", "4");
    ScopedEnv sip("SIP_ENABLED", "TRUE");

    const auto config = Config::load();
    REQUIRE(config.goodbye_phrases == std::vector<std::string>{"bye now", "see you"});
    REQUIRE(config.vad_speech_frames == 4);
    REQUIRE(config.sip_enabled);
    REQUIRE(config.frame_ms == 20);
    REQUIRE(config.realtime_url.rfind("wss://", 0) == 0);
}

TEST_CASE("Session settings derive from the configuration") {
    auto config = valid_config();
    config.playback_queue_ms = 4000;
    config.barge_in_confirm_mode = "transcript";
    config.media_timeout_ms = 2500;

    const auto session = make_session_config(config);
    REQUIRE(session.playback_capacity_frames == 200);
    REQUIRE(session.format.frame_bytes() == 160);
    REQUIRE(session.barge_in.confirm_mode == ConfirmMode::Transcript);
    REQUIRE(session.watchdog.media_timeout == std::chrono::milliseconds(2500));
    REQUIRE(session.goodbye_phrases == config.goodbye_phrases);
    REQUIRE(session.run_threads);
}
