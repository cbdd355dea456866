#include <catch2/catch_test_macros.hpp>

#include "realtime_bridge/logging.hpp"

using namespace realtime_bridge;
using namespace std::chrono_literals;

TEST_CASE("Key values are quoted only when needed") {
    REQUIRE(logging::format_kv({kv("call_id", "CA1"), kv("speaking", true)}) ==
            "call_id=CA1, speaking=true");
    REQUIRE(logging::format_kv({kv("text", "say \"bye\" now")}) ==
            "text=\"say \\\"bye\\\" now\"");
    REQUIRE(logging::format_kv({kv("turn_id", "")}) == "turn_id=\"\"");
    REQUIRE(with_kv("Turn started", {}) == "Turn started");
}

TEST_CASE("Durations are logged in milliseconds") {
    REQUIRE(kv("lag", 42ms).value == "42ms");
    REQUIRE(kv("lag", 1500us).value == "1.5ms");
}

TEST_CASE("Long transcripts are clipped on a character boundary") {
    REQUIRE(text_kv("text", "short").value == "short");

    const std::string accented = "ab\xC3\xA9" "cd";
    const auto clipped = text_kv("text", accented, 3);
    REQUIRE(clipped.value == "ab...(6 bytes)");
}

TEST_CASE("Throttle folds repeats into the next line") {
    logging::Throttle throttle(1000ms);
    const auto t0 = logging::Throttle::Clock::time_point{} + 10s;
    REQUIRE(throttle.ready(t0) == 0u);
    REQUIRE_FALSE(throttle.ready(t0 + 100ms));
    REQUIRE_FALSE(throttle.ready(t0 + 900ms));
    REQUIRE(throttle.ready(t0 + 1000ms) == 2u);
    REQUIRE(throttle.ready(t0 + 2500ms) == 0u);
}
