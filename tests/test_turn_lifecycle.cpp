#include <catch2/catch_test_macros.hpp>

#include "realtime_bridge/session/turn_lifecycle.hpp"

#include <chrono>

using namespace realtime_bridge;
using namespace std::chrono_literals;
using Clock = std::chrono::steady_clock;
using Result = TurnLifecycle::Result;

TEST_CASE("Turn moves from active through audio done to completed") {
    TurnLifecycle turns("call");
    const auto t0 = Clock::time_point{} + 1s;

    REQUIRE(turns.turn_started("r1", t0) == Result::Applied);
    REQUIRE(turns.turn_started("r1", t0) == Result::Unchanged);
    REQUIRE(turns.has_active_turn());
    REQUIRE(turns.current_turn_id() == std::optional<std::string>("r1"));

    REQUIRE(turns.mark_audio_done("r1", t0 + 1s) == Result::Applied);
    REQUIRE(turns.mark_audio_done("r1", t0 + 2s) == Result::Unchanged);
    REQUIRE_FALSE(turns.has_active_turn());
    REQUIRE(turns.snapshot("r1")->audio_done_ts == t0 + 1s);

    REQUIRE(turns.mark_completed("r1", t0 + 3s) == Result::Applied);
    REQUIRE(turns.current()->status == TurnStatus::Completed);
    REQUIRE(turns.snapshot("r1")->audio_done_ts == t0 + 1s);
}

TEST_CASE("Completion without audio done closes the audio stream") {
    TurnLifecycle turns;
    const auto t0 = Clock::time_point{} + 1s;
    turns.turn_started("r1", t0);
    REQUIRE(turns.mark_completed("r1", t0 + 1s) == Result::Applied);
    REQUIRE(turns.is_audio_done("r1"));
    REQUIRE(turns.mark_audio_done("r1", t0 + 2s) == Result::Unchanged);
}

TEST_CASE("Cancel request is granted at most once per turn") {
    TurnLifecycle turns;
    const auto t0 = Clock::time_point{} + 1s;
    turns.turn_started("r1", t0);

    REQUIRE(turns.mark_cancel_requested("r1"));
    REQUIRE_FALSE(turns.mark_cancel_requested("r1"));
    REQUIRE(turns.is_cancelled("r1"));
    REQUIRE(turns.snapshot("r1")->cancel_sent);

    // Vendor confirms by completing the turn.
    REQUIRE(turns.mark_completed("r1", t0 + 1s) == Result::Applied);
    REQUIRE(turns.current()->status == TurnStatus::Cancelled);
    REQUIRE(turns.mark_cancelled("r1") == Result::Unchanged);
    REQUIRE_FALSE(turns.mark_cancel_requested("r1"));
}

TEST_CASE("Completed turns cannot be cancelled") {
    TurnLifecycle turns;
    const auto t0 = Clock::time_point{} + 1s;
    turns.turn_started("r1", t0);
    turns.mark_completed("r1", t0);
    REQUIRE_FALSE(turns.mark_cancel_requested("r1"));
    REQUIRE_FALSE(turns.is_cancelled("r1"));
}

TEST_CASE("Only the current and previous turn are retained") {
    TurnLifecycle turns;
    const auto t0 = Clock::time_point{} + 1s;
    turns.turn_started("r1", t0);
    turns.turn_started("r2", t0 + 1s);
    REQUIRE(turns.is_known("r1"));
    REQUIRE(turns.mark_audio_done("r1", t0 + 2s) == Result::Applied);

    turns.turn_started("r3", t0 + 3s);
    REQUIRE_FALSE(turns.is_known("r1"));
    REQUIRE(turns.mark_audio_done("r1", t0 + 4s) == Result::UnknownTurn);
    REQUIRE(turns.mark_cancelled("missing") == Result::UnknownTurn);
    REQUIRE(turns.turns_started() == 3);
    REQUIRE(turns.current()->ordinal == 3);
}
