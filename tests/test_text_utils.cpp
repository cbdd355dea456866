#include <catch2/catch_test_macros.hpp>

#include "realtime_bridge/utils/text.hpp"

#include <string>

using namespace realtime_bridge;

TEST_CASE("remove_emojis strips emoji codepoints") {
    const std::string emoji = "\xF0\x9F\x98\x80";
    const std::string input = "Hello " + emoji + " world";
    const std::string expected = "Hello  world";
    REQUIRE(utils::remove_emojis(input) == expected);
}

TEST_CASE("remove_emojis leaves plain ASCII untouched") {
    const std::string input = "Plain text only.";
    REQUIRE(utils::remove_emojis(input) == input);
}

TEST_CASE("normalize_text lowercases and trims whitespace") {
    const std::string input = "  Hello\tWORLD  ";
    const std::string expected = "hello world";
    REQUIRE(utils::normalize_text(input) == expected);
}

TEST_CASE("strip_punctuation keeps apostrophes inside words") {
    REQUIRE(utils::normalize_text(utils::strip_punctuation("Don't go, 'friend'!")) ==
            "don't go friend");
}

TEST_CASE("last_sentence returns the final non-empty sentence") {
    REQUIRE(utils::last_sentence("Thanks for calling. Goodbye!") == " Goodbye");
    REQUIRE(utils::last_sentence("Goodbye. ...") == "Goodbye");
    REQUIRE(utils::last_sentence("See you\xE2\x80\xA6 take care") == " take care");
    REQUIRE(utils::last_sentence("?!").empty());
}
