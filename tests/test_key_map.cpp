#include <catch2/catch.hpp>

#include <linux/input-event-codes.h>

#include "typing_coach/key_map.hpp"

using namespace tc::core;

TEST_CASE("keys are classified for word tracking", "[keymap]") {
    KeyMap map;
    REQUIRE(map.classify(KEY_A, "us") == KeyClass::Letter);
    REQUIRE(map.classify(KEY_BACKSPACE, "us") == KeyClass::Backspace);
    REQUIRE(map.classify(KEY_SPACE, "us") == KeyClass::Boundary);
    REQUIRE(map.classify(KEY_ENTER, "us") == KeyClass::Boundary);
    REQUIRE(map.classify(KEY_1, "us") == KeyClass::Boundary);
    REQUIRE(map.classify(KEY_DOT, "us") == KeyClass::Boundary);
    REQUIRE(map.classify(KEY_LEFTSHIFT, "us") == KeyClass::Modifier);
    REQUIRE(map.classify(KEY_LEFT, "us") == KeyClass::Other);
}

TEST_CASE("layouts map the same code to different characters", "[keymap]") {
    KeyMap map;
    REQUIRE(map.character(KEY_Y, "us") == std::optional<std::string>("y"));
    REQUIRE(map.character(KEY_Y, "de") == std::optional<std::string>("z"));
    REQUIRE(map.classify(KEY_SEMICOLON, "us") == KeyClass::Boundary);
    REQUIRE(map.classify(KEY_SEMICOLON, "de") == KeyClass::Letter);
    // Unknown layouts read as us.
    REQUIRE(map.character(KEY_Y, "xx") == std::optional<std::string>("y"));
}

TEST_CASE("custom layouts can be added", "[keymap]") {
    KeyMap map;
    REQUIRE_FALSE(map.hasLayout("colemak"));
    map.addLayout("colemak", {{KEY_S, "r"}, {KEY_D, "s"}});
    REQUIRE(map.hasLayout("colemak"));
    REQUIRE(map.character(KEY_S, "colemak") == std::optional<std::string>("r"));
    REQUIRE_FALSE(map.character(KEY_A, "colemak").has_value());
}

TEST_CASE("key codes outside the evdev range are invalid", "[keymap]") {
    REQUIRE(KeyMap::isValidCode(KEY_A));
    REQUIRE(KeyMap::isValidCode(KEY_MAX));
    REQUIRE_FALSE(KeyMap::isValidCode(0));
    REQUIRE_FALSE(KeyMap::isValidCode(-3));
    REQUIRE_FALSE(KeyMap::isValidCode(KEY_MAX + 1));
}

TEST_CASE("safe names never reveal characters", "[keymap]") {
    KeyMap map;
    REQUIRE(map.safeName(KEY_A, "us") == "CHARACTER");
    REQUIRE(map.safeName(KEY_1, "us") == "CHARACTER");
    REQUIRE(map.safeName(KEY_BACKSPACE, "us") == "KEY_BACKSPACE");
    REQUIRE(map.safeName(KEY_SPACE, "us") == "KEY_SPACE");
}
