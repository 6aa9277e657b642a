#include <catch2/catch.hpp>

#include <string>
#include <vector>

#include "typing_coach/errors.hpp"
#include "typing_coach/word_list.hpp"

using namespace tc::core;

TEST_CASE("word list lookups ignore case and padding", "[words]") {
    WordList list({"House", " the ", ""});
    REQUIRE(list.size() == 2);
    REQUIRE(list.contains("house"));
    REQUIRE(list.contains("HOUSE"));
    REQUIRE(list.contains("the"));
    REQUIRE_FALSE(list.contains("hous"));
    REQUIRE_FALSE(list.contains(""));
}

TEST_CASE("word list files need at least one word", "[words][config]") {
    auto list = WordList::fromFile(TYPING_COACH_TEST_DATA_DIR "/words.txt");
    REQUIRE(list.contains("quick"));
    REQUIRE(list.contains("word"));
    REQUIRE_THROWS_AS(WordList::fromFile(TYPING_COACH_TEST_DATA_DIR "/missing.txt"), ConfigError);
}
