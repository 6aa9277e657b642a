#include <catch2/catch.hpp>

#include "typing_coach/wpm.hpp"

using namespace tc::core;

TEST_CASE("net keystrokes subtract two per backspace and floor at zero", "[wpm]") {
    for (int k = 0; k <= 40; ++k) {
        for (int b = 0; b <= 25; ++b) {
            const int expected = k >= 2 * b ? k - 2 * b : 0;
            REQUIRE(netKeystrokes(k, b) == expected);
        }
    }
}

TEST_CASE("wpm counts five net keystrokes as a word", "[wpm]") {
    REQUIRE(wordsPerMinute(60, 60000) == Approx(12.0));
    REQUIRE(wordsPerMinute(50, 30000) == Approx(20.0));
    REQUIRE(wordsPerMinute(5, 1000) == Approx(60.0));
}

TEST_CASE("wpm is zero for zero duration and never negative", "[wpm]") {
    REQUIRE(wordsPerMinute(100, 0) == 0.0);
    REQUIRE(wordsPerMinute(0, 5000) == 0.0);
    REQUIRE(wordsPerMinute(netKeystrokes(3, 10), 5000) == 0.0);
    REQUIRE(wordsPerMinute(10, -5) == 0.0);
    for (int net = 0; net < 200; net += 7) {
        for (TimestampMs d = 0; d < 100000; d += 3331) {
            REQUIRE(wordsPerMinute(net, d) >= 0.0);
        }
    }
}
