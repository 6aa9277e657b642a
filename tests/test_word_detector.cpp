#include <catch2/catch.hpp>

#include <string>

#include "typing_coach/word_detector.hpp"

using namespace tc::core;

namespace {

std::optional<WordObservation> typeWord(WordDetector& detector, const std::string& word,
                                        TimestampMs start, TimestampMs step) {
    std::optional<WordObservation> out;
    TimestampMs t = start;
    for (char ch : word) {
        auto r = detector.onLetter(std::string(1, ch), "us", t);
        if (r) out = r;
        t += step;
    }
    return out;
}

}  // namespace

TEST_CASE("boundary completes a word", "[words]") {
    WordDetector detector{WordConfig{}};
    REQUIRE_FALSE(typeWord(detector, "hello", 0, 100).has_value());
    REQUIRE(detector.inWord());

    auto word = detector.onBoundary();
    REQUIRE(word.has_value());
    REQUIRE(word->text == "hello");
    REQUIRE(word->layout == "us");
    REQUIRE(word->letter_count == 5);
    REQUIRE(word->total_duration_ms == 400);
    REQUIRE(word->active_duration_ms == 400);
    REQUIRE(word->speedMsPerLetter() == Approx(80.0));
    REQUIRE_FALSE(detector.inWord());
}

TEST_CASE("short words are discarded", "[words]") {
    WordDetector detector{WordConfig{}};
    (void)typeWord(detector, "to", 0, 100);
    REQUIRE_FALSE(detector.onBoundary().has_value());
}

TEST_CASE("a long pause splits words", "[words]") {
    WordConfig config;
    config.boundary_timeout_ms = 1000;
    WordDetector detector(config);

    (void)typeWord(detector, "cat", 0, 100);
    auto first = detector.onLetter("d", "us", 1201 + 200);
    REQUIRE(first.has_value());
    REQUIRE(first->text == "cat");
    REQUIRE(first->total_duration_ms == 200);
    REQUIRE(detector.inWord());
}

TEST_CASE("switching layout ends the word", "[words]") {
    WordDetector detector{WordConfig{}};
    (void)typeWord(detector, "dog", 0, 100);
    auto word = detector.onLetter("a", "de", 300);
    REQUIRE(word.has_value());
    REQUIRE(word->layout == "us");
}

TEST_CASE("backspaces are counted as editing time", "[words]") {
    WordConfig config;
    config.max_correction_window_ms = 3000;
    WordDetector detector(config);

    (void)detector.onLetter("t", "us", 0);
    (void)detector.onLetter("h", "us", 100);
    (void)detector.onLetter("r", "us", 200);
    (void)detector.onBackspace(350);
    (void)detector.onLetter("e", "us", 450);

    auto word = detector.onBoundary();
    REQUIRE(word);
    REQUIRE(word->text == "the");
    REQUIRE(word->backspace_count == 1);
    REQUIRE(word->editing_time_ms == 150);
    REQUIRE(word->total_duration_ms == 450);
    REQUIRE(word->active_duration_ms == 300);
    REQUIRE(word->speedMsPerLetter() == Approx(100.0));
}

TEST_CASE("erasing the whole word drops it", "[words]") {
    WordDetector detector{WordConfig{}};
    (void)detector.onLetter("a", "us", 0);
    (void)detector.onLetter("b", "us", 100);
    (void)detector.onBackspace(200);
    (void)detector.onBackspace(300);
    REQUIRE_FALSE(detector.inWord());
    REQUIRE_FALSE(detector.onBoundary().has_value());
}

TEST_CASE("overlong input is not a word", "[words]") {
    WordDetector detector{WordConfig{}};
    const std::string junk(WordDetector::kMaxWordLetters + 10, 'x');
    (void)typeWord(detector, junk, 0, 10);
    REQUIRE_FALSE(detector.onBoundary().has_value());

    (void)typeWord(detector, "fine", 2000, 100);
    auto word = detector.onBoundary();
    REQUIRE(word);
    REQUIRE(word->text == "fine");
}

TEST_CASE("active time has a floor per letter", "[words]") {
    WordDetector detector{WordConfig{}};
    (void)typeWord(detector, "abc", 0, 10);
    auto word = detector.onBoundary();
    REQUIRE(word);
    REQUIRE(word->active_duration_ms == 3 * WordDetector::kMinActiveMsPerLetter);
    REQUIRE(word->speedMsPerLetter() == Approx(50.0));
}

TEST_CASE("pauses inside a word do not count toward its speed", "[words]") {
    WordConfig config;
    config.boundary_timeout_ms = 1000;
    config.active_time_threshold_ms = 200;
    WordDetector detector(config);

    (void)detector.onLetter("w", "us", 0);
    (void)detector.onLetter("o", "us", 100);
    (void)detector.onLetter("r", "us", 700);
    (void)detector.onLetter("d", "us", 800);

    auto word = detector.onBoundary();
    REQUIRE(word);
    REQUIRE(word->total_duration_ms == 800);
    REQUIRE(word->active_duration_ms == 200);
    REQUIRE(word->speedMsPerLetter() == Approx(50.0));
}

TEST_CASE("reset discards the partial word", "[words]") {
    WordDetector detector{WordConfig{}};
    (void)typeWord(detector, "secret", 0, 100);
    detector.reset();
    REQUIRE_FALSE(detector.inWord());
    REQUIRE_FALSE(detector.onBoundary().has_value());
}
