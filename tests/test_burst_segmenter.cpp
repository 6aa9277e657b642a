#include <catch2/catch.hpp>

#include <vector>

#include "typing_coach/burst_segmenter.hpp"
#include "typing_coach/errors.hpp"

using namespace tc::core;

namespace {

BurstConfig burstConfig(TimestampMs timeout = 3000) {
    BurstConfig config;
    config.burst_timeout_ms = timeout;
    return config;
}

}  // namespace

TEST_CASE("presses within the timeout form one burst", "[burst]") {
    BurstSegmenter segmenter(burstConfig(3000));
    for (TimestampMs t : {0, 150, 300, 450, 600}) {
        REQUIRE_FALSE(segmenter.onKeyPress(t, false).has_value());
    }
    REQUIRE(segmenter.isOpen());

    auto burst = segmenter.flush();
    REQUIRE(burst.has_value());
    REQUIRE(burst->key_count == 5);
    REQUIRE(burst->backspace_count == 0);
    REQUIRE(burst->net_key_count == 5);
    REQUIRE(burst->start_time_ms == 0);
    REQUIRE(burst->end_time_ms == 600);
    REQUIRE(burst->duration_ms == 600);
    REQUIRE_FALSE(segmenter.isOpen());
}

TEST_CASE("backspace counts twice against net keystrokes", "[burst]") {
    BurstSegmenter segmenter(burstConfig());
    (void)segmenter.onKeyPress(0, false);    // A
    (void)segmenter.onKeyPress(100, false);  // B
    (void)segmenter.onKeyPress(200, false);  // C
    (void)segmenter.onKeyPress(300, true);   // Backspace
    (void)segmenter.onKeyPress(400, false);  // D

    auto burst = segmenter.flush();
    REQUIRE(burst);
    REQUIRE(burst->key_count == 5);
    REQUIRE(burst->backspace_count == 1);
    REQUIRE(burst->net_key_count == 3);
}

TEST_CASE("a gap longer than the timeout splits bursts", "[burst]") {
    BurstSegmenter segmenter(burstConfig(3000));
    std::vector<Burst> closed;
    for (TimestampMs t : {0, 100, 200}) {
        if (auto b = segmenter.onKeyPress(t, false)) closed.push_back(*b);
    }
    for (TimestampMs t : {4200, 4300}) {
        if (auto b = segmenter.onKeyPress(t, false)) closed.push_back(*b);
    }
    if (auto b = segmenter.flush()) closed.push_back(*b);

    REQUIRE(closed.size() == 2);
    REQUIRE(closed[0].key_count == 3);
    REQUIRE(closed[0].end_time_ms == 200);
    REQUIRE(closed[1].key_count == 2);
    REQUIRE(closed[1].start_time_ms == 4200);
}

TEST_CASE("idle check closes at exactly the timeout", "[burst]") {
    BurstSegmenter segmenter(burstConfig(1000));
    (void)segmenter.onKeyPress(500, false);

    REQUIRE_FALSE(segmenter.closeIfIdle(1499).has_value());
    REQUIRE(segmenter.isOpen());
    auto burst = segmenter.closeIfIdle(1500);
    REQUIRE(burst.has_value());
    REQUIRE(burst->key_count == 1);
    REQUIRE_FALSE(segmenter.isOpen());
    REQUIRE_FALSE(segmenter.closeIfIdle(5000).has_value());
}

TEST_CASE("active time skips gaps at or above the threshold", "[burst]") {
    BurstConfig config = burstConfig(3000);
    config.duration_method = DurationMethod::ActiveTime;
    config.active_time_threshold_ms = 500;
    BurstSegmenter segmenter(config);

    for (TimestampMs t : {0, 200, 500, 1500, 1700}) {
        (void)segmenter.onKeyPress(t, false);
    }
    auto burst = segmenter.flush();
    REQUIRE(burst);
    REQUIRE(burst->duration_ms == 700);
    REQUIRE(burst->end_time_ms == 1700);
}

TEST_CASE("active time never exceeds total time", "[burst]") {
    const std::vector<std::vector<TimestampMs>> runs = {
        {0, 100, 200, 300},
        {0, 499, 998, 1497},
        {0, 500, 1000},
        {10, 2000, 2100, 2900, 2950},
    };
    for (const auto& times : runs) {
        BurstConfig total_cfg = burstConfig(3000);
        BurstConfig active_cfg = total_cfg;
        active_cfg.duration_method = DurationMethod::ActiveTime;
        BurstSegmenter total(total_cfg);
        BurstSegmenter active(active_cfg);
        for (auto t : times) {
            (void)total.onKeyPress(t, false);
            (void)active.onKeyPress(t, false);
        }
        auto a = active.flush();
        auto t = total.flush();
        REQUIRE(a->duration_ms <= t->duration_ms);
    }

    // No gap reaches the threshold: both methods agree.
    BurstConfig active_cfg = burstConfig(3000);
    active_cfg.duration_method = DurationMethod::ActiveTime;
    BurstSegmenter active(active_cfg);
    for (TimestampMs t : {0, 100, 250, 400}) (void)active.onKeyPress(t, false);
    REQUIRE(active.flush()->duration_ms == 400);
}

TEST_CASE("persistence and high score gates are independent", "[burst]") {
    BurstConfig config = burstConfig(3000);
    config.min_key_count = 10;
    config.min_duration_ms = 5000;
    config.high_score_min_duration_ms = 10000;

    SECTION("too few keys") {
        BurstSegmenter segmenter(config);
        for (TimestampMs t = 0; t <= 12000; t += 2000) (void)segmenter.onKeyPress(t, false);
        auto burst = segmenter.flush();
        REQUIRE(burst->key_count == 7);
        REQUIRE_FALSE(burst->qualifies_for_persistence);
        REQUIRE(burst->qualifies_for_high_score);
    }

    SECTION("long enough for persistence only") {
        BurstSegmenter segmenter(config);
        for (TimestampMs t = 0; t <= 6000; t += 200) (void)segmenter.onKeyPress(t, false);
        auto burst = segmenter.flush();
        REQUIRE(burst->qualifies_for_persistence);
        REQUIRE_FALSE(burst->qualifies_for_high_score);
        REQUIRE(burst->avg_wpm == Approx(31.0 / 5.0 / 0.1));
    }

    SECTION("both") {
        BurstSegmenter segmenter(config);
        for (TimestampMs t = 0; t <= 10000; t += 250) (void)segmenter.onKeyPress(t, false);
        auto burst = segmenter.flush();
        REQUIRE(burst->qualifies_for_persistence);
        REQUIRE(burst->qualifies_for_high_score);
    }
}

TEST_CASE("open burst info reports running duration", "[burst]") {
    BurstSegmenter segmenter(burstConfig());
    REQUIRE_FALSE(segmenter.currentInfo().has_value());
    (void)segmenter.onKeyPress(1000, false);
    (void)segmenter.onKeyPress(1800, false);
    auto info = segmenter.currentInfo();
    REQUIRE(info);
    REQUIRE(info->key_count == 2);
    REQUIRE(info->duration_ms == 800);
    REQUIRE(segmenter.lastKeyTime() == 1800);
}

TEST_CASE("segmenter rejects incomplete configuration", "[burst][config]") {
    BurstConfig missing;
    REQUIRE_THROWS_AS(BurstSegmenter(missing), ConfigError);

    BurstConfig negative = burstConfig(-1);
    REQUIRE_THROWS_AS(BurstSegmenter(negative), ConfigError);

    BurstConfig inverted = burstConfig(400);
    inverted.active_time_threshold_ms = 500;
    REQUIRE_THROWS_AS(BurstSegmenter(inverted), ConfigError);
}
