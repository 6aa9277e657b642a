#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "typing_coach/log.hpp"
#include "typing_coach/types.hpp"
#include "typing_coach/word_list.hpp"

namespace tc::core {

struct BurstConfig {
    // Required: there is no safe default for the idle gap that closes a burst.
    std::optional<TimestampMs> burst_timeout_ms;
    DurationMethod duration_method{DurationMethod::TotalTime};
    TimestampMs active_time_threshold_ms{500};
    int min_key_count{10};
    TimestampMs min_duration_ms{5000};
    TimestampMs high_score_min_duration_ms{10000};

    [[nodiscard]] TimestampMs timeout() const { return burst_timeout_ms.value_or(0); }
    void validate() const;
};

struct WordConfig {
    TimestampMs boundary_timeout_ms{1000};
    std::size_t min_word_length{3};
    TimestampMs max_correction_window_ms{3000};
    TimestampMs active_time_threshold_ms{2000};
    bool store_hashes{false};
    // When set, words missing from the list are not aggregated.
    WordListPtr dictionary;

    void validate() const;
};

struct StatsConfig {
    int min_samples{2};

    void validate() const;
};

struct PrivacyConfig {
    std::string pepper_hex;
    std::string user_key_hex;
    std::vector<std::string> ignored_hashes;
    std::string ignored_words_file;

    void validate() const;
};

struct ListenerConfig {
    std::vector<std::string> device_paths;
    std::chrono::milliseconds visible_timeout{1000};
    std::size_t queue_capacity{1000};
    std::chrono::milliseconds flush_interval{500};

    void validate() const;
};

struct LayoutConfig {
    std::string default_layout{"us"};
    // layout id -> (evdev code -> character)
    std::unordered_map<std::string, std::unordered_map<KeyCode, std::string>> extra_layouts;
};

struct EngineConfig {
    BurstConfig burst;
    WordConfig words;
    StatsConfig stats;
    PrivacyConfig privacy;
    ListenerConfig listener;
    LayoutConfig layout;
    LogLevel log_level{LogLevel::Info};

    // Throws ConfigError on the first invalid value.
    void validate() const;
};

}  // namespace tc::core
