#include "typing_coach/engine_config.hpp"

#include <limits>

#include "typing_coach/errors.hpp"
#include "typing_coach/word_hasher.hpp"

namespace tc::core {

namespace {
// poll() takes its timeout as an int.
constexpr std::chrono::milliseconds kMaxWait{std::numeric_limits<int>::max()};
}  // namespace

void BurstConfig::validate() const {
    if (!burst_timeout_ms) {
        throw ConfigError("burst.burst_timeout_ms is required");
    }
    if (*burst_timeout_ms <= 0) {
        throw ConfigError("burst.burst_timeout_ms must be positive");
    }
    if (active_time_threshold_ms <= 0) {
        throw ConfigError("burst.active_time_threshold_ms must be positive");
    }
    if (active_time_threshold_ms > *burst_timeout_ms) {
        throw ConfigError("burst.active_time_threshold_ms (" + std::to_string(active_time_threshold_ms) +
                          ") must not exceed burst.burst_timeout_ms (" +
                          std::to_string(*burst_timeout_ms) + ")");
    }
    if (min_key_count < 1) {
        throw ConfigError("burst.min_key_count must be at least 1");
    }
    if (min_duration_ms < 0) {
        throw ConfigError("burst.min_duration_ms must not be negative");
    }
    if (high_score_min_duration_ms <= 0) {
        throw ConfigError("burst.high_score_min_duration_ms must be positive");
    }
}

void WordConfig::validate() const {
    if (boundary_timeout_ms <= 0) {
        throw ConfigError("words.boundary_timeout_ms must be positive");
    }
    if (min_word_length < 1) {
        throw ConfigError("words.min_word_length must be at least 1");
    }
    if (max_correction_window_ms < 0) {
        throw ConfigError("words.max_correction_window_ms must not be negative");
    }
    if (active_time_threshold_ms <= 0) {
        throw ConfigError("words.active_time_threshold_ms must be positive");
    }
}

void StatsConfig::validate() const {
    if (min_samples < 2) {
        throw ConfigError("stats.min_samples must be at least 2");
    }
}

void PrivacyConfig::validate() const {
    // keyFromHex reports the precise problem.
    (void)WordHasher::keyFromHex(pepper_hex);
    (void)WordHasher::keyFromHex(user_key_hex);
    for (const auto& hash : ignored_hashes) {
        if (!WordHasher::isHashHex(hash)) {
            throw ConfigError("privacy.ignored_hashes contains a malformed hash");
        }
    }
}

void ListenerConfig::validate() const {
    if (visible_timeout.count() <= 0) {
        throw ConfigError("listener.visible_timeout_ms must be positive");
    }
    if (visible_timeout > kMaxWait) {
        throw ConfigError("listener.visible_timeout_ms must not exceed " + std::to_string(kMaxWait.count()));
    }
    if (queue_capacity == 0) {
        throw ConfigError("listener.queue_capacity must be positive");
    }
    if (flush_interval.count() <= 0) {
        throw ConfigError("listener.flush_interval_ms must be positive");
    }
    if (flush_interval > kMaxWait) {
        throw ConfigError("listener.flush_interval_ms must not exceed " + std::to_string(kMaxWait.count()));
    }
}

void EngineConfig::validate() const {
    burst.validate();
    words.validate();
    stats.validate();
    privacy.validate();
    listener.validate();
    if (layout.default_layout.empty()) {
        throw ConfigError("layout.default must not be empty");
    }
}

}  // namespace tc::core
