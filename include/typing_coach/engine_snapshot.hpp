#pragma once

#include <cstdint>
#include <mutex>
#include <utility>
#include <optional>
#include <string>
#include <vector>

#include "typing_coach/statistics.hpp"
#include "typing_coach/types.hpp"

namespace tc::core {

struct EngineCounters {
    std::uint64_t keystrokes{0};
    std::uint64_t releases_ignored{0};
    std::uint64_t malformed_dropped{0};
    std::uint64_t password_filtered{0};
    std::uint64_t words_observed{0};
    std::uint64_t words_ignored{0};
    std::uint64_t words_unlisted{0};
    std::uint64_t bursts_closed{0};
    std::uint64_t bursts_recorded{0};
    std::uint64_t persistence_failures{0};
};

struct SessionSummary {
    TimestampMs typing_time_ms{0};
    std::int64_t recorded_net_keystrokes{0};
    double last_burst_wpm{0.0};
    std::optional<double> personal_best_wpm;
    std::optional<Burst> last_burst;
};

struct EngineSnapshot {
    EngineCounters counters;
    SessionSummary session;
    bool burst_open{false};
    int open_key_count{0};
    TimestampMs open_duration_ms{0};
    std::vector<KeyStat> slowest_keys;
    std::vector<KeyStat> fastest_keys;
    std::vector<DigraphStat> slowest_digraphs;
    std::vector<WordStat> slowest_words;

    // Overall WPM of recorded bursts.
    [[nodiscard]] double sessionWpm() const noexcept;
};

// Latest snapshot published by the aggregation thread for observers.
class SnapshotBoard {
public:
    void publish(EngineSnapshot snapshot) {
        std::lock_guard<std::mutex> lock(mutex_);
        latest_ = std::move(snapshot);
    }

    [[nodiscard]] EngineSnapshot latest() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return latest_;
    }

private:
    mutable std::mutex mutex_;
    EngineSnapshot latest_;
};

}  // namespace tc::core
