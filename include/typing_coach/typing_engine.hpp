#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>

#include "typing_coach/burst_segmenter.hpp"
#include "typing_coach/collaborators.hpp"
#include "typing_coach/engine_config.hpp"
#include "typing_coach/engine_snapshot.hpp"
#include "typing_coach/key_map.hpp"
#include "typing_coach/persistence_gateway.hpp"
#include "typing_coach/privacy_filter.hpp"
#include "typing_coach/statistics.hpp"
#include "typing_coach/types.hpp"
#include "typing_coach/word_detector.hpp"
#include "typing_coach/word_list.hpp"

namespace tc::core {

// Owns every piece of mutable burst and statistics state. Not thread-safe:
// exactly one aggregation thread drives it.
class TypingEngine {
public:
    static constexpr std::size_t kSnapshotRankLimit = 10;

    TypingEngine(const EngineConfig& config,
                 const KeyMap& key_map,
                 PrivacyFilter privacy,
                 PersistenceGateway& gateway,
                 const LayoutSource& layout);

    void process(const RawKeyEvent& event);

    // Closes the open burst once it has been idle for burst_timeout and
    // pushes changed aggregate rows to the gateway.
    void tick(TimestampMs now_ms);

    // Finalizes the open burst and flushes everything.
    void shutdown();

    [[nodiscard]] EngineSnapshot snapshot() const;

    [[nodiscard]] const EngineCounters& counters() const noexcept { return counters_; }
    [[nodiscard]] const KeyStatAggregator& keyStats() const noexcept { return key_stats_; }
    [[nodiscard]] const DigraphAggregator& digraphStats() const noexcept { return digraph_stats_; }
    [[nodiscard]] const WordStatAggregator& wordStats() const noexcept { return word_stats_; }
    [[nodiscard]] const BurstSegmenter& segmenter() const noexcept { return segmenter_; }

private:
    const KeyMap& key_map_;
    PrivacyFilter privacy_;
    PersistenceGateway& gateway_;
    const LayoutSource& layout_;
    WordListPtr dictionary_;

    BurstSegmenter segmenter_;
    WordDetector words_;
    KeyStatAggregator key_stats_;
    DigraphAggregator digraph_stats_;
    WordStatAggregator word_stats_;

    EngineCounters counters_;
    SessionSummary session_;
    std::unordered_map<DeviceId, TimestampMs> last_timestamp_by_device_;
    std::optional<TimestampMs> timeline_ms_;

    void handleClosedBurst(const Burst& burst);
    void handleWord(std::optional<WordObservation> word);
    void purgeIgnoredWords();
    void flushAggregates();
    void dropMalformed(const RawKeyEvent& event, const char* reason);
};

}  // namespace tc::core
