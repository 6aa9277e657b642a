#include "typing_coach/typing_engine.hpp"

#include <algorithm>

#include "typing_coach/log.hpp"

namespace tc::core {

namespace {

constexpr const char* kComponent = "TypingEngine";

}  // namespace

TypingEngine::TypingEngine(const EngineConfig& config,
                           const KeyMap& key_map,
                           PrivacyFilter privacy,
                           PersistenceGateway& gateway,
                           const LayoutSource& layout)
    : key_map_(key_map),
      privacy_(std::move(privacy)),
      gateway_(gateway),
      layout_(layout),
      dictionary_(config.words.dictionary),
      segmenter_(config.burst),
      words_(config.words),
      key_stats_(config.stats.min_samples),
      digraph_stats_(config.stats.min_samples),
      word_stats_(config.stats.min_samples) {}

void TypingEngine::process(const RawKeyEvent& event) {
    if (!KeyMap::isValidCode(event.key_code)) {
        dropMalformed(event, "unknown key code");
        return;
    }
    // Order is only guaranteed within one device.
    auto last = last_timestamp_by_device_.find(event.device_id);
    if (last != last_timestamp_by_device_.end() && event.timestamp_ms < last->second) {
        dropMalformed(event, "timestamp went backwards");
        return;
    }
    last_timestamp_by_device_[event.device_id] = event.timestamp_ms;

    if (!event.is_press) {
        ++counters_.releases_ignored;
        return;
    }

    // Devices interleave in arrival order; a key stamped slightly before the
    // previous key of another device is placed at that key's time.
    const TimestampMs ts = timeline_ms_ ? std::max(event.timestamp_ms, *timeline_ms_) : event.timestamp_ms;
    timeline_ms_ = ts;

    // An idle burst closes on the gap alone, whatever the new key turns out to be.
    if (auto closed = segmenter_.closeIfIdle(ts)) {
        handleClosedBurst(*closed);
    }

    if (!privacy_.admits(event)) {
        ++counters_.password_filtered;
        words_.reset();
        digraph_stats_.breakChain();
        return;
    }

    const std::string layout = layout_.current();
    const KeyClass key_class = key_map_.classify(event.key_code, layout);

    ++counters_.keystrokes;
    if (auto closed = segmenter_.onKeyPress(ts, key_class == KeyClass::Backspace)) {
        handleClosedBurst(*closed);
    }

    switch (key_class) {
        case KeyClass::Letter: {
            key_stats_.onPress(event.key_code, layout, ts);
            digraph_stats_.onPress(event.key_code, layout, ts);
            auto letter = key_map_.character(event.key_code, layout);
            handleWord(words_.onLetter(letter.value_or(""), layout, ts));
            break;
        }
        case KeyClass::Backspace:
            key_stats_.onPress(event.key_code, layout, ts);
            digraph_stats_.breakChain();
            handleWord(words_.onBackspace(ts));
            break;
        case KeyClass::Boundary:
            key_stats_.onPress(event.key_code, layout, ts);
            digraph_stats_.onPress(event.key_code, layout, ts);
            handleWord(words_.onBoundary());
            break;
        case KeyClass::Modifier:
            break;
        case KeyClass::Other:
            key_stats_.onPress(event.key_code, layout, ts);
            digraph_stats_.breakChain();
            handleWord(words_.onBoundary());
            break;
    }
}

void TypingEngine::tick(TimestampMs now_ms) {
    purgeIgnoredWords();
    if (auto closed = segmenter_.closeIfIdle(now_ms)) {
        handleClosedBurst(*closed);
        return;
    }
    flushAggregates();
}

void TypingEngine::shutdown() {
    purgeIgnoredWords();
    if (auto closed = segmenter_.flush()) {
        handleClosedBurst(*closed);
        return;
    }
    flushAggregates();
}

void TypingEngine::handleClosedBurst(const Burst& burst) {
    ++counters_.bursts_closed;
    handleWord(words_.onBoundary());
    key_stats_.endBurst();
    digraph_stats_.endBurst();

    session_.last_burst = burst;
    session_.last_burst_wpm = burst.avg_wpm;

    if (burst.qualifies_for_persistence) {
        ++counters_.bursts_recorded;
        session_.typing_time_ms += burst.duration_ms;
        session_.recorded_net_keystrokes += burst.net_key_count;
        if (burst.qualifies_for_high_score &&
            (!session_.personal_best_wpm || burst.avg_wpm > *session_.personal_best_wpm)) {
            session_.personal_best_wpm = burst.avg_wpm;
        }
        if (!gateway_.appendBurst(burst)) {
            ++counters_.persistence_failures;
            logWarn(kComponent, "Gateway ", gateway_.id(), " rejected burst ", burst.start_time_ms);
        }
    } else {
        logDebug(kComponent, "Burst of ", burst.key_count, " keys over ", burst.duration_ms,
                 "ms below recording threshold");
    }

    flushAggregates();
}

void TypingEngine::handleWord(std::optional<WordObservation> word) {
    if (!word) return;
    ++counters_.words_observed;
    if (dictionary_ && !dictionary_->contains(word->text)) {
        ++counters_.words_unlisted;
        PrivacyFilter::discardWord(*word);
        return;
    }
    auto key = privacy_.admitWord(*word);
    if (!key) {
        ++counters_.words_ignored;
        return;
    }
    word_stats_.add(*key, *word);
}

void TypingEngine::purgeIgnoredWords() {
    for (const auto& hash : privacy_.ignored().takeRecentlyAdded()) {
        const auto removed = word_stats_.table().eraseIf(
            [&](const WordStat& row) { return privacy_.keyHash(row.word_key) == hash; });
        if (removed > 0) {
            logInfo(kComponent, "Dropped ", removed, " aggregate(s) for a newly ignored word");
        }
    }
}

void TypingEngine::flushAggregates() {
    std::uint64_t failures = 0;
    for (const auto& row : key_stats_.table().takeDirty()) {
        if (!gateway_.upsertKeyStat(row)) ++failures;
    }
    for (const auto& row : digraph_stats_.table().takeDirty()) {
        if (!gateway_.upsertDigraphStat(row)) ++failures;
    }
    for (const auto& row : word_stats_.table().takeDirty()) {
        if (!gateway_.upsertWordStat(row)) ++failures;
    }
    if (failures > 0) {
        counters_.persistence_failures += failures;
        logWarn(kComponent, "Gateway ", gateway_.id(), " rejected ", failures, " aggregate update(s)");
    }
}

void TypingEngine::dropMalformed(const RawKeyEvent& event, const char* reason) {
    ++counters_.malformed_dropped;
    logWarn(kComponent, "Dropped event from device ", event.device_id, ": ", reason);
}

EngineSnapshot TypingEngine::snapshot() const {
    EngineSnapshot snap;
    snap.counters = counters_;
    snap.session = session_;
    if (auto info = segmenter_.currentInfo()) {
        snap.burst_open = true;
        snap.open_key_count = info->key_count;
        snap.open_duration_ms = info->duration_ms;
    }
    snap.slowest_keys = key_stats_.table().ranked(kSnapshotRankLimit, true, std::nullopt);
    snap.fastest_keys = key_stats_.table().ranked(kSnapshotRankLimit, false, std::nullopt);
    snap.slowest_digraphs = digraph_stats_.table().ranked(kSnapshotRankLimit, true, std::nullopt);
    snap.slowest_words = word_stats_.table().ranked(kSnapshotRankLimit, true, std::nullopt);
    return snap;
}

}  // namespace tc::core
