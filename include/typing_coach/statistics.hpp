#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "typing_coach/running_stat.hpp"
#include "typing_coach/stat_table.hpp"
#include "typing_coach/types.hpp"

namespace tc::core {

struct WordObservation;

struct KeyStat {
    KeyCode key_code{0};
    std::string layout;
    RunningStat stat;  // interval between presses, ms
};

struct DigraphStat {
    KeyCode first_key_code{0};
    KeyCode second_key_code{0};
    std::string layout;
    RunningStat stat;  // interval from first to second press, ms
};

struct WordStat {
    std::string word_key;  // plaintext or hash, depending on configuration
    std::string layout;
    RunningStat stat;      // ms per letter, editing time excluded
    std::int64_t total_letters{0};
    std::int64_t backspace_count{0};
    TimestampMs editing_time_ms{0};
};

struct KeyStatId {
    KeyCode key_code{0};
    std::string layout;
    bool operator==(const KeyStatId& other) const {
        return key_code == other.key_code && layout == other.layout;
    }
};

struct DigraphStatId {
    KeyCode first{0};
    KeyCode second{0};
    std::string layout;
    bool operator==(const DigraphStatId& other) const {
        return first == other.first && second == other.second && layout == other.layout;
    }
};

struct WordStatId {
    std::string word_key;
    std::string layout;
    bool operator==(const WordStatId& other) const {
        return word_key == other.word_key && layout == other.layout;
    }
};

struct KeyStatIdHash {
    std::size_t operator()(const KeyStatId& id) const noexcept;
};

struct DigraphStatIdHash {
    std::size_t operator()(const DigraphStatId& id) const noexcept;
};

struct WordStatIdHash {
    std::size_t operator()(const WordStatId& id) const noexcept;
};

using KeyStatTable = StatTable<KeyStatId, KeyStat, KeyStatIdHash>;
using DigraphStatTable = StatTable<DigraphStatId, DigraphStat, DigraphStatIdHash>;
using WordStatTable = StatTable<WordStatId, WordStat, WordStatIdHash>;

// Same-key press intervals inside one burst and one layout.
class KeyStatAggregator {
public:
    explicit KeyStatAggregator(int min_samples);

    void onPress(KeyCode code, const std::string& layout, TimestampMs timestamp_ms);
    void endBurst();

    [[nodiscard]] KeyStatTable& table() noexcept { return table_; }
    [[nodiscard]] const KeyStatTable& table() const noexcept { return table_; }

private:
    KeyStatTable table_;
    std::unordered_map<KeyStatId, TimestampMs, KeyStatIdHash> last_press_;
};

// Intervals between two different consecutive keys of one burst.
class DigraphAggregator {
public:
    explicit DigraphAggregator(int min_samples);

    void onPress(KeyCode code, const std::string& layout, TimestampMs timestamp_ms);
    // Forgets the previous key so no digraph spans the break.
    void breakChain();
    void endBurst() { breakChain(); }

    [[nodiscard]] DigraphStatTable& table() noexcept { return table_; }
    [[nodiscard]] const DigraphStatTable& table() const noexcept { return table_; }

private:
    struct Previous {
        KeyCode code{0};
        std::string layout;
        TimestampMs timestamp_ms{0};
    };

    DigraphStatTable table_;
    std::optional<Previous> previous_;
};

class WordStatAggregator {
public:
    explicit WordStatAggregator(int min_samples);

    void add(const std::string& word_key, const WordObservation& word);

    [[nodiscard]] WordStatTable& table() noexcept { return table_; }
    [[nodiscard]] const WordStatTable& table() const noexcept { return table_; }

private:
    WordStatTable table_;
};

}  // namespace tc::core
