#include "typing_coach/statistics.hpp"

#include "typing_coach/word_detector.hpp"

namespace tc::core {

namespace {
inline void hashCombine(std::size_t& seed, std::size_t value) {
    seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}
}  // namespace

std::size_t KeyStatIdHash::operator()(const KeyStatId& id) const noexcept {
    std::size_t seed = std::hash<int>{}(id.key_code);
    hashCombine(seed, std::hash<std::string>{}(id.layout));
    return seed;
}

std::size_t DigraphStatIdHash::operator()(const DigraphStatId& id) const noexcept {
    std::size_t seed = std::hash<int>{}(id.first);
    hashCombine(seed, std::hash<int>{}(id.second));
    hashCombine(seed, std::hash<std::string>{}(id.layout));
    return seed;
}

std::size_t WordStatIdHash::operator()(const WordStatId& id) const noexcept {
    std::size_t seed = std::hash<std::string>{}(id.word_key);
    hashCombine(seed, std::hash<std::string>{}(id.layout));
    return seed;
}

KeyStatAggregator::KeyStatAggregator(int min_samples) : table_(min_samples) {}

void KeyStatAggregator::onPress(KeyCode code, const std::string& layout, TimestampMs timestamp_ms) {
    KeyStatId id{code, layout};
    auto it = last_press_.find(id);
    if (it != last_press_.end()) {
        KeyStat prototype;
        prototype.key_code = code;
        prototype.layout = layout;
        auto& row = table_.touch(id, prototype);
        row.stat.add(static_cast<double>(timestamp_ms - it->second));
        it->second = timestamp_ms;
        return;
    }
    last_press_.emplace(std::move(id), timestamp_ms);
}

void KeyStatAggregator::endBurst() {
    last_press_.clear();
}

DigraphAggregator::DigraphAggregator(int min_samples) : table_(min_samples) {}

void DigraphAggregator::onPress(KeyCode code, const std::string& layout, TimestampMs timestamp_ms) {
    if (previous_ && previous_->code != code && previous_->layout == layout) {
        DigraphStatId id{previous_->code, code, layout};
        DigraphStat prototype;
        prototype.first_key_code = previous_->code;
        prototype.second_key_code = code;
        prototype.layout = layout;
        auto& row = table_.touch(id, prototype);
        row.stat.add(static_cast<double>(timestamp_ms - previous_->timestamp_ms));
    }
    previous_ = Previous{code, layout, timestamp_ms};
}

void DigraphAggregator::breakChain() {
    previous_.reset();
}

WordStatAggregator::WordStatAggregator(int min_samples) : table_(min_samples) {}

void WordStatAggregator::add(const std::string& word_key, const WordObservation& word) {
    WordStat prototype;
    prototype.word_key = word_key;
    prototype.layout = word.layout;
    auto& row = table_.touch(WordStatId{word_key, word.layout}, prototype);
    row.stat.add(word.speedMsPerLetter());
    row.total_letters += static_cast<std::int64_t>(word.letter_count);
    row.backspace_count += word.backspace_count;
    row.editing_time_ms += word.editing_time_ms;
}

}  // namespace tc::core
