#include "typing_coach/word_detector.hpp"

#include <algorithm>

namespace tc::core {

double WordObservation::speedMsPerLetter() const noexcept {
    if (letter_count == 0) return 0.0;
    return static_cast<double>(active_duration_ms) / static_cast<double>(letter_count);
}

WordDetector::WordDetector(WordConfig config) : config_(std::move(config)) {}

void WordDetector::begin(const std::string& letter, const std::string& layout, TimestampMs timestamp_ms) {
    State state;
    state.letters.push_back(letter);
    state.layout = layout;
    state.start_ms = timestamp_ms;
    state.last_keystroke_ms = timestamp_ms;
    state.letters_typed = 1;
    state_ = std::move(state);
}

std::optional<WordObservation> WordDetector::onLetter(const std::string& letter,
                                                      const std::string& layout,
                                                      TimestampMs timestamp_ms) {
    if (!state_) {
        begin(letter, layout, timestamp_ms);
        return std::nullopt;
    }

    auto& state = *state_;
    if (timestamp_ms - state.last_keystroke_ms > config_.boundary_timeout_ms ||
        layout != state.layout) {
        auto finished = finalize();
        begin(letter, layout, timestamp_ms);
        return finished;
    }

    if (state.overflow || state.letters.size() >= kMaxWordLetters) {
        // Not a word anymore; swallow keys until the next boundary.
        state.overflow = true;
        state.last_keystroke_ms = timestamp_ms;
        return std::nullopt;
    }

    // Backspace gaps are editing time, so only gaps ending on a letter count.
    const TimestampMs gap = timestamp_ms - state.last_keystroke_ms;
    if (gap <= config_.active_time_threshold_ms) {
        state.active_ms += gap;
    }
    state.letters.push_back(letter);
    state.last_keystroke_ms = timestamp_ms;
    state.letters_typed += 1;
    return std::nullopt;
}

std::optional<WordObservation> WordDetector::onBackspace(TimestampMs timestamp_ms) {
    if (!state_) return std::nullopt;

    auto& state = *state_;
    if (state.overflow) {
        state.last_keystroke_ms = timestamp_ms;
        return std::nullopt;
    }
    if (state.letters.empty()) return std::nullopt;

    state.backspaces += 1;
    const TimestampMs since_last = timestamp_ms - state.last_keystroke_ms;
    if (since_last <= config_.max_correction_window_ms) {
        state.editing_ms += since_last;
    }
    state.letters.pop_back();
    state.last_keystroke_ms = timestamp_ms;

    if (state.letters.empty()) {
        // Erased completely: nothing left to measure.
        reset();
    }
    return std::nullopt;
}

std::optional<WordObservation> WordDetector::onBoundary() {
    if (!state_) return std::nullopt;
    return finalize();
}

void WordDetector::reset() {
    state_.reset();
}

std::optional<WordObservation> WordDetector::finalize() {
    State state = std::move(*state_);
    state_.reset();

    if (state.overflow || state.letters.size() < config_.min_word_length) {
        return std::nullopt;
    }

    WordObservation word;
    for (const auto& letter : state.letters) {
        word.text += letter;
    }
    word.layout = std::move(state.layout);
    word.total_duration_ms = std::max<TimestampMs>(0, state.last_keystroke_ms - state.start_ms);
    word.active_duration_ms = std::max<TimestampMs>(
        state.active_ms, kMinActiveMsPerLetter * static_cast<TimestampMs>(state.letters_typed));
    word.editing_time_ms = state.editing_ms;
    word.backspace_count = state.backspaces;
    word.letter_count = state.letters.size();
    return word;
}

}  // namespace tc::core
