#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "typing_coach/engine_config.hpp"
#include "typing_coach/types.hpp"

namespace tc::core {

struct WordObservation {
    std::string text;
    std::string layout;
    TimestampMs total_duration_ms{0};
    // Letter-to-letter typing time, pauses and editing excluded, floored per letter.
    TimestampMs active_duration_ms{0};
    TimestampMs editing_time_ms{0};
    int backspace_count{0};
    std::size_t letter_count{0};

    // Active time per letter; the sample fed to word statistics.
    [[nodiscard]] double speedMsPerLetter() const noexcept;
};

class WordDetector {
public:
    static constexpr std::size_t kMaxWordLetters = 64;
    static constexpr TimestampMs kMinActiveMsPerLetter = 50;

    explicit WordDetector(WordConfig config);

    [[nodiscard]] std::optional<WordObservation> onLetter(const std::string& letter,
                                                          const std::string& layout,
                                                          TimestampMs timestamp_ms);
    [[nodiscard]] std::optional<WordObservation> onBackspace(TimestampMs timestamp_ms);
    [[nodiscard]] std::optional<WordObservation> onBoundary();

    // Drops the word in progress without emitting it.
    void reset();

    [[nodiscard]] bool inWord() const noexcept { return state_.has_value(); }

private:
    struct State {
        std::vector<std::string> letters;
        std::string layout;
        TimestampMs start_ms{0};
        TimestampMs last_keystroke_ms{0};
        std::size_t letters_typed{0};
        TimestampMs active_ms{0};
        TimestampMs editing_ms{0};
        int backspaces{0};
        bool overflow{false};
    };

    WordConfig config_;
    std::optional<State> state_;

    void begin(const std::string& letter, const std::string& layout, TimestampMs timestamp_ms);
    [[nodiscard]] std::optional<WordObservation> finalize();
};

}  // namespace tc::core
