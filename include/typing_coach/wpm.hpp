#pragma once

#include "typing_coach/types.hpp"

namespace tc::core {

// Each backspace removes itself and the character before it.
[[nodiscard]] constexpr int netKeystrokes(int key_count, int backspace_count) noexcept {
    const int net = key_count - 2 * backspace_count;
    return net > 0 ? net : 0;
}

// Five net keystrokes make one word. Zero duration yields zero.
[[nodiscard]] double wordsPerMinute(int net_key_count, TimestampMs duration_ms) noexcept;

}  // namespace tc::core
