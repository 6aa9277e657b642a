#include "typing_coach/wpm.hpp"

namespace tc::core {

double wordsPerMinute(int net_key_count, TimestampMs duration_ms) noexcept {
    if (net_key_count <= 0 || duration_ms <= 0) {
        return 0.0;
    }
    const double words = static_cast<double>(net_key_count) / 5.0;
    const double minutes = static_cast<double>(duration_ms) / 60000.0;
    return minutes > 0.0 ? words / minutes : 0.0;
}

}  // namespace tc::core
