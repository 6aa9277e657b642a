#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "typing_coach/engine_config.hpp"
#include "typing_coach/types.hpp"

namespace tc::core {

class BurstSegmenter {
public:
    struct OpenInfo {
        int key_count{0};
        TimestampMs duration_ms{0};
        bool qualifies_for_high_score{false};
    };

    explicit BurstSegmenter(BurstConfig config);

    // Feeds one admitted key press. When the press arrives after the burst
    // timeout, the previous burst is finalized and returned, and the press
    // opens the next one.
    [[nodiscard]] std::optional<Burst> onKeyPress(TimestampMs timestamp_ms, bool is_backspace);

    // Closes the open burst if now_ms is at least burst_timeout past its last key.
    [[nodiscard]] std::optional<Burst> closeIfIdle(TimestampMs now_ms);

    // Unconditionally finalizes the open burst (shutdown).
    [[nodiscard]] std::optional<Burst> flush();

    [[nodiscard]] bool isOpen() const noexcept { return open_; }
    [[nodiscard]] std::optional<OpenInfo> currentInfo() const;
    [[nodiscard]] std::optional<TimestampMs> lastKeyTime() const;
    [[nodiscard]] const BurstConfig& config() const noexcept { return config_; }

private:
    BurstConfig config_;
    bool open_{false};
    Burst current_;
    TimestampMs active_duration_ms_{0};

    void open(TimestampMs timestamp_ms, bool is_backspace);
    [[nodiscard]] TimestampMs currentDuration() const;
    [[nodiscard]] Burst finalize();
};

}  // namespace tc::core
