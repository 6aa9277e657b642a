#pragma once

#include <cstdint>
#include <string>

namespace tc::core {

using TimestampMs = std::int64_t;
using KeyCode = int;
using DeviceId = int;

struct RawKeyEvent {
    DeviceId device_id{-1};
    KeyCode key_code{0};
    TimestampMs timestamp_ms{0};
    bool is_press{false};
    bool is_password_context{false};
};

struct Burst {
    TimestampMs start_time_ms{0};
    TimestampMs end_time_ms{0};
    int key_count{0};
    int backspace_count{0};
    int net_key_count{0};
    TimestampMs duration_ms{0};
    double avg_wpm{0.0};
    bool qualifies_for_persistence{false};
    bool qualifies_for_high_score{false};
};

enum class DurationMethod {
    TotalTime,
    ActiveTime,
};

[[nodiscard]] const char* toString(DurationMethod method) noexcept;

}  // namespace tc::core
