#pragma once

#include <atomic>
#include <chrono>

#include "typing_coach/types.hpp"

struct timeval;

namespace tc::core {

// Monotonic millisecond source shared by the listener and the aggregation worker.
class Clock {
public:
    virtual ~Clock() = default;
    [[nodiscard]] virtual TimestampMs nowMs() const = 0;
};

class SteadyClock : public Clock {
public:
    [[nodiscard]] TimestampMs nowMs() const override;
};

class ManualClock : public Clock {
public:
    explicit ManualClock(TimestampMs start = 0) : now_(start) {}

    [[nodiscard]] TimestampMs nowMs() const override { return now_.load(); }
    void set(TimestampMs value) { now_.store(value); }
    void advance(TimestampMs delta) { now_.fetch_add(delta); }

private:
    std::atomic<TimestampMs> now_;
};

// Converts a kernel event time (CLOCK_MONOTONIC when configured on the fd) to ms.
[[nodiscard]] TimestampMs timevalToMs(const timeval& tv) noexcept;

}  // namespace tc::core
