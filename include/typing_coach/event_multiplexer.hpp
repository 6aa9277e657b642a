#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <optional>
#include <vector>

#include "typing_coach/device_set.hpp"
#include "typing_coach/types.hpp"

namespace tc::core {

class EventMultiplexer {
public:
    enum class Status {
        Events,
        TimedOut,
        Woken,
        NoDevices,
    };

    struct Batch {
        Status status{Status::TimedOut};
        std::vector<RawKeyEvent> events;
        std::size_t removed{0};
    };

    explicit EventMultiplexer(DeviceSet devices);
    ~EventMultiplexer();
    EventMultiplexer(const EventMultiplexer&) = delete;
    EventMultiplexer& operator=(const EventMultiplexer&) = delete;

    // Revalidates the set, then blocks until a device is readable, the timeout
    // elapses (nullopt blocks indefinitely) or wake() is called.
    [[nodiscard]] Batch nextBatch(std::optional<std::chrono::milliseconds> timeout);

    // Thread-safe; interrupts a pending nextBatch().
    void wake();

    [[nodiscard]] std::size_t deviceCount() const noexcept { return device_count_.load(); }

private:
    DeviceSet devices_;
    int wake_read_{-1};
    int wake_write_{-1};
    std::atomic<std::size_t> device_count_{0};

    void drainWakePipe();
    void dropDevice(DeviceId id, const char* reason);
};

// Finite while an observer is watching the statistics, otherwise indefinite.
[[nodiscard]] std::optional<std::chrono::milliseconds> adaptiveTimeout(
    bool observer_visible, std::chrono::milliseconds visible_timeout);

}  // namespace tc::core
