#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <thread>

#include "typing_coach/collaborators.hpp"
#include "typing_coach/event_multiplexer.hpp"
#include "typing_coach/event_queue.hpp"
#include "typing_coach/types.hpp"

namespace tc::core {

using EventQueue = BlockingQueue<RawKeyEvent>;

// Dedicated thread that owns the blocking waits on the device set and hands
// decoded presses to the aggregation side.
class KeyListener {
public:
    enum class State {
        Idle,
        Running,
        Stopped,
        NoDevices,
    };

    KeyListener(DeviceSet devices,
                EventQueue& queue,
                const VisibilityFlag& visibility,
                const PasswordContext& password_context,
                std::chrono::milliseconds visible_timeout);
    ~KeyListener();

    void start();
    // Returns promptly: the blocking wait is woken rather than timed out.
    void stop();

    [[nodiscard]] State state() const noexcept { return state_.load(); }
    [[nodiscard]] std::size_t deviceCount() const noexcept { return mux_.deviceCount(); }
    [[nodiscard]] std::uint64_t eventsForwarded() const noexcept { return forwarded_.load(); }

private:
    EventMultiplexer mux_;
    EventQueue& queue_;
    const VisibilityFlag& visibility_;
    const PasswordContext& password_context_;
    std::chrono::milliseconds visible_timeout_;

    std::atomic<bool> stop_{false};
    std::atomic<State> state_{State::Idle};
    std::atomic<std::uint64_t> forwarded_{0};
    std::thread thread_;

    void runLoop();
};

}  // namespace tc::core
