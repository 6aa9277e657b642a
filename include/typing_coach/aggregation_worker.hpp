#pragma once

#include <atomic>
#include <chrono>
#include <thread>

#include "typing_coach/clock.hpp"
#include "typing_coach/engine_snapshot.hpp"
#include "typing_coach/key_listener.hpp"
#include "typing_coach/typing_engine.hpp"

namespace tc::core {

// Single consumer of the event queue. Suspends only on the queue; wakes at
// least every flush interval to close idle bursts and publish a snapshot.
class AggregationWorker {
public:
    AggregationWorker(TypingEngine& engine,
                      EventQueue& queue,
                      const Clock& clock,
                      SnapshotBoard& board,
                      std::chrono::milliseconds flush_interval);
    ~AggregationWorker();

    void start();
    // Waits for the queue to be closed and drained, then finalizes the engine.
    void join();

private:
    TypingEngine& engine_;
    EventQueue& queue_;
    const Clock& clock_;
    SnapshotBoard& board_;
    std::chrono::milliseconds flush_interval_;
    std::thread thread_;

    void runLoop();
};

}  // namespace tc::core
