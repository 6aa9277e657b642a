#include "typing_coach/aggregation_worker.hpp"

#include <exception>

#include "typing_coach/log.hpp"

namespace tc::core {

namespace {

constexpr const char* kComponent = "AggregationWorker";

}  // namespace

AggregationWorker::AggregationWorker(TypingEngine& engine,
                                     EventQueue& queue,
                                     const Clock& clock,
                                     SnapshotBoard& board,
                                     std::chrono::milliseconds flush_interval)
    : engine_(engine),
      queue_(queue),
      clock_(clock),
      board_(board),
      flush_interval_(flush_interval) {}

AggregationWorker::~AggregationWorker() {
    queue_.close();
    join();
}

void AggregationWorker::start() {
    if (thread_.joinable()) return;
    thread_ = std::thread(&AggregationWorker::runLoop, this);
}

void AggregationWorker::join() {
    if (thread_.joinable()) {
        thread_.join();
    }
}

void AggregationWorker::runLoop() {
    try {
        TimestampMs next_tick = clock_.nowMs() + flush_interval_.count();
        while (true) {
            RawKeyEvent event;
            const auto status = queue_.popFor(event, flush_interval_);
            if (status == EventQueue::PopStatus::Closed) {
                break;
            }
            if (status == EventQueue::PopStatus::Item) {
                engine_.process(event);
            }

            const TimestampMs now = clock_.nowMs();
            if (status == EventQueue::PopStatus::Timeout || now >= next_tick) {
                engine_.tick(now);
                board_.publish(engine_.snapshot());
                next_tick = now + flush_interval_.count();
            }
        }

        engine_.shutdown();
        board_.publish(engine_.snapshot());
        const auto& counters = engine_.counters();
        logInfo(kComponent, "Finished: ", counters.keystrokes, " keystrokes, ", counters.bursts_recorded,
                " of ", counters.bursts_closed, " bursts recorded");
    } catch (const std::exception& ex) {
        logError(kComponent, "Aggregation stopped: ", ex.what());
        // Unblocks a listener waiting on a full queue.
        queue_.close();
    }
}

}  // namespace tc::core
