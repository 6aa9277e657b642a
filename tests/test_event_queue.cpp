#include <catch2/catch.hpp>

#include <atomic>
#include <chrono>
#include <thread>

#include "typing_coach/event_queue.hpp"

using namespace tc::core;
using namespace std::chrono_literals;

TEST_CASE("queue preserves order", "[queue]") {
    BlockingQueue<int> queue(8);
    for (int i = 0; i < 5; ++i) REQUIRE(queue.push(i));
    for (int i = 0; i < 5; ++i) {
        int out = -1;
        REQUIRE(queue.popFor(out, 10ms) == BlockingQueue<int>::PopStatus::Item);
        REQUIRE(out == i);
    }
    int out = 0;
    REQUIRE(queue.popFor(out, 10ms) == BlockingQueue<int>::PopStatus::Timeout);
}

TEST_CASE("a full queue blocks the producer instead of dropping", "[queue]") {
    BlockingQueue<int> queue(2);
    REQUIRE(queue.push(1));
    REQUIRE(queue.push(2));

    std::atomic<bool> pushed{false};
    std::thread producer([&]() {
        queue.push(3);
        pushed = true;
    });
    std::this_thread::sleep_for(50ms);
    REQUIRE_FALSE(pushed.load());
    REQUIRE(queue.size() == 2);

    int out = 0;
    REQUIRE(queue.pop(out));
    REQUIRE(out == 1);
    producer.join();
    REQUIRE(pushed.load());
    REQUIRE(queue.size() == 2);
}

TEST_CASE("closing drains remaining items before reporting closed", "[queue]") {
    BlockingQueue<int> queue(4);
    REQUIRE(queue.push(7));
    queue.close();
    REQUIRE(queue.closed());
    REQUIRE_FALSE(queue.push(8));

    int out = 0;
    REQUIRE(queue.popFor(out, 10ms) == BlockingQueue<int>::PopStatus::Item);
    REQUIRE(out == 7);
    REQUIRE(queue.popFor(out, 10ms) == BlockingQueue<int>::PopStatus::Closed);
    REQUIRE_FALSE(queue.pop(out));
}

TEST_CASE("close releases a blocked producer", "[queue]") {
    BlockingQueue<int> queue(1);
    REQUIRE(queue.push(1));
    std::atomic<bool> result{true};
    std::thread producer([&]() { result = queue.push(2); });
    std::this_thread::sleep_for(20ms);
    queue.close();
    producer.join();
    REQUIRE_FALSE(result.load());
}
