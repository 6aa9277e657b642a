#include <catch2/catch.hpp>

#include <linux/input-event-codes.h>

#include <chrono>
#include <memory>
#include <thread>

#include "typing_coach/key_listener.hpp"
#include "test_support.hpp"

using namespace tc::core;
using namespace std::chrono_literals;
using tc::test::PipeControl;

namespace {

bool waitForState(const KeyListener& listener, KeyListener::State state) {
    const auto deadline = std::chrono::steady_clock::now() + 2000ms;
    while (std::chrono::steady_clock::now() < deadline) {
        if (listener.state() == state) return true;
        std::this_thread::sleep_for(5ms);
    }
    return listener.state() == state;
}

}  // namespace

TEST_CASE("listener forwards events with the password flag", "[listener]") {
    std::shared_ptr<PipeControl> a;
    DeviceSet devices;
    devices.add(tc::test::makePipeSource(1, a));
    EventQueue queue(16);
    VisibilityFlag visibility;
    PasswordContext password;

    KeyListener listener(std::move(devices), queue, visibility, password, 20ms);
    listener.start();
    REQUIRE(listener.state() == KeyListener::State::Running);

    REQUIRE(a->send(KEY_A, 10));
    RawKeyEvent ev;
    REQUIRE(queue.popFor(ev, 2000ms) == EventQueue::PopStatus::Item);
    REQUIRE(ev.key_code == KEY_A);
    REQUIRE_FALSE(ev.is_password_context);

    password.set(true);
    REQUIRE(a->send(KEY_B, 20));
    REQUIRE(queue.popFor(ev, 2000ms) == EventQueue::PopStatus::Item);
    REQUIRE(ev.key_code == KEY_B);
    REQUIRE(ev.is_password_context);

    listener.stop();
    REQUIRE(listener.state() == KeyListener::State::Stopped);
    REQUIRE(queue.closed());
    REQUIRE(listener.eventsForwarded() == 2);
}

TEST_CASE("listener stops promptly while blocked indefinitely", "[listener]") {
    std::shared_ptr<PipeControl> a;
    DeviceSet devices;
    devices.add(tc::test::makePipeSource(1, a));
    EventQueue queue(4);
    VisibilityFlag visibility;  // hidden: the wait has no timeout
    PasswordContext password;

    KeyListener listener(std::move(devices), queue, visibility, password, 1000ms);
    listener.start();
    std::this_thread::sleep_for(20ms);

    const auto start = std::chrono::steady_clock::now();
    listener.stop();
    REQUIRE(std::chrono::steady_clock::now() - start < 500ms);
}

TEST_CASE("listener reports when every device is gone", "[listener]") {
    std::shared_ptr<PipeControl> a, b;
    DeviceSet devices;
    devices.add(tc::test::makePipeSource(1, a));
    devices.add(tc::test::makePipeSource(2, b));
    EventQueue queue(4);
    VisibilityFlag visibility;
    visibility.set(true);
    PasswordContext password;

    KeyListener listener(std::move(devices), queue, visibility, password, 10ms);
    listener.start();
    a->healthy = false;
    b->healthy = false;

    REQUIRE(waitForState(listener, KeyListener::State::NoDevices));
    REQUIRE(queue.closed());
    REQUIRE(listener.deviceCount() == 0);
    REQUIRE(a->closes.load() == 1);
    REQUIRE(b->closes.load() == 1);
    listener.stop();
}
