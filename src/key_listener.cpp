#include "typing_coach/key_listener.hpp"

#include "typing_coach/log.hpp"

namespace tc::core {

namespace {

constexpr const char* kComponent = "KeyListener";

}  // namespace

KeyListener::KeyListener(DeviceSet devices,
                         EventQueue& queue,
                         const VisibilityFlag& visibility,
                         const PasswordContext& password_context,
                         std::chrono::milliseconds visible_timeout)
    : mux_(std::move(devices)),
      queue_(queue),
      visibility_(visibility),
      password_context_(password_context),
      visible_timeout_(visible_timeout) {}

KeyListener::~KeyListener() { stop(); }

void KeyListener::start() {
    if (thread_.joinable()) return;
    stop_.store(false);
    state_.store(State::Running);
    thread_ = std::thread(&KeyListener::runLoop, this);
}

void KeyListener::stop() {
    stop_.store(true);
    mux_.wake();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void KeyListener::runLoop() {
    logInfo(kComponent, "Listening on ", mux_.deviceCount(), " device(s)");
    while (!stop_.load()) {
        auto batch = mux_.nextBatch(adaptiveTimeout(visibility_.get(), visible_timeout_));
        if (batch.removed > 0) {
            logWarn(kComponent, batch.removed, " device(s) removed, ", mux_.deviceCount(), " remaining");
        }
        if (batch.status == EventMultiplexer::Status::NoDevices) {
            logError(kComponent, "No input devices available; listener stopped");
            state_.store(State::NoDevices);
            queue_.close();
            return;
        }

        const bool password = password_context_.get();
        for (auto& event : batch.events) {
            event.is_password_context = password;
            if (!queue_.push(event)) {
                // Consumer closed the queue.
                state_.store(State::Stopped);
                return;
            }
            forwarded_.fetch_add(1);
        }
    }
    state_.store(State::Stopped);
    queue_.close();
    logInfo(kComponent, "Stopped after ", forwarded_.load(), " event(s)");
}

}  // namespace tc::core
