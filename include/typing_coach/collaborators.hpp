#pragma once

#include <atomic>
#include <mutex>
#include <string>

namespace tc::core {

// Set by the UI thread when the statistics view is shown or hidden. The listener
// only ever reads the flag; it never calls into the observer.
class VisibilityFlag {
public:
    void set(bool visible) noexcept { visible_.store(visible, std::memory_order_relaxed); }
    [[nodiscard]] bool get() const noexcept { return visible_.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> visible_{false};
};

// Written by the accessibility collaborator while focus sits in a password field.
class PasswordContext {
public:
    void set(bool active) noexcept { active_.store(active); }
    [[nodiscard]] bool get() const noexcept { return active_.load(); }

private:
    std::atomic<bool> active_{false};
};

// Current keyboard layout id, replaced by the layout collaborator at any time.
class LayoutSource {
public:
    explicit LayoutSource(std::string initial = "us") : layout_(std::move(initial)) {}

    void set(const std::string& layout) {
        std::lock_guard<std::mutex> lock(mutex_);
        layout_ = layout;
    }

    [[nodiscard]] std::string current() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return layout_;
    }

private:
    mutable std::mutex mutex_;
    std::string layout_;
};

}  // namespace tc::core
