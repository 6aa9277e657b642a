#include "typing_coach/event_multiplexer.hpp"

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

#include "typing_coach/log.hpp"

namespace tc::core {

namespace {

constexpr const char* kComponent = "EventMultiplexer";

}  // namespace

EventMultiplexer::EventMultiplexer(DeviceSet devices) : devices_(std::move(devices)) {
    int fds[2];
    if (::pipe2(fds, O_NONBLOCK | O_CLOEXEC) != 0) {
        throw std::runtime_error(std::string("Failed to create wake pipe: ") + std::strerror(errno));
    }
    wake_read_ = fds[0];
    wake_write_ = fds[1];
    device_count_.store(devices_.size());
}

EventMultiplexer::~EventMultiplexer() {
    if (wake_read_ >= 0) ::close(wake_read_);
    if (wake_write_ >= 0) ::close(wake_write_);
}

EventMultiplexer::Batch EventMultiplexer::nextBatch(std::optional<std::chrono::milliseconds> timeout) {
    Batch batch;

    // A dead descriptor makes poll() return at once; it must never reach the wait.
    auto pruned = prune(std::move(devices_));
    devices_ = std::move(pruned.devices);
    batch.removed = pruned.removed;
    device_count_.store(devices_.size());
    if (devices_.empty()) {
        batch.status = Status::NoDevices;
        return batch;
    }

    std::vector<pollfd> fds;
    std::vector<DeviceId> ids;
    fds.reserve(devices_.size() + 1);
    fds.push_back({wake_read_, POLLIN, 0});
    for (const auto& source : devices_) {
        fds.push_back({source->fd(), POLLIN, 0});
        ids.push_back(source->id());
    }

    int timeout_ms = -1;
    if (timeout) {
        timeout_ms = static_cast<int>(std::clamp<std::chrono::milliseconds::rep>(
            timeout->count(), 0, std::numeric_limits<int>::max()));
    }
    const int rc = ::poll(fds.data(), fds.size(), timeout_ms);
    if (rc < 0) {
        if (errno != EINTR) {
            logWarn(kComponent, "poll failed: ", std::strerror(errno));
        }
        batch.status = Status::TimedOut;
        return batch;
    }
    if (rc == 0) {
        batch.status = Status::TimedOut;
        return batch;
    }

    bool woken = false;
    if (fds[0].revents & POLLIN) {
        drainWakePipe();
        woken = true;
    }

    std::vector<std::pair<DeviceId, const char*>> failed;
    for (std::size_t i = 1; i < fds.size(); ++i) {
        const short revents = fds[i].revents;
        if (revents == 0) continue;
        const DeviceId id = ids[i - 1];
        if (revents & POLLNVAL) {
            failed.emplace_back(id, "invalid descriptor");
            continue;
        }
        InputSource* source = devices_.find(id);
        if (!source) continue;
        if (revents & POLLIN) {
            if (source->read(batch.events) == ReadStatus::Error) {
                failed.emplace_back(id, "read error");
            }
        } else if (revents & (POLLERR | POLLHUP)) {
            failed.emplace_back(id, "device hung up");
        }
    }
    for (const auto& [id, reason] : failed) {
        dropDevice(id, reason);
        ++batch.removed;
    }
    device_count_.store(devices_.size());

    if (!batch.events.empty()) {
        batch.status = Status::Events;
    } else if (woken) {
        batch.status = Status::Woken;
    } else {
        batch.status = Status::TimedOut;
    }
    return batch;
}

void EventMultiplexer::wake() {
    const char byte = 1;
    if (::write(wake_write_, &byte, 1) < 0 && errno != EAGAIN) {
        logWarn(kComponent, "wake write failed: ", std::strerror(errno));
    }
}

void EventMultiplexer::drainWakePipe() {
    char buf[64];
    while (::read(wake_read_, buf, sizeof(buf)) > 0) {
    }
}

void EventMultiplexer::dropDevice(DeviceId id, const char* reason) {
    InputSource* source = devices_.find(id);
    if (!source) return;
    logWarn(kComponent, "Dropping input device ", id, " (", source->name(), "): ", reason);
    devices_.remove(id);
}

std::optional<std::chrono::milliseconds> adaptiveTimeout(bool observer_visible,
                                                         std::chrono::milliseconds visible_timeout) {
    if (observer_visible) return visible_timeout;
    return std::nullopt;
}

}  // namespace tc::core
