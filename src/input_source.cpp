#include "typing_coach/input_source.hpp"

#include <fcntl.h>
#include <linux/input-event-codes.h>
#include <libevdev/libevdev.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <ctime>
#include <memory>

#include "typing_coach/clock.hpp"
#include "typing_coach/log.hpp"

namespace tc::core {

namespace {

constexpr const char* kComponent = "EvdevSource";

}  // namespace

// Only defined here, so open() is the one way to build an EvdevSource.
struct EvdevSource::ConstructToken {};

InputSourcePtr EvdevSource::open(const std::string& path, DeviceId id) {
    int fd = ::open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) {
        logWarn(kComponent, "Cannot open ", path, ": ", std::strerror(errno));
        return nullptr;
    }
    libevdev* dev = nullptr;
    int rc = libevdev_new_from_fd(fd, &dev);
    if (rc != 0) {
        logWarn(kComponent, "Not an evdev node: ", path, ": ", std::strerror(-rc));
        ::close(fd);
        return nullptr;
    }
    if (!libevdev_has_event_code(dev, EV_KEY, KEY_A)) {
        logDebug(kComponent, "Skipping ", path, ": no letter keys");
        libevdev_free(dev);
        ::close(fd);
        return nullptr;
    }
    // Event times must share the clock the aggregation worker ticks with.
    if (libevdev_set_clock_id(dev, CLOCK_MONOTONIC) != 0) {
        logWarn(kComponent, "Cannot switch ", path, " to the monotonic clock");
    }

    const char* raw_name = libevdev_get_name(dev);
    std::string name = raw_name ? raw_name : path;
    return std::make_unique<EvdevSource>(ConstructToken{}, id, std::move(name), fd, dev);
}

EvdevSource::EvdevSource(const ConstructToken&, DeviceId id, std::string name, int fd, libevdev* dev)
    : id_(id), name_(std::move(name)), fd_(fd), dev_(dev) {}

EvdevSource::~EvdevSource() { close(); }

bool EvdevSource::healthy() const {
    return !failed_ && fd_ >= 0 && dev_ != nullptr;
}

ReadStatus EvdevSource::read(std::vector<RawKeyEvent>& out) {
    if (!healthy()) return ReadStatus::Error;

    const auto before = out.size();
    unsigned int flags = LIBEVDEV_READ_FLAG_NORMAL;
    while (true) {
        input_event ev{};
        int rc = libevdev_next_event(dev_, flags, &ev);
        if (rc == LIBEVDEV_READ_STATUS_SUCCESS) {
            if (flags == LIBEVDEV_READ_FLAG_SYNC) {
                // State deltas after a dropped buffer carry no usable timing.
                continue;
            }
            // value 2 is autorepeat; it is not a distinct keystroke.
            if (ev.type == EV_KEY && (ev.value == 0 || ev.value == 1)) {
                RawKeyEvent event;
                event.device_id = id_;
                event.key_code = ev.code;
                event.timestamp_ms = timevalToMs(ev.time);
                event.is_press = ev.value == 1;
                out.push_back(event);
            }
        } else if (rc == LIBEVDEV_READ_STATUS_SYNC) {
            logWarn(kComponent, "Event buffer overrun on ", name_, "; resyncing");
            flags = LIBEVDEV_READ_FLAG_SYNC;
        } else if (rc == -EAGAIN) {
            if (flags == LIBEVDEV_READ_FLAG_SYNC) {
                flags = LIBEVDEV_READ_FLAG_NORMAL;
                continue;
            }
            break;
        } else if (rc == -EINTR) {
            continue;
        } else {
            failed_ = true;
            logWarn(kComponent, "Read failed on ", name_, ": ", std::strerror(-rc));
            return ReadStatus::Error;
        }
    }
    return out.size() > before ? ReadStatus::Ok : ReadStatus::WouldBlock;
}

void EvdevSource::close() {
    if (dev_) {
        libevdev_free(dev_);
        dev_ = nullptr;
    }
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

}  // namespace tc::core
