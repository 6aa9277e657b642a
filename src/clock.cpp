#include "typing_coach/clock.hpp"

#include <sys/time.h>

namespace tc::core {

TimestampMs SteadyClock::nowMs() const {
    using namespace std::chrono;
    return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

TimestampMs timevalToMs(const timeval& tv) noexcept {
    return static_cast<TimestampMs>(tv.tv_sec) * 1000 + static_cast<TimestampMs>(tv.tv_usec) / 1000;
}

}  // namespace tc::core
