#include "typing_coach/running_stat.hpp"

#include <algorithm>

namespace tc::core {

void RunningStat::add(double sample) noexcept {
    ++count;
    if (count == 1) {
        mean = sample;
        min = sample;
        max = sample;
        return;
    }
    mean += (sample - mean) / static_cast<double>(count);
    min = std::min(min, sample);
    max = std::max(max, sample);
}

}  // namespace tc::core
