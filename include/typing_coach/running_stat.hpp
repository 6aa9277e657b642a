#pragma once

#include <cstdint>

namespace tc::core {

// Incremental mean with bounds; no samples are retained.
struct RunningStat {
    double mean{0.0};
    std::int64_t count{0};
    double min{0.0};
    double max{0.0};

    void add(double sample) noexcept;
};

}  // namespace tc::core
