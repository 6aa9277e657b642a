#pragma once

#include <string>

#include "typing_coach/statistics.hpp"
#include "typing_coach/types.hpp"

namespace tc::core {

// Boundary to the durable store. Every call returns true once the write is
// acknowledged. Rows arriving here are already past the privacy filter.
class PersistenceGateway {
public:
    virtual ~PersistenceGateway() = default;

    [[nodiscard]] virtual std::string id() const = 0;
    // Idempotent on burst.start_time_ms.
    virtual bool appendBurst(const Burst& burst) = 0;
    virtual bool upsertKeyStat(const KeyStat& stat) = 0;
    virtual bool upsertDigraphStat(const DigraphStat& stat) = 0;
    virtual bool upsertWordStat(const WordStat& stat) = 0;
};

}  // namespace tc::core
