#include "typing_coach/types.hpp"

namespace tc::core {

const char* toString(DurationMethod method) noexcept {
    switch (method) {
        case DurationMethod::TotalTime:
            return "total_time";
        case DurationMethod::ActiveTime:
            return "active_time";
    }
    return "unknown";
}

}  // namespace tc::core
