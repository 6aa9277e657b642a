#include "typing_coach/engine_snapshot.hpp"

#include "typing_coach/wpm.hpp"

namespace tc::core {

double EngineSnapshot::sessionWpm() const noexcept {
    return wordsPerMinute(static_cast<int>(session.recorded_net_keystrokes), session.typing_time_ms);
}

}  // namespace tc::core
