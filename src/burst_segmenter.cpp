#include "typing_coach/burst_segmenter.hpp"

#include <algorithm>

#include "typing_coach/wpm.hpp"

namespace tc::core {

BurstSegmenter::BurstSegmenter(BurstConfig config) : config_(std::move(config)) {
    config_.validate();
}

void BurstSegmenter::open(TimestampMs timestamp_ms, bool is_backspace) {
    open_ = true;
    active_duration_ms_ = 0;
    current_ = Burst{};
    current_.start_time_ms = timestamp_ms;
    current_.end_time_ms = timestamp_ms;
    current_.key_count = 1;
    current_.backspace_count = is_backspace ? 1 : 0;
    current_.net_key_count = netKeystrokes(current_.key_count, current_.backspace_count);
}

std::optional<Burst> BurstSegmenter::onKeyPress(TimestampMs timestamp_ms, bool is_backspace) {
    std::optional<Burst> closed;
    if (open_ && timestamp_ms - current_.end_time_ms >= config_.timeout()) {
        closed = finalize();
    }
    if (!open_) {
        open(timestamp_ms, is_backspace);
        return closed;
    }

    const TimestampMs gap = timestamp_ms - current_.end_time_ms;
    if (gap < config_.active_time_threshold_ms) {
        active_duration_ms_ += gap;
    }
    current_.key_count += 1;
    if (is_backspace) {
        current_.backspace_count += 1;
    }
    current_.net_key_count = netKeystrokes(current_.key_count, current_.backspace_count);
    current_.end_time_ms = timestamp_ms;
    return closed;
}

std::optional<Burst> BurstSegmenter::closeIfIdle(TimestampMs now_ms) {
    if (!open_ || now_ms - current_.end_time_ms < config_.timeout()) {
        return std::nullopt;
    }
    return finalize();
}

std::optional<Burst> BurstSegmenter::flush() {
    if (!open_) return std::nullopt;
    return finalize();
}

std::optional<BurstSegmenter::OpenInfo> BurstSegmenter::currentInfo() const {
    if (!open_) return std::nullopt;
    const auto duration = currentDuration();
    return OpenInfo{current_.key_count, duration,
                    duration >= config_.high_score_min_duration_ms};
}

std::optional<TimestampMs> BurstSegmenter::lastKeyTime() const {
    if (!open_) return std::nullopt;
    return current_.end_time_ms;
}

TimestampMs BurstSegmenter::currentDuration() const {
    if (config_.duration_method == DurationMethod::ActiveTime) {
        return active_duration_ms_;
    }
    return std::max<TimestampMs>(0, current_.end_time_ms - current_.start_time_ms);
}

Burst BurstSegmenter::finalize() {
    Burst burst = current_;
    burst.duration_ms = currentDuration();
    burst.net_key_count = netKeystrokes(burst.key_count, burst.backspace_count);
    burst.avg_wpm = wordsPerMinute(burst.net_key_count, burst.duration_ms);
    burst.qualifies_for_persistence = burst.key_count >= config_.min_key_count &&
                                      burst.duration_ms >= config_.min_duration_ms;
    burst.qualifies_for_high_score = burst.duration_ms >= config_.high_score_min_duration_ms;
    open_ = false;
    active_duration_ms_ = 0;
    current_ = Burst{};
    return burst;
}

}  // namespace tc::core
