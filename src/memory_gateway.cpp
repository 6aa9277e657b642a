#include "typing_coach/memory_gateway.hpp"

namespace tc::core {

std::string MemoryGateway::id() const {
    return "memory";
}

bool MemoryGateway::consumeFailure() {
    if (fail_next_ == 0) return false;
    --fail_next_;
    return true;
}

bool MemoryGateway::appendBurst(const Burst& burst) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (consumeFailure()) return false;
    // A repeated start time is acknowledged without a second row.
    if (bursts_.emplace(burst.start_time_ms, burst).second) {
        ++writes_;
    }
    return true;
}

bool MemoryGateway::upsertKeyStat(const KeyStat& stat) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (consumeFailure()) return false;
    key_stats_[{stat.key_code, stat.layout}] = stat;
    ++writes_;
    return true;
}

bool MemoryGateway::upsertDigraphStat(const DigraphStat& stat) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (consumeFailure()) return false;
    digraph_stats_[{stat.first_key_code, stat.second_key_code, stat.layout}] = stat;
    ++writes_;
    return true;
}

bool MemoryGateway::upsertWordStat(const WordStat& stat) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (consumeFailure()) return false;
    word_stats_[{stat.word_key, stat.layout}] = stat;
    ++writes_;
    return true;
}

void MemoryGateway::failNextWrites(std::size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_next_ = count;
}

std::vector<Burst> MemoryGateway::bursts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Burst> out;
    out.reserve(bursts_.size());
    for (const auto& [start, burst] : bursts_) {
        out.push_back(burst);
    }
    return out;
}

std::optional<KeyStat> MemoryGateway::keyStat(KeyCode code, const std::string& layout) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = key_stats_.find({code, layout});
    if (it == key_stats_.end()) return std::nullopt;
    return it->second;
}

std::optional<DigraphStat> MemoryGateway::digraphStat(KeyCode first, KeyCode second,
                                                      const std::string& layout) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = digraph_stats_.find({first, second, layout});
    if (it == digraph_stats_.end()) return std::nullopt;
    return it->second;
}

std::optional<WordStat> MemoryGateway::wordStat(const std::string& word_key,
                                                const std::string& layout) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = word_stats_.find({word_key, layout});
    if (it == word_stats_.end()) return std::nullopt;
    return it->second;
}

std::size_t MemoryGateway::keyStatCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return key_stats_.size();
}

std::size_t MemoryGateway::digraphStatCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return digraph_stats_.size();
}

std::size_t MemoryGateway::wordStatCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return word_stats_.size();
}

std::size_t MemoryGateway::writeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return writes_;
}

}  // namespace tc::core
