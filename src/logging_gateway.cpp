#include "typing_coach/logging_gateway.hpp"

#include <iomanip>
#include <sstream>

#include "typing_coach/log.hpp"

namespace tc::core {

namespace {

constexpr const char* kComponent = "LoggingGateway";

std::string formatStat(const RunningStat& stat) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << "mean=" << stat.mean << "ms min=" << stat.min
        << "ms max=" << stat.max << "ms n=" << stat.count;
    return out.str();
}

}  // namespace

LoggingGateway::LoggingGateway(bool word_keys_are_hashes)
    : word_keys_are_hashes_(word_keys_are_hashes) {}

std::string LoggingGateway::id() const {
    return "logging";
}

bool LoggingGateway::appendBurst(const Burst& burst) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream wpm;
    wpm << std::fixed << std::setprecision(1) << burst.avg_wpm;
    logInfo(kComponent, "burst start=", burst.start_time_ms, " keys=", burst.key_count,
            " backspaces=", burst.backspace_count, " net=", burst.net_key_count,
            " duration=", burst.duration_ms, "ms wpm=", wpm.str(),
            burst.qualifies_for_high_score ? " high-score" : "");
    return true;
}

bool LoggingGateway::upsertKeyStat(const KeyStat& stat) {
    std::lock_guard<std::mutex> lock(mutex_);
    logDebug(kComponent, "key ", stat.key_code, " [", stat.layout, "] ", formatStat(stat.stat));
    return true;
}

bool LoggingGateway::upsertDigraphStat(const DigraphStat& stat) {
    std::lock_guard<std::mutex> lock(mutex_);
    logDebug(kComponent, "digraph ", stat.first_key_code, "->", stat.second_key_code, " [",
             stat.layout, "] ", formatStat(stat.stat));
    return true;
}

bool LoggingGateway::upsertWordStat(const WordStat& stat) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string key = word_keys_are_hashes_ ? stat.word_key.substr(0, 12) : std::string("<word>");
    logDebug(kComponent, "word ", key, " [", stat.layout, "] ", formatStat(stat.stat),
             " letters=", stat.total_letters, " backspaces=", stat.backspace_count,
             " editing=", stat.editing_time_ms, "ms");
    return true;
}

}  // namespace tc::core
