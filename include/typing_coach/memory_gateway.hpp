#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include "typing_coach/persistence_gateway.hpp"

namespace tc::core {

// In-process store honouring the gateway contract: one burst row per start time
// and one stat row per identity.
class MemoryGateway : public PersistenceGateway {
public:
    std::string id() const override;
    bool appendBurst(const Burst& burst) override;
    bool upsertKeyStat(const KeyStat& stat) override;
    bool upsertDigraphStat(const DigraphStat& stat) override;
    bool upsertWordStat(const WordStat& stat) override;

    // Makes the next `count` writes fail, for exercising error paths.
    void failNextWrites(std::size_t count);

    [[nodiscard]] std::vector<Burst> bursts() const;
    [[nodiscard]] std::optional<KeyStat> keyStat(KeyCode code, const std::string& layout) const;
    [[nodiscard]] std::optional<DigraphStat> digraphStat(KeyCode first, KeyCode second,
                                                         const std::string& layout) const;
    [[nodiscard]] std::optional<WordStat> wordStat(const std::string& word_key,
                                                   const std::string& layout) const;
    [[nodiscard]] std::size_t keyStatCount() const;
    [[nodiscard]] std::size_t digraphStatCount() const;
    [[nodiscard]] std::size_t wordStatCount() const;
    [[nodiscard]] std::size_t writeCount() const;

private:
    mutable std::mutex mutex_;
    std::map<TimestampMs, Burst> bursts_;
    std::map<std::pair<KeyCode, std::string>, KeyStat> key_stats_;
    std::map<std::tuple<KeyCode, KeyCode, std::string>, DigraphStat> digraph_stats_;
    std::map<std::pair<std::string, std::string>, WordStat> word_stats_;
    std::size_t fail_next_{0};
    std::size_t writes_{0};

    bool consumeFailure();
};

}  // namespace tc::core
