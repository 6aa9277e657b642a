#pragma once

#include <mutex>

#include "typing_coach/persistence_gateway.hpp"

namespace tc::core {

class LoggingGateway : public PersistenceGateway {
public:
    // With store_hashes false the word keys are plaintext and are not printed.
    explicit LoggingGateway(bool word_keys_are_hashes = false);

    std::string id() const override;
    bool appendBurst(const Burst& burst) override;
    bool upsertKeyStat(const KeyStat& stat) override;
    bool upsertDigraphStat(const DigraphStat& stat) override;
    bool upsertWordStat(const WordStat& stat) override;

private:
    bool word_keys_are_hashes_;
    std::mutex mutex_;
};

}  // namespace tc::core
