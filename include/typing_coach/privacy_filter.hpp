#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "typing_coach/types.hpp"
#include "typing_coach/word_hasher.hpp"

namespace tc::core {

struct WordObservation;

// Hashes of words the user never wants aggregated. Writable from the operator
// thread, read by the aggregation thread.
class IgnoredWordSet {
public:
    IgnoredWordSet() = default;
    explicit IgnoredWordSet(const std::vector<std::string>& hashes);

    // Returns false for a malformed hash.
    bool addHash(const std::string& hash_hex);
    // Hashes the word and forgets the plaintext.
    void addWord(std::string word, const WordHasher& hasher);

    [[nodiscard]] bool contains(const std::string& hash_hex) const;
    [[nodiscard]] std::size_t size() const;

    // Hashes added since the last call, so existing aggregates can be purged.
    [[nodiscard]] std::vector<std::string> takeRecentlyAdded();

private:
    mutable std::mutex mutex_;
    std::unordered_set<std::string> hashes_;
    std::vector<std::string> recent_;
};

using IgnoredWordSetPtr = std::shared_ptr<IgnoredWordSet>;

[[nodiscard]] std::vector<std::string> readIgnoredHashFile(const std::string& path);

class PrivacyFilter {
public:
    PrivacyFilter(std::shared_ptr<const WordHasher> hasher,
                  IgnoredWordSetPtr ignored,
                  bool store_hashes);

    // Password-context events never reach aggregation or persistence.
    [[nodiscard]] bool admits(const RawKeyEvent& event) const noexcept {
        return !event.is_password_context;
    }

    // Returns the WordStat key for an admitted word, or nullopt when the word
    // is ignored. The observation's plaintext is wiped in every case.
    [[nodiscard]] std::optional<std::string> admitWord(WordObservation& word) const;
    // Wipes a word that will not be aggregated.
    static void discardWord(WordObservation& word);

    [[nodiscard]] std::string keyHash(const std::string& word_key) const;
    [[nodiscard]] bool storesHashes() const noexcept { return store_hashes_; }
    [[nodiscard]] const WordHasher& hasher() const noexcept { return *hasher_; }
    [[nodiscard]] IgnoredWordSet& ignored() noexcept { return *ignored_; }

private:
    std::shared_ptr<const WordHasher> hasher_;
    IgnoredWordSetPtr ignored_;
    bool store_hashes_;
};

}  // namespace tc::core
