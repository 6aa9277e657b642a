#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <string>

#include <openssl/types.h>

namespace tc::core {

using HashKey = std::array<std::uint8_t, 32>;

// Keyed BLAKE2b-256 of a lowercased word. The same keys give the same hash on
// every machine, and the hash cannot be turned back into the word.
class WordHasher {
public:
    WordHasher(const HashKey& pepper, const HashKey& user_key);

    [[nodiscard]] std::string hash(const std::string& word) const;

    [[nodiscard]] static HashKey keyFromHex(const std::string& hex);
    [[nodiscard]] static bool isHashHex(const std::string& text);

private:
    // Fetched once, shared by copies.
    std::shared_ptr<EVP_MAC> mac_;
    HashKey pepper_;
    HashKey user_salt_;
};

}  // namespace tc::core
