#include "typing_coach/word_hasher.hpp"

#include <cctype>
#include <memory>
#include <stdexcept>

#include <openssl/core_names.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/params.h>

#include "typing_coach/errors.hpp"

namespace tc::core {

namespace {

constexpr char kSaltLabel[] = "ignored_words_user_salt_derivation";

struct MacCtxDeleter {
    void operator()(EVP_MAC_CTX* ctx) const { EVP_MAC_CTX_free(ctx); }
};

// BLAKE2b with a 32-byte output, keyed, over the concatenation of parts.
HashKey blake2bKeyed(EVP_MAC* mac, const HashKey& key,
                     const std::uint8_t* first, std::size_t first_len,
                     const std::uint8_t* second, std::size_t second_len) {
    std::unique_ptr<EVP_MAC_CTX, MacCtxDeleter> ctx(EVP_MAC_CTX_new(mac));
    if (!ctx) throw std::runtime_error("EVP_MAC_CTX_new failed");

    std::size_t out_size = 32;
    OSSL_PARAM params[] = {
        OSSL_PARAM_construct_size_t(OSSL_MAC_PARAM_SIZE, &out_size),
        OSSL_PARAM_construct_end(),
    };
    if (EVP_MAC_init(ctx.get(), key.data(), key.size(), params) != 1) {
        throw std::runtime_error("EVP_MAC_init failed");
    }
    if (first_len > 0 && EVP_MAC_update(ctx.get(), first, first_len) != 1) {
        throw std::runtime_error("EVP_MAC_update failed");
    }
    if (second_len > 0 && EVP_MAC_update(ctx.get(), second, second_len) != 1) {
        throw std::runtime_error("EVP_MAC_update failed");
    }
    HashKey out{};
    std::size_t written = 0;
    if (EVP_MAC_final(ctx.get(), out.data(), &written, out.size()) != 1 || written != out.size()) {
        throw std::runtime_error("EVP_MAC_final failed");
    }
    return out;
}

int hexValue(char ch) {
    if (ch >= '0' && ch <= '9') return ch - '0';
    if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
    if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
    return -1;
}

}  // namespace

WordHasher::WordHasher(const HashKey& pepper, const HashKey& user_key)
    : mac_(EVP_MAC_fetch(nullptr, "BLAKE2BMAC", nullptr), EVP_MAC_free), pepper_(pepper) {
    if (!mac_) throw std::runtime_error("BLAKE2BMAC is not available in this OpenSSL build");
    user_salt_ = blake2bKeyed(mac_.get(), user_key,
                              reinterpret_cast<const std::uint8_t*>(kSaltLabel), sizeof(kSaltLabel) - 1,
                              nullptr, 0);
}

std::string WordHasher::hash(const std::string& word) const {
    std::string normalized;
    normalized.reserve(word.size());
    for (char ch : word) {
        normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    const HashKey digest = blake2bKeyed(mac_.get(), pepper_,
                                        user_salt_.data(), user_salt_.size(),
                                        reinterpret_cast<const std::uint8_t*>(normalized.data()),
                                        normalized.size());
    OPENSSL_cleanse(normalized.data(), normalized.size());
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(digest.size() * 2);
    for (auto byte : digest) {
        out.push_back(kHex[byte >> 4]);
        out.push_back(kHex[byte & 0x0f]);
    }
    return out;
}

HashKey WordHasher::keyFromHex(const std::string& hex) {
    HashKey key{};
    if (hex.size() != key.size() * 2) {
        throw ConfigError("hash key must be 64 hex characters");
    }
    for (std::size_t i = 0; i < key.size(); ++i) {
        const int hi = hexValue(hex[2 * i]);
        const int lo = hexValue(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw ConfigError("hash key contains a non-hex character");
        }
        key[i] = static_cast<std::uint8_t>((hi << 4) | lo);
    }
    return key;
}

bool WordHasher::isHashHex(const std::string& text) {
    if (text.size() != 64) return false;
    for (char ch : text) {
        if (hexValue(ch) < 0) return false;
    }
    return true;
}

}  // namespace tc::core
