#include "typing_coach/privacy_filter.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

#include <openssl/crypto.h>

#include "typing_coach/errors.hpp"
#include "typing_coach/log.hpp"
#include "typing_coach/word_detector.hpp"

namespace tc::core {

namespace {
std::string lowerHex(const std::string& hex) {
    std::string out = hex;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return out;
}

// Overwrites before releasing so the plaintext does not linger in the buffer.
void wipe(std::string& text) {
    OPENSSL_cleanse(text.data(), text.size());
    text.clear();
}
}  // namespace

IgnoredWordSet::IgnoredWordSet(const std::vector<std::string>& hashes) {
    for (const auto& hash : hashes) {
        if (!WordHasher::isHashHex(hash)) {
            throw ConfigError("malformed ignored-word hash");
        }
        hashes_.insert(lowerHex(hash));
    }
}

bool IgnoredWordSet::addHash(const std::string& hash_hex) {
    if (!WordHasher::isHashHex(hash_hex)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = hashes_.insert(lowerHex(hash_hex));
    if (inserted) {
        recent_.push_back(*it);
    }
    return true;
}

void IgnoredWordSet::addWord(std::string word, const WordHasher& hasher) {
    const std::string hash = hasher.hash(word);
    wipe(word);
    addHash(hash);
}

bool IgnoredWordSet::contains(const std::string& hash_hex) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hashes_.count(hash_hex) != 0;
}

std::size_t IgnoredWordSet::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hashes_.size();
}

std::vector<std::string> IgnoredWordSet::takeRecentlyAdded() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    out.swap(recent_);
    return out;
}

std::vector<std::string> readIgnoredHashFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("failed to open ignored words file: " + path);
    }
    std::vector<std::string> out;
    std::string line;
    std::size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        line.erase(std::remove_if(line.begin(), line.end(),
                                  [](unsigned char ch) { return std::isspace(ch) != 0; }),
                   line.end());
        if (line.empty() || line[0] == '#') continue;
        if (!WordHasher::isHashHex(line)) {
            throw ConfigError("ignored words file " + path + " line " + std::to_string(line_no) +
                              " is not a 64-character hash");
        }
        out.push_back(lowerHex(line));
    }
    return out;
}

PrivacyFilter::PrivacyFilter(std::shared_ptr<const WordHasher> hasher,
                             IgnoredWordSetPtr ignored,
                             bool store_hashes)
    : hasher_(std::move(hasher)), ignored_(std::move(ignored)), store_hashes_(store_hashes) {
    if (!hasher_) throw std::invalid_argument("PrivacyFilter requires a hasher");
    if (!ignored_) ignored_ = std::make_shared<IgnoredWordSet>();
}

std::optional<std::string> PrivacyFilter::admitWord(WordObservation& word) const {
    const std::string hash = hasher_->hash(word.text);
    if (ignored_->contains(hash)) {
        wipe(word.text);
        return std::nullopt;
    }
    if (store_hashes_) {
        wipe(word.text);
        return hash;
    }
    std::string key = std::move(word.text);
    word.text.clear();
    return key;
}

void PrivacyFilter::discardWord(WordObservation& word) {
    wipe(word.text);
}

std::string PrivacyFilter::keyHash(const std::string& word_key) const {
    return store_hashes_ ? word_key : hasher_->hash(word_key);
}

}  // namespace tc::core
