#include "typing_coach/word_list.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

#include <openssl/crypto.h>

#include "typing_coach/errors.hpp"

namespace tc::core {

namespace {

std::string normalize(const std::string& input) {
    auto begin = std::find_if_not(input.begin(), input.end(), [](unsigned char ch) {
        return std::isspace(ch) != 0;
    });
    auto end = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char ch) {
        return std::isspace(ch) != 0;
    }).base();
    if (begin >= end) {
        return {};
    }
    std::string out(begin, end);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return out;
}

}  // namespace

WordList::WordList(const std::vector<std::string>& words) {
    for (const auto& word : words) {
        auto entry = normalize(word);
        if (!entry.empty()) {
            words_.insert(std::move(entry));
        }
    }
}

WordList WordList::fromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("failed to open word list: " + path);
    }
    std::vector<std::string> words;
    std::string line;
    while (std::getline(in, line)) {
        words.push_back(std::move(line));
    }
    WordList list(words);
    if (list.size() == 0) {
        throw ConfigError("word list is empty: " + path);
    }
    return list;
}

bool WordList::contains(const std::string& word) const {
    std::string key = normalize(word);
    const bool found = words_.count(key) != 0;
    OPENSSL_cleanse(key.data(), key.size());
    return found;
}

}  // namespace tc::core
