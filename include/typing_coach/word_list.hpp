#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

namespace tc::core {

// Known words, one per line in the source file. Only words found here are
// aggregated when a list is configured.
class WordList {
public:
    explicit WordList(const std::vector<std::string>& words);

    // Throws ConfigError when the file is missing or holds no words.
    [[nodiscard]] static WordList fromFile(const std::string& path);

    // ASCII case-insensitive.
    [[nodiscard]] bool contains(const std::string& word) const;
    [[nodiscard]] std::size_t size() const noexcept { return words_.size(); }

private:
    std::unordered_set<std::string> words_;
};

using WordListPtr = std::shared_ptr<const WordList>;

}  // namespace tc::core
