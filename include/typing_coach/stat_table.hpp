#pragma once

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace tc::core {

// Keyed rows carrying a RunningStat named `stat`. Rows below min_samples are
// kept but never handed to readers.
template <typename Id, typename Row, typename Hash>
class StatTable {
public:
    explicit StatTable(int min_samples) : min_samples_(min_samples) {}

    Row& touch(const Id& id, const Row& prototype) {
        auto it = rows_.find(id);
        if (it == rows_.end()) {
            it = rows_.emplace(id, prototype).first;
        }
        dirty_.insert(id);
        return it->second;
    }

    [[nodiscard]] const Row* find(const Id& id) const {
        auto it = rows_.find(id);
        return it == rows_.end() ? nullptr : &it->second;
    }

    [[nodiscard]] std::optional<Row> exposedRow(const Id& id) const {
        const Row* row = find(id);
        if (!row || !isExposed(*row)) return std::nullopt;
        return *row;
    }

    bool erase(const Id& id) {
        dirty_.erase(id);
        return rows_.erase(id) > 0;
    }

    template <typename Pred>
    std::size_t eraseIf(Pred pred) {
        std::size_t removed = 0;
        for (auto it = rows_.begin(); it != rows_.end();) {
            if (pred(it->second)) {
                dirty_.erase(it->first);
                it = rows_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    [[nodiscard]] bool isExposed(const Row& row) const noexcept {
        return row.stat.count >= min_samples_;
    }

    [[nodiscard]] std::vector<Row> exposed() const {
        std::vector<Row> out;
        for (const auto& [id, row] : rows_) {
            if (isExposed(row)) out.push_back(row);
        }
        return out;
    }

    // Clears the dirty set; returns the changed rows that readers may see.
    [[nodiscard]] std::vector<Row> takeDirty() {
        std::vector<Row> out;
        for (const auto& id : dirty_) {
            auto it = rows_.find(id);
            if (it != rows_.end() && isExposed(it->second)) {
                out.push_back(it->second);
            }
        }
        dirty_.clear();
        return out;
    }

    // Highest mean first when slowest is true, lowest mean first otherwise.
    [[nodiscard]] std::vector<Row> ranked(std::size_t limit,
                                          bool slowest,
                                          const std::optional<std::string>& layout) const {
        std::vector<Row> out;
        for (const auto& [id, row] : rows_) {
            if (!isExposed(row)) continue;
            if (layout && row.layout != *layout) continue;
            out.push_back(row);
        }
        std::sort(out.begin(), out.end(), [slowest](const Row& a, const Row& b) {
            return slowest ? a.stat.mean > b.stat.mean : a.stat.mean < b.stat.mean;
        });
        if (out.size() > limit) out.resize(limit);
        return out;
    }

    [[nodiscard]] std::size_t size() const noexcept { return rows_.size(); }
    [[nodiscard]] int minSamples() const noexcept { return min_samples_; }

private:
    int min_samples_;
    std::unordered_map<Id, Row, Hash> rows_;
    std::unordered_set<Id, Hash> dirty_;
};

}  // namespace tc::core
