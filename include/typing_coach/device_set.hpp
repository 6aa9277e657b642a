#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "typing_coach/input_source.hpp"

namespace tc::core {

// Owned collection of live input handles. Move-only; pruning produces a new set.
class DeviceSet {
public:
    DeviceSet() = default;
    DeviceSet(DeviceSet&&) = default;
    DeviceSet& operator=(DeviceSet&&) = default;
    DeviceSet(const DeviceSet&) = delete;
    DeviceSet& operator=(const DeviceSet&) = delete;

    void add(InputSourcePtr source);
    // Closes and drops one handle; returns false if it is not in the set.
    bool remove(DeviceId id);

    [[nodiscard]] InputSource* find(DeviceId id) const;
    [[nodiscard]] std::size_t size() const noexcept { return sources_.size(); }
    [[nodiscard]] bool empty() const noexcept { return sources_.empty(); }

    [[nodiscard]] std::vector<InputSourcePtr>::const_iterator begin() const { return sources_.begin(); }
    [[nodiscard]] std::vector<InputSourcePtr>::const_iterator end() const { return sources_.end(); }

    // Empties the set and hands the handles to the caller.
    [[nodiscard]] std::vector<InputSourcePtr> release();

private:
    std::vector<InputSourcePtr> sources_;
};

struct PruneResult {
    DeviceSet devices;
    std::size_t removed{0};
};

// False when the descriptor is gone or the source reports itself dead. Never throws.
[[nodiscard]] bool validate(const InputSource& source) noexcept;

// Keeps valid handles; closes each invalid one exactly once.
[[nodiscard]] PruneResult prune(DeviceSet devices);

// Opens the configured paths, or every /dev/input/by-path/*-kbd node when none are given.
[[nodiscard]] DeviceSet discoverKeyboards(const std::vector<std::string>& paths);

}  // namespace tc::core
