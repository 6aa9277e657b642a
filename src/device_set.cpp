#include "typing_coach/device_set.hpp"

#include <fcntl.h>

#include <algorithm>
#include <exception>
#include <filesystem>

#include "typing_coach/log.hpp"

namespace tc::core {

namespace {

constexpr const char* kComponent = "DeviceSet";

std::vector<std::filesystem::path> byPathKeyboards() {
    std::vector<std::filesystem::path> nodes;
    const std::filesystem::path by_path("/dev/input/by-path");
    std::error_code ec;
    if (!std::filesystem::exists(by_path, ec)) {
        return nodes;
    }
    for (auto& entry : std::filesystem::directory_iterator(by_path, ec)) {
        if (ec) break;
        if (!entry.is_symlink(ec) && !entry.is_character_file(ec)) continue;
        const auto name = entry.path().filename().string();
        if (name.find("-kbd") == std::string::npos) continue;
        std::filesystem::path real = std::filesystem::read_symlink(entry.path(), ec);
        nodes.push_back(real.empty() ? entry.path() : (entry.path().parent_path() / real));
    }
    std::sort(nodes.begin(), nodes.end());
    nodes.erase(std::unique(nodes.begin(), nodes.end()), nodes.end());
    return nodes;
}

}  // namespace

void DeviceSet::add(InputSourcePtr source) {
    if (source) {
        sources_.push_back(std::move(source));
    }
}

bool DeviceSet::remove(DeviceId id) {
    auto it = std::find_if(sources_.begin(), sources_.end(),
                           [id](const InputSourcePtr& s) { return s->id() == id; });
    if (it == sources_.end()) return false;
    (*it)->close();
    sources_.erase(it);
    return true;
}

InputSource* DeviceSet::find(DeviceId id) const {
    for (const auto& source : sources_) {
        if (source->id() == id) return source.get();
    }
    return nullptr;
}

std::vector<InputSourcePtr> DeviceSet::release() {
    std::vector<InputSourcePtr> out;
    out.swap(sources_);
    return out;
}

bool validate(const InputSource& source) noexcept {
    try {
        if (source.closed()) return false;
        const int fd = source.fd();
        if (fd < 0 || ::fcntl(fd, F_GETFL) == -1) return false;
        return source.healthy();
    } catch (const std::exception&) {
        return false;
    }
}

PruneResult prune(DeviceSet devices) {
    PruneResult result;
    for (auto& source : devices.release()) {
        if (validate(*source)) {
            result.devices.add(std::move(source));
            continue;
        }
        logWarn(kComponent, "Removing dead input device ", source->id(), " (", source->name(), ")");
        source->close();
        ++result.removed;
    }
    return result;
}

DeviceSet discoverKeyboards(const std::vector<std::string>& paths) {
    std::vector<std::string> candidates = paths;
    if (candidates.empty()) {
        for (const auto& node : byPathKeyboards()) {
            candidates.push_back(node.string());
        }
    }

    DeviceSet devices;
    DeviceId next_id = 0;
    for (const auto& path : candidates) {
        auto source = EvdevSource::open(path, next_id);
        if (!source) continue;
        logInfo(kComponent, "Listening on ", source->name(), " (", path, ")");
        devices.add(std::move(source));
        ++next_id;
    }
    return devices;
}

}  // namespace tc::core
