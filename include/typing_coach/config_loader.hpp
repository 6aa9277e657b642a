#pragma once

#include <string>

#include "typing_coach/engine_config.hpp"

namespace tc::core {

class ConfigLoader {
public:
    [[nodiscard]] EngineConfig loadFromFile(const std::string& path) const;
    // Relative layout and ignore-list paths resolve against base_dir.
    [[nodiscard]] EngineConfig loadFromString(const std::string& text,
                                              const std::string& base_dir = ".") const;
};

}  // namespace tc::core
