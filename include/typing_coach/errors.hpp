#pragma once

#include <stdexcept>
#include <string>

namespace tc::core {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what)
        : std::runtime_error("Configuration error: " + what) {}
};

// Raised when every input source has been pruned; the listener cannot continue.
class NoDevicesAvailable : public std::runtime_error {
public:
    NoDevicesAvailable() : std::runtime_error("No input devices available") {}
};

}  // namespace tc::core
