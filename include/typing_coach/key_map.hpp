#pragma once

#include <optional>
#include <string>
#include <unordered_map>

#include "typing_coach/types.hpp"

namespace tc::core {

enum class KeyClass {
    Letter,
    Backspace,
    Boundary,
    Modifier,
    Other,
};

// Per-layout mapping from evdev codes to the characters they produce.
class KeyMap {
public:
    using CharTable = std::unordered_map<KeyCode, std::string>;

    KeyMap();

    void addLayout(const std::string& id, CharTable table);
    [[nodiscard]] bool hasLayout(const std::string& id) const;

    [[nodiscard]] static bool isValidCode(KeyCode code) noexcept;
    [[nodiscard]] static bool isBackspace(KeyCode code) noexcept;
    [[nodiscard]] static bool isModifier(KeyCode code) noexcept;

    [[nodiscard]] KeyClass classify(KeyCode code, const std::string& layout) const;
    [[nodiscard]] std::optional<std::string> character(KeyCode code, const std::string& layout) const;

    // Loggable description: the evdev name for non-character keys, CHARACTER otherwise.
    [[nodiscard]] std::string safeName(KeyCode code, const std::string& layout) const;

private:
    std::unordered_map<std::string, CharTable> layouts_;

    [[nodiscard]] const CharTable& tableFor(const std::string& layout) const;
};

[[nodiscard]] bool isLetterText(const std::string& text);

}  // namespace tc::core
