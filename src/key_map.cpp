#include "typing_coach/key_map.hpp"

#include <cctype>
#include <linux/input-event-codes.h>
#include <libevdev/libevdev.h>

namespace tc::core {

namespace {

KeyMap::CharTable usTable() {
    return {
        {KEY_1, "1"}, {KEY_2, "2"}, {KEY_3, "3"}, {KEY_4, "4"}, {KEY_5, "5"},
        {KEY_6, "6"}, {KEY_7, "7"}, {KEY_8, "8"}, {KEY_9, "9"}, {KEY_0, "0"},
        {KEY_MINUS, "-"}, {KEY_EQUAL, "="},
        {KEY_Q, "q"}, {KEY_W, "w"}, {KEY_E, "e"}, {KEY_R, "r"}, {KEY_T, "t"},
        {KEY_Y, "y"}, {KEY_U, "u"}, {KEY_I, "i"}, {KEY_O, "o"}, {KEY_P, "p"},
        {KEY_LEFTBRACE, "["}, {KEY_RIGHTBRACE, "]"},
        {KEY_A, "a"}, {KEY_S, "s"}, {KEY_D, "d"}, {KEY_F, "f"}, {KEY_G, "g"},
        {KEY_H, "h"}, {KEY_J, "j"}, {KEY_K, "k"}, {KEY_L, "l"},
        {KEY_SEMICOLON, ";"}, {KEY_APOSTROPHE, "'"}, {KEY_GRAVE, "`"}, {KEY_BACKSLASH, "\\"},
        {KEY_Z, "z"}, {KEY_X, "x"}, {KEY_C, "c"}, {KEY_V, "v"}, {KEY_B, "b"},
        {KEY_N, "n"}, {KEY_M, "m"},
        {KEY_COMMA, ","}, {KEY_DOT, "."}, {KEY_SLASH, "/"},
    };
}

KeyMap::CharTable deTable() {
    auto table = usTable();
    table[KEY_Y] = "z";
    table[KEY_Z] = "y";
    table[KEY_MINUS] = "ß";
    table[KEY_EQUAL] = "'";
    table[KEY_LEFTBRACE] = "ü";
    table[KEY_RIGHTBRACE] = "+";
    table[KEY_SEMICOLON] = "ö";
    table[KEY_APOSTROPHE] = "ä";
    table[KEY_GRAVE] = "^";
    table[KEY_BACKSLASH] = "#";
    table[KEY_SLASH] = "-";
    return table;
}

bool isWhitespaceKey(KeyCode code) {
    return code == KEY_SPACE || code == KEY_ENTER || code == KEY_TAB || code == KEY_KPENTER;
}

}  // namespace

bool isLetterText(const std::string& text) {
    if (text.size() == 1) {
        return std::isalpha(static_cast<unsigned char>(text[0])) != 0;
    }
    return text == "ä" || text == "ö" || text == "ü" || text == "ß";
}

KeyMap::KeyMap() {
    layouts_.emplace("us", usTable());
    layouts_.emplace("de", deTable());
}

void KeyMap::addLayout(const std::string& id, CharTable table) {
    layouts_[id] = std::move(table);
}

bool KeyMap::hasLayout(const std::string& id) const {
    return layouts_.count(id) != 0;
}

bool KeyMap::isValidCode(KeyCode code) noexcept {
    return code > KEY_RESERVED && code <= KEY_MAX;
}

bool KeyMap::isBackspace(KeyCode code) noexcept {
    return code == KEY_BACKSPACE;
}

bool KeyMap::isModifier(KeyCode code) noexcept {
    switch (code) {
        case KEY_LEFTSHIFT:
        case KEY_RIGHTSHIFT:
        case KEY_LEFTCTRL:
        case KEY_RIGHTCTRL:
        case KEY_LEFTALT:
        case KEY_RIGHTALT:
        case KEY_LEFTMETA:
        case KEY_RIGHTMETA:
        case KEY_CAPSLOCK:
            return true;
        default:
            return false;
    }
}

const KeyMap::CharTable& KeyMap::tableFor(const std::string& layout) const {
    auto it = layouts_.find(layout);
    if (it == layouts_.end()) {
        it = layouts_.find("us");
    }
    return it->second;
}

std::optional<std::string> KeyMap::character(KeyCode code, const std::string& layout) const {
    const auto& table = tableFor(layout);
    auto it = table.find(code);
    if (it == table.end()) return std::nullopt;
    return it->second;
}

KeyClass KeyMap::classify(KeyCode code, const std::string& layout) const {
    if (isBackspace(code)) return KeyClass::Backspace;
    if (isModifier(code)) return KeyClass::Modifier;
    if (isWhitespaceKey(code)) return KeyClass::Boundary;
    if (auto ch = character(code, layout)) {
        return isLetterText(*ch) ? KeyClass::Letter : KeyClass::Boundary;
    }
    return KeyClass::Other;
}

std::string KeyMap::safeName(KeyCode code, const std::string& layout) const {
    if (!isWhitespaceKey(code) && character(code, layout)) {
        return "CHARACTER";
    }
    const char* name = libevdev_event_code_get_name(EV_KEY, static_cast<unsigned int>(code));
    if (name) return name;
    return "KEY_" + std::to_string(code);
}

}  // namespace tc::core
