#include "typing_coach/config_loader.hpp"

// Use the system package include path
#define TOML_EXCEPTIONS 1
#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <libevdev/libevdev.h>

#include "typing_coach/errors.hpp"
#include "typing_coach/key_map.hpp"
#include "typing_coach/privacy_filter.hpp"
#include "typing_coach/word_list.hpp"

namespace tc::core {

namespace {

std::string trim(const std::string& input) {
    auto begin = std::find_if_not(input.begin(), input.end(), [](unsigned char ch) {
        return std::isspace(ch) != 0;
    });
    auto end = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char ch) {
        return std::isspace(ch) != 0;
    }).base();
    if (begin >= end) {
        return {};
    }
    return std::string(begin, end);
}

std::string qualified(const char* section, const char* key) {
    return std::string(section) + "." + key;
}

std::optional<std::int64_t> readInt(const toml::table* section, const char* section_name, const char* key) {
    if (!section) return std::nullopt;
    const toml::node* node = section->get(key);
    if (!node) return std::nullopt;
    if (!node->is_integer()) {
        throw ConfigError(qualified(section_name, key) + " must be an integer");
    }
    return node->value<std::int64_t>();
}

// For fields stored as int; a wider TOML value must not wrap on the way in.
std::optional<int> readSmallInt(const toml::table* section, const char* section_name, const char* key) {
    auto value = readInt(section, section_name, key);
    if (!value) return std::nullopt;
    if (*value < std::numeric_limits<int>::min() || *value > std::numeric_limits<int>::max()) {
        throw ConfigError(qualified(section_name, key) + " is out of range: " + std::to_string(*value));
    }
    return static_cast<int>(*value);
}

std::optional<bool> readBool(const toml::table* section, const char* section_name, const char* key) {
    if (!section) return std::nullopt;
    const toml::node* node = section->get(key);
    if (!node) return std::nullopt;
    if (!node->is_boolean()) {
        throw ConfigError(qualified(section_name, key) + " must be true or false");
    }
    return node->value<bool>();
}

std::optional<std::string> readString(const toml::table* section, const char* section_name, const char* key) {
    if (!section) return std::nullopt;
    const toml::node* node = section->get(key);
    if (!node) return std::nullopt;
    if (!node->is_string()) {
        throw ConfigError(qualified(section_name, key) + " must be a string");
    }
    return node->value<std::string>();
}

std::vector<std::string> readStringArray(const toml::table* section, const char* section_name, const char* key) {
    std::vector<std::string> out;
    if (!section) return out;
    const toml::node* node = section->get(key);
    if (!node) return out;
    const toml::array* arr = node->as_array();
    if (!arr) {
        throw ConfigError(qualified(section_name, key) + " must be an array of strings");
    }
    for (const auto& elem : *arr) {
        auto value = elem.value<std::string>();
        if (!value) {
            throw ConfigError(qualified(section_name, key) + " must be an array of strings");
        }
        out.push_back(*value);
    }
    return out;
}

DurationMethod parseDurationMethod(const std::string& text) {
    if (text == "total_time") return DurationMethod::TotalTime;
    if (text == "active_time") return DurationMethod::ActiveTime;
    throw ConfigError("burst.duration_method must be total_time or active_time, got " + text);
}

int parseKeycodeToken(const std::string& raw) {
    std::string token = trim(raw);
    if (token.empty()) {
        throw ConfigError("empty keycode token");
    }
    std::string upper;
    upper.reserve(token.size());
    for (char ch : token) {
        upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(ch))));
    }
    if (upper.rfind("KEY_", 0) == 0) {
        int code = libevdev_event_code_from_name(EV_KEY, upper.c_str());
        if (code >= 0) return code;
        throw ConfigError("unknown keycode name: " + token);
    }
    try {
        return std::stoi(token);
    } catch (const std::exception&) {
        throw ConfigError("invalid keycode token: " + token);
    }
}

// Rows of "KEY_NAME, character"; '#' starts a comment.
KeyMap::CharTable readKeymapCsv(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("failed to open keymap file: " + path.string());
    }

    KeyMap::CharTable table;
    std::string line;
    std::size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        auto comma = line.find(',');
        if (comma == std::string::npos) {
            throw ConfigError("keymap " + path.string() + " line " + std::to_string(line_no) +
                              " needs KEY_NAME, character");
        }
        const int code = parseKeycodeToken(line.substr(0, comma));
        std::string character = trim(line.substr(comma + 1));
        if (character.empty()) {
            throw ConfigError("keymap " + path.string() + " line " + std::to_string(line_no) +
                              " has no character");
        }
        table[code] = std::move(character);
    }
    if (table.empty()) {
        throw ConfigError("keymap file is empty: " + path.string());
    }
    return table;
}

EngineConfig buildConfig(const toml::table& tbl, const std::filesystem::path& root_dir) {
    EngineConfig config;

    const toml::table* burst = tbl["burst"].as_table();
    if (!burst) throw ConfigError("missing [burst] section");
    config.burst.burst_timeout_ms = readInt(burst, "burst", "burst_timeout_ms");
    if (auto method = readString(burst, "burst", "duration_method")) {
        config.burst.duration_method = parseDurationMethod(*method);
    }
    if (auto v = readInt(burst, "burst", "active_time_threshold_ms")) config.burst.active_time_threshold_ms = *v;
    if (auto v = readSmallInt(burst, "burst", "min_key_count")) config.burst.min_key_count = *v;
    if (auto v = readInt(burst, "burst", "min_duration_ms")) config.burst.min_duration_ms = *v;
    if (auto v = readInt(burst, "burst", "high_score_min_duration_ms")) config.burst.high_score_min_duration_ms = *v;

    const toml::table* words = tbl["words"].as_table();
    if (auto v = readInt(words, "words", "boundary_timeout_ms")) config.words.boundary_timeout_ms = *v;
    if (auto v = readInt(words, "words", "min_word_length")) {
        if (*v < 1) throw ConfigError("words.min_word_length must be at least 1");
        config.words.min_word_length = static_cast<std::size_t>(*v);
    }
    if (auto v = readInt(words, "words", "max_correction_window_ms")) config.words.max_correction_window_ms = *v;
    if (auto v = readInt(words, "words", "active_time_threshold_ms")) config.words.active_time_threshold_ms = *v;
    if (auto v = readBool(words, "words", "store_hashes")) config.words.store_hashes = *v;
    if (auto file = readString(words, "words", "dictionary")) {
        config.words.dictionary = std::make_shared<const WordList>(WordList::fromFile((root_dir / *file).string()));
    }

    const toml::table* stats = tbl["stats"].as_table();
    if (auto v = readSmallInt(stats, "stats", "min_samples")) config.stats.min_samples = *v;

    const toml::table* privacy = tbl["privacy"].as_table();
    if (!privacy) throw ConfigError("missing [privacy] section");
    config.privacy.pepper_hex = readString(privacy, "privacy", "pepper_hex").value_or("");
    config.privacy.user_key_hex = readString(privacy, "privacy", "user_key_hex").value_or("");
    config.privacy.ignored_hashes = readStringArray(privacy, "privacy", "ignored_hashes");
    if (auto file = readString(privacy, "privacy", "ignored_words_file")) {
        const auto path = root_dir / *file;
        config.privacy.ignored_words_file = path.string();
        for (auto& hash : readIgnoredHashFile(path.string())) {
            config.privacy.ignored_hashes.push_back(std::move(hash));
        }
    }

    const toml::table* listener = tbl["listener"].as_table();
    config.listener.device_paths = readStringArray(listener, "listener", "device_paths");
    if (auto v = readInt(listener, "listener", "visible_timeout_ms")) {
        config.listener.visible_timeout = std::chrono::milliseconds(*v);
    }
    if (auto v = readInt(listener, "listener", "queue_capacity")) {
        if (*v <= 0) throw ConfigError("listener.queue_capacity must be positive");
        config.listener.queue_capacity = static_cast<std::size_t>(*v);
    }
    if (auto v = readInt(listener, "listener", "flush_interval_ms")) {
        config.listener.flush_interval = std::chrono::milliseconds(*v);
    }

    const toml::table* layout = tbl["layout"].as_table();
    if (auto v = readString(layout, "layout", "default")) config.layout.default_layout = *v;
    if (auto layouts = tbl["layouts"].as_table()) {
        for (auto&& [name, node] : *layouts) {
            const toml::table* entry = node.as_table();
            std::string id(name.str());
            if (!entry) throw ConfigError("[layouts." + id + "] must be a table");
            auto keymap = readString(entry, "layouts", "keymap");
            if (!keymap) throw ConfigError("[layouts." + id + "] needs a keymap path");
            config.layout.extra_layouts[id] = readKeymapCsv(root_dir / *keymap);
        }
    }

    const toml::table* logging = tbl["logging"].as_table();
    if (auto v = readString(logging, "logging", "level")) config.log_level = parseLogLevel(*v);

    config.validate();
    return config;
}

}  // namespace

EngineConfig ConfigLoader::loadFromFile(const std::string& path) const {
    const auto file_path = std::filesystem::absolute(path);
    toml::table tbl;
    try {
        tbl = toml::parse_file(path);
    } catch (const toml::parse_error& err) {
        std::ostringstream oss;
        oss << "TOML parse error in " << path << ": " << err.description() << " (" << err.source().begin << ")";
        throw ConfigError(oss.str());
    }
    return buildConfig(tbl, file_path.parent_path());
}

EngineConfig ConfigLoader::loadFromString(const std::string& text, const std::string& base_dir) const {
    toml::table tbl;
    try {
        tbl = toml::parse(text);
    } catch (const toml::parse_error& err) {
        throw ConfigError("TOML parse error: " + std::string(err.description()));
    }
    return buildConfig(tbl, std::filesystem::path(base_dir));
}

}  // namespace tc::core
