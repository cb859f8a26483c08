#pragma once

#include <ragloop/core/types.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace ragloop::config {

// Flattened "section.key" -> raw value view of a TOML-style config file
using ConfigValues = std::map<std::string, std::string>;

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

// Quote handling
inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// Tilde expansion
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::filesystem::path(home) / path.substr(path.size() > 1 ? 2 : 1);
        }
    }
    return path;
}

// Non-empty environment variable, or nullopt
inline std::optional<std::string> env_value(const char* name) {
    if (const char* v = std::getenv(name); v && *v) {
        return std::string(v);
    }
    return std::nullopt;
}

// Strict scalar parsing; the whole (trimmed) string must be consumed
Result<long long> parse_integer(std::string_view raw);
Result<double> parse_double(std::string_view raw);
Result<bool> parse_bool(std::string_view raw);
Result<std::chrono::milliseconds> parse_ms(std::string_view raw);

// Parse a TOML-style file into "section.key" entries. Keys outside any section are
// stored bare. A missing file yields an empty map.
Result<ConfigValues> parse_config_file(const std::filesystem::path& config_path);

// Parse config text (same grammar as parse_config_file)
ConfigValues parse_config_text(std::string_view text);

/// Returns the user config directory
/// Unix: $XDG_CONFIG_HOME/ragloop or ~/.config/ragloop
std::filesystem::path get_config_dir();

// Get standard config path (override → RAGLOOP_CONFIG → config dir)
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace ragloop::config
