#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>

namespace traitstream::config {

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

// Tilde expansion for "~" and "~/..."; "~user" forms are returned unchanged.
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    const char* home = std::getenv("HOME");
    if (!home) {
        return path;
    }
    if (path.size() == 1) {
        return std::filesystem::path(home);
    }
    if (path[1] == '/') {
        return std::filesystem::path(home) / path.substr(2);
    }
    return path;
}

// All "key = value" pairs of a TOML-style file, keyed "section.key". Keys outside any section
// are stored bare. Missing or unreadable files yield an empty map.
std::map<std::string, std::string> load_config_map(const std::filesystem::path& config_path);

// Parse a value from TOML config file
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Get standard config path: override, then TRAITSTREAM_CONFIG, then
// $XDG_CONFIG_HOME/traitstream/config.toml or ~/.config/traitstream/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace traitstream::config
