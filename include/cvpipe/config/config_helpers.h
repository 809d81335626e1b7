#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <cvpipe/core/types.h>

namespace cvpipe::config {

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
            if (path.size() == 1) {
                return std::filesystem::path(home);
            }
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

/// section -> key -> raw (unquoted) value; top-level keys live under ""
using ConfigSections = std::map<std::string, std::map<std::string, std::string>>;

// Parse a whole TOML-subset file: [section] headers, key = value, # comments.
// Dotted keys ("pipeline.workers") outside a section are filed under their prefix.
Result<ConfigSections> parse_config_file(const std::filesystem::path& config_path);

// Parse a value from TOML config file
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Parse a comma- or TOML-array-separated list of strings.
// Accepts forms like "a,b" or ["a", "b"].
std::vector<std::string> parse_string_list(const std::string& raw);

// Parse true/false/yes/no/on/off/1/0
std::optional<bool> parse_bool(std::string value);

// Get standard config path
// Unix: $XDG_CONFIG_HOME/cvpipe/config.toml or ~/.config/cvpipe/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace cvpipe::config
