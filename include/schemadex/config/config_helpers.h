#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>

namespace schemadex::config {

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

// "~" and "~/x" expand against $HOME
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            if (path.size() == 1)
                return std::filesystem::path(home);
            if (path[1] == '/')
                return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// Non-empty environment value
inline std::optional<std::string> env_value(const char* name) {
    if (const char* v = std::getenv(name); v && *v)
        return std::string(v);
    return std::nullopt;
}

// Parse a value from TOML config file; empty when absent
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Explicit override, else <config dir>/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

/// $XDG_CONFIG_HOME/schemadex or ~/.config/schemadex
std::filesystem::path get_config_dir();

/// $SCHEMADEX_CACHE_DIR, else $XDG_CACHE_HOME/schemadex or ~/.cache/schemadex
std::filesystem::path get_cache_dir();

} // namespace schemadex::config
