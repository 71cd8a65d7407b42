#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace coderag::config {

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

// Tilde expansion
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (path == "~" || path.rfind("~/", 0) == 0) {
        if (const char* home = std::getenv("HOME")) {
            return path.size() <= 2 ? std::filesystem::path(home)
                                    : std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// Non-empty value of an environment variable
inline std::optional<std::string> env_value(const char* name) {
    if (const char* v = std::getenv(name); v && *v) {
        return std::string(v);
    }
    return std::nullopt;
}

/// Returns the user config directory: $XDG_CONFIG_HOME/coderag or ~/.config/coderag
std::filesystem::path get_config_dir();

/// Returns the user data directory (snapshots): $XDG_DATA_HOME/coderag or ~/.local/share/coderag
std::filesystem::path get_data_dir();

// Config file location; an explicit override wins, then CODERAG_CONFIG, then get_config_dir()
std::filesystem::path get_config_path(const std::string& override_path = "");

// CODERAG_DATA_DIR, else get_data_dir()
std::filesystem::path resolve_data_dir();

} // namespace coderag::config
