#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace engram::config {

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
            return std::filesystem::path(home) / (path.size() > 2 ? path.substr(2) : "");
        }
    }
    return path;
}

// Non-empty environment variable, if set
inline std::optional<std::string> env_value(const char* name) {
    if (const char* v = std::getenv(name); v && *v) {
        return std::string(v);
    }
    return std::nullopt;
}

// Flat view of a TOML config file: "section.key" -> unquoted value. Missing file gives an
// empty map.
std::map<std::string, std::string> parse_config_flat(const std::filesystem::path& config_path);

// Resolve config file path: explicit override, ENGRAM_CONFIG, then XDG location
std::filesystem::path get_config_path(const std::string& override_path = "");

// Resolve the default data directory ($XDG_DATA_HOME/engram or ~/.local/share/engram)
std::filesystem::path get_data_dir();

// Lenient scalar parsing; nullopt on malformed input
std::optional<double> parse_double(std::string_view s);
std::optional<long long> parse_int(std::string_view s);
std::optional<bool> parse_bool(std::string_view s);

} // namespace engram::config
