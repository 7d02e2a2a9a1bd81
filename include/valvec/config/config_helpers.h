#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace valvec::config {

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

inline std::string to_lower(std::string_view in) {
    std::string out(in);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// "1", "true", "on", "yes" (any case) are truthy; anything else is not
inline bool is_truthy(std::string_view value) {
    auto v = to_lower(value);
    return v == "1" || v == "true" || v == "on" || v == "yes";
}

// Time parsing
inline std::optional<std::chrono::milliseconds> parse_ms(std::string_view s) {
    try {
        std::size_t consumed = 0;
        std::string str(s);
        auto v = std::stoll(str, &consumed);
        if (consumed != str.size() || v < 0) {
            return std::nullopt;
        }
        return std::chrono::milliseconds(v);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// Non-empty environment variable value, if set
inline std::optional<std::string> env_value(const char* name) {
    if (const char* v = std::getenv(name); v && *v) {
        return std::string(v);
    }
    return std::nullopt;
}

// Parse a value from TOML config file.
// Supports both "[section] key = v" and "section.key = v" forms.
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Get standard config path
// VALVEC_CONFIG env → $XDG_CONFIG_HOME/valvec/config.toml → ~/.config/valvec/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace valvec::config
