#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <dockhand/core/types.h>

namespace dockhand::config {

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

/// Looks up a variable by name. Production code reads the process environment;
/// tests substitute a map.
using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;

/// EnvLookup backed by std::getenv. Unset and empty variables both read as absent.
EnvLookup processEnvironment();

// Parse a value from TOML config file ("[section] key = value" or "section.key = value")
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Parse a comma- or TOML-array-separated list. Accepts "a,b" or ["a", "b"].
std::vector<std::string> parse_list(const std::string& raw);

// Parse a byte size such as "1G", "512m", "1024" (binary multiples)
Result<std::uint64_t> parse_byte_size(std::string_view raw);

// Get standard config path: $XDG_CONFIG_HOME/dockhand/config.toml or ~/.config/dockhand/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace dockhand::config
