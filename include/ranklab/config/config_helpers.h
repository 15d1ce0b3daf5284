#pragma once

#include <ranklab/core/types.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>

namespace ranklab::config {

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

// Flattened "section.key" -> unquoted value
using ConfigValues = std::map<std::string, std::string>;

/**
 * @brief Parse the TOML subset used by ranklab config files.
 *
 * Supports [section] headers, key = value pairs, quoted strings and # comments
 * (whole-line or trailing an unquoted value). Keys outside any section are
 * stored without a prefix. FileNotFound if the file cannot be opened,
 * ParseError for a line that is neither a header nor a key = value pair.
 */
Result<ConfigValues> parse_config_file(const std::filesystem::path& config_path);

// Typed value parsing; ConfigurationError names the offending key
Result<double> parse_double(const std::string& key, const std::string& value);
Result<int64_t> parse_int(const std::string& key, const std::string& value);

/// Returns the user config directory: $XDG_CONFIG_HOME/ranklab or ~/.config/ranklab
std::filesystem::path get_config_dir();

/**
 * @brief Resolve the config file location.
 *
 * override_path wins, then $RANKLAB_CONFIG, then get_config_dir()/config.toml.
 */
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace ranklab::config
