#pragma once

#include <codectx/core/types.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>

namespace codectx::config {

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

// true/false/yes/no/on/off/1/0, case-insensitive
Result<bool> parse_bool(std::string_view raw);

// Signed decimal integer; surrounding whitespace and quotes are ignored
Result<int64_t> parse_int(std::string_view raw);

/**
 * @brief Read every key of a TOML-style file into a flat "section.key" -> value map.
 *
 * Values are unquoted and stripped of inline comments. Keys outside any section keep
 * their bare name.
 */
Result<std::map<std::string, std::string>>
parse_config_file(const std::filesystem::path& config_path);

/// Returns the user data directory
/// $XDG_DATA_HOME/codectx or ~/.local/share/codectx
std::filesystem::path get_data_dir();

} // namespace codectx::config
