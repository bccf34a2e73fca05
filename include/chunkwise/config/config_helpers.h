#pragma once

#include <chunkwise/chunking/chunk_types.h>
#include <chunkwise/core/types.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>

namespace chunkwise::config {

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

// Parse a value from TOML config file; empty when the file, section or key is missing
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Get standard config path
std::filesystem::path get_config_path(const std::string& override_path = "");

/**
 * Resolve the chunking configuration.
 * Precedence: CHUNKWISE_* environment > [chunking] section of config_path > defaults.
 * A missing file is not an error. An overlap that is not configured follows the chunk size
 * (see defaultOverlapFor). Malformed numbers yield ParseError, and the merged result is
 * validated.
 */
Result<chunking::ChunkConfig> load_chunk_config(const std::filesystem::path& config_path);

// Parse a non-negative decimal integer; rejects signs, blanks and trailing garbage
Result<size_t> parse_size(const std::string& raw, const std::string& what);

} // namespace chunkwise::config
