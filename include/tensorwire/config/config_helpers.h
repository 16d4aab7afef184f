#pragma once

#include <tensorwire/codec/codec_options.h>

#include <spdlog/common.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace tensorwire::config {

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
            return std::filesystem::path(home) / path.substr(path.size() > 1 ? 2 : 1);
        }
    }
    return path;
}

// Parse a value from TOML config file. Accepts "[section] key = v" and "section.key = v".
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Get standard config path: override, then $TENSORWIRE_CONFIG, then XDG. A leading '~'
// in the first two is expanded against $HOME.
std::filesystem::path get_config_path(const std::string& override_path = "");

// "edge" / "edge_replicate" / "pad" and "reject" / "strict"
std::optional<codec::PaddingPolicy> parse_padding_policy(std::string_view value);

// trace, debug, info, warn|warning, error|err, critical|crit, off|none|silent
std::optional<spdlog::level::level_enum> parse_log_level(std::string_view value);

/**
 * @brief Resolve codec options (env -> config file -> defaults)
 *
 * Env: TENSORWIRE_PADDING_POLICY, TENSORWIRE_SAMPLE_TYPE.
 * Config: [decode] padding, [assemble] sample_type.
 * Unrecognised values are ignored with a warning.
 */
codec::CodecOptions resolve_codec_options_from_config(const std::string& override_path = "");

/**
 * @brief Apply the log level (env TENSORWIRE_LOG_LEVEL -> [logging] level)
 * @return The level now in effect
 */
spdlog::level::level_enum apply_log_level_from_env(const std::string& override_path = "");

} // namespace tensorwire::config
