#pragma once

#include <plyfetch/transfer/transfer.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace plyfetch::config {

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
            if (path.size() == 1)
                return std::filesystem::path(home);
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// Unsigned integer parsing; nullopt on empty, signed, trailing garbage or overflow
inline std::optional<std::uint64_t> parse_uint(std::string_view s) {
    if (s.empty())
        return std::nullopt;
    std::uint64_t out = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    if (ec != std::errc{} || ptr != s.data() + s.size())
        return std::nullopt;
    return out;
}

inline std::optional<bool> parse_bool(std::string_view s) {
    if (s == "true" || s == "1" || s == "yes" || s == "on")
        return true;
    if (s == "false" || s == "0" || s == "no" || s == "off")
        return false;
    return std::nullopt;
}

// Parse a value from TOML config file
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Get standard config path
// Unix: $XDG_CONFIG_HOME/plyfetch/config.toml or ~/.config/plyfetch/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

/// Returns the user cache directory
/// Unix: $XDG_CACHE_HOME/plyfetch or ~/.cache/plyfetch
std::filesystem::path get_cache_dir();

/**
 * Effective client settings. Resolved once at the process edge and handed to the library
 * explicitly.
 */
struct ClientConfig {
    std::filesystem::path configPath; // file that was consulted (may not exist)
    transfer::ServerConfig server{};
    transfer::TransferOptions transfer{};
    transfer::CacheConfig cache{};
    bool cacheEnabled{true};
};

/**
 * Resolve settings as env -> config file -> defaults.
 *   PLYFETCH_CONFIG     config file (unless override_path is given)
 *   PLYFETCH_SERVER     [server] base_url
 *   PLYFETCH_CACHE_DIR  [cache] dir
 * Malformed values are logged and ignored.
 */
ClientConfig load_client_config(const std::string& override_path = "");

} // namespace plyfetch::config
