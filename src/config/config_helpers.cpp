#include <fstream>
#include <plyfetch/config/config_helpers.h>

#include <spdlog/spdlog.h>

namespace plyfetch::config {

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return "";
    }

    std::string line;
    std::string currentSection;
    bool in_target_section = section.empty();

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
                in_target_section = (section.empty() || currentSection == section);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos)
            continue;

        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Remove inline comments outside quotes
        if (!v.empty() && (v.front() == '"' || v.front() == '\'')) {
            size_t close = v.find(v.front(), 1);
            if (close != std::string::npos)
                v.resize(close + 1);
        } else if (!v.empty()) {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        }

        // Support both "server.base_url" and "[server] base_url"
        if ((in_target_section && k == key) || (!section.empty() && k == section + "." + key)) {
            return unquote(v);
        }
    }

    return "";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return std::filesystem::path(override_path);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "plyfetch" / "config.toml";
    }

    return configHome / "plyfetch" / "config.toml";
}

std::filesystem::path get_cache_dir() {
    if (const char* xdg = std::getenv("XDG_CACHE_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "plyfetch";
    }
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home) / ".cache" / "plyfetch";
    }
    return std::filesystem::current_path() / "cache";
}

namespace {

// Reads an unsigned setting; a present but malformed value keeps the default.
std::optional<std::uint64_t> read_uint(const std::filesystem::path& path, const char* section,
                                       const char* key) {
    const auto raw = parse_config_value(path, section, key);
    if (raw.empty())
        return std::nullopt;
    auto v = parse_uint(raw);
    if (!v) {
        spdlog::warn("Ignoring invalid {}.{} = '{}' in {}", section, key, raw, path.string());
    }
    return v;
}

std::optional<std::chrono::milliseconds> read_ms(const std::filesystem::path& path,
                                                 const char* section, const char* key) {
    if (auto v = read_uint(path, section, key))
        return std::chrono::milliseconds(static_cast<std::int64_t>(*v));
    return std::nullopt;
}

} // namespace

ClientConfig load_client_config(const std::string& override_path) {
    ClientConfig cfg;

    // 1) config file location: explicit override, PLYFETCH_CONFIG, then XDG default
    if (!override_path.empty()) {
        cfg.configPath = get_config_path(override_path);
    } else if (const char* env = std::getenv("PLYFETCH_CONFIG"); env && *env) {
        cfg.configPath = std::filesystem::path(env);
    } else {
        cfg.configPath = get_config_path();
    }
    cfg.cache.directory = get_cache_dir() / "ply";

    std::error_code ec;
    const bool haveFile = std::filesystem::exists(cfg.configPath, ec);
    if (haveFile) {
        spdlog::debug("Loading config from {}", cfg.configPath.string());
        const auto& p = cfg.configPath;

        // [server]
        if (auto v = parse_config_value(p, "server", "base_url"); !v.empty())
            cfg.server.baseUrl = v;
        if (auto v = read_ms(p, "server", "manifest_timeout_ms"))
            cfg.server.manifestTimeout = *v;
        if (auto v = read_ms(p, "server", "chunk_timeout_ms"))
            cfg.server.chunkTimeout = *v;

        // [transfer]
        if (auto v = read_uint(p, "transfer", "concurrency")) {
            if (*v > 0 && *v <= 256)
                cfg.transfer.concurrency = static_cast<int>(*v);
            else
                spdlog::warn("Ignoring transfer.concurrency = {} (allowed 1..256)", *v);
        }
        if (auto v = read_uint(p, "transfer", "max_retries")) {
            if (*v > 0 && *v <= 100)
                cfg.transfer.retry.maxRetries = static_cast<std::uint32_t>(*v);
            else
                spdlog::warn("Ignoring transfer.max_retries = {} (allowed 1..100)", *v);
        }
        if (auto v = read_ms(p, "transfer", "initial_backoff_ms"))
            cfg.transfer.retry.initialBackoff = *v;
        if (auto v = read_ms(p, "transfer", "max_backoff_ms"))
            cfg.transfer.retry.maxBackoff = *v;
        if (auto v = read_ms(p, "transfer", "session_timeout_ms"))
            cfg.transfer.sessionTimeout = *v;

        // [cache]
        if (auto v = parse_config_value(p, "cache", "dir"); !v.empty())
            cfg.cache.directory = expand_tilde(v);
        if (auto v = read_uint(p, "cache", "ttl_seconds"))
            cfg.cache.ttl = std::chrono::seconds(static_cast<std::int64_t>(*v));
        if (auto raw = parse_config_value(p, "cache", "enabled"); !raw.empty()) {
            if (auto b = parse_bool(raw)) {
                cfg.cacheEnabled = *b;
            } else {
                spdlog::warn("Ignoring invalid cache.enabled = '{}' in {}", raw, p.string());
            }
        }
    }

    // 2) environment wins over the file
    if (const char* env = std::getenv("PLYFETCH_SERVER"); env && *env) {
        cfg.server.baseUrl = env;
    }
    if (const char* env = std::getenv("PLYFETCH_CACHE_DIR"); env && *env) {
        cfg.cache.directory = expand_tilde(env);
    }

    return cfg;
}

} // namespace plyfetch::config
