/*
 * plyfetch/src/cli/cmd_cache.cpp
 *
 * `plyfetch cache <stats|cleanup|check|remove>`: inspect and maintain the local artifact cache.
 */

#include <plyfetch/cli/commands.h>
#include <plyfetch/config/config_helpers.h>
#include <plyfetch/transfer/transfer.hpp>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>

#include <chrono>
#include <ctime>
#include <memory>
#include <string>

using json = nlohmann::json;

namespace plyfetch::cli {

namespace {

struct CacheOpts {
    std::string key;
    bool emitJson{false};
};

std::unique_ptr<transfer::ICacheManager> openCache(const GlobalOptions& globals) {
    applyLogLevel(globals);
    auto cfg = config::load_client_config(globals.configPath);
    return transfer::makeCacheManager(cfg.cache);
}

std::string formatTime(std::chrono::system_clock::time_point tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

int fail(const transfer::Error& err) {
    spdlog::error("{} ({})", err.message, transfer::errorCodeName(err.code));
    return kExitFailure;
}

void runStats(const CacheOpts& opts, GlobalOptions& globals) {
    auto cache = openCache(globals);
    auto st = cache->stats();
    if (!st.ok()) {
        globals.exitCode = fail(st.error());
        return;
    }
    const auto& s = st.value();
    if (opts.emitJson) {
        fmt::print("{}\n", json{{"directory", cache->config().directory.string()},
                                {"file_count", s.fileCount},
                                {"total_bytes", s.totalBytes},
                                {"expired_count", s.expiredCount},
                                {"ttl_seconds", cache->config().ttl.count()}}
                               .dump());
    } else {
        fmt::print("Cache directory: {}\n", cache->config().directory.string());
        fmt::print("  entries: {} ({} expired)\n", s.fileCount, s.expiredCount);
        fmt::print("  size:    {:.2f} MiB\n",
                   static_cast<double>(s.totalBytes) / (1024.0 * 1024.0));
        fmt::print("  ttl:     {} s\n", cache->config().ttl.count());
    }
    globals.exitCode = kExitOk;
}

void runCleanup(GlobalOptions& globals) {
    auto cache = openCache(globals);
    auto removed = cache->cleanupExpired();
    if (!removed.ok()) {
        globals.exitCode = fail(removed.error());
        return;
    }
    fmt::print("Removed {} expired cache entr{}\n", removed.value(),
               removed.value() == 1 ? "y" : "ies");
    globals.exitCode = kExitOk;
}

void runCheck(const CacheOpts& opts, GlobalOptions& globals) {
    auto cache = openCache(globals);
    auto entry = cache->lookup(opts.key);
    if (!entry.ok()) {
        fmt::print("{}: not cached or expired\n", opts.key);
        globals.exitCode = entry.error().code == transfer::ErrorCode::NotFound
                               ? kExitFailure
                               : fail(entry.error());
        return;
    }
    const auto& e = entry.value();
    fmt::print("{}: fresh\n", e.key);
    fmt::print("  path:    {}\n", e.path.string());
    fmt::print("  size:    {} bytes\n", e.sizeBytes);
    fmt::print("  created: {}\n", formatTime(e.createdAt));
    fmt::print("  sha256:  {}\n", e.sha256);
    globals.exitCode = kExitOk;
}

void runRemove(const CacheOpts& opts, GlobalOptions& globals) {
    auto cache = openCache(globals);
    auto removed = cache->remove(opts.key);
    if (!removed.ok()) {
        globals.exitCode = fail(removed.error());
        return;
    }
    fmt::print("Removed {}\n", opts.key);
    globals.exitCode = kExitOk;
}

} // namespace

void registerCacheCommand(CLI::App& app, std::shared_ptr<GlobalOptions> globals) {
    auto* cmd = app.add_subcommand("cache", "Inspect and maintain the local artifact cache");
    cmd->require_subcommand(1);
    auto opts = std::make_shared<CacheOpts>();

    auto* stats = cmd->add_subcommand("stats", "Show entry count and total size");
    stats->add_flag("--json", opts->emitJson, "Emit JSON on stdout");
    stats->callback([opts, globals]() { runStats(*opts, *globals); });

    auto* cleanup = cmd->add_subcommand("cleanup", "Delete entries older than the ttl");
    cleanup->callback([globals]() { runCleanup(*globals); });

    auto* check = cmd->add_subcommand("check", "Report whether a key has a fresh entry");
    check->add_option("key", opts->key, "Cache key (job id)")->required();
    check->callback([opts, globals]() { runCheck(*opts, *globals); });

    auto* remove = cmd->add_subcommand("remove", "Delete the entry for a key");
    remove->add_option("key", opts->key, "Cache key (job id)")->required();
    remove->callback([opts, globals]() { runRemove(*opts, *globals); });
}

} // namespace plyfetch::cli
