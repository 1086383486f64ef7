/*
 * plyfetch/src/cli/cmd_fetch.cpp
 *
 * `plyfetch fetch <job-id>`: resolve, fetch and reassemble one artifact, serving fresh cache hits
 * without network access.
 * - Settings come from load_client_config(); flags override them for this run.
 * - Expired cache entries are cleaned up before the transfer starts.
 * - Without -o the artifact is materialized in the cache and its path is printed, so -o is
 *   required whenever the cache is off (--no-cache or [cache] enabled = false).
 * - Ctrl-C cancels the transfer; no partial artifact is left behind.
 * - --json prints a single result object to stdout; logs stay on stderr.
 */

#include <plyfetch/cli/commands.h>
#include <plyfetch/config/config_helpers.h>
#include <plyfetch/transfer/transfer.hpp>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <optional>
#include <string>

#include <unistd.h>

using json = nlohmann::json;

namespace plyfetch::cli {

namespace {

std::atomic<bool> g_interrupted{false};

void onInterrupt(int) {
    g_interrupted.store(true);
}

struct FetchOpts {
    std::string jobId;
    std::optional<std::string> server;
    std::optional<int> concurrency;
    std::optional<int> retries;
    std::optional<int> chunkTimeoutMs;
    std::optional<std::int64_t> sessionTimeoutMs;
    std::optional<std::string> output;
    bool noCache{false};
    bool refresh{false};
    bool emitJson{false};
};

std::string humanBytes(std::uint64_t bytes) {
    constexpr double kMiB = 1024.0 * 1024.0;
    if (bytes >= 1024ull * 1024ull)
        return fmt::format("{:.2f} MiB", static_cast<double>(bytes) / kMiB);
    if (bytes >= 1024ull)
        return fmt::format("{:.1f} KiB", static_cast<double>(bytes) / 1024.0);
    return fmt::format("{} B", bytes);
}

json errorJson(const std::string& jobId, const transfer::Error& err) {
    json j = {{"job_id", jobId},
              {"success", false},
              {"error", {{"code", transfer::errorCodeName(err.code)}, {"message", err.message}}}};
    if (err.chunkIndex)
        j["error"]["chunk_index"] = *err.chunkIndex;
    if (err.attempts)
        j["error"]["attempts"] = *err.attempts;
    return j;
}

json resultJson(const transfer::Artifact& a) {
    return json{{"job_id", a.jobId},
                {"success", true},
                {"size_bytes", a.sizeBytes},
                {"sha256", a.sha256},
                {"path", a.path.string()},
                {"from_cache", a.fromCache},
                {"chunks", a.report ? a.report->manifest.chunkCount : 0u},
                {"retries", a.report ? a.report->retries : 0u},
                {"elapsed_ms", a.elapsed.count()}};
}

void runFetch(const FetchOpts& opts, GlobalOptions& globals) {
    applyLogLevel(globals);
    auto cfg = config::load_client_config(globals.configPath);

    if (opts.server)
        cfg.server.baseUrl = *opts.server;
    if (opts.concurrency)
        cfg.transfer.concurrency = *opts.concurrency;
    if (opts.retries)
        cfg.transfer.retry.maxRetries = static_cast<std::uint32_t>(*opts.retries);
    if (opts.chunkTimeoutMs)
        cfg.server.chunkTimeout = std::chrono::milliseconds(*opts.chunkTimeoutMs);
    if (opts.sessionTimeoutMs)
        cfg.transfer.sessionTimeout = std::chrono::milliseconds(*opts.sessionTimeoutMs);

    const bool useCache = cfg.cacheEnabled && !opts.noCache;
    if (!useCache && !opts.output) {
        // Without the cache a memory fetch has nowhere to put the bytes
        throw CLI::ValidationError("fetch", opts.noCache
                                                ? "--no-cache requires -o/--output"
                                                : "cache is disabled in " +
                                                      cfg.configPath.string() +
                                                      "; pass -o/--output");
    }
    std::shared_ptr<transfer::ICacheManager> cache;
    if (useCache) {
        cache = transfer::makeCacheManager(cfg.cache);
        auto removed = cache->cleanupExpired();
        if (!removed.ok()) {
            spdlog::warn("Cache cleanup failed: {}", removed.error().message);
        }
        if (auto st = cache->stats(); st.ok()) {
            spdlog::info("Cache {}: {} entries, {}", cfg.cache.directory.string(),
                         st.value().fileCount, humanBytes(st.value().totalBytes));
        }
    }

    std::shared_ptr<transfer::IHttpAdapter> http = transfer::makeCurlHttpAdapter();
    auto fetcher = transfer::makeArtifactFetcherWithDependencies(
        transfer::makeManifestClient(cfg.server, http), transfer::makeChunkFetcher(cfg.server, http),
        cache);

    transfer::ArtifactRequest req;
    req.jobId = opts.jobId;
    req.useCache = useCache;
    req.refresh = opts.refresh;
    req.options = cfg.transfer;
    if (opts.output) {
        req.destination = transfer::Destination::File;
        req.outputPath = *opts.output;
    }

    const bool showProgress = !opts.emitJson && !globals.quiet && ::isatty(STDERR_FILENO);
    transfer::ProgressCallback onProgress;
    if (showProgress) {
        onProgress = [](const transfer::ProgressEvent& ev) {
            if (ev.stage != transfer::ProgressStage::Fetching || ev.chunkCount == 0)
                return;
            fmt::print(stderr, "\r  chunk {}/{}  {} / {}", ev.chunksDone, ev.chunkCount,
                       humanBytes(ev.bytesDone), humanBytes(ev.totalBytes));
            if (ev.chunksDone == ev.chunkCount)
                fmt::print(stderr, "\n");
            std::fflush(stderr);
        };
    }

    g_interrupted.store(false);
    auto previous = std::signal(SIGINT, onInterrupt);
    auto result = fetcher->fetch(req, onProgress, [] { return g_interrupted.load(); });
    std::signal(SIGINT, previous == SIG_ERR ? SIG_DFL : previous);

    if (!result.ok()) {
        const auto& err = result.error();
        if (opts.emitJson) {
            fmt::print("{}\n", errorJson(opts.jobId, err).dump());
        }
        spdlog::error("{} ({})", err.message, transfer::errorCodeName(err.code));
        globals.exitCode = kExitFailure;
        return;
    }

    const auto& artifact = result.value();
    if (opts.emitJson) {
        fmt::print("{}\n", resultJson(artifact).dump());
    } else {
        fmt::print("{} {} ({})\n", artifact.fromCache ? "Cached" : "Fetched", artifact.jobId,
                   humanBytes(artifact.sizeBytes));
        if (!artifact.path.empty())
            fmt::print("  path:    {}\n", artifact.path.string());
        fmt::print("  sha256:  {}\n", artifact.sha256);
        if (artifact.report) {
            fmt::print("  chunks:  {} ({} retries)\n", artifact.report->manifest.chunkCount,
                       artifact.report->retries);
        }
        fmt::print("  elapsed: {} ms\n", artifact.elapsed.count());
    }
    globals.exitCode = kExitOk;
}

} // namespace

void registerFetchCommand(CLI::App& app, std::shared_ptr<GlobalOptions> globals) {
    auto* sub = app.add_subcommand("fetch", "Fetch an artifact by job id (cache first)");
    auto opts = std::make_shared<FetchOpts>();

    sub->add_option("job-id", opts->jobId, "Job identifier")->required()->check(CLI::NonEmpty());
    sub->add_option("--server", opts->server,
                    "Server base URL (default: $PLYFETCH_SERVER or [server] base_url)");
    sub->add_option("-c,--concurrency", opts->concurrency, "Parallel chunk fetches (default 8)")
        ->check(CLI::Range(1, 64));
    sub->add_option("--retries", opts->retries, "Attempts per chunk (default 3)")
        ->check(CLI::Range(1, 20));
    sub->add_option("--timeout-ms", opts->chunkTimeoutMs, "Per-chunk timeout in ms (default 30000)")
        ->check(CLI::Range(100, 3600 * 1000));
    sub->add_option("--session-timeout-ms", opts->sessionTimeoutMs,
                    "Whole-transfer timeout in ms (default: none)")
        ->check(CLI::Range(std::int64_t{0}, std::int64_t{24} * 3600 * 1000));
    sub->add_option("-o,--output", opts->output, "Write the artifact to this file");
    sub->add_flag("--no-cache", opts->noCache, "Bypass the local cache entirely");
    sub->add_flag("--refresh", opts->refresh, "Ignore a fresh cache entry and re-fetch");
    sub->add_flag("--json", opts->emitJson, "Emit the result as JSON on stdout");

    sub->callback([opts, globals]() { runFetch(*opts, *globals); });
}

} // namespace plyfetch::cli
