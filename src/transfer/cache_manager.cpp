/*
 * plyfetch/src/transfer/cache_manager.cpp
 *
 * Time-bounded artifact cache keyed by job identifier.
 *
 * Layout under CacheConfig::directory:
 *   <name><ext>             artifact bytes (read-only, 0444)
 *   <name><ext>.meta.json   {"key","path","size_bytes","created_at","last_access_at","sha256"}
 *   .staging/               in-progress writes, renamed into place only on full success
 *
 * - Freshness: now - createdAt <= ttl (clock injectable via CacheConfig::clock)
 * - Stale entries are invisible to isFresh/load/lookup but stay on disk until cleanupExpired()
 * - load() re-hashes the payload; a size or digest mismatch is reported as NotFound
 * - Readers hold the shared lock; publishing renames, remove and cleanup hold it exclusively
 * - cleanupExpired() deletes the payload before its sidecar; an entry whose payload cannot be
 *   deleted keeps its sidecar and is retried by the next pass
 */

#include <plyfetch/transfer/transfer.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace plyfetch::transfer {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr const char* kStagingDirName = ".staging";
constexpr const char* kMetaSuffix = ".meta.json";
constexpr std::size_t kKeyHashChars = 12;

std::int64_t toEpochMillis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point fromEpochMillis(std::int64_t ms) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::milliseconds(ms)));
}

bool isPlainKeyChar(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
           c == '.' || c == '_' || c == '-';
}

// Filesystem-safe entry name. Keys outside [A-Za-z0-9._-], or starting with '.', get a
// sanitized stem plus a digest suffix so distinct keys never share a name.
std::string entryNameFor(std::string_view key) {
    const bool plain = !key.empty() && key.front() != '.' &&
                       std::all_of(key.begin(), key.end(), isPlainKeyChar);
    if (plain)
        return std::string(key);

    std::string stem;
    stem.reserve(key.size());
    for (char c : key) {
        stem.push_back(isPlainKeyChar(c) ? c : '_');
    }
    while (!stem.empty() && stem.front() == '.')
        stem.erase(stem.begin());
    if (stem.size() > 64)
        stem.resize(64);

    const auto digest = sha256Hex(std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(key.data()), key.size()));
    return stem + "-" + digest.substr(0, kKeyHashChars);
}

Error cacheError(std::string message) {
    return Error{ErrorCode::CacheError, std::move(message)};
}

Error notFound(std::string_view key, std::string_view why) {
    return Error{ErrorCode::NotFound, "cache entry '" + std::string(key) + "' " + std::string(why)};
}

Expected<void> fsync_dir(const fs::path& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        return cacheError("open(O_DIRECTORY) failed for: " + dir.string());
    }
    if (::fsync(fd) != 0) {
        ::close(fd);
        return cacheError("fsync(dir) failed for: " + dir.string());
    }
    ::close(fd);
    return {};
}

// Create (truncate) path, write all bytes and fsync before closing.
Expected<void> writeDurable(const fs::path& path, const char* data, std::size_t size) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return cacheError("Failed to create " + path.string() + ": " + std::strerror(errno));
    }
    std::size_t remaining = size;
    while (remaining > 0) {
        ssize_t n = ::write(fd, data, remaining);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            const std::string reason = std::strerror(errno);
            ::close(fd);
            return cacheError("write failed on " + path.string() + ": " + reason);
        }
        data += n;
        remaining -= static_cast<std::size_t>(n);
    }
    if (::fsync(fd) != 0) {
        ::close(fd);
        return cacheError("fsync() failed for: " + path.string());
    }
    ::close(fd);
    return {};
}

Expected<void> fsyncFile(const fs::path& path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return cacheError("Failed to open " + path.string() + ": " + std::strerror(errno));
    }
    if (::fsync(fd) != 0) {
        ::close(fd);
        return cacheError("fsync() failed for: " + path.string());
    }
    ::close(fd);
    return {};
}

json toJson(const CacheEntry& e) {
    return json{{"key", e.key},
                {"path", e.path.string()},
                {"size_bytes", e.sizeBytes},
                {"created_at", toEpochMillis(e.createdAt)},
                {"last_access_at", toEpochMillis(e.lastAccessAt)},
                {"sha256", e.sha256}};
}

Expected<CacheEntry> readMeta(const fs::path& metaPath) {
    std::ifstream in(metaPath, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::NotFound, "no metadata at " + metaPath.string()};
    }
    const std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    auto j = json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) {
        return cacheError("metadata is not a JSON object: " + metaPath.string());
    }

    auto str = [&j](const char* name) -> const json* {
        auto it = j.find(name);
        return (it != j.end() && it->is_string()) ? &*it : nullptr;
    };
    auto num = [&j](const char* name) -> const json* {
        auto it = j.find(name);
        return (it != j.end() && it->is_number_integer()) ? &*it : nullptr;
    };

    const auto* key = str("key");
    const auto* path = str("path");
    const auto* sha = str("sha256");
    const auto* size = num("size_bytes");
    const auto* created = num("created_at");
    const auto* accessed = num("last_access_at");
    if (!key || !path || !sha || !size || !created || !accessed) {
        return cacheError("metadata is missing required fields: " + metaPath.string());
    }

    CacheEntry e;
    e.key = key->get<std::string>();
    e.path = path->get<std::string>();
    e.sha256 = sha->get<std::string>();
    e.sizeBytes = size->get<std::uint64_t>();
    e.createdAt = fromEpochMillis(created->get<std::int64_t>());
    e.lastAccessAt = fromEpochMillis(accessed->get<std::int64_t>());
    return e;
}

bool endsWith(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

} // namespace

class FileCacheManager final : public ICacheManager {
public:
    explicit FileCacheManager(CacheConfig config) : config_(std::move(config)) {}

    const CacheConfig& config() const noexcept override { return config_; }

    bool isFresh(std::string_view key) override {
        if (key.empty())
            return false;
        std::shared_lock lk(mutex_);
        auto entry = freshEntryLocked(key);
        return entry.ok();
    }

    Expected<CacheEntry> lookup(std::string_view key) override {
        if (key.empty()) {
            return Error{ErrorCode::InvalidArgument, "cache lookup: empty key"};
        }
        std::shared_lock lk(mutex_);
        auto entry = freshEntryLocked(key);
        if (!entry.ok())
            return entry;
        auto e = entry.value();
        touchLocked(e);
        return e;
    }

    fs::path entryPath(std::string_view key) const override {
        return dataPathFor(entryNameFor(key));
    }

    Expected<ByteVector> load(std::string_view key) override {
        if (key.empty()) {
            return Error{ErrorCode::InvalidArgument, "cache load: empty key"};
        }
        std::shared_lock lk(mutex_);
        auto entry = freshEntryLocked(key);
        if (!entry.ok())
            return entry.error();
        auto e = entry.value();

        std::ifstream in(e.path, std::ios::binary);
        if (!in) {
            return notFound(key, "payload is unreadable");
        }
        ByteVector bytes(static_cast<std::size_t>(e.sizeBytes));
        in.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        if (static_cast<std::uint64_t>(in.gcount()) != e.sizeBytes || in.peek() != std::ifstream::traits_type::eof()) {
            spdlog::warn("Cache entry {} has wrong size (expected {} bytes); ignoring it", key,
                         e.sizeBytes);
            return notFound(key, "is corrupted (size mismatch)");
        }
        if (sha256Hex(bytes) != e.sha256) {
            spdlog::warn("Cache entry {} failed SHA-256 verification; ignoring it", key);
            return notFound(key, "is corrupted (digest mismatch)");
        }

        touchLocked(e);
        spdlog::debug("Cache hit for {} ({} bytes)", key, e.sizeBytes);
        return bytes;
    }

    Expected<CacheEntry> store(std::string_view key, std::span<const std::byte> data) override {
        if (key.empty()) {
            return Error{ErrorCode::InvalidArgument, "cache store: empty key"};
        }
        auto staging = stagingPathFor(key, config_.extension);
        if (!staging.ok())
            return staging.error();

        auto written = writeDurable(staging.value(), reinterpret_cast<const char*>(data.data()),
                                    data.size());
        if (!written.ok()) {
            removeQuietly(staging.value());
            return written.error();
        }
        return commit(key, staging.value(), data.size(), sha256Hex(data));
    }

    Expected<CacheEntry> storeFile(std::string_view key, const fs::path& source) override {
        if (key.empty()) {
            return Error{ErrorCode::InvalidArgument, "cache store: empty key"};
        }
        std::error_code ec;
        if (!fs::is_regular_file(source, ec)) {
            return Error{ErrorCode::InvalidArgument,
                         "cache store: not a regular file: " + source.string()};
        }
        auto staging = stagingPathFor(key, config_.extension);
        if (!staging.ok())
            return staging.error();

        fs::copy_file(source, staging.value(), fs::copy_options::overwrite_existing, ec);
        if (ec) {
            removeQuietly(staging.value());
            return cacheError("Failed to copy " + source.string() + " into cache: " +
                              ec.message());
        }
        auto synced = fsyncFile(staging.value());
        if (!synced.ok()) {
            removeQuietly(staging.value());
            return synced.error();
        }
        const auto size = fs::file_size(staging.value(), ec);
        if (ec) {
            removeQuietly(staging.value());
            return cacheError("Failed to stat staged copy: " + ec.message());
        }
        auto digest = sha256HexOfFile(staging.value());
        if (!digest.ok()) {
            removeQuietly(staging.value());
            return cacheError(digest.error().message);
        }
        return commit(key, staging.value(), size, digest.value());
    }

    Expected<void> remove(std::string_view key) override {
        if (key.empty()) {
            return Error{ErrorCode::InvalidArgument, "cache remove: empty key"};
        }
        std::unique_lock lk(mutex_);
        const auto name = entryNameFor(key);
        std::error_code ec1, ec2;
        const bool hadMeta = fs::remove(metaPathFor(name), ec1);
        const bool hadData = fs::remove(dataPathFor(name), ec2);
        if (ec1 || ec2) {
            return cacheError("Failed to remove cache entry '" + std::string(key) +
                              "': " + (ec1 ? ec1 : ec2).message());
        }
        if (!hadMeta && !hadData) {
            return notFound(key, "does not exist");
        }
        spdlog::info("Removed cache entry {}", key);
        return {};
    }

    Expected<std::size_t> cleanupExpired() override {
        std::unique_lock lk(mutex_);
        std::error_code ec;
        if (!fs::exists(config_.directory, ec))
            return std::size_t{0};

        const auto now = currentTime();
        std::size_t removed = 0;
        std::size_t failed = 0;

        auto metas = listMetaFiles();
        if (!metas.ok())
            return metas.error();
        for (const auto& metaPath : metas.value()) {
            const auto fname = metaPath.filename().string();
            const fs::path dataPath =
                metaPath.parent_path() / fname.substr(0, fname.size() - std::strlen(kMetaSuffix));
            auto meta = readMeta(metaPath);
            if (!meta.ok()) {
                spdlog::warn("Removing unreadable cache metadata {}: {}", metaPath.string(),
                             meta.error().message);
                removeQuietly(metaPath);
                removeQuietly(dataPath);
                continue;
            }
            if (isFreshAt(meta.value(), now))
                continue;

            std::error_code rec;
            fs::remove(dataPath, rec);
            if (!rec)
                fs::remove(metaPath, rec);
            if (rec) {
                ++failed;
                spdlog::warn("Failed to delete expired cache entry {}: {}", meta.value().key,
                             rec.message());
                continue;
            }
            ++removed;
            spdlog::debug("Removed expired cache entry {}", meta.value().key);
        }

        removeOrphansLocked();

        if (removed > 0) {
            spdlog::info("Cleaned up {} expired cache entries", removed);
        }
        if (failed > 0) {
            spdlog::warn("{} expired cache entries could not be deleted", failed);
        }
        return removed;
    }

    Expected<CacheStats> stats() override {
        std::shared_lock lk(mutex_);
        CacheStats out;
        std::error_code ec;
        if (!fs::exists(config_.directory, ec))
            return out;

        const auto now = currentTime();
        auto metas = listMetaFiles();
        if (!metas.ok())
            return metas.error();
        for (const auto& metaPath : metas.value()) {
            auto meta = readMeta(metaPath);
            if (!meta.ok())
                continue;
            ++out.fileCount;
            out.totalBytes += meta.value().sizeBytes;
            if (!isFreshAt(meta.value(), now))
                ++out.expiredCount;
        }
        return out;
    }

private:
    std::chrono::system_clock::time_point currentTime() const {
        return config_.clock ? config_.clock() : std::chrono::system_clock::now();
    }

    bool isFreshAt(const CacheEntry& e, std::chrono::system_clock::time_point now) const {
        return now - e.createdAt <= config_.ttl;
    }

    fs::path dataPathFor(const std::string& name) const {
        return config_.directory / (name + config_.extension);
    }

    fs::path metaPathFor(const std::string& name) const {
        return config_.directory / (name + config_.extension + kMetaSuffix);
    }

    fs::path stagingDir() const { return config_.directory / kStagingDirName; }

    Expected<std::vector<fs::path>> listMetaFiles() const {
        std::vector<fs::path> out;
        std::error_code ec;
        fs::directory_iterator it(config_.directory, ec);
        if (ec) {
            return cacheError("Failed to scan cache directory " + config_.directory.string() +
                              ": " + ec.message());
        }
        for (const auto& dirent : it) {
            std::error_code tec;
            if (dirent.is_regular_file(tec) &&
                endsWith(dirent.path().filename().string(), kMetaSuffix)) {
                out.push_back(dirent.path());
            }
        }
        return out;
    }

    Expected<fs::path> stagingPathFor(std::string_view key, std::string_view suffix) {
        std::error_code ec;
        fs::create_directories(stagingDir(), ec);
        if (ec) {
            return cacheError("Failed to create cache staging dir: " + stagingDir().string() +
                              " (" + ec.message() + ")");
        }
        const auto seq = stagingSeq_.fetch_add(1, std::memory_order_relaxed);
        const auto now_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
                                std::chrono::steady_clock::now().time_since_epoch())
                                .count();
        return stagingDir() / (entryNameFor(key) + "." + std::to_string(::getpid()) + "." +
                               std::to_string(now_ns) + "." + std::to_string(seq) +
                               std::string(suffix) + ".tmp");
    }

    // Caller holds the lock (shared or exclusive).
    Expected<CacheEntry> freshEntryLocked(std::string_view key) const {
        const auto name = entryNameFor(key);
        auto meta = readMeta(metaPathFor(name));
        if (!meta.ok()) {
            if (meta.error().code != ErrorCode::NotFound) {
                spdlog::warn("Ignoring cache entry {}: {}", key, meta.error().message);
            }
            return notFound(key, "does not exist");
        }
        auto& e = meta.value();
        if (e.key != key) {
            return notFound(key, "does not exist (name collision)");
        }
        if (!isFreshAt(e, currentTime())) {
            return notFound(key, "is stale");
        }
        e.path = dataPathFor(name);
        std::error_code ec;
        const auto onDisk = fs::file_size(e.path, ec);
        if (ec || onDisk != e.sizeBytes) {
            return notFound(key, "payload is missing or truncated");
        }
        return e;
    }

    // Rewrites the sidecar with lastAccessAt = now; best effort.
    void touchLocked(CacheEntry& e) {
        e.lastAccessAt = currentTime();
        auto tmp = stagingPathFor(e.key, kMetaSuffix);
        if (!tmp.ok()) {
            spdlog::debug("Could not update access time for {}: {}", e.key, tmp.error().message);
            return;
        }
        const auto text = toJson(e).dump();
        auto written = writeDurable(tmp.value(), text.data(), text.size());
        std::error_code ec;
        if (written.ok())
            fs::rename(tmp.value(), metaPathFor(entryNameFor(e.key)), ec);
        if (!written.ok() || ec) {
            removeQuietly(tmp.value());
            spdlog::debug("Could not update access time for {}", e.key);
        }
    }

    Expected<CacheEntry> commit(std::string_view key, const fs::path& stagedData,
                                std::uint64_t size, std::string sha) {
        const auto name = entryNameFor(key);
        std::error_code ec;
        fs::permissions(stagedData,
                        fs::perms::owner_read | fs::perms::group_read | fs::perms::others_read,
                        fs::perm_options::replace, ec);
        if (ec) {
            spdlog::debug("Could not make cached payload read-only: {}", ec.message());
        }

        CacheEntry e;
        e.key = std::string(key);
        e.path = dataPathFor(name);
        e.sizeBytes = size;
        e.createdAt = currentTime();
        e.lastAccessAt = e.createdAt;
        e.sha256 = std::move(sha);

        auto stagedMeta = stagingPathFor(key, kMetaSuffix);
        if (!stagedMeta.ok()) {
            removeQuietly(stagedData);
            return stagedMeta.error();
        }
        const auto text = toJson(e).dump(2);
        auto written = writeDurable(stagedMeta.value(), text.data(), text.size());
        if (!written.ok()) {
            removeQuietly(stagedData);
            removeQuietly(stagedMeta.value());
            return written.error();
        }

        {
            std::unique_lock lk(mutex_);
            fs::rename(stagedData, e.path, ec);
            if (ec) {
                removeQuietly(stagedData);
                removeQuietly(stagedMeta.value());
                return cacheError("rename() failed (" + ec.message() + ") publishing " +
                                  e.path.string());
            }
            fs::rename(stagedMeta.value(), metaPathFor(name), ec);
            if (ec) {
                removeQuietly(stagedMeta.value());
                return cacheError("rename() failed (" + ec.message() + ") publishing " +
                                  metaPathFor(name).string());
            }
        }

        auto rd = fsync_dir(config_.directory);
        if (!rd.ok()) {
            spdlog::debug("fsync on cache dir failed (continuing): {}", rd.error().message);
        }
        spdlog::info("Cached {} ({} bytes) at {}", e.key, e.sizeBytes, e.path.string());
        return e;
    }

    // Caller holds the exclusive lock. Deletes staging files and sidecar-less payloads whose
    // mtime is older than the ttl.
    void removeOrphansLocked() {
        const auto cutoff = fs::file_time_type::clock::now() - config_.ttl;
        std::error_code ec;

        if (fs::exists(stagingDir(), ec)) {
            for (const auto& dirent : fs::directory_iterator(stagingDir(), ec)) {
                std::error_code tec;
                const auto mtime = fs::last_write_time(dirent.path(), tec);
                if (!tec && mtime < cutoff) {
                    spdlog::debug("Removing orphaned staging file {}", dirent.path().string());
                    removeQuietly(dirent.path());
                }
            }
        }

        for (const auto& dirent : fs::directory_iterator(config_.directory, ec)) {
            const auto fname = dirent.path().filename().string();
            std::error_code tec;
            if (!dirent.is_regular_file(tec) || !endsWith(fname, config_.extension))
                continue;
            if (fs::exists(dirent.path().string() + kMetaSuffix, tec))
                continue;
            const auto mtime = fs::last_write_time(dirent.path(), tec);
            if (!tec && mtime < cutoff) {
                spdlog::debug("Removing cache payload without metadata {}", dirent.path().string());
                removeQuietly(dirent.path());
            }
        }
    }

    static void removeQuietly(const fs::path& p) {
        std::error_code ec;
        fs::remove(p, ec);
        if (ec) {
            spdlog::debug("Failed to remove {}: {}", p.string(), ec.message());
        }
    }

    CacheConfig config_;
    mutable std::shared_mutex mutex_;
    std::atomic<std::uint64_t> stagingSeq_{0};
};

std::unique_ptr<ICacheManager> makeCacheManager(CacheConfig config) {
    return std::make_unique<FileCacheManager>(std::move(config));
}

} // namespace plyfetch::transfer
