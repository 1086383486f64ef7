#pragma once

/*
 * plyfetch Transfer - Public Types and Interfaces (C++20)
 *
 * This header defines the public data types and abstract interfaces for the
 * chunked artifact transfer subsystem. It intentionally contains no implementation details.
 *
 * Design principles:
 * - One manifest request per transfer attempt; chunks are fetched independently
 * - Bounded parallelism with per-chunk retry and whole-session cancellation
 * - Offset-addressed reassembly into a pre-sized destination (buffer or file)
 * - A time-bounded local cache keyed by job identifier, written via staging + atomic rename
 * - Clear separation of concerns (HTTP adapter, manifest, chunk fetch, scheduling, reassembly,
 *   cache)
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace plyfetch::transfer {

// ================================
// Fundamental enums and constants
// ================================

/**
 * Canonical error codes for transfer and cache operations.
 * Note: Not a std::error_code category to keep this header implementation-free.
 */
enum class ErrorCode {
    None = 0,
    InvalidArgument,
    ManifestError,   // unknown job, unreachable server, inconsistent metadata
    ChunkTransient,  // network-level failure for one chunk; retried with backoff
    ChunkPermanent,  // length/content mismatch for one chunk; never retried
    ReassemblyError, // byte accounting mismatch after all chunks are done
    CacheError,      // disk I/O failure inside the cache directory
    NotFound,
    NetworkError,
    Timeout,
    Cancelled,
    IoError,
    Unknown
};

[[nodiscard]] constexpr const char* errorCodeName(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::None:
            return "None";
        case ErrorCode::InvalidArgument:
            return "InvalidArgument";
        case ErrorCode::ManifestError:
            return "ManifestError";
        case ErrorCode::ChunkTransient:
            return "ChunkTransient";
        case ErrorCode::ChunkPermanent:
            return "ChunkPermanent";
        case ErrorCode::ReassemblyError:
            return "ReassemblyError";
        case ErrorCode::CacheError:
            return "CacheError";
        case ErrorCode::NotFound:
            return "NotFound";
        case ErrorCode::NetworkError:
            return "NetworkError";
        case ErrorCode::Timeout:
            return "Timeout";
        case ErrorCode::Cancelled:
            return "Cancelled";
        case ErrorCode::IoError:
            return "IoError";
        case ErrorCode::Unknown:
            return "Unknown";
    }
    return "Unknown";
}

/// Default request timeouts, cache window and scheduling limits.
inline constexpr std::chrono::milliseconds kDefaultManifestTimeout{10000};
inline constexpr std::chrono::milliseconds kDefaultChunkTimeout{30000};
inline constexpr std::chrono::seconds kDefaultCacheTtl{24 * 3600};
inline constexpr int kDefaultConcurrency = 8;
inline constexpr std::uint32_t kDefaultMaxRetries = 3;

// ===================
// Small data objects
// ===================

using ByteVector = std::vector<std::byte>;

/**
 * HTTP header key/value pair.
 */
struct Header {
    std::string name;
    std::string value;
};

/**
 * Canonical error object. chunkIndex/attempts are set when a failure is attributable to a
 * single chunk.
 */
struct Error {
    ErrorCode code{ErrorCode::None};
    std::string message;
    std::optional<std::uint32_t> chunkIndex{};
    std::optional<std::uint32_t> attempts{};
};

/**
 * Immutable transfer metadata, fetched once per transfer attempt.
 * Invariant: chunkCount == ceil(totalSize / chunkSize), last chunk length in (0, chunkSize].
 */
struct TransferManifest {
    std::string jobId;
    std::uint64_t totalSize{0};
    std::uint32_t chunkSize{0};
    std::uint32_t chunkCount{0};
    std::string fileName; // optional, as reported by the server
};

enum class ChunkState { Pending, InFlight, Done, Failed };

/**
 * Per-chunk bookkeeping owned by the scheduler for one transfer attempt.
 */
struct ChunkTask {
    std::uint32_t index{0};
    std::uint64_t offset{0};
    std::uint32_t length{0};
    ChunkState state{ChunkState::Pending};
    std::uint32_t attempts{0};
};

/**
 * Aggregate state of one artifact request: Fetching until every chunk is Done, Reassembling
 * until the destination is published, then Complete. Any terminal failure moves it to Failed.
 */
enum class SessionState { Fetching, Reassembling, Complete, Failed };

/**
 * Retry/backoff policy. maxRetries is the total number of attempts a chunk may take.
 */
struct RetryPolicy {
    std::uint32_t maxRetries{kDefaultMaxRetries};
    std::chrono::milliseconds initialBackoff{200};
    double multiplier{2.0};
    std::chrono::milliseconds maxBackoff{5000};
    double jitter{0.25}; // +/- fraction applied to each delay
};

/**
 * Per-transfer scheduling options.
 */
struct TransferOptions {
    int concurrency{kDefaultConcurrency};
    RetryPolicy retry{};
    std::chrono::milliseconds sessionTimeout{0}; // 0 = unbounded
    // Absolute end of the session; when set it replaces now + sessionTimeout
    std::optional<std::chrono::steady_clock::time_point> deadline{};
};

/**
 * Remote endpoint configuration, passed explicitly (never read from the environment here).
 */
struct ServerConfig {
    std::string baseUrl{"http://127.0.0.1:8000"};
    std::vector<Header> headers;
    std::chrono::milliseconds manifestTimeout{kDefaultManifestTimeout};
    std::chrono::milliseconds chunkTimeout{kDefaultChunkTimeout};
};

/**
 * Chunk validation knobs.
 */
struct ChunkFetcherOptions {
    bool rejectAllZeroPayload{true};
};

using SystemClock = std::function<std::chrono::system_clock::time_point()>;

/**
 * Local cache configuration.
 */
struct CacheConfig {
    std::filesystem::path directory{"cache/ply"};
    std::chrono::seconds ttl{kDefaultCacheTtl};
    std::string extension{".ply"};
    SystemClock clock{}; // empty = std::chrono::system_clock::now
};

/**
 * Persisted cache record.
 */
struct CacheEntry {
    std::string key;
    std::filesystem::path path;
    std::uint64_t sizeBytes{0};
    std::chrono::system_clock::time_point createdAt{};
    std::chrono::system_clock::time_point lastAccessAt{};
    std::string sha256; // lower-case hex
};

struct CacheStats {
    std::size_t fileCount{0};
    std::uint64_t totalBytes{0};
    std::size_t expiredCount{0};
};

/**
 * Progress stages during a single artifact request.
 */
enum class ProgressStage { Resolving, Fetching, Reassembling, Caching, Complete };

struct ProgressEvent {
    std::string jobId;
    std::uint32_t chunksDone{0};
    std::uint32_t chunkCount{0};
    std::uint64_t bytesDone{0};
    std::uint64_t totalBytes{0};
    ProgressStage stage{ProgressStage::Fetching};
};

/**
 * Outcome of a successful scheduler run.
 */
struct TransferReport {
    TransferManifest manifest;
    std::vector<ChunkTask> tasks; // final snapshot, ordered by index
    std::uint64_t bytesFetched{0};
    std::uint32_t retries{0};
    std::chrono::milliseconds elapsed{0};
    SessionState state{SessionState::Fetching};
};

/**
 * Raw HTTP response summary (the body is streamed to a sink).
 */
struct HttpResponse {
    long status{0};
    std::uint64_t bodyBytes{0};
};

// =========================
// Lightweight Expected<T>
// =========================

/**
 * Minimal Expected<T> for interfaces (header-only, no exceptions required).
 * - If ok() is true, value() is valid; otherwise error() is set.
 */
template <typename T> class Expected {
public:
    Expected() = default;
    Expected(const T& v) : _ok(true), _value(v) {}
    Expected(T&& v) noexcept : _ok(true), _value(std::move(v)) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    [[nodiscard]] const T& value() const& { return _value; }
    [[nodiscard]] T& value() & { return _value; }
    [[nodiscard]] T&& value() && { return std::move(_value); }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{false};
    T _value{};
    Error _error{};
};

// Specialization for Expected<void>
template <> class Expected<void> {
public:
    Expected() : _ok(true) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{true};
    Error _error{};
};

// ===================
// Callback signatures
// ===================

using ProgressCallback = std::function<void(const ProgressEvent&)>;
using ShouldCancel = std::function<bool()>; // return true to cancel ASAP
using BodySink = std::function<Expected<void>(std::span<const std::byte>)>;

// ==========================
// Service interface classes
// ==========================

/**
 * HTTP adapter abstraction (libcurl-based implementation will satisfy this).
 */
class IHttpAdapter {
public:
    virtual ~IHttpAdapter() = default;

    /**
     * Perform a GET and stream the body to sink. The sink may be called multiple times on the
     * calling thread; a sink error aborts the transfer and is returned unchanged.
     * A cancelled transfer returns ErrorCode::Cancelled.
     */
    virtual Expected<HttpResponse> get(std::string_view url, const std::vector<Header>& headers,
                                       std::chrono::milliseconds timeout, const BodySink& sink,
                                       const ShouldCancel& shouldCancel) = 0;
};

/**
 * Resolves a job identifier to its transfer manifest. Stateless between calls.
 * A request aborted through shouldCancel returns ErrorCode::Cancelled.
 */
class IManifestClient {
public:
    virtual ~IManifestClient() = default;
    virtual Expected<TransferManifest> resolve(std::string_view jobId,
                                               const ShouldCancel& shouldCancel = {}) = 0;
};

/**
 * One bounded-size read for one chunk index.
 * Fails with ChunkTransient (retryable) or ChunkPermanent (length/content mismatch).
 */
class IChunkFetcher {
public:
    virtual ~IChunkFetcher() = default;
    virtual Expected<ByteVector> fetchChunk(std::string_view jobId, std::uint32_t index,
                                            std::uint64_t offset, std::uint32_t length,
                                            const ShouldCancel& shouldCancel) = 0;
};

/**
 * Offset-addressed destination of exactly totalSize() bytes.
 * write() is safe to call concurrently for disjoint ranges.
 */
class IReassembler {
public:
    virtual ~IReassembler() = default;

    [[nodiscard]] virtual std::uint64_t totalSize() const noexcept = 0;
    [[nodiscard]] virtual std::uint64_t bytesWritten() const noexcept = 0;

    virtual Expected<void> write(std::uint64_t offset, std::span<const std::byte> data) = 0;

    /**
     * Verify byte accounting and publish the destination (file: fsync + atomic rename).
     */
    virtual Expected<void> finish() = 0;

    /**
     * Release the destination without publishing it (file: delete the staging file).
     */
    virtual void discard() noexcept = 0;

    /**
     * Memory destination: the reassembled bytes (valid after finish()). File: empty.
     */
    virtual ByteVector takeBytes() = 0;

    /**
     * File destination: the published path. Memory: empty.
     */
    [[nodiscard]] virtual std::filesystem::path targetPath() const = 0;
};

/**
 * Streaming SHA-256 calculator. finalize() re-arms the instance for the next digest.
 */
class IIntegrityVerifier {
public:
    virtual ~IIntegrityVerifier() = default;
    virtual void reset() = 0;
    virtual void update(std::span<const std::byte> data) = 0;
    virtual std::string finalize() = 0; // lower-case hex, empty on failure
};

/**
 * Drives chunk fetches for one manifest with bounded concurrency, retries and cancellation.
 */
class ITransferScheduler {
public:
    virtual ~ITransferScheduler() = default;
    virtual Expected<TransferReport> fetch(const TransferManifest& manifest,
                                           IReassembler& destination,
                                           const TransferOptions& options,
                                           const ShouldCancel& shouldCancel = {},
                                           const ProgressCallback& onProgress = {}) = 0;
};

/**
 * Keyed, time-bounded artifact cache. Exclusively owns its directory.
 */
class ICacheManager {
public:
    virtual ~ICacheManager() = default;

    [[nodiscard]] virtual bool isFresh(std::string_view key) = 0;

    /**
     * Cached bytes when fresh; ErrorCode::NotFound for missing, stale or corrupted entries.
     * Stale entries are left on disk.
     */
    virtual Expected<ByteVector> load(std::string_view key) = 0;

    /**
     * Fresh entry metadata without reading the payload (updates lastAccessAt).
     */
    virtual Expected<CacheEntry> lookup(std::string_view key) = 0;

    /**
     * Where the payload for key lives (or would live). No I/O.
     */
    [[nodiscard]] virtual std::filesystem::path entryPath(std::string_view key) const = 0;

    virtual Expected<CacheEntry> store(std::string_view key, std::span<const std::byte> data) = 0;
    virtual Expected<CacheEntry> storeFile(std::string_view key,
                                           const std::filesystem::path& source) = 0;
    virtual Expected<void> remove(std::string_view key) = 0;

    /**
     * Physically delete entries with now - createdAt > ttl. Returns the number removed.
     */
    virtual Expected<std::size_t> cleanupExpired() = 0;
    virtual Expected<CacheStats> stats() = 0;

    [[nodiscard]] virtual const CacheConfig& config() const noexcept = 0;
};

// ======================
// End-to-end requests
// ======================

enum class Destination { Memory, File };

struct ArtifactRequest {
    std::string jobId;
    Destination destination{Destination::Memory};
    std::filesystem::path outputPath; // required for Destination::File
    bool useCache{true};
    bool refresh{false}; // skip the freshness check, still store on success
    TransferOptions options{};
};

struct Artifact {
    std::string jobId;
    ByteVector bytes;           // Destination::Memory
    std::filesystem::path path; // Destination::File, or the cache file backing a memory artifact
    std::uint64_t sizeBytes{0};
    std::string sha256;
    bool fromCache{false};
    std::optional<TransferReport> report{}; // set when fetched over the network
    std::chrono::milliseconds elapsed{0};
};

/**
 * Cache check -> manifest -> scheduled chunk fetch -> reassembly -> cache store.
 */
class IArtifactFetcher {
public:
    virtual ~IArtifactFetcher() = default;
    virtual Expected<Artifact> fetch(const ArtifactRequest& request,
                                     const ProgressCallback& onProgress = {},
                                     const ShouldCancel& shouldCancel = {}) = 0;
};

// ======================
// Chunk geometry helpers
// ======================

[[nodiscard]] constexpr std::uint64_t chunkCountFor(std::uint64_t totalSize,
                                                   std::uint64_t chunkSize) noexcept {
    if (chunkSize == 0)
        return 0;
    return totalSize / chunkSize + (totalSize % chunkSize != 0 ? 1 : 0);
}

[[nodiscard]] constexpr std::uint64_t chunkOffset(const TransferManifest& m,
                                                  std::uint32_t index) noexcept {
    return static_cast<std::uint64_t>(index) * m.chunkSize;
}

/**
 * Length of chunk `index`; the last chunk carries the remainder. 0 when index is out of range.
 */
[[nodiscard]] constexpr std::uint32_t chunkLength(const TransferManifest& m,
                                                  std::uint32_t index) noexcept {
    if (m.chunkCount == 0 || index >= m.chunkCount)
        return 0;
    if (index + 1 < m.chunkCount)
        return m.chunkSize;
    return static_cast<std::uint32_t>(m.totalSize -
                                      static_cast<std::uint64_t>(m.chunkSize) * (m.chunkCount - 1));
}

/**
 * Build a manifest and apply the validation rules (non-zero sizes, consistent count).
 */
Expected<TransferManifest> makeManifest(std::string jobId, std::uint64_t totalSize,
                                        std::uint64_t chunkSize, std::uint64_t reportedCount,
                                        std::string fileName = {});

/**
 * Percent-encode a value for use as a single URL path segment.
 */
[[nodiscard]] std::string encodePathSegment(std::string_view segment);

/**
 * HTTP statuses worth retrying for idempotent GETs (408, 425, 429, 5xx).
 */
[[nodiscard]] constexpr bool isTransientHttpStatus(long status) noexcept {
    return status == 408 || status == 425 || status == 429 || (status >= 500 && status <= 599);
}

// ======================
// Factories
// ======================

std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter();

std::unique_ptr<IManifestClient> makeManifestClient(ServerConfig server,
                                                    std::shared_ptr<IHttpAdapter> http);

std::unique_ptr<IChunkFetcher> makeChunkFetcher(ServerConfig server,
                                                std::shared_ptr<IHttpAdapter> http,
                                                ChunkFetcherOptions options = {});

std::unique_ptr<IReassembler> makeMemoryReassembler(std::uint64_t totalSize);

/**
 * Pre-sized staging file under <target dir>/.plyfetch-staging, renamed onto target by finish().
 */
Expected<std::unique_ptr<IReassembler>> makeFileReassembler(const std::filesystem::path& target,
                                                            std::uint64_t totalSize);

std::unique_ptr<IIntegrityVerifier> makeSha256Verifier();

/**
 * One-shot helpers over makeSha256Verifier().
 */
[[nodiscard]] std::string sha256Hex(std::span<const std::byte> data);
Expected<std::string> sha256HexOfFile(const std::filesystem::path& path);

std::unique_ptr<ITransferScheduler> makeTransferScheduler(std::shared_ptr<IChunkFetcher> fetcher);

std::unique_ptr<ICacheManager> makeCacheManager(CacheConfig config);

/**
 * Default wiring over libcurl. cache may be disabled by passing cacheEnabled = false.
 */
std::unique_ptr<IArtifactFetcher> makeArtifactFetcher(const ServerConfig& server,
                                                      const CacheConfig& cache,
                                                      bool cacheEnabled = true);

/**
 * Injectable wiring; cache may be null.
 */
std::unique_ptr<IArtifactFetcher>
makeArtifactFetcherWithDependencies(std::shared_ptr<IManifestClient> manifests,
                                    std::shared_ptr<IChunkFetcher> chunks,
                                    std::shared_ptr<ICacheManager> cache);

} // namespace plyfetch::transfer
