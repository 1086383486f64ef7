/*
 * plyfetch/src/transfer/artifact_fetcher.cpp
 *
 * End-to-end artifact request:
 *   cache freshness check -> manifest -> scheduled chunk fetch -> reassembly -> cache store
 *
 * - A fresh cache hit never touches the network; a hit whose payload no longer matches its
 *   recorded digest is treated as a miss
 * - sessionTimeout bounds the whole request from manifest resolution to publishing
 * - A failed transfer leaves no output file and no cache entry
 * - Cache store failures degrade to "not cached" (logged) and never fail the request
 */

#include <plyfetch/transfer/transfer.hpp>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <exception>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace plyfetch::transfer {

namespace fs = std::filesystem;

namespace {

using SteadyClock = std::chrono::steady_clock;

constexpr std::size_t kCopyBlock = 1 << 20;
constexpr mode_t kOutputMode = 0644;

std::chrono::milliseconds since(SteadyClock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - start);
}

void emit(const ProgressCallback& onProgress, const std::string& jobId, ProgressStage stage,
          std::uint64_t done, std::uint64_t total, std::uint32_t chunksDone = 0,
          std::uint32_t chunkCount = 0) {
    if (!onProgress)
        return;
    ProgressEvent ev;
    ev.jobId = jobId;
    ev.stage = stage;
    ev.bytesDone = done;
    ev.totalBytes = total;
    ev.chunksDone = chunksDone;
    ev.chunkCount = chunkCount;
    onProgress(ev);
}

Error timeoutError(const std::string& jobId) {
    return Error{ErrorCode::Timeout,
                 "transfer of job '" + jobId + "' exceeded its session timeout"};
}

Error cancelledError(const std::string& jobId) {
    return Error{ErrorCode::Cancelled, "transfer of job '" + jobId + "' cancelled"};
}

Expected<void> writeAll(int fd, const char* data, std::size_t size, const fs::path& path) {
    while (size > 0) {
        ssize_t n = ::write(fd, data, size);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            return Error{ErrorCode::IoError,
                         "write failed on " + path.string() + ": " + std::strerror(errno)};
        }
        data += n;
        size -= static_cast<std::size_t>(n);
    }
    return {};
}

// Copy src into a sibling temporary of dst, hashing as it goes. The temporary is renamed onto
// dst only when the digest equals expectedSha256; a mismatch leaves dst untouched and reports
// NotFound. Returns the digest of the published copy.
Expected<std::string> copyVerifiedToOutput(const fs::path& src, const fs::path& dst,
                                           const std::string& expectedSha256) {
    std::error_code ec;
    const fs::path parent = dst.parent_path().empty() ? fs::path(".") : dst.parent_path();
    fs::create_directories(parent, ec);
    if (ec) {
        return Error{ErrorCode::IoError,
                     "Failed to create output dir " + parent.string() + ": " + ec.message()};
    }

    std::ifstream in(src, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::NotFound, "cached payload is unreadable: " + src.string()};
    }

    const fs::path tmp =
        parent / ("." + dst.filename().string() + ".tmp-" + std::to_string(::getpid()));
    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, kOutputMode);
    if (fd < 0) {
        return Error{ErrorCode::IoError,
                     "Failed to create " + tmp.string() + ": " + std::strerror(errno)};
    }
    auto abandon = [&tmp, &fd](Error err) -> Error {
        if (fd >= 0)
            ::close(fd);
        fd = -1;
        std::error_code rec;
        fs::remove(tmp, rec);
        return err;
    };

    auto verifier = makeSha256Verifier();
    std::vector<char> block(kCopyBlock);
    while (in) {
        in.read(block.data(), static_cast<std::streamsize>(block.size()));
        const auto got = static_cast<std::size_t>(in.gcount());
        if (got == 0)
            break;
        verifier->update(
            std::span<const std::byte>(reinterpret_cast<const std::byte*>(block.data()), got));
        auto written = writeAll(fd, block.data(), got, tmp);
        if (!written.ok())
            return abandon(written.error());
    }
    if (in.bad()) {
        return abandon(Error{ErrorCode::IoError, "Read failed on cached payload " + src.string()});
    }

    const auto digest = verifier->finalize();
    if (digest.empty()) {
        return abandon(Error{ErrorCode::Unknown, "SHA-256 digest failed for: " + src.string()});
    }
    if (digest != expectedSha256) {
        return abandon(Error{ErrorCode::NotFound,
                             "cached payload " + src.string() + " is corrupted (digest mismatch)"});
    }

    // Cached payloads are read-only; the caller's copy is not.
    if (::fchmod(fd, kOutputMode) != 0 || ::fsync(fd) != 0) {
        return abandon(Error{ErrorCode::IoError,
                             "Failed to finalize " + tmp.string() + ": " + std::strerror(errno)});
    }
    ::close(fd);
    fd = -1;

    fs::rename(tmp, dst, ec);
    if (ec) {
        return abandon(Error{ErrorCode::IoError,
                             "rename() failed (" + ec.message() + ") publishing " + dst.string()});
    }
    return digest;
}

} // namespace

class ArtifactFetcher final : public IArtifactFetcher {
public:
    ArtifactFetcher(std::shared_ptr<IManifestClient> manifests,
                    std::shared_ptr<IChunkFetcher> chunks, std::shared_ptr<ICacheManager> cache)
        : manifests_(std::move(manifests)), scheduler_(makeTransferScheduler(std::move(chunks))),
          cache_(std::move(cache)) {}

    Expected<Artifact> fetch(const ArtifactRequest& request, const ProgressCallback& onProgress,
                             const ShouldCancel& shouldCancel) override {
        try {
            const auto started = SteadyClock::now();

            if (request.jobId.empty()) {
                return Error{ErrorCode::InvalidArgument, "artifact request: empty job id"};
            }
            if (request.destination == Destination::File && request.outputPath.empty()) {
                return Error{ErrorCode::InvalidArgument,
                             "artifact request: file destination requires an output path"};
            }
            if (!manifests_) {
                return Error{ErrorCode::InvalidArgument, "artifact fetcher has no manifest client"};
            }

            if (cache_ && request.useCache && !request.refresh) {
                auto hit = fromCache(request, onProgress);
                if (hit.ok()) {
                    hit.value().elapsed = since(started);
                    return hit;
                }
                if (hit.error().code != ErrorCode::NotFound)
                    return hit;
            }

            std::optional<SteadyClock::time_point> deadline;
            if (request.options.sessionTimeout.count() > 0)
                deadline = started + request.options.sessionTimeout;
            auto interrupted = [&]() -> std::optional<Error> {
                if (shouldCancel && shouldCancel())
                    return cancelledError(request.jobId);
                if (deadline && SteadyClock::now() >= *deadline)
                    return timeoutError(request.jobId);
                return std::nullopt;
            };
            ShouldCancel sessionCancel = [&interrupted] { return interrupted().has_value(); };

            emit(onProgress, request.jobId, ProgressStage::Resolving, 0, 0);
            auto manifest = manifests_->resolve(request.jobId, sessionCancel);
            if (!manifest.ok()) {
                if (manifest.error().code == ErrorCode::Cancelled) {
                    if (auto reason = interrupted())
                        return *reason;
                }
                return manifest.error();
            }
            if (auto reason = interrupted())
                return *reason;
            const auto& m = manifest.value();

            std::unique_ptr<IReassembler> dest;
            if (request.destination == Destination::File) {
                auto made = makeFileReassembler(request.outputPath, m.totalSize);
                if (!made.ok())
                    return made.error();
                dest = std::move(made.value());
            } else {
                dest = makeMemoryReassembler(m.totalSize);
            }

            TransferOptions options = request.options;
            options.deadline = deadline;
            auto report = scheduler_->fetch(m, *dest, options, shouldCancel, onProgress);
            if (!report.ok())
                return report.error();

            if (auto reason = interrupted()) {
                dest->discard();
                spdlog::info("Transfer of job {} stopped before publishing: {}", request.jobId,
                             reason->message);
                return *reason;
            }

            emit(onProgress, request.jobId, ProgressStage::Reassembling, m.totalSize, m.totalSize,
                 m.chunkCount, m.chunkCount);
            auto finished = dest->finish();
            if (!finished.ok()) {
                dest->discard();
                return finished.error();
            }
            report.value().state = SessionState::Complete;

            Artifact out;
            out.jobId = request.jobId;
            out.sizeBytes = m.totalSize;
            out.report = std::move(report.value());
            if (request.destination == Destination::File) {
                out.path = dest->targetPath();
                auto digest = sha256HexOfFile(out.path);
                if (!digest.ok())
                    return digest.error();
                out.sha256 = std::move(digest.value());
            } else {
                out.bytes = dest->takeBytes();
                out.sha256 = sha256Hex(out.bytes);
            }

            if (cache_ && request.useCache) {
                emit(onProgress, request.jobId, ProgressStage::Caching, m.totalSize, m.totalSize,
                     m.chunkCount, m.chunkCount);
                auto stored = request.destination == Destination::File
                                  ? cache_->storeFile(request.jobId, out.path)
                                  : cache_->store(request.jobId, out.bytes);
                if (!stored.ok()) {
                    spdlog::warn("Artifact {} fetched but not cached: {}", request.jobId,
                                 stored.error().message);
                } else if (request.destination == Destination::Memory) {
                    out.path = stored.value().path;
                }
            }

            emit(onProgress, request.jobId, ProgressStage::Complete, m.totalSize, m.totalSize,
                 m.chunkCount, m.chunkCount);
            out.elapsed = since(started);
            return out;
        } catch (const std::exception& ex) {
            return Error{ErrorCode::Unknown, std::string("Exception: ") + ex.what()};
        }
    }

private:
    Expected<Artifact> fromCache(const ArtifactRequest& request,
                                 const ProgressCallback& onProgress) {
        Artifact out;
        out.jobId = request.jobId;
        out.fromCache = true;

        if (request.destination == Destination::File) {
            auto entry = cache_->lookup(request.jobId);
            if (!entry.ok())
                return entry.error();
            auto copied =
                copyVerifiedToOutput(entry.value().path, request.outputPath, entry.value().sha256);
            if (!copied.ok()) {
                if (copied.error().code == ErrorCode::NotFound) {
                    spdlog::warn("Ignoring cache entry {}: {}", request.jobId,
                                 copied.error().message);
                }
                return copied.error();
            }
            out.path = request.outputPath;
            out.sizeBytes = entry.value().sizeBytes;
            out.sha256 = std::move(copied.value());
        } else {
            auto bytes = cache_->load(request.jobId);
            if (!bytes.ok())
                return bytes.error();
            out.bytes = std::move(bytes.value());
            out.path = cache_->entryPath(request.jobId);
            out.sizeBytes = out.bytes.size();
            out.sha256 = sha256Hex(out.bytes);
        }

        spdlog::info("Cache hit for job {} ({} bytes)", request.jobId, out.sizeBytes);
        emit(onProgress, request.jobId, ProgressStage::Complete, out.sizeBytes, out.sizeBytes);
        return out;
    }

    std::shared_ptr<IManifestClient> manifests_;
    std::unique_ptr<ITransferScheduler> scheduler_;
    std::shared_ptr<ICacheManager> cache_;
};

std::unique_ptr<IArtifactFetcher>
makeArtifactFetcherWithDependencies(std::shared_ptr<IManifestClient> manifests,
                                    std::shared_ptr<IChunkFetcher> chunks,
                                    std::shared_ptr<ICacheManager> cache) {
    return std::make_unique<ArtifactFetcher>(std::move(manifests), std::move(chunks),
                                             std::move(cache));
}

std::unique_ptr<IArtifactFetcher> makeArtifactFetcher(const ServerConfig& server,
                                                      const CacheConfig& cache,
                                                      bool cacheEnabled) {
    std::shared_ptr<IHttpAdapter> http = makeCurlHttpAdapter();
    return makeArtifactFetcherWithDependencies(
        makeManifestClient(server, http), makeChunkFetcher(server, http),
        cacheEnabled ? std::shared_ptr<ICacheManager>(makeCacheManager(cache)) : nullptr);
}

} // namespace plyfetch::transfer
