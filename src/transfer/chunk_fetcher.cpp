/*
 * plyfetch/src/transfer/chunk_fetcher.cpp
 *
 * One bounded read per chunk index:
 * - GET {baseUrl}/api/download_chunk/{jobId}/{index}
 * - The body is buffered up to exactly `length` bytes; an overflowing body is aborted early
 * - Classification:
 *     transport failure, timeout, 408/425/429/5xx   -> ChunkTransient (caller retries)
 *     other non-2xx, short/long body, all-zero body -> ChunkPermanent (never retried)
 *     cooperative cancellation                      -> Cancelled
 */

#include <plyfetch/transfer/transfer.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace plyfetch::transfer {

namespace {

Error chunkError(ErrorCode code, std::string_view jobId, std::uint32_t index,
                 std::string message) {
    Error err;
    err.code = code;
    err.message =
        "chunk " + std::to_string(index) + " of job '" + std::string(jobId) + "': " + message;
    err.chunkIndex = index;
    return err;
}

bool allZero(const ByteVector& bytes) {
    return std::all_of(bytes.begin(), bytes.end(), [](std::byte b) { return b == std::byte{0}; });
}

} // namespace

class HttpChunkFetcher final : public IChunkFetcher {
public:
    HttpChunkFetcher(ServerConfig server, std::shared_ptr<IHttpAdapter> http,
                     ChunkFetcherOptions options)
        : server_(std::move(server)), http_(std::move(http)), options_(options) {
        while (!server_.baseUrl.empty() && server_.baseUrl.back() == '/')
            server_.baseUrl.pop_back();
    }

    Expected<ByteVector> fetchChunk(std::string_view jobId, std::uint32_t index,
                                    std::uint64_t offset, std::uint32_t length,
                                    const ShouldCancel& shouldCancel) override {
        if (length == 0) {
            return chunkError(ErrorCode::InvalidArgument, jobId, index, "expected length is 0");
        }

        const std::string url = server_.baseUrl + "/api/download_chunk/" +
                                encodePathSegment(jobId) + "/" + std::to_string(index);

        ByteVector buffer;
        buffer.reserve(length);
        auto sink = [&](std::span<const std::byte> data) -> Expected<void> {
            if (buffer.size() + data.size() > length) {
                return chunkError(ErrorCode::ChunkPermanent, jobId, index,
                                  "response exceeds expected length " + std::to_string(length));
            }
            buffer.insert(buffer.end(), data.begin(), data.end());
            return {};
        };

        auto resp = http_->get(url, server_.headers, server_.chunkTimeout, sink, shouldCancel);
        if (!resp.ok()) {
            const auto& err = resp.error();
            switch (err.code) {
                case ErrorCode::ChunkPermanent:
                case ErrorCode::Cancelled:
                    return err;
                default:
                    return chunkError(ErrorCode::ChunkTransient, jobId, index, err.message);
            }
        }

        const long status = resp.value().status;
        if (status < 200 || status > 299) {
            const auto code =
                isTransientHttpStatus(status) ? ErrorCode::ChunkTransient : ErrorCode::ChunkPermanent;
            return chunkError(code, jobId, index, "HTTP " + std::to_string(status));
        }

        if (buffer.size() != length) {
            return chunkError(ErrorCode::ChunkPermanent, jobId, index,
                              "received " + std::to_string(buffer.size()) + " bytes, expected " +
                                  std::to_string(length) + " at offset " + std::to_string(offset));
        }
        if (options_.rejectAllZeroPayload && allZero(buffer)) {
            return chunkError(ErrorCode::ChunkPermanent, jobId, index,
                              "payload of " + std::to_string(length) + " bytes is all zero");
        }

        spdlog::debug("Chunk {} of job {} fetched ({} bytes at offset {})", index, jobId, length,
                      offset);
        return buffer;
    }

private:
    ServerConfig server_;
    std::shared_ptr<IHttpAdapter> http_;
    ChunkFetcherOptions options_;
};

std::unique_ptr<IChunkFetcher> makeChunkFetcher(ServerConfig server,
                                                std::shared_ptr<IHttpAdapter> http,
                                                ChunkFetcherOptions options) {
    return std::make_unique<HttpChunkFetcher>(std::move(server), std::move(http), options);
}

} // namespace plyfetch::transfer
