/*
 * plyfetch/src/transfer/manifest_client.cpp
 *
 * Manifest resolution:
 * - GET {baseUrl}/api/download_info/{jobId}
 * - Response: {"file_size": u64, "chunk_size": u32, "num_chunks": u32, "filename": "..."}
 * - Every failure (transport, HTTP status, malformed JSON, inconsistent counts) surfaces as
 *   ErrorCode::ManifestError; nothing is retried here and no state survives between calls.
 * - A request aborted through ShouldCancel surfaces as ErrorCode::Cancelled.
 */

#include <plyfetch/transfer/transfer.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace plyfetch::transfer {

namespace {

// Manifest documents are tiny; anything larger is not a manifest
constexpr std::size_t kMaxManifestBytes = 64 * 1024;

Error manifestError(std::string_view jobId, std::string message) {
    return Error{ErrorCode::ManifestError,
                 "manifest for job '" + std::string(jobId) + "': " + std::move(message)};
}

} // namespace

Expected<TransferManifest> makeManifest(std::string jobId, std::uint64_t totalSize,
                                        std::uint64_t chunkSize, std::uint64_t reportedCount,
                                        std::string fileName) {
    if (totalSize == 0) {
        return manifestError(jobId, "file_size is 0");
    }
    if (chunkSize == 0) {
        return manifestError(jobId, "chunk_size is 0");
    }
    if (chunkSize > std::numeric_limits<std::uint32_t>::max()) {
        return manifestError(jobId, "chunk_size " + std::to_string(chunkSize) +
                                        " does not fit in 32 bits");
    }
    const auto derived = chunkCountFor(totalSize, chunkSize);
    if (derived > std::numeric_limits<std::uint32_t>::max()) {
        return manifestError(jobId, "chunk count " + std::to_string(derived) + " is too large");
    }
    if (derived != reportedCount) {
        return manifestError(jobId, "server reports " + std::to_string(reportedCount) +
                                        " chunks but file_size/chunk_size implies " +
                                        std::to_string(derived));
    }

    TransferManifest m;
    m.jobId = std::move(jobId);
    m.totalSize = totalSize;
    m.chunkSize = static_cast<std::uint32_t>(chunkSize);
    m.chunkCount = static_cast<std::uint32_t>(derived);
    m.fileName = std::move(fileName);
    return m;
}

std::string encodePathSegment(std::string_view segment) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(segment.size());
    for (unsigned char c : segment) {
        const bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                                (c >= '0' && c <= '9') || c == '-' || c == '.' || c == '_' ||
                                c == '~';
        if (unreserved) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[(c >> 4) & 0xF]);
            out.push_back(kHex[c & 0xF]);
        }
    }
    return out;
}

class HttpManifestClient final : public IManifestClient {
public:
    HttpManifestClient(ServerConfig server, std::shared_ptr<IHttpAdapter> http)
        : server_(std::move(server)), http_(std::move(http)) {}

    Expected<TransferManifest> resolve(std::string_view jobId,
                                       const ShouldCancel& shouldCancel) override {
        if (jobId.empty()) {
            return Error{ErrorCode::InvalidArgument, "empty job id"};
        }

        const std::string url = urlFor(jobId);
        std::string body;
        auto sink = [&body, jobId](std::span<const std::byte> data) -> Expected<void> {
            if (body.size() + data.size() > kMaxManifestBytes) {
                return manifestError(jobId, "response exceeds " +
                                                std::to_string(kMaxManifestBytes) + " bytes");
            }
            body.append(reinterpret_cast<const char*>(data.data()), data.size());
            return {};
        };

        auto resp = http_->get(url, server_.headers, server_.manifestTimeout, sink, shouldCancel);
        if (!resp.ok()) {
            const auto code = resp.error().code;
            if (code == ErrorCode::ManifestError || code == ErrorCode::Cancelled)
                return resp.error();
            return manifestError(jobId, "request failed: " + resp.error().message);
        }

        const long status = resp.value().status;
        if (status == 404) {
            return manifestError(jobId, "unknown job (HTTP 404)");
        }
        if (status < 200 || status > 299) {
            return manifestError(jobId, "HTTP " + std::to_string(status));
        }

        auto parsed = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
        if (parsed.is_discarded() || !parsed.is_object()) {
            return manifestError(jobId, "response is not a JSON object");
        }

        auto field = [&parsed](const char* name) -> std::optional<std::uint64_t> {
            auto it = parsed.find(name);
            if (it == parsed.end() || !it->is_number_unsigned())
                return std::nullopt;
            return it->get<std::uint64_t>();
        };

        const auto fileSize = field("file_size");
        const auto chunkSize = field("chunk_size");
        const auto numChunks = field("num_chunks");
        if (!fileSize || !chunkSize || !numChunks) {
            return manifestError(
                jobId, "missing or non-integer file_size/chunk_size/num_chunks");
        }

        std::string fileName;
        if (auto it = parsed.find("filename"); it != parsed.end() && it->is_string()) {
            fileName = it->get<std::string>();
        }

        auto manifest =
            makeManifest(std::string(jobId), *fileSize, *chunkSize, *numChunks, fileName);
        if (manifest.ok()) {
            spdlog::info("Manifest for job {}: {} bytes in {} chunks of {} bytes", jobId,
                         manifest.value().totalSize, manifest.value().chunkCount,
                         manifest.value().chunkSize);
        }
        return manifest;
    }

private:
    std::string urlFor(std::string_view jobId) const {
        std::string url = server_.baseUrl;
        while (!url.empty() && url.back() == '/')
            url.pop_back();
        url += "/api/download_info/";
        url += encodePathSegment(jobId);
        return url;
    }

    ServerConfig server_;
    std::shared_ptr<IHttpAdapter> http_;
};

std::unique_ptr<IManifestClient> makeManifestClient(ServerConfig server,
                                                    std::shared_ptr<IHttpAdapter> http) {
    return std::make_unique<HttpManifestClient>(std::move(server), std::move(http));
}

} // namespace plyfetch::transfer
