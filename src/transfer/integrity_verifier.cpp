/*
 * plyfetch/src/transfer/integrity_verifier.cpp
 *
 * Streaming SHA-256 via OpenSSL EVP.
 * - update() accepts byte spans and feeds them to the active digest context.
 * - finalize() returns lower-case hex and re-initializes the context for reuse.
 * - sha256HexOfFile() streams a file in fixed-size blocks.
 *
 * Dependencies:
 * - OpenSSL::Crypto
 */

#include <plyfetch/transfer/transfer.hpp>

#include <openssl/evp.h>

#include <array>
#include <cstddef>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace plyfetch::transfer {

namespace {

constexpr std::size_t kFileReadBlock = 1 << 20;

// Simple RAII wrapper for EVP_MD_CTX
struct EvpMdCtx {
    EVP_MD_CTX* ctx{nullptr};
    EvpMdCtx() : ctx(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() {
        if (ctx)
            EVP_MD_CTX_free(ctx);
    }
    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;
    EvpMdCtx(EvpMdCtx&& other) noexcept : ctx(other.ctx) { other.ctx = nullptr; }
    EvpMdCtx& operator=(EvpMdCtx&& other) noexcept {
        if (this != &other) {
            if (ctx)
                EVP_MD_CTX_free(ctx);
            ctx = other.ctx;
            other.ctx = nullptr;
        }
        return *this;
    }
    explicit operator bool() const noexcept { return ctx != nullptr; }
};

inline std::string to_hex_lower(const unsigned char* bytes, std::size_t len) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        unsigned v = bytes[i];
        out[2 * i + 0] = kHex[(v >> 4) & 0xF];
        out[2 * i + 1] = kHex[(v >> 0) & 0xF];
    }
    return out;
}

class Sha256Verifier final : public IIntegrityVerifier {
public:
    Sha256Verifier() { reset(); }
    ~Sha256Verifier() override = default;

    void reset() override {
        _ctx = EvpMdCtx{};
        _failed = !_ctx || EVP_DigestInit_ex(_ctx.ctx, EVP_sha256(), nullptr) != 1;
    }

    void update(std::span<const std::byte> data) override {
        if (_failed || data.empty())
            return;
        if (EVP_DigestUpdate(_ctx.ctx, data.data(), data.size()) != 1) {
            _failed = true;
        }
    }

    std::string finalize() override {
        if (_failed) {
            reset();
            return {};
        }

        std::array<unsigned char, EVP_MAX_MD_SIZE> md_buf{};
        unsigned md_len = 0;
        if (EVP_DigestFinal_ex(_ctx.ctx, md_buf.data(), &md_len) != 1) {
            reset();
            return {};
        }

        auto hex = to_hex_lower(md_buf.data(), md_len);
        reset();
        return hex;
    }

private:
    EvpMdCtx _ctx{};
    bool _failed{false};
};

} // namespace

std::unique_ptr<IIntegrityVerifier> makeSha256Verifier() {
    return std::make_unique<Sha256Verifier>();
}

std::string sha256Hex(std::span<const std::byte> data) {
    Sha256Verifier verifier;
    verifier.update(data);
    return verifier.finalize();
}

Expected<std::string> sha256HexOfFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IoError, "Failed to open for hashing: " + path.string()};
    }

    Sha256Verifier verifier;
    std::vector<char> block(kFileReadBlock);
    while (in) {
        in.read(block.data(), static_cast<std::streamsize>(block.size()));
        const auto got = in.gcount();
        if (got > 0) {
            verifier.update(std::span<const std::byte>(
                reinterpret_cast<const std::byte*>(block.data()), static_cast<std::size_t>(got)));
        }
    }
    if (in.bad()) {
        return Error{ErrorCode::IoError, "Read failed while hashing: " + path.string()};
    }

    auto hex = verifier.finalize();
    if (hex.empty()) {
        return Error{ErrorCode::Unknown, "SHA-256 digest failed for: " + path.string()};
    }
    return hex;
}

} // namespace plyfetch::transfer
