/*
 * plyfetch/src/transfer/reassembler.cpp
 *
 * Offset-addressed reassembly:
 * - MemoryReassembler: a pre-sized buffer; concurrent writers copy into disjoint slices
 * - FileReassembler: a pre-sized staging file (0600) written with pwrite(); finish() widens it
 *   to 0644, fsyncs and renames it onto the target path, discard() unlinks it
 * - Both keep an atomic byte/chunk counter; finish() requires bytesWritten == totalSize exactly
 */

#include <plyfetch/transfer/transfer.hpp>

#include <spdlog/spdlog.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace plyfetch::transfer {

namespace fs = std::filesystem;

namespace {

constexpr const char* kStagingDirName = ".plyfetch-staging";
constexpr mode_t kPublishedMode = 0644;

Error reassemblyError(std::string message) {
    return Error{ErrorCode::ReassemblyError, std::move(message)};
}

Expected<void> checkBounds(std::uint64_t offset, std::size_t size, std::uint64_t total) {
    if (size == 0) {
        return reassemblyError("empty write at offset " + std::to_string(offset));
    }
    if (offset > total || static_cast<std::uint64_t>(size) > total - offset) {
        return reassemblyError("write [" + std::to_string(offset) + ", " +
                               std::to_string(offset + size) + ") exceeds destination size " +
                               std::to_string(total));
    }
    return {};
}

Expected<void> verifyTotals(std::uint64_t written, std::uint64_t total) {
    if (written != total) {
        return reassemblyError("reassembled " + std::to_string(written) +
                               " bytes, manifest expects " + std::to_string(total));
    }
    return {};
}

Expected<void> fsync_dir(const fs::path& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        return Error{ErrorCode::IoError, "open(O_DIRECTORY) failed for: " + dir.string()};
    }
    if (::fsync(fd) != 0) {
        ::close(fd);
        return Error{ErrorCode::IoError, "fsync(dir) failed for: " + dir.string()};
    }
    ::close(fd);
    return {};
}

} // namespace

// ---------- Memory destination ----------

class MemoryReassembler final : public IReassembler {
public:
    explicit MemoryReassembler(std::uint64_t totalSize)
        : total_(totalSize), buffer_(static_cast<std::size_t>(totalSize)) {}

    std::uint64_t totalSize() const noexcept override { return total_; }
    std::uint64_t bytesWritten() const noexcept override {
        return written_.load(std::memory_order_acquire);
    }

    Expected<void> write(std::uint64_t offset, std::span<const std::byte> data) override {
        auto bounds = checkBounds(offset, data.size(), total_);
        if (!bounds.ok())
            return bounds;
        std::memcpy(buffer_.data() + offset, data.data(), data.size());
        written_.fetch_add(data.size(), std::memory_order_acq_rel);
        return {};
    }

    Expected<void> finish() override { return verifyTotals(bytesWritten(), total_); }

    void discard() noexcept override {
        ByteVector().swap(buffer_);
        written_.store(0, std::memory_order_release);
    }

    ByteVector takeBytes() override { return std::move(buffer_); }

    fs::path targetPath() const override { return {}; }

private:
    const std::uint64_t total_;
    ByteVector buffer_;
    std::atomic<std::uint64_t> written_{0};
};

// ---------- File destination ----------

class FileReassembler final : public IReassembler {
public:
    FileReassembler(fs::path target, fs::path staging, int fd, std::uint64_t totalSize)
        : target_(std::move(target)), staging_(std::move(staging)), fd_(fd), total_(totalSize) {}

    ~FileReassembler() override {
        if (!published_)
            discard();
    }

    FileReassembler(const FileReassembler&) = delete;
    FileReassembler& operator=(const FileReassembler&) = delete;

    std::uint64_t totalSize() const noexcept override { return total_; }
    std::uint64_t bytesWritten() const noexcept override {
        return written_.load(std::memory_order_acquire);
    }

    Expected<void> write(std::uint64_t offset, std::span<const std::byte> data) override {
        auto bounds = checkBounds(offset, data.size(), total_);
        if (!bounds.ok())
            return bounds;
        if (fd_ < 0) {
            return Error{ErrorCode::IoError, "staging file is closed: " + staging_.string()};
        }

        const auto* cursor = reinterpret_cast<const char*>(data.data());
        std::size_t remaining = data.size();
        auto position = static_cast<off_t>(offset);
        while (remaining > 0) {
            ssize_t n = ::pwrite(fd_, cursor, remaining, position);
            if (n < 0) {
                if (errno == EINTR)
                    continue;
                return Error{ErrorCode::IoError, "pwrite failed on " + staging_.string() + ": " +
                                                     std::strerror(errno)};
            }
            cursor += n;
            remaining -= static_cast<std::size_t>(n);
            position += n;
        }
        written_.fetch_add(data.size(), std::memory_order_acq_rel);
        return {};
    }

    Expected<void> finish() override {
        auto totals = verifyTotals(bytesWritten(), total_);
        if (!totals.ok())
            return totals;
        if (fd_ < 0) {
            return Error{ErrorCode::IoError, "staging file is closed: " + staging_.string()};
        }

        if (::fchmod(fd_, kPublishedMode) != 0) {
            return Error{ErrorCode::IoError, "fchmod() failed for " + staging_.string() + ": " +
                                                 std::strerror(errno)};
        }
        if (::fsync(fd_) != 0) {
            return Error{ErrorCode::IoError, "fsync() failed for: " + staging_.string()};
        }
        ::close(fd_);
        fd_ = -1;

        std::error_code ec;
        fs::rename(staging_, target_, ec);
        if (ec) {
            return Error{ErrorCode::IoError, "rename() failed (" + ec.message() + ") from " +
                                                 staging_.string() + " to " + target_.string()};
        }
        published_ = true;

        auto rd = fsync_dir(target_.parent_path().empty() ? fs::path(".") : target_.parent_path());
        if (!rd.ok()) {
            spdlog::debug("fsync on target dir failed (continuing): {}", rd.error().message);
        }

        std::error_code rm_ec;
        fs::remove(staging_.parent_path(), rm_ec); // only succeeds when empty
        return {};
    }

    void discard() noexcept override {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
        if (published_)
            return;
        std::error_code ec;
        fs::remove(staging_, ec);
        if (ec) {
            spdlog::debug("discard: failed to remove staging file {}: {}", staging_.string(),
                          ec.message());
        }
        fs::remove(staging_.parent_path(), ec);
    }

    ByteVector takeBytes() override { return {}; }

    fs::path targetPath() const override { return target_; }

private:
    fs::path target_;
    fs::path staging_;
    int fd_{-1};
    const std::uint64_t total_;
    std::atomic<std::uint64_t> written_{0};
    bool published_{false};
};

std::unique_ptr<IReassembler> makeMemoryReassembler(std::uint64_t totalSize) {
    return std::make_unique<MemoryReassembler>(totalSize);
}

Expected<std::unique_ptr<IReassembler>> makeFileReassembler(const fs::path& target,
                                                            std::uint64_t totalSize) {
    if (target.empty() || !target.has_filename()) {
        return Error{ErrorCode::InvalidArgument, "file destination requires a target file path"};
    }

    const fs::path parent = target.parent_path().empty() ? fs::path(".") : target.parent_path();
    const fs::path stagingDir = parent / kStagingDirName;
    std::error_code ec;
    fs::create_directories(stagingDir, ec);
    if (ec) {
        return Error{ErrorCode::IoError, "Failed to create staging dir: " + stagingDir.string() +
                                             " (" + ec.message() + ")"};
    }

    // Unique filename: <target>.<timestamp>.part
    auto now_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
                      std::chrono::steady_clock::now().time_since_epoch())
                      .count();
    const fs::path staging =
        stagingDir / (target.filename().string() + "." + std::to_string(now_ns) + ".part");

    int fd = ::open(staging.c_str(), O_RDWR | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (fd < 0) {
        return Error{ErrorCode::IoError, "Failed to create staging file: " + staging.string() +
                                             " (" + std::strerror(errno) + ")"};
    }
    if (::ftruncate(fd, static_cast<off_t>(totalSize)) != 0) {
        const std::string reason = std::strerror(errno);
        ::close(fd);
        fs::remove(staging, ec);
        return Error{ErrorCode::IoError,
                     "Failed to pre-size staging file " + staging.string() + ": " + reason};
    }

    return std::unique_ptr<IReassembler>(
        std::make_unique<FileReassembler>(target, staging, fd, totalSize));
}

} // namespace plyfetch::transfer
