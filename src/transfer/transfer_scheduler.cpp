/*
 * plyfetch/src/transfer/transfer_scheduler.cpp
 *
 * Bounded-parallel chunk scheduling for one manifest:
 * - min(concurrency, chunkCount) std::jthread workers pull Pending tasks from a ready queue
 * - A transient failure puts the task back to Pending after an exponential, jittered backoff
 *   (held in a delayed queue); attempts are counted when a fetch starts
 * - A permanent failure, an exhausted task, an external cancel or the session deadline stops
 *   every worker; in-flight fetches observe the stop through their ShouldCancel
 * - Progress events are emitted in completion order, serialized under the session mutex
 * - The deadline is TransferOptions::deadline when the caller set one, else now + sessionTimeout
 * - A successful run leaves the session Reassembling; publishing is the caller's step
 *
 * ShouldCancel supplied by the caller may be polled from several worker threads at once.
 */

#include <plyfetch/transfer/transfer.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <random>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace plyfetch::transfer {

namespace {

using SteadyClock = std::chrono::steady_clock;

// Upper bound on how long an idle worker sleeps before re-checking cancel and deadline
constexpr std::chrono::milliseconds kIdlePoll{50};

struct DelayedTask {
    SteadyClock::time_point due;
    std::uint32_t index;
    bool operator>(const DelayedTask& other) const noexcept { return due > other.due; }
};

struct Session {
    const TransferManifest& manifest;
    IReassembler& destination;
    const TransferOptions& options;
    const ShouldCancel& shouldCancel;
    const ProgressCallback& onProgress;

    std::mutex mu;
    std::condition_variable cv;
    std::vector<ChunkTask> tasks;
    std::deque<std::uint32_t> ready;
    std::priority_queue<DelayedTask, std::vector<DelayedTask>, std::greater<>> delayed;
    std::uint32_t done{0};
    std::uint64_t bytesFetched{0};
    std::uint32_t retries{0};
    std::optional<Error> failure;
    SessionState state{SessionState::Fetching};
    std::atomic<bool> stopping{false};
    std::optional<SteadyClock::time_point> deadline;
    std::mt19937 rng{std::random_device{}()};

    Session(const TransferManifest& m, IReassembler& dest, const TransferOptions& opts,
            const ShouldCancel& cancel, const ProgressCallback& progress)
        : manifest(m), destination(dest), options(opts), shouldCancel(cancel),
          onProgress(progress) {}

    bool externallyCancelled() const { return shouldCancel && shouldCancel(); }

    bool pastDeadline() const { return deadline && SteadyClock::now() >= *deadline; }

    // Caller holds mu. The first failure wins; later ones are side effects of the stop.
    void failLocked(Error err) {
        if (!failure) {
            failure = std::move(err);
            state = SessionState::Failed;
        }
        stopping.store(true, std::memory_order_release);
        cv.notify_all();
    }

    void fail(Error err) {
        std::lock_guard<std::mutex> lk(mu);
        failLocked(std::move(err));
    }

    // Caller holds mu.
    std::optional<Error> stopReasonLocked() const {
        if (externallyCancelled()) {
            return Error{ErrorCode::Cancelled, "transfer of job '" + manifest.jobId + "' cancelled"};
        }
        if (pastDeadline()) {
            return Error{ErrorCode::Timeout, "transfer of job '" + manifest.jobId +
                                                 "' exceeded its session timeout"};
        }
        return std::nullopt;
    }

    // Caller holds mu.
    void promoteDueLocked(SteadyClock::time_point now) {
        while (!delayed.empty() && delayed.top().due <= now) {
            ready.push_back(delayed.top().index);
            delayed.pop();
        }
    }

    // Caller holds mu.
    std::chrono::milliseconds backoffLocked(std::uint32_t attempts) {
        const auto& policy = options.retry;
        double delay = static_cast<double>(policy.initialBackoff.count()) *
                       std::pow(policy.multiplier, static_cast<double>(attempts > 0 ? attempts - 1 : 0));
        delay = std::min(delay, static_cast<double>(policy.maxBackoff.count()));
        if (policy.jitter > 0.0) {
            std::uniform_real_distribution<double> dist(-policy.jitter, policy.jitter);
            delay *= 1.0 + dist(rng);
        }
        return std::chrono::milliseconds(static_cast<std::int64_t>(std::max(0.0, delay)));
    }

    // Caller holds mu.
    void emitProgressLocked() {
        if (!onProgress)
            return;
        ProgressEvent ev;
        ev.jobId = manifest.jobId;
        ev.chunksDone = done;
        ev.chunkCount = manifest.chunkCount;
        ev.bytesDone = bytesFetched;
        ev.totalBytes = manifest.totalSize;
        ev.stage = ProgressStage::Fetching;
        onProgress(ev);
    }
};

class TransferScheduler final : public ITransferScheduler {
public:
    explicit TransferScheduler(std::shared_ptr<IChunkFetcher> fetcher)
        : fetcher_(std::move(fetcher)) {}

    Expected<TransferReport> fetch(const TransferManifest& manifest, IReassembler& destination,
                                   const TransferOptions& options,
                                   const ShouldCancel& shouldCancel,
                                   const ProgressCallback& onProgress) override {
        if (!fetcher_) {
            return Error{ErrorCode::InvalidArgument, "scheduler has no chunk fetcher"};
        }
        if (manifest.chunkCount == 0 || manifest.chunkSize == 0 || manifest.totalSize == 0) {
            return Error{ErrorCode::InvalidArgument,
                         "empty manifest for job '" + manifest.jobId + "'"};
        }
        if (options.concurrency < 1) {
            return Error{ErrorCode::InvalidArgument,
                         "concurrency must be >= 1 (got " + std::to_string(options.concurrency) +
                             ")"};
        }
        if (options.retry.maxRetries < 1) {
            return Error{ErrorCode::InvalidArgument, "maxRetries must be >= 1"};
        }
        if (destination.totalSize() != manifest.totalSize) {
            return Error{ErrorCode::InvalidArgument,
                         "destination holds " + std::to_string(destination.totalSize()) +
                             " bytes, manifest expects " + std::to_string(manifest.totalSize)};
        }

        const auto started = SteadyClock::now();
        Session s(manifest, destination, options, shouldCancel, onProgress);
        if (options.deadline) {
            s.deadline = options.deadline;
        } else if (options.sessionTimeout.count() > 0) {
            s.deadline = started + options.sessionTimeout;
        }

        s.tasks.reserve(manifest.chunkCount);
        for (std::uint32_t i = 0; i < manifest.chunkCount; ++i) {
            ChunkTask t;
            t.index = i;
            t.offset = chunkOffset(manifest, i);
            t.length = chunkLength(manifest, i);
            s.tasks.push_back(t);
            s.ready.push_back(i);
        }

        const auto workers = static_cast<std::uint32_t>(
            std::min<std::uint64_t>(static_cast<std::uint64_t>(options.concurrency),
                                    manifest.chunkCount));
        spdlog::debug("Fetching job {}: {} chunks with {} workers", manifest.jobId,
                      manifest.chunkCount, workers);

        {
            std::vector<std::jthread> pool;
            pool.reserve(workers);
            for (std::uint32_t w = 0; w < workers; ++w) {
                pool.emplace_back([this, &s](std::stop_token st) { runWorker(s, st); });
            }
        } // jthreads join here

        if (s.failure) {
            destination.discard();
            const auto& err = *s.failure;
            if (err.code == ErrorCode::Cancelled) {
                spdlog::info("Transfer of job {} cancelled", manifest.jobId);
            } else {
                spdlog::error("Transfer of job {} failed: {}", manifest.jobId, err.message);
            }
            return err;
        }

        if (s.done != manifest.chunkCount) {
            destination.discard();
            return Error{ErrorCode::Unknown, "workers exited with " + std::to_string(s.done) +
                                                 " of " + std::to_string(manifest.chunkCount) +
                                                 " chunks done"};
        }

        std::uint64_t lengthSum = 0;
        for (const auto& t : s.tasks)
            lengthSum += t.length;
        if (lengthSum != manifest.totalSize || s.bytesFetched != manifest.totalSize) {
            destination.discard();
            return Error{ErrorCode::ReassemblyError,
                         "fetched " + std::to_string(s.bytesFetched) + " bytes, manifest expects " +
                             std::to_string(manifest.totalSize)};
        }

        TransferReport report;
        report.manifest = manifest;
        report.tasks = std::move(s.tasks);
        report.bytesFetched = s.bytesFetched;
        report.retries = s.retries;
        report.state = s.state;
        report.elapsed =
            std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - started);
        spdlog::info("Fetched job {} ({} bytes, {} chunks, {} retries) in {} ms", manifest.jobId,
                     report.bytesFetched, manifest.chunkCount, report.retries,
                     report.elapsed.count());
        return report;
    }

private:
    // Blocks until a task is ready or the session is over; returns nullopt when the worker
    // should exit.
    static std::optional<std::uint32_t> nextTask(Session& s, std::stop_token& st) {
        std::unique_lock<std::mutex> lk(s.mu);
        for (;;) {
            if (s.stopping.load(std::memory_order_acquire) || st.stop_requested())
                return std::nullopt;
            if (s.done == s.manifest.chunkCount)
                return std::nullopt;
            if (auto reason = s.stopReasonLocked()) {
                s.failLocked(std::move(*reason));
                return std::nullopt;
            }

            const auto now = SteadyClock::now();
            s.promoteDueLocked(now);
            if (!s.ready.empty()) {
                const auto idx = s.ready.front();
                s.ready.pop_front();
                auto& task = s.tasks[idx];
                task.state = ChunkState::InFlight;
                ++task.attempts;
                return idx;
            }

            auto wake = now + kIdlePoll;
            if (!s.delayed.empty())
                wake = std::min(wake, s.delayed.top().due);
            s.cv.wait_until(lk, wake);
        }
    }

    void runWorker(Session& s, std::stop_token st) {
        try {
            while (auto idx = nextTask(s, st)) {
                if (!runTask(s, *idx))
                    return;
            }
        } catch (const std::exception& e) {
            s.fail(Error{ErrorCode::Unknown, std::string("transfer worker failed: ") + e.what()});
        }
    }

    // Returns false when the worker should stop pulling tasks.
    bool runTask(Session& s, std::uint32_t idx) {
        ChunkTask task;
        {
            std::lock_guard<std::mutex> lk(s.mu);
            task = s.tasks[idx];
        }

        ShouldCancel chunkCancel = [&s] {
            return s.stopping.load(std::memory_order_acquire) || s.externallyCancelled() ||
                   s.pastDeadline();
        };

        auto result =
            fetcher_->fetchChunk(s.manifest.jobId, idx, task.offset, task.length, chunkCancel);

        if (result.ok()) {
            auto& bytes = result.value();
            auto written = s.destination.write(task.offset, bytes);
            std::lock_guard<std::mutex> lk(s.mu);
            if (!written.ok()) {
                s.tasks[idx].state = ChunkState::Failed;
                Error err = written.error();
                err.chunkIndex = idx;
                err.attempts = s.tasks[idx].attempts;
                s.failLocked(std::move(err));
                return false;
            }
            s.tasks[idx].state = ChunkState::Done;
            ++s.done;
            s.bytesFetched += bytes.size();
            s.emitProgressLocked();
            if (s.done == s.manifest.chunkCount) {
                s.state = SessionState::Reassembling;
                s.cv.notify_all();
            }
            return true;
        }

        Error err = result.error();
        std::lock_guard<std::mutex> lk(s.mu);
        auto& slot = s.tasks[idx];
        err.chunkIndex = idx;
        err.attempts = slot.attempts;

        if (s.stopping.load(std::memory_order_acquire)) {
            // Already stopping; this failure is a consequence of the stop.
            slot.state = ChunkState::Pending;
            return false;
        }

        if (err.code == ErrorCode::Cancelled) {
            slot.state = ChunkState::Pending;
            auto reason = s.stopReasonLocked();
            s.failLocked(reason ? std::move(*reason) : std::move(err));
            return false;
        }

        if (err.code == ErrorCode::ChunkTransient && slot.attempts < s.options.retry.maxRetries) {
            slot.state = ChunkState::Pending;
            ++s.retries;
            const auto delay = s.backoffLocked(slot.attempts);
            s.delayed.push(DelayedTask{SteadyClock::now() + delay, idx});
            spdlog::warn("Chunk {} of job {} failed (attempt {}/{}), retrying in {} ms: {}", idx,
                         s.manifest.jobId, slot.attempts, s.options.retry.maxRetries,
                         delay.count(), err.message);
            s.cv.notify_one();
            return true;
        }

        slot.state = ChunkState::Failed;
        if (err.code == ErrorCode::ChunkTransient) {
            err.message += " (gave up after " + std::to_string(slot.attempts) + " attempts)";
        }
        s.failLocked(std::move(err));
        return false;
    }

    std::shared_ptr<IChunkFetcher> fetcher_;
};

} // namespace

std::unique_ptr<ITransferScheduler> makeTransferScheduler(std::shared_ptr<IChunkFetcher> fetcher) {
    return std::make_unique<TransferScheduler>(std::move(fetcher));
}

} // namespace plyfetch::transfer
