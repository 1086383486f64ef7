#include <gtest/gtest.h>
#include <plyfetch/transfer/transfer.hpp>

#include "tests/support/fake_transfer.hpp"
#include "tests/support/temp_dir_scope.hpp"

#include <atomic>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;
using namespace plyfetch::transfer;
using namespace std::chrono_literals;
using plyfetch::test_support::FakeClock;
using plyfetch::test_support::patterned_bytes;
using plyfetch::test_support::ScriptedChunkFetcher;
using plyfetch::test_support::StaticManifestClient;
using plyfetch::test_support::TempDirScope;

namespace {

ByteVector readFile(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    std::vector<char> raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    ByteVector out(raw.size());
    std::memcpy(out.data(), raw.data(), raw.size());
    return out;
}

// Forwards to a real cache and counts payload reads and metadata lookups.
class CountingCache final : public ICacheManager {
public:
    explicit CountingCache(std::shared_ptr<ICacheManager> inner) : inner_(std::move(inner)) {}

    bool isFresh(std::string_view key) override { return inner_->isFresh(key); }
    Expected<ByteVector> load(std::string_view key) override {
        ++loads;
        return inner_->load(key);
    }
    Expected<CacheEntry> lookup(std::string_view key) override {
        ++lookups;
        return inner_->lookup(key);
    }
    fs::path entryPath(std::string_view key) const override { return inner_->entryPath(key); }
    Expected<CacheEntry> store(std::string_view key, std::span<const std::byte> data) override {
        return inner_->store(key, data);
    }
    Expected<CacheEntry> storeFile(std::string_view key, const fs::path& source) override {
        return inner_->storeFile(key, source);
    }
    Expected<void> remove(std::string_view key) override { return inner_->remove(key); }
    Expected<std::size_t> cleanupExpired() override { return inner_->cleanupExpired(); }
    Expected<CacheStats> stats() override { return inner_->stats(); }
    const CacheConfig& config() const noexcept override { return inner_->config(); }

    std::atomic<int> loads{0};
    std::atomic<int> lookups{0};

private:
    std::shared_ptr<ICacheManager> inner_;
};

constexpr auto kPublishedPerms = fs::perms::owner_read | fs::perms::owner_write |
                                 fs::perms::group_read | fs::perms::others_read;

class ArtifactFetcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        tmp_ = std::make_unique<TempDirScope>(TempDirScope::unique_under("plyfetch-artifact"));
        artifact_ = patterned_bytes(40'000);
        auto m = makeManifest("job-e2e", artifact_.size(), 4096,
                              chunkCountFor(artifact_.size(), 4096), "mesh.ply");
        ASSERT_TRUE(m.ok()) << m.error().message;
        manifests_ = std::make_shared<StaticManifestClient>(m.value());
        chunks_ = std::make_shared<ScriptedChunkFetcher>(artifact_);

        CacheConfig cfg;
        cfg.directory = tmp_->path() / "cache";
        cfg.ttl = 24h;
        cfg.clock = clock_.fn();
        cache_ = std::shared_ptr<ICacheManager>(makeCacheManager(cfg));
        fetcher_ = makeArtifactFetcherWithDependencies(manifests_, chunks_, cache_);
    }

    ArtifactRequest memoryRequest() const {
        ArtifactRequest req;
        req.jobId = "job-e2e";
        req.options.concurrency = 4;
        req.options.retry.initialBackoff = 1ms;
        req.options.retry.jitter = 0.0;
        return req;
    }

    ArtifactRequest fileRequest(const fs::path& out) const {
        auto req = memoryRequest();
        req.destination = Destination::File;
        req.outputPath = out;
        return req;
    }

    std::unique_ptr<TempDirScope> tmp_;
    ByteVector artifact_;
    FakeClock clock_;
    std::shared_ptr<StaticManifestClient> manifests_;
    std::shared_ptr<ScriptedChunkFetcher> chunks_;
    std::shared_ptr<ICacheManager> cache_;
    std::unique_ptr<IArtifactFetcher> fetcher_;
};

} // namespace

TEST_F(ArtifactFetcherTest, MissThenHitSkipsNetwork) {
    auto first = fetcher_->fetch(memoryRequest());
    ASSERT_TRUE(first.ok()) << first.error().message;
    EXPECT_FALSE(first.value().fromCache);
    EXPECT_EQ(first.value().bytes, artifact_);
    EXPECT_EQ(first.value().sha256, sha256Hex(artifact_));
    ASSERT_TRUE(first.value().report.has_value());
    EXPECT_EQ(first.value().report->state, SessionState::Complete);
    EXPECT_EQ(first.value().path, cache_->config().directory / "job-e2e.ply");
    EXPECT_EQ(manifests_->calls(), 1);
    const auto callsAfterMiss = chunks_->totalCalls();

    auto second = fetcher_->fetch(memoryRequest());
    ASSERT_TRUE(second.ok()) << second.error().message;
    EXPECT_TRUE(second.value().fromCache);
    EXPECT_EQ(second.value().bytes, artifact_);
    EXPECT_FALSE(second.value().report.has_value());
    EXPECT_EQ(manifests_->calls(), 1);
    EXPECT_EQ(chunks_->totalCalls(), callsAfterMiss);
}

TEST_F(ArtifactFetcherTest, RefreshBypassesFreshEntry) {
    ASSERT_TRUE(fetcher_->fetch(memoryRequest()).ok());
    auto req = memoryRequest();
    req.refresh = true;
    auto again = fetcher_->fetch(req);
    ASSERT_TRUE(again.ok());
    EXPECT_FALSE(again.value().fromCache);
    EXPECT_EQ(manifests_->calls(), 2);
}

TEST_F(ArtifactFetcherTest, ExpiredEntryIsRefetched) {
    ASSERT_TRUE(fetcher_->fetch(memoryRequest()).ok());
    clock_.advance(25h);
    auto again = fetcher_->fetch(memoryRequest());
    ASSERT_TRUE(again.ok());
    EXPECT_FALSE(again.value().fromCache);
    EXPECT_EQ(manifests_->calls(), 2);
    EXPECT_TRUE(cache_->isFresh("job-e2e"));
}

TEST_F(ArtifactFetcherTest, FileDestinationAndCachedCopy) {
    const auto out = tmp_->path() / "out" / "model.ply";
    auto first = fetcher_->fetch(fileRequest(out));
    ASSERT_TRUE(first.ok()) << first.error().message;
    EXPECT_EQ(first.value().path, out);
    EXPECT_TRUE(first.value().bytes.empty());
    EXPECT_EQ(readFile(out), artifact_);
    EXPECT_EQ(first.value().sha256, sha256Hex(artifact_));

    const auto copy = tmp_->path() / "copy.ply";
    auto second = fetcher_->fetch(fileRequest(copy));
    ASSERT_TRUE(second.ok()) << second.error().message;
    EXPECT_TRUE(second.value().fromCache);
    EXPECT_EQ(readFile(copy), artifact_);
    EXPECT_EQ(manifests_->calls(), 1);

    EXPECT_EQ(fs::status(out).permissions() & fs::perms::all, kPublishedPerms);
    EXPECT_EQ(fs::status(copy).permissions() & fs::perms::all, kPublishedPerms);
}

TEST_F(ArtifactFetcherTest, CorruptedCacheEntryIsRefetchedInFileMode) {
    const auto out = tmp_->path() / "model.ply";
    ASSERT_TRUE(fetcher_->fetch(fileRequest(out)).ok());

    // Same size, different bytes: only the digest can tell.
    const auto cached = cache_->entryPath("job-e2e");
    fs::permissions(cached, fs::perms::owner_write, fs::perm_options::add);
    {
        std::fstream f(cached, std::ios::in | std::ios::out | std::ios::binary);
        ASSERT_TRUE(f.good());
        f.seekp(100);
        f.write("\0\0", 2);
    }
    ASSERT_EQ(fs::file_size(cached), artifact_.size());

    const auto copy = tmp_->path() / "copy.ply";
    auto second = fetcher_->fetch(fileRequest(copy));
    ASSERT_TRUE(second.ok()) << second.error().message;
    EXPECT_FALSE(second.value().fromCache);
    EXPECT_EQ(manifests_->calls(), 2);
    EXPECT_EQ(readFile(copy), artifact_);
    EXPECT_EQ(second.value().sha256, sha256Hex(artifact_));

    auto reloaded = cache_->load("job-e2e");
    ASSERT_TRUE(reloaded.ok()) << reloaded.error().message;
    EXPECT_EQ(reloaded.value(), artifact_);
}

TEST_F(ArtifactFetcherTest, CachedCopyReportsDigestOfWrittenFile) {
    ASSERT_TRUE(fetcher_->fetch(fileRequest(tmp_->path() / "a.ply")).ok());
    const auto copy = tmp_->path() / "b.ply";
    auto hit = fetcher_->fetch(fileRequest(copy));
    ASSERT_TRUE(hit.ok()) << hit.error().message;
    EXPECT_TRUE(hit.value().fromCache);
    auto onDisk = sha256HexOfFile(copy);
    ASSERT_TRUE(onDisk.ok());
    EXPECT_EQ(hit.value().sha256, onDisk.value());
}

TEST_F(ArtifactFetcherTest, MemoryHitReadsCacheOnce) {
    auto counting = std::make_shared<CountingCache>(cache_);
    auto fetcher = makeArtifactFetcherWithDependencies(manifests_, chunks_, counting);
    ASSERT_TRUE(fetcher->fetch(memoryRequest()).ok());
    const int loadsBefore = counting->loads.load();
    const int lookupsBefore = counting->lookups.load();

    auto hit = fetcher->fetch(memoryRequest());
    ASSERT_TRUE(hit.ok()) << hit.error().message;
    EXPECT_TRUE(hit.value().fromCache);
    EXPECT_EQ(hit.value().path, cache_->config().directory / "job-e2e.ply");
    EXPECT_EQ(counting->loads.load() - loadsBefore, 1);
    EXPECT_EQ(counting->lookups.load() - lookupsBefore, 0);
}

TEST_F(ArtifactFetcherTest, SessionTimeoutCoversManifestResolution) {
    auto slow = std::make_shared<StaticManifestClient>(
        makeManifest("job-e2e", artifact_.size(), 4096, chunkCountFor(artifact_.size(), 4096)),
        5000ms);
    auto fetcher = makeArtifactFetcherWithDependencies(slow, chunks_, cache_);
    const auto out = tmp_->path() / "model.ply";
    auto req = fileRequest(out);
    req.options.sessionTimeout = 100ms;

    const auto started = std::chrono::steady_clock::now();
    auto r = fetcher->fetch(req);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, ErrorCode::Timeout);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 2000ms);
    EXPECT_EQ(chunks_->totalCalls(), 0u);
    EXPECT_FALSE(fs::exists(out));
    EXPECT_FALSE(cache_->isFresh("job-e2e"));
}

TEST_F(ArtifactFetcherTest, CancelDuringManifestResolution) {
    auto slow = std::make_shared<StaticManifestClient>(
        makeManifest("job-e2e", artifact_.size(), 4096, chunkCountFor(artifact_.size(), 4096)),
        5000ms);
    auto fetcher = makeArtifactFetcherWithDependencies(slow, chunks_, cache_);
    const auto cancelAt = std::chrono::steady_clock::now() + 50ms;

    auto r = fetcher->fetch(memoryRequest(), {},
                            [cancelAt] { return std::chrono::steady_clock::now() >= cancelAt; });
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, ErrorCode::Cancelled);
    EXPECT_EQ(chunks_->totalCalls(), 0u);
}

TEST_F(ArtifactFetcherTest, SessionTimeoutSpansResolutionAndChunks) {
    // Neither step alone exceeds the budget; together they do.
    auto slow = std::make_shared<StaticManifestClient>(
        makeManifest("job-e2e", artifact_.size(), 4096, chunkCountFor(artifact_.size(), 4096)),
        150ms);
    chunks_->setLatency(150ms);
    auto fetcher = makeArtifactFetcherWithDependencies(slow, chunks_, cache_);
    auto req = memoryRequest();
    req.options.concurrency = 16;
    req.options.sessionTimeout = 250ms;

    auto r = fetcher->fetch(req);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, ErrorCode::Timeout);
    EXPECT_FALSE(cache_->isFresh("job-e2e"));
}

TEST_F(ArtifactFetcherTest, ProgressEndsWithComplete) {
    std::vector<ProgressStage> stages;
    auto r = fetcher_->fetch(memoryRequest(),
                             [&](const ProgressEvent& ev) { stages.push_back(ev.stage); });
    ASSERT_TRUE(r.ok());
    ASSERT_FALSE(stages.empty());
    EXPECT_EQ(stages.front(), ProgressStage::Resolving);
    EXPECT_EQ(stages.back(), ProgressStage::Complete);
}

TEST_F(ArtifactFetcherTest, FailedTransferLeavesNothingBehind) {
    chunks_->failWith(3, {ErrorCode::ChunkPermanent});
    const auto out = tmp_->path() / "model.ply";
    auto r = fetcher_->fetch(fileRequest(out));
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, ErrorCode::ChunkPermanent);
    EXPECT_EQ(r.error().chunkIndex.value_or(99), 3u);
    EXPECT_FALSE(fs::exists(out));
    EXPECT_FALSE(cache_->isFresh("job-e2e"));
}

TEST_F(ArtifactFetcherTest, ManifestErrorPropagates) {
    auto bad = std::make_shared<StaticManifestClient>(
        Error{ErrorCode::ManifestError, "unknown job 'job-e2e'"});
    auto fetcher = makeArtifactFetcherWithDependencies(bad, chunks_, cache_);
    auto r = fetcher->fetch(memoryRequest());
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, ErrorCode::ManifestError);
    EXPECT_EQ(chunks_->totalCalls(), 0u);
}

TEST_F(ArtifactFetcherTest, InvalidRequests) {
    auto req = memoryRequest();
    req.jobId.clear();
    EXPECT_EQ(fetcher_->fetch(req).error().code, ErrorCode::InvalidArgument);

    auto fileReq = memoryRequest();
    fileReq.destination = Destination::File;
    EXPECT_EQ(fetcher_->fetch(fileReq).error().code, ErrorCode::InvalidArgument);

    EXPECT_EQ(manifests_->calls(), 0);
}

TEST_F(ArtifactFetcherTest, WorksWithoutCache) {
    auto fetcher = makeArtifactFetcherWithDependencies(manifests_, chunks_, nullptr);
    auto r = fetcher->fetch(memoryRequest());
    ASSERT_TRUE(r.ok()) << r.error().message;
    EXPECT_EQ(r.value().bytes, artifact_);
    EXPECT_TRUE(r.value().path.empty());
    EXPECT_FALSE(fs::exists(cache_->config().directory));
}

TEST_F(ArtifactFetcherTest, UseCacheFalseNeitherReadsNorWrites) {
    ASSERT_TRUE(fetcher_->fetch(memoryRequest()).ok());
    auto req = memoryRequest();
    req.useCache = false;
    auto r = fetcher_->fetch(req);
    ASSERT_TRUE(r.ok());
    EXPECT_FALSE(r.value().fromCache);
    EXPECT_EQ(manifests_->calls(), 2);
}

TEST_F(ArtifactFetcherTest, CacheStoreFailureIsNotFatal) {
    const auto blocker = tmp_->path() / "not-a-dir";
    {
        std::ofstream(blocker) << "file";
    }
    CacheConfig cfg;
    cfg.directory = blocker;
    auto brokenCache = std::shared_ptr<ICacheManager>(makeCacheManager(cfg));
    auto fetcher = makeArtifactFetcherWithDependencies(manifests_, chunks_, brokenCache);

    auto r = fetcher->fetch(memoryRequest());
    ASSERT_TRUE(r.ok()) << r.error().message;
    EXPECT_EQ(r.value().bytes, artifact_);
    EXPECT_FALSE(brokenCache->isFresh("job-e2e"));
}
