#include <gtest/gtest.h>
#include <plyfetch/transfer/transfer.hpp>

#include "tests/support/fake_transfer.hpp"

#include <memory>
#include <string>

using namespace plyfetch::transfer;
using plyfetch::test_support::FakeHttpAdapter;

namespace {

ServerConfig server() {
    ServerConfig s;
    s.baseUrl = "http://srv:8000";
    s.chunkTimeout = std::chrono::milliseconds(1234);
    s.headers.push_back(Header{"X-Client", "plyfetch-test"});
    return s;
}

std::shared_ptr<FakeHttpAdapter> reply(long status, std::string body) {
    auto http = std::make_shared<FakeHttpAdapter>();
    http->handler = [status, body](const std::string&) {
        return FakeHttpAdapter::Reply{status, body};
    };
    return http;
}

std::shared_ptr<FakeHttpAdapter> transportFailure(ErrorCode code) {
    auto http = std::make_shared<FakeHttpAdapter>();
    http->handler = [code](const std::string&) {
        FakeHttpAdapter::Reply r;
        r.transportError = Error{code, "transport failure"};
        return r;
    };
    return http;
}

} // namespace

TEST(ChunkFetcher, ReturnsExactRangeAndBuildsUrl) {
    auto http = reply(200, "ABCDEFGH");
    http->sliceSize = 3; // body arrives in several callbacks
    auto fetcher = makeChunkFetcher(server(), http);

    auto r = fetcher->fetchChunk("job 7", 2, 16, 8, {});
    ASSERT_TRUE(r.ok()) << r.error().message;
    EXPECT_EQ(r.value(), plyfetch::test_support::to_bytes("ABCDEFGH"));

    auto urls = http->urls();
    ASSERT_EQ(urls.size(), 1u);
    EXPECT_EQ(urls.front(), "http://srv:8000/api/download_chunk/job%207/2");
    EXPECT_EQ(http->lastTimeout().count(), 1234);
    ASSERT_EQ(http->lastHeaders().size(), 1u);
    EXPECT_EQ(http->lastHeaders().front().name, "X-Client");
}

TEST(ChunkFetcher, ShortBodyIsPermanent) {
    auto fetcher = makeChunkFetcher(server(), reply(200, "ABC"));
    auto r = fetcher->fetchChunk("j", 1, 8, 8, {});
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, ErrorCode::ChunkPermanent);
    ASSERT_TRUE(r.error().chunkIndex.has_value());
    EXPECT_EQ(*r.error().chunkIndex, 1u);
}

TEST(ChunkFetcher, LongBodyIsPermanent) {
    auto fetcher = makeChunkFetcher(server(), reply(200, "ABCDEFGHIJ"));
    auto r = fetcher->fetchChunk("j", 0, 0, 8, {});
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, ErrorCode::ChunkPermanent);
    EXPECT_NE(r.error().message.find("exceeds expected length"), std::string::npos);
}

TEST(ChunkFetcher, AllZeroPayloadIsPermanentByDefault) {
    auto fetcher = makeChunkFetcher(server(), reply(200, std::string(16, '\0')));
    auto r = fetcher->fetchChunk("j", 0, 0, 16, {});
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, ErrorCode::ChunkPermanent);
}

TEST(ChunkFetcher, AllZeroPayloadAcceptedWhenDisabled) {
    ChunkFetcherOptions opts;
    opts.rejectAllZeroPayload = false;
    auto fetcher = makeChunkFetcher(server(), reply(200, std::string(16, '\0')), opts);
    auto r = fetcher->fetchChunk("j", 0, 0, 16, {});
    ASSERT_TRUE(r.ok()) << r.error().message;
    EXPECT_EQ(r.value().size(), 16u);
}

TEST(ChunkFetcher, ServerErrorsAreTransient) {
    for (long status : {500L, 502L, 503L, 429L, 408L}) {
        auto fetcher = makeChunkFetcher(server(), reply(status, "try later"));
        auto r = fetcher->fetchChunk("j", 3, 0, 4, {});
        ASSERT_FALSE(r.ok()) << status;
        EXPECT_EQ(r.error().code, ErrorCode::ChunkTransient) << status;
        EXPECT_EQ(r.error().chunkIndex.value_or(99), 3u);
    }
}

TEST(ChunkFetcher, ClientErrorsArePermanent) {
    for (long status : {400L, 403L, 404L, 410L}) {
        auto fetcher = makeChunkFetcher(server(), reply(status, "nope"));
        auto r = fetcher->fetchChunk("j", 0, 0, 4, {});
        ASSERT_FALSE(r.ok()) << status;
        EXPECT_EQ(r.error().code, ErrorCode::ChunkPermanent) << status;
    }
}

TEST(ChunkFetcher, TransportFailuresAreTransient) {
    for (auto code : {ErrorCode::NetworkError, ErrorCode::Timeout, ErrorCode::Unknown}) {
        auto fetcher = makeChunkFetcher(server(), transportFailure(code));
        auto r = fetcher->fetchChunk("j", 0, 0, 4, {});
        ASSERT_FALSE(r.ok());
        EXPECT_EQ(r.error().code, ErrorCode::ChunkTransient) << errorCodeName(code);
    }
}

TEST(ChunkFetcher, CancellationIsReportedAsCancelled) {
    auto http = reply(200, "ABCD");
    http->handler = [](const std::string&) {
        FakeHttpAdapter::Reply r{200, "ABCD"};
        r.delay = std::chrono::milliseconds(2000);
        return r;
    };
    auto fetcher = makeChunkFetcher(server(), http);
    auto r = fetcher->fetchChunk("j", 0, 0, 4, [] { return true; });
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, ErrorCode::Cancelled);
}

TEST(ChunkFetcher, ZeroLengthIsInvalid) {
    auto http = reply(200, "");
    auto fetcher = makeChunkFetcher(server(), http);
    auto r = fetcher->fetchChunk("j", 0, 0, 0, {});
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
    EXPECT_TRUE(http->urls().empty());
}
