// RangeCast - Seekable media delivery engine
// Tests for StreamCoordinator
//
// Tests cover:
// - Byte-exact delivery over HIT, MISS and mixed ranges
// - One backend fetch per chunk for concurrent readers
// - Handoff of an in-flight chunk when its consumer disconnects
// - Prefetch, access notifications and error mapping

#include <gtest/gtest.h>
#include "rangecast/streaming/stream_coordinator.hpp"
#include "support/fake_backend.hpp"
#include "support/test_log_sink.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

namespace rangecast {
namespace streaming {
namespace test {

using namespace std::chrono_literals;
using rangecast::test::FakeCatalog;
using rangecast::test::FakeObjects;
using rangecast::test::FakeSession;
using rangecast::test::patternBytes;
using rangecast::test::sliceOf;
using rangecast::test::TestLogSink;
using rangecast::test::waitUntil;

constexpr ByteCount CHUNK = 100;
constexpr ByteCount PART = 50;

class StreamCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        logger_ = rangecast::test::makeTestLogger(sink_);
        objects_ = std::make_shared<FakeObjects>();
        data_ = patternBytes(1000, 3);
        catalog_.addObject(*objects_, "movie", file_, data_, "video/mp4");

        for (int i = 0; i < 2; ++i) {
            sessions_.push_back(std::make_shared<FakeSession>(objects_, "s" + std::to_string(i + 1)));
        }
        SessionPoolConfig poolConfig;
        poolConfig.defaultCooldown = 50ms;
        poolConfig.acquireTimeout = 2000ms;
        auto pool = SessionPool::create(rangecast::test::asBackendSessions(sessions_), poolConfig, logger_);
        ASSERT_TRUE(pool.isSuccess());
        pool_ = std::move(pool).value();

        FetcherConfig fetcherConfig;
        fetcherConfig.partSize = PART;
        fetcher_ = std::make_unique<Fetcher>(fetcherConfig, logger_);
        rotating_ = std::make_unique<RotatingFetcher>(*pool_, *fetcher_, RotatingFetchConfig(), logger_);

        MediaCacheConfig cacheConfig;
        cacheConfig.capacityBytes = 100000;
        cacheConfig.chunkSize = CHUNK;
        cache_ = std::make_unique<MediaCache>(cacheConfig, std::make_shared<MemoryBlockStore>(), logger_);

        coordinator_ = std::make_unique<StreamCoordinator>(catalog_, *cache_, *rotating_, logger_);
    }

    Result<StreamSummary, Error> streamInto(Bytes& out, const ByteRange& range,
                                            const FileReference& file) {
        ByteSink sink = [&out](const uint8_t* data, size_t size) {
            out.insert(out.end(), data, data + size);
            return true;
        };
        return coordinator_->stream(file, range, sink);
    }

    Result<StreamSummary, Error> streamInto(Bytes& out, const ByteRange& range) {
        return streamInto(out, range, file_);
    }

    void setDelay(std::chrono::milliseconds delay) {
        for (auto& session : sessions_) {
            session->setDelay(delay);
        }
    }

    size_t backendParts() const { return rangecast::test::totalParts(sessions_); }

    const FileReference file_{42, 7};
    Bytes data_;
    std::shared_ptr<TestLogSink> sink_;
    std::shared_ptr<core::StructuredLogger> logger_;
    std::shared_ptr<FakeObjects> objects_;
    FakeCatalog catalog_;
    std::vector<std::shared_ptr<FakeSession>> sessions_;
    std::unique_ptr<SessionPool> pool_;
    std::unique_ptr<Fetcher> fetcher_;
    std::unique_ptr<RotatingFetcher> rotating_;
    std::unique_ptr<MediaCache> cache_;
    std::unique_ptr<StreamCoordinator> coordinator_;
};

// =============================================================================
// Delivery
// =============================================================================

TEST_F(StreamCoordinatorTest, MissThenHitDeliversSameBytes) {
    Bytes first;
    auto miss = streamInto(first, ByteRange::of(0, 350));
    ASSERT_TRUE(miss.isSuccess()) << miss.error().toString();
    EXPECT_EQ(first, sliceOf(data_, 0, 350));
    EXPECT_EQ(miss.value().verdict(), CacheVerdict::Miss);
    EXPECT_EQ(miss.value().missChunks, 4u);
    EXPECT_EQ(miss.value().bytesDelivered, 350u);

    const size_t partsAfterMiss = backendParts();
    EXPECT_EQ(partsAfterMiss, 8u);

    Bytes second;
    auto hit = streamInto(second, ByteRange::of(120, 260));
    ASSERT_TRUE(hit.isSuccess());
    EXPECT_EQ(second, sliceOf(data_, 120, 260));
    EXPECT_EQ(hit.value().verdict(), CacheVerdict::Hit);
    EXPECT_EQ(backendParts(), partsAfterMiss);
    EXPECT_EQ(pool_->statistics().totalLoad, 0u);
}

TEST_F(StreamCoordinatorTest, MixedRangeIsPartial) {
    Bytes warm;
    ASSERT_TRUE(streamInto(warm, ByteRange::of(100, 200)).isSuccess());

    Bytes out;
    auto mixed = streamInto(out, ByteRange::of(30, 290));
    ASSERT_TRUE(mixed.isSuccess());
    EXPECT_EQ(out, sliceOf(data_, 30, 290));
    EXPECT_EQ(mixed.value().verdict(), CacheVerdict::Partial);
    EXPECT_EQ(mixed.value().hitChunks, 1u);
    EXPECT_EQ(mixed.value().missChunks, 2u);
    EXPECT_EQ(cacheVerdictToString(mixed.value().verdict()), std::string("PARTIAL"));
}

TEST_F(StreamCoordinatorTest, WholeObjectAndTailChunk) {
    Bytes out;
    auto whole = streamInto(out, ByteRange::whole());
    ASSERT_TRUE(whole.isSuccess());
    EXPECT_EQ(out, data_);
    EXPECT_EQ(whole.value().range.end, 1000u);

    Bytes tail;
    ASSERT_TRUE(streamInto(tail, ByteRange::of(990, 1000)).isSuccess());
    EXPECT_EQ(tail, sliceOf(data_, 990, 1000));
}

TEST_F(StreamCoordinatorTest, ConcurrentReadersShareOneFetch) {
    setDelay(10ms);
    constexpr int READERS = 6;
    std::vector<Bytes> outputs(READERS);
    std::vector<std::thread> threads;
    std::atomic<int> succeeded{0};

    for (int i = 0; i < READERS; ++i) {
        threads.emplace_back([this, i, &outputs, &succeeded]() {
            if (streamInto(outputs[i], ByteRange::of(0, 300)).isSuccess()) {
                ++succeeded;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(succeeded.load(), READERS);
    for (const auto& out : outputs) {
        EXPECT_EQ(out, sliceOf(data_, 0, 300));
    }
    EXPECT_EQ(rangecast::test::partsAt(sessions_, file_, 0), 1u);
    EXPECT_EQ(backendParts(), 6u);
    EXPECT_EQ(cache_->statistics().reservedBytes, 0u);
    EXPECT_EQ(pool_->statistics().totalLoad, 0u);
}

TEST_F(StreamCoordinatorTest, DisconnectHandsChunkToSubscriber) {
    setDelay(20ms);

    std::atomic<bool> leaderStarted{false};
    Result<StreamSummary, Error> leaderResult =
        Result<StreamSummary, Error>::error(Error(ErrorCode::InvalidState));

    std::thread leader([&]() {
        ByteSink quitAfterFirstPart = [&](const uint8_t*, size_t) {
            leaderStarted = true;
            // Leave only once the second reader has joined the fill.
            waitUntil([this] { return cache_->statistics().coalescedJoins >= 1; });
            return false;
        };
        leaderResult = coordinator_->stream(file_, ByteRange::of(0, 300), quitAfterFirstPart);
    });

    ASSERT_TRUE(waitUntil([&] { return leaderStarted.load(); }));
    Bytes out;
    auto follower = streamInto(out, ByteRange::of(0, 300));
    leader.join();

    ASSERT_TRUE(leaderResult.isError());
    EXPECT_EQ(leaderResult.error().code, ErrorCode::Cancelled);

    ASSERT_TRUE(follower.isSuccess()) << follower.error().toString();
    EXPECT_EQ(out, sliceOf(data_, 0, 300));
    EXPECT_EQ(coordinator_->statistics().handoffs, 1u);
    EXPECT_EQ(rangecast::test::partsAt(sessions_, file_, 0), 1u);
    EXPECT_TRUE(cache_->contains(file_, 0));
    EXPECT_TRUE(cache_->contains(file_, 2));
    EXPECT_EQ(cache_->statistics().reservedBytes, 0u);
    EXPECT_EQ(pool_->statistics().totalLoad, 0u);

    auto stats = coordinator_->statistics();
    EXPECT_EQ(stats.cancelledStreams, 1u);
    EXPECT_EQ(stats.activeStreams, 0u);
}

TEST_F(StreamCoordinatorTest, ConsumerStopReleasesEverything) {
    ByteSink stop = [](const uint8_t*, size_t) { return false; };
    auto result = coordinator_->stream(file_, ByteRange::of(0, 500), stop);

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ErrorCode::Cancelled);
    EXPECT_FALSE(cache_->contains(file_, 1));
    EXPECT_EQ(cache_->statistics().reservedBytes, 0u);
    EXPECT_EQ(cache_->statistics().activeFills, 0u);
    EXPECT_EQ(pool_->statistics().totalLoad, 0u);
}

// =============================================================================
// Prefetch and Notifications
// =============================================================================

TEST_F(StreamCoordinatorTest, PrefetchMakesLaterStreamHit) {
    auto prefetched = coordinator_->prefetch(file_, ByteRange::of(0, 200));
    ASSERT_TRUE(prefetched.isSuccess());
    EXPECT_EQ(prefetched.value().bytesDelivered, 0u);
    EXPECT_TRUE(cache_->contains(file_, 0));
    EXPECT_TRUE(cache_->contains(file_, 1));

    // A second prefetch does not count as a viewer access.
    ASSERT_TRUE(coordinator_->prefetch(file_, ByteRange::of(0, 200)).isSuccess());
    EXPECT_EQ(cache_->entryInfo(ChunkKey(file_, 0))->frequency, 1u);

    Bytes out;
    auto hit = streamInto(out, ByteRange::of(0, 200));
    ASSERT_TRUE(hit.isSuccess());
    EXPECT_EQ(hit.value().verdict(), CacheVerdict::Hit);
    EXPECT_EQ(out, sliceOf(data_, 0, 200));
    EXPECT_EQ(coordinator_->statistics().prefetches, 2u);
}

TEST_F(StreamCoordinatorTest, ListenerHearsOnlyServedStreams) {
    std::mutex mutex;
    std::vector<FileReference> heard;
    coordinator_->setAccessListener([&](const FileReference& file, const ObjectInfo& info) {
        std::lock_guard<std::mutex> lock(mutex);
        heard.push_back(file);
        EXPECT_EQ(info.size, 1000u);
    });

    ASSERT_TRUE(coordinator_->prefetch(file_, ByteRange::of(0, 100)).isSuccess());
    Bytes out;
    ASSERT_TRUE(streamInto(out, ByteRange::of(0, 100)).isSuccess());

    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_EQ(heard.size(), 1u);
    EXPECT_EQ(heard[0], file_);
}

TEST_F(StreamCoordinatorTest, UncacheableContentPassesThrough) {
    const FileReference doc(42, 8);
    Bytes bytes = patternBytes(250, 9);
    catalog_.addObject(*objects_, "doc", doc, bytes, "application/pdf");

    Bytes first;
    ASSERT_TRUE(streamInto(first, ByteRange::whole(), doc).isSuccess());
    EXPECT_EQ(first, bytes);

    Bytes second;
    auto again = streamInto(second, ByteRange::whole(), doc);
    ASSERT_TRUE(again.isSuccess());
    EXPECT_EQ(again.value().verdict(), CacheVerdict::Miss);
    EXPECT_FALSE(cache_->contains(doc, 0));
    EXPECT_EQ(cache_->statistics().usedBytes, 0u);
}

// =============================================================================
// Errors
// =============================================================================

TEST_F(StreamCoordinatorTest, RangeOutsideObjectIsNotSatisfiable) {
    Bytes out;
    auto result = streamInto(out, ByteRange::of(900, 1200));
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ErrorCode::RangeNotSatisfiable);
    EXPECT_EQ(backendParts(), 0u);
}

TEST_F(StreamCoordinatorTest, UnknownFileIsNotFound) {
    Bytes out;
    auto result = streamInto(out, ByteRange::whole(), FileReference(1, 1));
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ErrorCode::NotFound);
}

TEST_F(StreamCoordinatorTest, BackendFailureLeavesNothingCached) {
    objects_->remove(file_);

    Bytes out;
    auto result = streamInto(out, ByteRange::of(0, 200));
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ErrorCode::NotFound);
    EXPECT_FALSE(cache_->contains(file_, 0));
    EXPECT_EQ(cache_->statistics().activeFills, 0u);
    EXPECT_EQ(coordinator_->statistics().failedStreams, 1u);

    objects_->put(file_, data_);
    Bytes retry;
    ASSERT_TRUE(streamInto(retry, ByteRange::of(0, 200)).isSuccess());
    EXPECT_EQ(retry, sliceOf(data_, 0, 200));
}

} // namespace test
} // namespace streaming
} // namespace rangecast
