// RangeCast - Seekable media delivery engine
// Tests for ChunkFill and fill coalescing in MediaCache

#include <gtest/gtest.h>
#include "rangecast/streaming/chunk_fill.hpp"
#include "rangecast/streaming/media_cache.hpp"
#include "support/fake_backend.hpp"

#include <chrono>
#include <thread>

namespace rangecast {
namespace streaming {
namespace test {

using rangecast::test::patternBytes;

class ChunkFillTest : public ::testing::Test {
protected:
    void SetUp() override {
        MediaCacheConfig config;
        config.capacityBytes = 1024;
        config.chunkSize = 100;
        cache_ = std::make_unique<MediaCache>(config, std::make_shared<MemoryBlockStore>());
    }

    std::unique_ptr<MediaCache> cache_;
    const ChunkKey key_{FileReference(1, 1), 0};
};

TEST_F(ChunkFillTest, AppendIsBoundedByExpectedLength) {
    ChunkFill fill(key_, 10, true);
    Bytes data = patternBytes(16);

    EXPECT_EQ(fill.append(data.data(), 6), 6u);
    EXPECT_FALSE(fill.complete());
    EXPECT_EQ(fill.append(data.data() + 6, 10), 4u);
    EXPECT_EQ(fill.received(), 10u);
    EXPECT_TRUE(fill.complete());
    EXPECT_EQ(fill.append(data.data(), 1), 0u);
    EXPECT_EQ(fill.snapshot(), rangecast::test::sliceOf(data, 0, 10));
}

TEST_F(ChunkFillTest, WaiterSeesBytesAsTheyArrive) {
    ChunkFill fill(key_, 8, true);
    Bytes data = patternBytes(8);
    core::CancellationToken cancel;

    std::thread producer([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        fill.append(data.data(), 4);
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        fill.append(data.data() + 4, 4);
        fill.complete();
    });

    Bytes seen;
    while (seen.size() < 8) {
        FillRead read = fill.waitForData(seen.size(), cancel);
        ASSERT_EQ(read.kind, FillRead::Kind::Data);
        seen.insert(seen.end(), read.bytes.begin(), read.bytes.end());
    }
    producer.join();

    EXPECT_EQ(seen, data);
    FillRead end = fill.waitForData(8, cancel);
    EXPECT_EQ(end.kind, FillRead::Kind::Data);
    EXPECT_TRUE(end.bytes.empty());
}

TEST_F(ChunkFillTest, WaiterObservesFailureAndCancellation) {
    ChunkFill failing(key_, 8, true);
    failing.fail(core::Error(ErrorCode::BackendError, "boom"));
    FillRead failed = failing.waitForData(0, core::CancellationToken());
    EXPECT_EQ(failed.kind, FillRead::Kind::Failed);
    EXPECT_EQ(failed.error.code, ErrorCode::BackendError);

    ChunkFill idle(key_, 8, true);
    core::CancellationToken cancel;
    cancel.cancel();
    FillRead cancelled = idle.waitForData(0, cancel, std::chrono::milliseconds(5));
    EXPECT_EQ(cancelled.kind, FillRead::Kind::Cancelled);
}

TEST_F(ChunkFillTest, ConcurrentBeginFillCoalesces) {
    FillTicket leader = cache_->beginFill(key_, 100);
    FillTicket follower = cache_->beginFill(key_, 100);

    EXPECT_EQ(leader.role, FillRole::Leader);
    EXPECT_EQ(follower.role, FillRole::Follower);
    EXPECT_EQ(leader.fill, follower.fill);
    EXPECT_EQ(leader.fill->subscriberCount(), 1u);

    auto stats = cache_->statistics();
    EXPECT_EQ(stats.fillsStarted, 1u);
    EXPECT_EQ(stats.coalescedJoins, 1u);
    EXPECT_EQ(stats.reservedBytes, 100u);
}

TEST_F(ChunkFillTest, CompletedFillBecomesReadable) {
    FillTicket leader = cache_->beginFill(key_, 100);
    Bytes data = patternBytes(100, 3);
    leader.fill->append(data.data(), data.size());
    ASSERT_TRUE(leader.fill->complete());
    cache_->completeFill(leader.fill);

    EXPECT_TRUE(cache_->contains(key_.file, 0));
    auto read = cache_->read(key_.file, 0, 0, 100);
    ASSERT_TRUE(read.isSuccess());
    EXPECT_EQ(read.value(), data);

    FillTicket later = cache_->beginFill(key_, 100);
    EXPECT_EQ(later.role, FillRole::Cached);
    EXPECT_EQ(cache_->statistics().reservedBytes, 0u);
}

TEST_F(ChunkFillTest, LeaderLeavingHandsFillToSubscriber) {
    FillTicket leader = cache_->beginFill(key_, 100);
    FillTicket follower = cache_->beginFill(key_, 100);
    Bytes data = patternBytes(100, 4);
    leader.fill->append(data.data(), 40);

    EXPECT_EQ(cache_->releaseFill(leader.fill), FillState::Orphaned);

    auto fill = follower.fill;
    FillRead pending = fill->waitForData(40, core::CancellationToken());
    EXPECT_EQ(pending.kind, FillRead::Kind::Orphaned);
    ASSERT_TRUE(fill->adopt());
    EXPECT_EQ(fill->subscriberCount(), 0u);

    fill->append(data.data() + 40, 60);
    ASSERT_TRUE(fill->complete());
    cache_->completeFill(fill);

    auto read = cache_->read(key_.file, 0, 0, 100);
    ASSERT_TRUE(read.isSuccess());
    EXPECT_EQ(read.value(), data);
}

TEST_F(ChunkFillTest, LastConsumerLeavingAbandonsFill) {
    FillTicket leader = cache_->beginFill(key_, 100);
    FillTicket follower = cache_->beginFill(key_, 100);

    EXPECT_EQ(cache_->releaseFill(leader.fill), FillState::Orphaned);
    cache_->unsubscribe(follower.fill);

    EXPECT_EQ(follower.fill->state(), FillState::Abandoned);
    auto stats = cache_->statistics();
    EXPECT_EQ(stats.activeFills, 0u);
    EXPECT_EQ(stats.fillsAbandoned, 1u);
    EXPECT_EQ(stats.usedBytes, 0u);

    EXPECT_EQ(cache_->beginFill(key_, 100).role, FillRole::Leader);
}

TEST_F(ChunkFillTest, FailedFillReleasesReservation) {
    FillTicket leader = cache_->beginFill(key_, 100);
    FillTicket follower = cache_->beginFill(key_, 100);

    cache_->failFill(leader.fill, core::Error(ErrorCode::NotFound, "gone"));

    FillRead read = follower.fill->waitForData(0, core::CancellationToken());
    EXPECT_EQ(read.kind, FillRead::Kind::Failed);
    EXPECT_EQ(read.error.code, ErrorCode::NotFound);
    EXPECT_EQ(cache_->statistics().usedBytes, 0u);
    EXPECT_FALSE(cache_->contains(key_.file, 0));
}

TEST_F(ChunkFillTest, UncacheableFillRunsWithoutReservation) {
    FillTicket leader = cache_->beginFill(key_, 100, false);
    EXPECT_FALSE(leader.fill->admit());
    EXPECT_EQ(cache_->statistics().reservedBytes, 0u);

    Bytes data = patternBytes(100);
    leader.fill->append(data.data(), data.size());
    ASSERT_TRUE(leader.fill->complete());
    cache_->completeFill(leader.fill);

    EXPECT_FALSE(cache_->contains(key_.file, 0));
    EXPECT_EQ(cache_->statistics().fillsCompleted, 1u);
}

} // namespace test
} // namespace streaming
} // namespace rangecast
