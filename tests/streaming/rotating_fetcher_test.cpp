// RangeCast - Seekable media delivery engine
// Tests for RotatingFetcher
//
// Tests cover:
// - Rotation to another session after a rate limit, resuming mid-range
// - Bounded retries with a single session
// - Revoked sessions, terminal errors and consumer cancellation

#include <gtest/gtest.h>
#include "rangecast/streaming/rotating_fetcher.hpp"
#include "support/fake_backend.hpp"
#include "support/test_log_sink.hpp"

#include <chrono>
#include <thread>

namespace rangecast {
namespace streaming {
namespace test {

using namespace std::chrono_literals;
using rangecast::test::FakeObjects;
using rangecast::test::FakeSession;
using rangecast::test::patternBytes;
using rangecast::test::sliceOf;
using rangecast::test::TestLogSink;

class RotatingFetcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        logger_ = rangecast::test::makeTestLogger(sink_);
        objects_ = std::make_shared<FakeObjects>();
        data_ = patternBytes(1000, 11);
        objects_->put(file_, data_);

        FetcherConfig fetcherConfig;
        fetcherConfig.partSize = 100;
        fetcher_ = std::make_unique<Fetcher>(fetcherConfig, logger_);
    }

    void makePool(size_t count, uint32_t maxRetries = 3, Duration acquireTimeout = 2000ms) {
        sessions_.clear();
        for (size_t i = 0; i < count; ++i) {
            sessions_.push_back(std::make_shared<FakeSession>(objects_, "s" + std::to_string(i + 1)));
        }
        SessionPoolConfig config;
        config.defaultCooldown = 50ms;
        config.acquireTimeout = acquireTimeout;
        auto pool = SessionPool::create(rangecast::test::asBackendSessions(sessions_), config, logger_);
        ASSERT_TRUE(pool.isSuccess());
        pool_ = std::move(pool).value();

        RotatingFetchConfig rotating;
        rotating.maxRetries = maxRetries;
        rotating_ = std::make_unique<RotatingFetcher>(*pool_, *fetcher_, rotating, logger_);
    }

    Result<FetchOutcome, Error> fetchInto(Bytes& out, const ByteRange& range) {
        return rotating_->fetchRange(file_, range, [&out](const uint8_t* data, size_t size) {
            out.insert(out.end(), data, data + size);
            return true;
        });
    }

    const FileReference file_{8, 1};
    Bytes data_;
    std::shared_ptr<TestLogSink> sink_;
    std::shared_ptr<core::StructuredLogger> logger_;
    std::shared_ptr<FakeObjects> objects_;
    std::vector<std::shared_ptr<FakeSession>> sessions_;
    std::unique_ptr<Fetcher> fetcher_;
    std::unique_ptr<SessionPool> pool_;
    std::unique_ptr<RotatingFetcher> rotating_;
};

TEST_F(RotatingFetcherTest, HealthyFetchDeliversRange) {
    makePool(2);
    Bytes out;
    auto outcome = fetchInto(out, ByteRange::of(150, 620));

    ASSERT_TRUE(outcome.isSuccess());
    EXPECT_EQ(out, sliceOf(data_, 150, 620));
    EXPECT_EQ(outcome.value().bytesDelivered, 470u);
    EXPECT_EQ(outcome.value().rotations, 0u);
    EXPECT_EQ(outcome.value().lastSession, 1u);
    EXPECT_EQ(pool_->statistics().totalLoad, 0u);
}

TEST_F(RotatingFetcherTest, RateLimitRotatesToAnotherSession) {
    makePool(2);
    Bytes out;

    // Session 1 serves the first part, then is rate limited.
    bool armed = false;
    auto outcome = rotating_->fetchRange(file_, ByteRange::of(0, 400),
        [&](const uint8_t* data, size_t size) {
            out.insert(out.end(), data, data + size);
            if (!armed) {
                sessions_[0]->rateLimitNext(5000ms);
                armed = true;
            }
            return true;
        });

    ASSERT_TRUE(outcome.isSuccess()) << outcome.error().toString();
    EXPECT_EQ(out, sliceOf(data_, 0, 400));
    EXPECT_EQ(outcome.value().rotations, 1u);
    EXPECT_EQ(outcome.value().lastSession, 2u);

    EXPECT_EQ(sessions_[0]->parts(), 1u);
    EXPECT_EQ(sessions_[1]->parts(), 3u);
    EXPECT_EQ(sessions_[1]->partsAt(file_, 100), 1u);

    auto snapshot = pool_->snapshot();
    EXPECT_GT(snapshot[0].cooldownRemaining, 4000ms);
    EXPECT_EQ(snapshot[0].rateLimitCount, 1u);
    EXPECT_EQ(pool_->statistics().totalLoad, 0u);
}

TEST_F(RotatingFetcherTest, SingleRateLimitedSessionExhaustsBudget) {
    makePool(1, 2);
    sessions_[0]->rateLimitNext(20ms, 100);

    Bytes out;
    auto outcome = fetchInto(out, ByteRange::of(0, 100));

    ASSERT_TRUE(outcome.isError());
    EXPECT_EQ(outcome.error().code, ErrorCode::BackendError);
    EXPECT_NE(outcome.error().message.find("Retry budget exhausted"), std::string::npos);
    EXPECT_EQ(sessions_[0]->calls(), 3u);
    EXPECT_TRUE(out.empty());
    EXPECT_EQ(sink_->countAtLevel(pal::LogLevel::Error), 1u);
}

TEST_F(RotatingFetcherTest, CooldownLongerThanAcquireTimeoutExhaustsBudget) {
    makePool(1, 2, 50ms);
    sessions_[0]->rateLimitNext(3000ms, 100);

    Bytes out;
    auto start = std::chrono::steady_clock::now();
    auto outcome = fetchInto(out, ByteRange::of(0, 100));
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(outcome.isError());
    EXPECT_EQ(outcome.error().code, ErrorCode::BackendError);
    EXPECT_NE(outcome.error().message.find("Retry budget exhausted"), std::string::npos);
    EXPECT_EQ(sessions_[0]->calls(), 1u);
    EXPECT_LT(elapsed, 2000ms);
    EXPECT_EQ(pool_->statistics().unavailableCount, 2u);
    EXPECT_EQ(pool_->statistics().totalLoad, 0u);
    EXPECT_EQ(sink_->countAtLevel(pal::LogLevel::Error), 1u);
}

TEST_F(RotatingFetcherTest, CancelWhileWaitingForCooldown) {
    makePool(1, 3, 5000ms);
    sessions_[0]->rateLimitNext(5000ms);

    core::CancellationToken cancel;
    std::thread canceller([cancel]() {
        std::this_thread::sleep_for(100ms);
        cancel.cancel();
    });

    auto start = std::chrono::steady_clock::now();
    auto outcome = rotating_->fetchRange(file_, ByteRange::of(0, 100),
        [](const uint8_t*, size_t) { return true; }, cancel);
    auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    ASSERT_TRUE(outcome.isError());
    EXPECT_EQ(outcome.error().code, ErrorCode::Cancelled);
    EXPECT_LT(elapsed, 2000ms);
}

TEST_F(RotatingFetcherTest, SingleSessionRecoversAfterCooldown) {
    makePool(1);
    sessions_[0]->rateLimitNext(30ms);

    Bytes out;
    auto outcome = fetchInto(out, ByteRange::of(0, 300));

    ASSERT_TRUE(outcome.isSuccess());
    EXPECT_EQ(out, sliceOf(data_, 0, 300));
    EXPECT_EQ(outcome.value().rotations, 1u);
}

TEST_F(RotatingFetcherTest, RateLimitWithoutHintUsesDefaultCooldown) {
    makePool(2);
    sessions_[0]->failNext(core::Error(ErrorCode::RateLimited, "slow down"));

    Bytes out;
    auto outcome = fetchInto(out, ByteRange::of(0, 100));
    ASSERT_TRUE(outcome.isSuccess());

    auto snapshot = pool_->snapshot();
    EXPECT_EQ(snapshot[0].rateLimitCount, 1u);
    EXPECT_LE(snapshot[0].cooldownRemaining, 50ms);
}

TEST_F(RotatingFetcherTest, RevokedSessionIsExcludedForGood) {
    makePool(2);
    sessions_[0]->revoke();

    Bytes out;
    auto outcome = fetchInto(out, ByteRange::of(0, 200));

    ASSERT_TRUE(outcome.isSuccess());
    EXPECT_EQ(out, sliceOf(data_, 0, 200));
    EXPECT_EQ(pool_->statistics().failedCount, 1u);
    EXPECT_EQ(pool_->healthySessions(), (std::set<SessionId>{2}));
}

TEST_F(RotatingFetcherTest, AllSessionsRevokedIsBackendError) {
    makePool(1);
    sessions_[0]->revoke();

    Bytes out;
    auto outcome = fetchInto(out, ByteRange::of(0, 200));
    ASSERT_TRUE(outcome.isError());
    EXPECT_EQ(outcome.error().code, ErrorCode::BackendError);
}

TEST_F(RotatingFetcherTest, NotFoundIsTerminal) {
    makePool(2);
    sessions_[0]->failNext(core::Error(ErrorCode::NotFound, "message deleted"));

    Bytes out;
    auto outcome = fetchInto(out, ByteRange::of(0, 100));
    ASSERT_TRUE(outcome.isError());
    EXPECT_EQ(outcome.error().code, ErrorCode::NotFound);
    EXPECT_EQ(sessions_[1]->calls(), 0u);
}

TEST_F(RotatingFetcherTest, ConsumerStopCancelsAndReleasesSession) {
    makePool(1);
    size_t parts = 0;
    auto outcome = rotating_->fetchRange(file_, ByteRange::of(0, 1000),
        [&parts](const uint8_t*, size_t) { return ++parts < 2; });

    ASSERT_TRUE(outcome.isError());
    EXPECT_EQ(outcome.error().code, ErrorCode::Cancelled);
    EXPECT_EQ(sessions_[0]->parts(), 2u);
    EXPECT_EQ(pool_->statistics().totalLoad, 0u);
}

TEST_F(RotatingFetcherTest, CancelledTokenStopsBeforeSelecting) {
    makePool(1);
    core::CancellationToken cancel;
    cancel.cancel();

    auto outcome = rotating_->fetchRange(file_, ByteRange::of(0, 100),
        [](const uint8_t*, size_t) { return true; }, cancel);
    ASSERT_TRUE(outcome.isError());
    EXPECT_EQ(outcome.error().code, ErrorCode::Cancelled);
    EXPECT_EQ(sessions_[0]->calls(), 0u);
}

TEST_F(RotatingFetcherTest, EmptyAndUnresolvedRanges) {
    makePool(1);
    Bytes out;
    auto empty = fetchInto(out, ByteRange::of(40, 40));
    ASSERT_TRUE(empty.isSuccess());
    EXPECT_EQ(empty.value().bytesDelivered, 0u);

    EXPECT_EQ(fetchInto(out, ByteRange::whole()).error().code, ErrorCode::InvalidArgument);
}

TEST(FetchStateTest, Names) {
    EXPECT_STREQ(fetchStateToString(FetchState::Selecting), "selecting");
    EXPECT_STREQ(fetchStateToString(FetchState::Exhausted), "exhausted");
}

} // namespace test
} // namespace streaming
} // namespace rangecast
