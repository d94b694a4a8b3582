// RangeCast - Seekable media delivery engine
// Integration Tests: MediaServer over loopback HTTP
//
// Tests cover:
// - Range requests served through the whole pipeline
// - Pre-cache of the next series item after a served episode
// - Concurrent clients coalescing onto one backend fetch
// - Cache index surviving a restart
// - Lifecycle and status document

#include <gtest/gtest.h>
#include "rangecast/api/media_server.hpp"
#include "rangecast/core/json.hpp"
#include "support/fake_backend.hpp"
#include "support/http_client.hpp"
#include "support/test_log_sink.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <thread>
#include <vector>

#include <unistd.h>

namespace rangecast {
namespace integration {
namespace test {

using rangecast::test::asString;
using rangecast::test::FakeCatalog;
using rangecast::test::FakeObjects;
using rangecast::test::FakeSession;
using rangecast::test::HttpResponse;
using rangecast::test::patternBytes;
using rangecast::test::sliceOf;
using rangecast::test::TestHttpClient;
using rangecast::test::TestLogSink;
using rangecast::test::waitUntil;

constexpr ByteCount EPISODE_SIZE = 1000;

class MediaServerIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        cacheDir_ = std::filesystem::temp_directory_path() /
                    ("rangecast_server_test_" + std::to_string(getpid()) + "_" +
                     ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(cacheDir_);

        logger_ = rangecast::test::makeTestLogger(sink_);
        objects_ = std::make_shared<FakeObjects>();
        catalog_ = std::make_shared<FakeCatalog>();
        for (int64_t i = 1; i <= 3; ++i) {
            episodes_.push_back(patternBytes(EPISODE_SIZE, static_cast<uint32_t>(i * 13)));
            catalog_->addObject(*objects_, "ep" + std::to_string(i), episode(i), episodes_.back(),
                                "video/mp4", SeriesPosition{"show s1", i});
        }
        for (int i = 0; i < 2; ++i) {
            sessions_.push_back(std::make_shared<FakeSession>(objects_, "account-" + std::to_string(i + 1)));
        }

        config_.server.bindAddress = "127.0.0.1";
        config_.server.port = 0;
        config_.sessions.count = 2;
        config_.sessions.acquireTimeoutMs = 2000;
        config_.cache.capacityBytes = 100000;
        config_.cache.chunkSizeBytes = 200;
        config_.cache.store = core::CacheStoreKind::Disk;
        config_.cache.directory = cacheDir_.string();
        config_.fetch.partSizeBytes = 100;
        config_.precache.bytes = 400;
    }

    void TearDown() override {
        if (server_) {
            server_->stop();
            server_.reset();
        }
        std::filesystem::remove_all(cacheDir_);
    }

    static FileReference episode(int64_t index) { return FileReference(77, index); }

    void startServer() {
        auto created = api::MediaServer::create(config_, rangecast::test::asBackendSessions(sessions_),
                                                catalog_, logger_);
        ASSERT_TRUE(created.isSuccess()) << created.error().toString();
        server_ = std::move(created).value();
        auto started = server_->start();
        ASSERT_TRUE(started.isSuccess()) << started.error().toString();
    }

    HttpResponse get(const std::string& target, const std::string& headers = "") {
        TestHttpClient client(server_->port());
        EXPECT_TRUE(client.connected());
        return client.request("GET", target, headers);
    }

    std::filesystem::path cacheDir_;
    std::shared_ptr<TestLogSink> sink_;
    std::shared_ptr<core::StructuredLogger> logger_;
    std::shared_ptr<FakeObjects> objects_;
    std::shared_ptr<FakeCatalog> catalog_;
    std::vector<Bytes> episodes_;
    std::vector<std::shared_ptr<FakeSession>> sessions_;
    core::Configuration config_;
    std::unique_ptr<api::MediaServer> server_;
};

// =============================================================================
// Delivery
// =============================================================================

TEST_F(MediaServerIntegrationTest, ServesRangesThroughTheCache) {
    config_.precache.enabled = false;
    startServer();

    auto miss = get("/stream/ep1", "Range: bytes=250-649\r\n");
    EXPECT_EQ(miss.status, 206);
    EXPECT_EQ(miss.header("x-cache"), "MISS");
    EXPECT_EQ(miss.body, asString(sliceOf(episodes_[0], 250, 650)));

    const size_t parts = rangecast::test::totalParts(sessions_);
    auto hit = get("/stream/ep1", "Range: bytes=300-599\r\n");
    EXPECT_EQ(hit.status, 206);
    EXPECT_EQ(hit.header("x-cache"), "HIT");
    EXPECT_EQ(hit.body, asString(sliceOf(episodes_[0], 300, 600)));
    EXPECT_EQ(rangecast::test::totalParts(sessions_), parts);

    auto partial = get("/stream/ep1", "Range: bytes=0-999\r\n");
    EXPECT_EQ(partial.header("x-cache"), "PARTIAL");
    EXPECT_EQ(partial.body, asString(episodes_[0]));
}

TEST_F(MediaServerIntegrationTest, NextEpisodeIsPreCached) {
    startServer();

    auto first = get("/stream/ep1");
    ASSERT_EQ(first.status, 200);

    ASSERT_TRUE(waitUntil([this] { return server_->precache().statistics().completed >= 1; }));
    EXPECT_TRUE(server_->cache().contains(episode(2), 0));
    EXPECT_TRUE(server_->cache().contains(episode(2), 1));
    EXPECT_FALSE(server_->cache().contains(episode(2), 2));

    auto second = get("/stream/ep2", "Range: bytes=0-399\r\n");
    EXPECT_EQ(second.status, 206);
    EXPECT_EQ(second.header("x-cache"), "HIT");
    EXPECT_EQ(second.body, asString(sliceOf(episodes_[1], 0, 400)));
    EXPECT_EQ(rangecast::test::partsAt(sessions_, episode(2), 0), 1u);
    EXPECT_EQ(rangecast::test::partsAt(sessions_, episode(2), 300), 1u);
}

TEST_F(MediaServerIntegrationTest, DisabledPreCacheLeavesNextEpisodeCold) {
    config_.precache.enabled = false;
    startServer();

    ASSERT_EQ(get("/stream/ep1").status, 200);
    EXPECT_EQ(server_->precache().statistics().scheduled, 0u);
    EXPECT_EQ(get("/stream/ep2", "Range: bytes=0-99\r\n").header("x-cache"), "MISS");
}

TEST_F(MediaServerIntegrationTest, ConcurrentClientsShareOneFetch) {
    config_.precache.enabled = false;
    startServer();
    for (auto& session : sessions_) {
        session->setDelay(std::chrono::milliseconds(10));
    }

    constexpr int CLIENTS = 8;
    std::vector<HttpResponse> responses(CLIENTS);
    std::vector<std::thread> threads;
    for (int i = 0; i < CLIENTS; ++i) {
        threads.emplace_back([this, i, &responses]() {
            TestHttpClient client(server_->port());
            responses[i] = client.request("GET", "/stream/ep3", "Range: bytes=0-599\r\n");
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (const auto& response : responses) {
        EXPECT_EQ(response.status, 206);
        EXPECT_EQ(response.body, asString(sliceOf(episodes_[2], 0, 600)));
    }
    EXPECT_EQ(rangecast::test::partsAt(sessions_, episode(3), 0), 1u);
    EXPECT_EQ(rangecast::test::totalParts(sessions_), 6u);
    EXPECT_EQ(server_->sessionPool().statistics().totalLoad, 0u);
}

TEST_F(MediaServerIntegrationTest, CacheSurvivesRestart) {
    config_.precache.enabled = false;
    startServer();
    ASSERT_EQ(get("/stream/ep1", "Range: bytes=0-399\r\n").status, 206);
    server_->stop();
    server_.reset();
    EXPECT_TRUE(std::filesystem::exists(cacheDir_ / "index.json"));

    const size_t parts = rangecast::test::totalParts(sessions_);
    startServer();
    EXPECT_TRUE(server_->cache().contains(episode(1), 0));

    auto hit = get("/stream/ep1", "Range: bytes=0-399\r\n");
    EXPECT_EQ(hit.header("x-cache"), "HIT");
    EXPECT_EQ(hit.body, asString(sliceOf(episodes_[0], 0, 400)));
    EXPECT_EQ(rangecast::test::totalParts(sessions_), parts);
}

TEST_F(MediaServerIntegrationTest, RateLimitedAccountIsRotatedOut) {
    config_.precache.enabled = false;
    startServer();
    sessions_[0]->rateLimitNext(std::chrono::milliseconds(60000));

    auto response = get("/stream/ep1", "Range: bytes=0-199\r\n");
    EXPECT_EQ(response.status, 206);
    EXPECT_EQ(response.body, asString(sliceOf(episodes_[0], 0, 200)));

    auto status = core::parseJson(server_->statusJson());
    ASSERT_TRUE(status.isSuccess());
    EXPECT_EQ(status.value()["sessions"]["cooling"].getUInt(), 1u);
    EXPECT_EQ(status.value()["sessions"]["rateLimits"].getUInt(), 1u);
}

// =============================================================================
// Lifecycle
// =============================================================================

TEST_F(MediaServerIntegrationTest, StatusDocumentIsJson) {
    config_.precache.enabled = false;
    startServer();
    ASSERT_EQ(get("/stream/ep1", "Range: bytes=0-9\r\n").status, 206);

    auto response = get("/status");
    EXPECT_EQ(response.status, 200);
    auto status = core::parseJson(response.body);
    ASSERT_TRUE(status.isSuccess()) << response.body;
    const core::JsonValue& doc = status.value();
    EXPECT_EQ(doc["state"].getString(), "Running");
    EXPECT_EQ(doc["sessions"]["count"].getUInt(), 2u);
    EXPECT_EQ(doc["streams"]["completed"].getUInt(), 1u);
    EXPECT_EQ(doc["cache"]["capacityBytes"].getUInt(), 100000u);
    EXPECT_TRUE(doc.contains("precache"));
}

TEST_F(MediaServerIntegrationTest, LifecycleTransitions) {
    startServer();
    EXPECT_EQ(server_->state(), api::ServerState::Running);
    EXPECT_NE(server_->port(), 0);
    EXPECT_EQ(server_->start().error().code, core::ErrorCode::InvalidState);

    server_->stop();
    EXPECT_EQ(server_->state(), api::ServerState::Stopped);
    EXPECT_EQ(server_->start().error().code, core::ErrorCode::InvalidState);
    server_->stop();
    EXPECT_STREQ(api::serverStateToString(server_->state()), "Stopped");
}

TEST_F(MediaServerIntegrationTest, CreateRejectsBadInput) {
    auto noSessions = api::MediaServer::create(config_, {}, catalog_, logger_);
    ASSERT_TRUE(noSessions.isError());
    EXPECT_EQ(noSessions.error().code, core::ErrorCode::InvalidArgument);

    auto noCatalog = api::MediaServer::create(config_, rangecast::test::asBackendSessions(sessions_),
                                              nullptr, logger_);
    ASSERT_TRUE(noCatalog.isError());
    EXPECT_EQ(noCatalog.error().code, core::ErrorCode::InvalidArgument);
}

TEST_F(MediaServerIntegrationTest, MemoryStoreNeedsNoDirectory) {
    config_.cache.store = core::CacheStoreKind::Memory;
    config_.cache.directory = "";
    startServer();

    EXPECT_EQ(get("/stream/ep1", "Range: bytes=0-99\r\n").status, 206);
    EXPECT_FALSE(std::filesystem::exists(cacheDir_));
}

TEST(CreateLoggerTest, UnopenableFileFallsBackToConsole) {
    core::LoggingConfig config;
    config.console = false;
    config.file = "/nonexistent-dir/rangecast.log";
    config.level = core::LogLevelConfig::Debug;

    auto logger = api::createLogger(config);
    ASSERT_NE(logger, nullptr);
    EXPECT_EQ(logger->getLevel(), core::LogLevelConfig::Debug);
}

} // namespace test
} // namespace integration
} // namespace rangecast
