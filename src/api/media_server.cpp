// RangeCast - Seekable media delivery engine
// MediaServer Implementation

#include "rangecast/api/media_server.hpp"
#include "rangecast/core/json.hpp"
#include "rangecast/http/http_server.hpp"
#include "rangecast/http/stream_handler.hpp"
#include "rangecast/pal/log_pal.hpp"
#include "rangecast/streaming/block_store.hpp"
#include "rangecast/streaming/fetcher.hpp"
#include "rangecast/streaming/rotating_fetcher.hpp"

#include <atomic>
#include <mutex>
#include <sstream>

namespace rangecast {
namespace api {

using core::Error;
using core::ErrorCode;

namespace {

const char* const LOG_CATEGORY = "Server";

} // anonymous namespace

// =============================================================================
// Logger Setup
// =============================================================================

std::shared_ptr<core::StructuredLogger> createLogger(const core::LoggingConfig& config) {
    auto logger = std::make_shared<core::StructuredLogger>();
    logger->setLevel(config.level);
    logger->setJsonFormat(config.json);

    bool console = config.console;
    std::string fileProblem;
    if (!config.file.empty()) {
        auto fileSink = std::make_shared<pal::FileLogSink>(config.file);
        if (fileSink->isOpen()) {
            logger->addSink(fileSink);
        } else {
            fileProblem = "Cannot open log file " + config.file + ", logging to console";
            console = true;
        }
    }
    if (console) {
        logger->addSink(std::make_shared<pal::ConsoleLogSink>());
    }
    if (!fileProblem.empty()) {
        logger->warning(fileProblem, LOG_CATEGORY);
    }
    return logger;
}

// =============================================================================
// MediaServer Implementation Class
// =============================================================================

class MediaServer::Impl {
public:
    Impl(const core::Configuration& config,
         std::shared_ptr<core::StructuredLogger> logger,
         std::shared_ptr<streaming::ICatalog> catalog)
        : config_(config)
        , logger_(std::move(logger))
        , catalog_(std::move(catalog)) {
    }

    ~Impl() {
        stop();
    }

    core::Result<void, Error> build(std::vector<std::shared_ptr<streaming::IBackendSession>> sessions,
                              std::shared_ptr<streaming::ISeriesOrdering> ordering) {
        if (!catalog_) {
            return core::Result<void, Error>::error(Error(ErrorCode::InvalidArgument, "A catalog is required"));
        }

        streaming::SessionPoolConfig poolConfig;
        poolConfig.defaultCooldown = std::chrono::seconds(config_.sessions.cooldownSeconds);
        poolConfig.acquireTimeout = std::chrono::milliseconds(config_.sessions.acquireTimeoutMs);
        auto pool = streaming::SessionPool::create(std::move(sessions), poolConfig, logger_);
        if (pool.isError()) {
            return core::Result<void, Error>::error(pool.error());
        }
        pool_ = std::move(pool).value();

        streaming::FetcherConfig fetcherConfig;
        fetcherConfig.partSize = config_.fetch.partSizeBytes;
        fetcher_ = std::make_unique<streaming::Fetcher>(fetcherConfig, logger_);

        streaming::RotatingFetchConfig retryConfig;
        retryConfig.maxRetries = config_.sessions.maxFetchRetries;
        rotating_ = std::make_unique<streaming::RotatingFetcher>(*pool_, *fetcher_, retryConfig, logger_);

        auto store = openStore();
        if (store.isError()) {
            return core::Result<void, Error>::error(store.error());
        }

        streaming::MediaCacheConfig cacheConfig;
        cacheConfig.enabled = config_.cache.enabled;
        cacheConfig.capacityBytes = config_.cache.capacityBytes;
        cacheConfig.chunkSize = config_.cache.chunkSizeBytes;
        cacheConfig.cacheAllTypes = config_.cache.cacheAllTypes;
        cache_ = std::make_unique<streaming::MediaCache>(cacheConfig, store.value(), logger_);

        if (persistIndex()) {
            auto loaded = cache_->loadIndex();
            if (loaded.isError()) {
                RANGECAST_LOG_WARNING(logger_, LOG_CATEGORY,
                    "Cache index not loaded, starting empty: " + loaded.error().toString());
            }
        }

        coordinator_ = std::make_unique<streaming::StreamCoordinator>(*catalog_, *cache_, *rotating_, logger_);

        streaming::PreCacheSchedulerConfig precacheConfig;
        precacheConfig.enabled = config_.precache.enabled;
        precacheConfig.bytes = config_.precache.bytes;
        precacheConfig.workers = config_.precache.workers;
        streaming::StreamCoordinator* coordinator = coordinator_.get();
        precache_ = std::make_unique<streaming::PreCacheScheduler>(
            precacheConfig, *catalog_, *cache_,
            [coordinator](const FileReference& file, const ByteRange& range,
                          const core::CancellationToken& cancel) {
                auto prefetched = coordinator->prefetch(file, range, cancel);
                if (prefetched.isError()) {
                    return core::Result<void, Error>::error(prefetched.error());
                }
                return core::Result<void, Error>::success();
            },
            std::move(ordering), logger_);

        streaming::PreCacheScheduler* precache = precache_.get();
        coordinator_->setAccessListener([precache](const FileReference& file, const ObjectInfo& info) {
            precache->onFileServed(file, info);
        });

        handler_ = std::make_unique<http::StreamHandler>(*catalog_, *cache_, *coordinator_, logger_);
        handler_->setStatusProvider([this]() { return statusJson(); });

        http::HttpServerConfig httpConfig;
        httpConfig.bindAddress = config_.server.bindAddress;
        httpConfig.port = config_.server.port;
        httpConfig.maxConnections = config_.server.maxConnections;
        http::StreamHandler* handler = handler_.get();
        http_ = std::make_unique<http::HttpServer>(httpConfig,
            [handler](const http::HttpRequest& request, http::HttpResponseWriter& writer) {
                handler->handle(request, writer);
            },
            logger_);

        state_ = ServerState::Initialized;
        return core::Result<void, Error>::success();
    }

    core::Result<void, Error> start() {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (state_ == ServerState::Running) {
            return core::Result<void, Error>::error(Error(ErrorCode::InvalidState, "Server is already running"));
        }
        if (state_ != ServerState::Initialized) {
            return core::Result<void, Error>::error(Error(ErrorCode::InvalidState,
                std::string("Cannot start from state ") + serverStateToString(state_.load())));
        }

        auto started = http_->start();
        if (started.isError()) {
            RANGECAST_LOG_ERROR(logger_, LOG_CATEGORY, "Failed to start: " + started.error().toString());
            return started;
        }
        state_ = ServerState::Running;

        RANGECAST_LOG_INFO(logger_, LOG_CATEGORY,
            "RangeCast running on port " + std::to_string(http_->port()) + " with " +
            std::to_string(pool_->size()) + " backend session(s), cache " +
            (config_.cache.enabled ? cache_->store().describe() : std::string("disabled")));
        return core::Result<void, Error>::success();
    }

    void stop() {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (state_ != ServerState::Running && state_ != ServerState::Initialized) {
            return;
        }
        state_ = ServerState::Stopping;

        if (http_) {
            http_->stop();
        }
        if (precache_) {
            precache_->shutdown();
        }
        if (cache_ && persistIndex()) {
            auto saved = cache_->saveIndex();
            if (saved.isError()) {
                RANGECAST_LOG_ERROR(logger_, LOG_CATEGORY,
                    "Failed to save cache index: " + saved.error().toString());
            }
        }

        state_ = ServerState::Stopped;
        RANGECAST_LOG_INFO(logger_, LOG_CATEGORY, "RangeCast stopped");
        if (logger_) {
            logger_->flush();
        }
    }

    ServerState state() const {
        return state_.load();
    }

    uint16_t port() const {
        return http_ ? http_->port() : 0;
    }

    std::string statusJson() const {
        std::ostringstream out;

        auto pool = pool_->statistics();
        out << "{\"state\":\"" << serverStateToString(state()) << "\""
            << ",\"sessions\":{\"count\":" << pool.sessionCount
            << ",\"usable\":" << pool.usableCount
            << ",\"cooling\":" << pool.coolingCount
            << ",\"failed\":" << pool.failedCount
            << ",\"load\":" << pool.totalLoad
            << ",\"acquires\":" << pool.totalAcquires
            << ",\"rateLimits\":" << pool.totalRateLimits
            << ",\"unavailable\":" << pool.unavailableCount
            << ",\"list\":[";
        bool first = true;
        for (const auto& session : pool_->snapshot()) {
            out << (first ? "" : ",")
                << "{\"id\":" << session.id
                << ",\"label\":\"" << core::escapeJson(session.label) << "\""
                << ",\"load\":" << session.load
                << ",\"cooldownMs\":" << session.cooldownRemaining.count()
                << ",\"failed\":" << (session.failed ? "true" : "false") << "}";
            first = false;
        }
        out << "]}";

        auto cache = cache_->statistics();
        out << ",\"cache\":{\"enabled\":" << (cache_->enabled() ? "true" : "false")
            << ",\"store\":\"" << core::escapeJson(cache_->store().describe()) << "\""
            << ",\"usedBytes\":" << cache.usedBytes
            << ",\"capacityBytes\":" << cache.capacityBytes
            << ",\"entries\":" << cache.entryCount
            << ",\"activeFills\":" << cache.activeFills
            << ",\"hits\":" << cache.hits
            << ",\"misses\":" << cache.misses
            << ",\"evictions\":" << cache.evictions
            << ",\"passThrough\":" << cache.passThrough
            << ",\"coalescedJoins\":" << cache.coalescedJoins << "}";

        auto streams = coordinator_->statistics();
        out << ",\"streams\":{\"active\":" << streams.activeStreams
            << ",\"completed\":" << streams.completedStreams
            << ",\"cancelled\":" << streams.cancelledStreams
            << ",\"failed\":" << streams.failedStreams
            << ",\"bytesDelivered\":" << streams.bytesDelivered
            << ",\"handoffs\":" << streams.handoffs << "}";

        auto fetch = fetcher_->statistics();
        out << ",\"fetch\":{\"parts\":" << fetch.partsDownloaded
            << ",\"bytes\":" << fetch.bytesDownloaded
            << ",\"failedParts\":" << fetch.failedParts << "}";

        auto precache = precache_->statistics();
        out << ",\"precache\":{\"enabled\":" << (config_.precache.enabled ? "true" : "false")
            << ",\"scheduled\":" << precache.scheduled
            << ",\"completed\":" << precache.completed
            << ",\"failed\":" << precache.failed
            << ",\"cancelled\":" << precache.cancelled
            << ",\"outstanding\":" << precache_->outstandingCount() << "}";

        out << ",\"connections\":{\"active\":" << http_->activeConnections()
            << ",\"total\":" << http_->totalConnections() << "}}";
        return out.str();
    }

    core::Configuration config_;
    std::shared_ptr<core::StructuredLogger> logger_;
    std::shared_ptr<streaming::ICatalog> catalog_;

    std::unique_ptr<streaming::SessionPool> pool_;
    std::unique_ptr<streaming::Fetcher> fetcher_;
    std::unique_ptr<streaming::RotatingFetcher> rotating_;
    std::unique_ptr<streaming::MediaCache> cache_;
    std::unique_ptr<streaming::StreamCoordinator> coordinator_;
    std::unique_ptr<streaming::PreCacheScheduler> precache_;
    std::unique_ptr<http::StreamHandler> handler_;
    std::unique_ptr<http::HttpServer> http_;

private:
    core::Result<std::shared_ptr<streaming::IBlockStore>, Error> openStore() {
        using StoreResult = core::Result<std::shared_ptr<streaming::IBlockStore>, Error>;

        if (config_.cache.store == core::CacheStoreKind::Memory || !config_.cache.enabled) {
            return StoreResult::success(std::make_shared<streaming::MemoryBlockStore>());
        }
        auto store = streaming::FileBlockStore::open(config_.cache.directory);
        if (store.isError()) {
            return StoreResult::error(store.error());
        }
        return StoreResult::success(std::shared_ptr<streaming::IBlockStore>(std::move(store).value()));
    }

    bool persistIndex() const {
        return config_.cache.enabled && config_.cache.persistIndex &&
               config_.cache.store == core::CacheStoreKind::Disk;
    }

    // Serializes start() and stop(); readers use the atomic alone.
    std::mutex stateMutex_;
    std::atomic<ServerState> state_{ServerState::Stopped};
};

// =============================================================================
// MediaServer Public Interface
// =============================================================================

core::Result<std::unique_ptr<MediaServer>, Error> MediaServer::create(
    const core::Configuration& config,
    std::vector<std::shared_ptr<streaming::IBackendSession>> sessions,
    std::shared_ptr<streaming::ICatalog> catalog,
    std::shared_ptr<core::StructuredLogger> logger,
    std::shared_ptr<streaming::ISeriesOrdering> ordering)
{
    using CreateResult = core::Result<std::unique_ptr<MediaServer>, Error>;

    auto impl = std::make_unique<Impl>(config, std::move(logger), std::move(catalog));
    auto built = impl->build(std::move(sessions), std::move(ordering));
    if (built.isError()) {
        return CreateResult::error(built.error());
    }
    return CreateResult::success(std::make_unique<MediaServer>(PrivateTag(), std::move(impl)));
}

MediaServer::MediaServer(PrivateTag, std::unique_ptr<Impl> impl)
    : impl_(std::move(impl)) {
}

MediaServer::~MediaServer() = default;

core::Result<void, Error> MediaServer::start() {
    return impl_->start();
}

void MediaServer::stop() {
    impl_->stop();
}

ServerState MediaServer::state() const {
    return impl_->state();
}

uint16_t MediaServer::port() const {
    return impl_->port();
}

std::string MediaServer::statusJson() const {
    return impl_->statusJson();
}

const core::Configuration& MediaServer::config() const {
    return impl_->config_;
}

streaming::SessionPool& MediaServer::sessionPool() {
    return *impl_->pool_;
}

streaming::MediaCache& MediaServer::cache() {
    return *impl_->cache_;
}

streaming::StreamCoordinator& MediaServer::coordinator() {
    return *impl_->coordinator_;
}

streaming::PreCacheScheduler& MediaServer::precache() {
    return *impl_->precache_;
}

} // namespace api
} // namespace rangecast
