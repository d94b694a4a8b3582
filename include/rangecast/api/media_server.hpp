// RangeCast - Seekable media delivery engine
// MediaServer Public API
//
// Owns and wires every component of the delivery service from one
// Configuration: session pool, fetchers, media cache and its block store,
// stream coordinator, pre-cache scheduler and the HTTP surface.

#ifndef RANGECAST_API_MEDIA_SERVER_HPP
#define RANGECAST_API_MEDIA_SERVER_HPP

#include "rangecast/core/config_manager.hpp"
#include "rangecast/core/error_codes.hpp"
#include "rangecast/core/result.hpp"
#include "rangecast/core/structured_logger.hpp"
#include "rangecast/streaming/backend.hpp"
#include "rangecast/streaming/media_cache.hpp"
#include "rangecast/streaming/precache_scheduler.hpp"
#include "rangecast/streaming/series.hpp"
#include "rangecast/streaming/session_pool.hpp"
#include "rangecast/streaming/stream_coordinator.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace rangecast {
namespace api {

/**
 * @brief Server lifecycle state.
 */
enum class ServerState {
    Initialized,  ///< Components built, not listening
    Running,      ///< Accepting connections
    Stopping,     ///< Shutdown in progress
    Stopped       ///< Stopped; the cache index has been saved
};

inline const char* serverStateToString(ServerState state) {
    switch (state) {
        case ServerState::Initialized: return "Initialized";
        case ServerState::Running:     return "Running";
        case ServerState::Stopping:    return "Stopping";
        case ServerState::Stopped:     return "Stopped";
        default:                       return "Unknown";
    }
}

/**
 * @brief The delivery service.
 *
 * Typical usage:
 * @code
 * auto server = MediaServer::create(config, sessions, catalog, logger);
 * if (server.isSuccess() && server.value()->start().isSuccess()) {
 *     // ... serve until told to stop
 *     server.value()->stop();
 * }
 * @endcode
 *
 * Thread Safety:
 * - start(), stop() and statusJson() may be called from any thread
 * - Component accessors return references valid for the server's lifetime
 */
class MediaServer {
public:
    /**
     * @brief Build every component.
     *
     * A persisted cache index is loaded here; an unreadable index is logged
     * and the cache starts empty.
     *
     * @param sessions Backend sessions (1..50)
     * @param catalog Catalog shared with the caller
     * @param ordering Series ordering; default is index + 1
     * @return InvalidArgument for bad sessions, IOError if the cache
     *         directory cannot be created
     */
    static core::Result<std::unique_ptr<MediaServer>, core::Error> create(
        const core::Configuration& config,
        std::vector<std::shared_ptr<streaming::IBackendSession>> sessions,
        std::shared_ptr<streaming::ICatalog> catalog,
        std::shared_ptr<core::StructuredLogger> logger = nullptr,
        std::shared_ptr<streaming::ISeriesOrdering> ordering = nullptr);

private:
    class Impl;
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    MediaServer(PrivateTag, std::unique_ptr<Impl> impl);

    /**
     * @brief Stops the server if it is still running.
     */
    ~MediaServer();

    MediaServer(const MediaServer&) = delete;
    MediaServer& operator=(const MediaServer&) = delete;

    /**
     * @brief Start listening.
     * @return InvalidState if not Initialized, IOError if the port cannot be bound
     */
    core::Result<void, core::Error> start();

    /**
     * @brief Stop listening, finish pre-cache tasks and save the cache index.
     */
    void stop();

    ServerState state() const;
    bool isRunning() const { return state() == ServerState::Running; }

    /**
     * @brief Bound HTTP port (useful when the configured port is 0).
     */
    uint16_t port() const;

    /**
     * @brief Pool, cache, stream and pre-cache statistics as one JSON object.
     */
    std::string statusJson() const;

    const core::Configuration& config() const;
    streaming::SessionPool& sessionPool();
    streaming::MediaCache& cache();
    streaming::StreamCoordinator& coordinator();
    streaming::PreCacheScheduler& precache();

private:
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Logger with the sinks and format named by the logging section.
 *
 * A log file that cannot be opened is reported on the console sink.
 */
std::shared_ptr<core::StructuredLogger> createLogger(const core::LoggingConfig& config);

} // namespace api
} // namespace rangecast

#endif // RANGECAST_API_MEDIA_SERVER_HPP
