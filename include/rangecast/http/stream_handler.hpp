// RangeCast - Seekable media delivery engine
// Stream Handler - HTTP routes of the delivery service
//
// Routes:
//   GET|HEAD /stream/<catalogKey>  seekable media delivery (Range aware)
//   OPTIONS  /stream/<catalogKey>  CORS preflight
//   GET      /status               pool, cache and stream statistics as JSON

#ifndef RANGECAST_HTTP_STREAM_HANDLER_HPP
#define RANGECAST_HTTP_STREAM_HANDLER_HPP

#include "rangecast/core/structured_logger.hpp"
#include "rangecast/http/http_server.hpp"
#include "rangecast/streaming/backend.hpp"
#include "rangecast/streaming/media_cache.hpp"
#include "rangecast/streaming/stream_coordinator.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace rangecast {
namespace http {

/**
 * @brief Produces the /status document.
 */
using StatusProvider = std::function<std::string()>;

class StreamHandler {
public:
    StreamHandler(streaming::ICatalog& catalog,
                  streaming::MediaCache& cache,
                  streaming::StreamCoordinator& coordinator,
                  std::shared_ptr<core::StructuredLogger> logger = nullptr);

    void setStatusProvider(StatusProvider provider);

    /**
     * @brief Entry point bound to HttpServer.
     */
    void handle(const HttpRequest& request, HttpResponseWriter& writer);

private:
    void handleStream(const HttpRequest& request, const std::string& catalogKey,
                      HttpResponseWriter& writer);
    void handleStatus(const HttpRequest& request, HttpResponseWriter& writer);
    void sendError(HttpResponseWriter& writer, const core::Error& error);
    void logAccess(const HttpRequest& request, const HttpResponseWriter& writer,
                   const std::string& detail);

    streaming::ICatalog& catalog_;
    streaming::MediaCache& cache_;
    streaming::StreamCoordinator& coordinator_;
    std::shared_ptr<core::StructuredLogger> logger_;

    std::mutex statusMutex_;
    StatusProvider statusProvider_;
};

/**
 * @brief Headers sent with every response of the service.
 */
HttpHeaders corsHeaders();

/**
 * @brief Content-Disposition value with a sanitized file name.
 */
std::string contentDisposition(const std::string& fileName);

} // namespace http
} // namespace rangecast

#endif // RANGECAST_HTTP_STREAM_HANDLER_HPP
