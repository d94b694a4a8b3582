// RangeCast - Seekable media delivery engine
// HTTP Server - Minimal blocking HTTP/1.1 listener
//
// One accept thread and one thread per connection. Requests on a
// connection are handled sequentially (keep-alive, no pipelining of
// responses). Response bodies are streamed through HttpResponseWriter so a
// handler can forward bytes as they arrive from the backend.

#ifndef RANGECAST_HTTP_HTTP_SERVER_HPP
#define RANGECAST_HTTP_HTTP_SERVER_HPP

#include "rangecast/core/cancellation.hpp"
#include "rangecast/core/error_codes.hpp"
#include "rangecast/core/result.hpp"
#include "rangecast/core/structured_logger.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace rangecast {
namespace http {

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Parsed request head. Header names are lowercased.
 */
struct HttpRequest {
    std::string method;
    std::string target;     ///< Raw request target
    std::string path;       ///< Percent-decoded path without the query
    std::string query;
    std::string version;    ///< "HTTP/1.1" or "HTTP/1.0"
    std::map<std::string, std::string> headers;
    std::string remoteAddress;
    core::CancellationToken cancel;  ///< Set when the server stops

    /**
     * @brief Header value by case-insensitive name, empty if absent.
     */
    std::string header(const std::string& name) const;

    bool wantsKeepAlive() const;
};

const char* statusReason(int status);

/**
 * @brief Writes one response to a connection.
 *
 * sendHead() must be called exactly once before any body bytes. Once a write
 * fails every later call returns false and the connection is closed after
 * the handler returns.
 */
class HttpResponseWriter {
public:
    HttpResponseWriter(int fd, bool headRequest, bool keepAlive);

    bool sendHead(int status, const HttpHeaders& headers);
    bool sendBody(const uint8_t* data, size_t size);

    /**
     * @brief Head plus a complete small body (error pages, JSON).
     */
    bool sendSimple(int status, const std::string& contentType, const std::string& body,
                    const HttpHeaders& extraHeaders = HttpHeaders());

    bool headSent() const { return headSent_; }
    bool failed() const { return failed_; }
    int status() const { return status_; }
    uint64_t bodyBytes() const { return bodyBytes_; }

    /**
     * @brief Close the connection after this response.
     */
    void closeAfterResponse() { keepAlive_ = false; }
    bool keepAlive() const { return keepAlive_ && !failed_; }

private:
    bool writeAll(const char* data, size_t size);

    int fd_;
    bool headRequest_;
    bool keepAlive_;
    bool headSent_{false};
    bool failed_{false};
    int status_{0};
    uint64_t bodyBytes_{0};
};

using HttpHandler = std::function<void(const HttpRequest&, HttpResponseWriter&)>;

struct HttpServerConfig {
    std::string bindAddress = "0.0.0.0";
    uint16_t port = 8080;             ///< 0 picks an ephemeral port
    uint32_t maxConnections = 256;
    int backlog = 128;
    size_t maxHeaderBytes = 16 * 1024;
    std::chrono::seconds idleTimeout{30};   ///< Keep-alive and request read timeout
    std::chrono::seconds sendTimeout{60};   ///< A stalled client is dropped after this
};

/**
 * @brief Blocking HTTP/1.1 server.
 *
 * Thread Safety: start() and stop() may be called from any thread; the
 * handler runs on connection threads.
 */
class HttpServer {
public:
    HttpServer(const HttpServerConfig& config, HttpHandler handler,
               std::shared_ptr<core::StructuredLogger> logger = nullptr);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /**
     * @brief Bind, listen and start accepting.
     * @return IOError if the socket cannot be bound
     */
    core::Result<void, core::Error> start();

    /**
     * @brief Stop accepting, cancel in-flight requests and join all threads.
     */
    void stop();

    bool isRunning() const { return running_.load(); }

    /**
     * @brief Port actually bound (differs from config when it was 0).
     */
    uint16_t port() const { return boundPort_; }

    size_t activeConnections() const;
    uint64_t totalConnections() const { return totalConnections_.load(); }

private:
    struct Connection {
        int fd{-1};
        std::string remoteAddress;
        core::CancellationToken cancel;
        std::thread thread;
        std::atomic<bool> done{false};
        std::atomic<bool> busy{false};  ///< A handler is running for this connection
    };

    void acceptLoop();

    /**
     * @brief Cancel the token of any busy connection whose peer hung up.
     *
     * A handler that is waiting for a backend session writes nothing, so a
     * failed send cannot reveal the disconnect.
     */
    void watchLoop();
    void serveConnection(Connection& connection);
    void reapConnections(bool all);
    void rejectConnection(int fd);

    /**
     * @brief Read one request head from fd into request.
     * @return false when the peer closed, timed out or sent garbage
     */
    bool readRequest(Connection& connection, std::string& buffer, HttpRequest& request,
                     int& errorStatus);

    HttpServerConfig config_;
    HttpHandler handler_;
    std::shared_ptr<core::StructuredLogger> logger_;

    int listenFd_{-1};
    uint16_t boundPort_{0};
    std::atomic<bool> running_{false};
    std::thread acceptThread_;
    std::thread watchThread_;

    mutable std::mutex connectionsMutex_;
    std::list<std::unique_ptr<Connection>> connections_;
    std::atomic<uint64_t> totalConnections_{0};
};

/**
 * @brief Decode %XX escapes. Returns false on a malformed escape.
 */
bool percentDecode(const std::string& input, std::string& output);

} // namespace http
} // namespace rangecast

#endif // RANGECAST_HTTP_HTTP_SERVER_HPP
