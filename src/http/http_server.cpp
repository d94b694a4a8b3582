// RangeCast - Seekable media delivery engine
// HTTP Server Implementation (POSIX sockets)

#include "rangecast/http/http_server.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <iterator>
#include <thread>
#include <vector>

namespace rangecast {
namespace http {

using core::Error;
using core::ErrorCode;

namespace {

const char* const LOG_CATEGORY = "Http";
constexpr int ACCEPT_POLL_MS = 200;
constexpr int WATCH_POLL_MS = 100;
constexpr size_t MAX_DISCARDED_BODY = 64 * 1024;

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string trim(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t");
    return text.substr(begin, end - begin + 1);
}

void setTimeout(int fd, int option, std::chrono::seconds timeout) {
    struct timeval tv;
    tv.tv_sec = static_cast<time_t>(timeout.count());
    tv.tv_usec = 0;
    setsockopt(fd, SOL_SOCKET, option, &tv, sizeof(tv));
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

// =============================================================================
// Request and Response
// =============================================================================

std::string HttpRequest::header(const std::string& name) const {
    auto it = headers.find(toLower(name));
    return it != headers.end() ? it->second : std::string();
}

bool HttpRequest::wantsKeepAlive() const {
    std::string connection = toLower(header("connection"));
    if (connection.find("close") != std::string::npos) {
        return false;
    }
    if (version == "HTTP/1.0") {
        return connection.find("keep-alive") != std::string::npos;
    }
    return true;
}

const char* statusReason(int status) {
    switch (status) {
        case 200: return "OK";
        case 204: return "No Content";
        case 206: return "Partial Content";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 413: return "Payload Too Large";
        case 416: return "Range Not Satisfiable";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default: return "Unknown";
    }
}

bool percentDecode(const std::string& input, std::string& output) {
    output.clear();
    output.reserve(input.size());
    for (size_t i = 0; i < input.size(); ++i) {
        if (input[i] != '%') {
            output += input[i];
            continue;
        }
        if (i + 2 >= input.size()) {
            return false;
        }
        int high = hexValue(input[i + 1]);
        int low = hexValue(input[i + 2]);
        if (high < 0 || low < 0) {
            return false;
        }
        output += static_cast<char>((high << 4) | low);
        i += 2;
    }
    return true;
}

HttpResponseWriter::HttpResponseWriter(int fd, bool headRequest, bool keepAlive)
    : fd_(fd)
    , headRequest_(headRequest)
    , keepAlive_(keepAlive) {
}

bool HttpResponseWriter::sendHead(int status, const HttpHeaders& headers) {
    if (headSent_ || failed_) {
        return false;
    }
    status_ = status;
    headSent_ = true;

    std::string head = "HTTP/1.1 " + std::to_string(status) + " " + statusReason(status) + "\r\n";
    for (const auto& header : headers) {
        head += header.first + ": " + header.second + "\r\n";
    }
    head += keepAlive_ ? "Connection: keep-alive\r\n" : "Connection: close\r\n";
    head += "\r\n";
    return writeAll(head.data(), head.size());
}

bool HttpResponseWriter::sendBody(const uint8_t* data, size_t size) {
    if (!headSent_ || failed_) {
        return false;
    }
    if (headRequest_ || size == 0) {
        return true;
    }
    if (!writeAll(reinterpret_cast<const char*>(data), size)) {
        return false;
    }
    bodyBytes_ += size;
    return true;
}

bool HttpResponseWriter::sendSimple(int status, const std::string& contentType, const std::string& body,
                                    const HttpHeaders& extraHeaders) {
    HttpHeaders headers{
        {"Content-Type", contentType},
        {"Content-Length", std::to_string(body.size())},
    };
    headers.insert(headers.end(), extraHeaders.begin(), extraHeaders.end());
    if (!sendHead(status, headers)) {
        return false;
    }
    return sendBody(reinterpret_cast<const uint8_t*>(body.data()), body.size());
}

bool HttpResponseWriter::writeAll(const char* data, size_t size) {
    while (size > 0) {
        ssize_t sent = send(fd_, data, size, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            failed_ = true;
            return false;
        }
        data += sent;
        size -= static_cast<size_t>(sent);
    }
    return true;
}

// =============================================================================
// Server
// =============================================================================

HttpServer::HttpServer(const HttpServerConfig& config, HttpHandler handler,
                       std::shared_ptr<core::StructuredLogger> logger)
    : config_(config)
    , handler_(std::move(handler))
    , logger_(std::move(logger)) {
}

HttpServer::~HttpServer() {
    stop();
}

core::Result<void, Error> HttpServer::start() {
    using StartResult = core::Result<void, Error>;

    if (running_.load()) {
        return StartResult::error(Error(ErrorCode::InvalidState, "HTTP server already running"));
    }

    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(config_.port);
    if (inet_pton(AF_INET, config_.bindAddress.c_str(), &addr.sin_addr) != 1) {
        return StartResult::error(Error(ErrorCode::InvalidArgument,
            "Invalid IPv4 address: " + config_.bindAddress, "server.bindAddress"));
    }

    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        return StartResult::error(Error(ErrorCode::IOError,
            "socket failed: " + std::string(strerror(errno))));
    }

    int opt = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    if (bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        close(fd);
        return StartResult::error(Error(ErrorCode::IOError,
            "bind failed: " + std::string(strerror(err)),
            config_.bindAddress + ":" + std::to_string(config_.port)));
    }

    if (listen(fd, config_.backlog) < 0) {
        int err = errno;
        close(fd);
        return StartResult::error(Error(ErrorCode::IOError,
            "listen failed: " + std::string(strerror(err))));
    }

    struct sockaddr_in bound;
    socklen_t boundLen = sizeof(bound);
    if (getsockname(fd, reinterpret_cast<struct sockaddr*>(&bound), &boundLen) == 0) {
        boundPort_ = ntohs(bound.sin_port);
    } else {
        boundPort_ = config_.port;
    }

    listenFd_ = fd;
    running_ = true;
    acceptThread_ = std::thread([this]() { acceptLoop(); });
    watchThread_ = std::thread([this]() { watchLoop(); });

    RANGECAST_LOG_INFO(logger_, LOG_CATEGORY,
        "Listening on " + config_.bindAddress + ":" + std::to_string(boundPort_));
    return StartResult::success();
}

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    if (acceptThread_.joinable()) {
        acceptThread_.join();
    }
    if (watchThread_.joinable()) {
        watchThread_.join();
    }
    if (listenFd_ >= 0) {
        close(listenFd_);
        listenFd_ = -1;
    }

    {
        std::lock_guard<std::mutex> lock(connectionsMutex_);
        for (auto& connection : connections_) {
            connection->cancel.cancel();
            shutdown(connection->fd, SHUT_RDWR);
        }
    }
    reapConnections(true);

    RANGECAST_LOG_INFO(logger_, LOG_CATEGORY, "HTTP server stopped");
}

size_t HttpServer::activeConnections() const {
    std::lock_guard<std::mutex> lock(connectionsMutex_);
    return static_cast<size_t>(std::count_if(connections_.begin(), connections_.end(),
        [](const std::unique_ptr<Connection>& connection) { return !connection->done.load(); }));
}

void HttpServer::acceptLoop() {
    while (running_.load()) {
        struct pollfd pfd;
        pfd.fd = listenFd_;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int ready = poll(&pfd, 1, ACCEPT_POLL_MS);

        reapConnections(false);
        if (ready <= 0) {
            continue;
        }

        struct sockaddr_in clientAddr;
        socklen_t addrLen = sizeof(clientAddr);
        int clientFd = accept(listenFd_, reinterpret_cast<struct sockaddr*>(&clientAddr), &addrLen);
        if (clientFd < 0) {
            if (errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK) {
                RANGECAST_LOG_WARNING(logger_, LOG_CATEGORY,
                    "accept failed: " + std::string(strerror(errno)));
            }
            continue;
        }
        ++totalConnections_;

        if (activeConnections() >= config_.maxConnections) {
            rejectConnection(clientFd);
            continue;
        }

        setTimeout(clientFd, SO_RCVTIMEO, config_.idleTimeout);
        setTimeout(clientFd, SO_SNDTIMEO, config_.sendTimeout);
        int noDelay = 1;
        setsockopt(clientFd, IPPROTO_TCP, TCP_NODELAY, &noDelay, sizeof(noDelay));

        char addrStr[INET_ADDRSTRLEN];
        inet_ntop(AF_INET, &clientAddr.sin_addr, addrStr, sizeof(addrStr));

        auto connection = std::make_unique<Connection>();
        connection->fd = clientFd;
        connection->remoteAddress = std::string(addrStr) + ":" + std::to_string(ntohs(clientAddr.sin_port));

        std::lock_guard<std::mutex> lock(connectionsMutex_);
        Connection* raw = connection.get();
        connections_.push_back(std::move(connection));
        raw->thread = std::thread([this, raw]() {
            serveConnection(*raw);
            raw->done = true;
        });
    }
}

void HttpServer::watchLoop() {
    while (running_.load()) {
        std::vector<struct pollfd> fds;
        std::vector<Connection*> owners;
        {
            std::lock_guard<std::mutex> lock(connectionsMutex_);
            for (auto& connection : connections_) {
                if (connection->busy.load() && !connection->cancel.isCancelled()) {
                    struct pollfd pfd;
                    pfd.fd = connection->fd;
                    pfd.events = POLLRDHUP;
                    pfd.revents = 0;
                    fds.push_back(pfd);
                    owners.push_back(connection.get());
                }
            }
        }

        if (fds.empty()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(WATCH_POLL_MS));
            continue;
        }
        if (poll(fds.data(), static_cast<nfds_t>(fds.size()), WATCH_POLL_MS) <= 0) {
            continue;
        }

        // A connection still listed has not had its fd closed since the snapshot.
        std::lock_guard<std::mutex> lock(connectionsMutex_);
        for (size_t i = 0; i < fds.size(); ++i) {
            if ((fds[i].revents & (POLLRDHUP | POLLHUP | POLLERR)) == 0) {
                continue;
            }
            bool listed = std::any_of(connections_.begin(), connections_.end(),
                [&](const std::unique_ptr<Connection>& connection) { return connection.get() == owners[i]; });
            if (listed && owners[i]->busy.load()) {
                RANGECAST_LOG_DEBUG(logger_, LOG_CATEGORY,
                    "Client " + owners[i]->remoteAddress + " hung up, cancelling its request");
                owners[i]->cancel.cancel();
            }
        }
    }
}

void HttpServer::rejectConnection(int fd) {
    RANGECAST_LOG_WARNING(logger_, LOG_CATEGORY,
        "Connection limit of " + std::to_string(config_.maxConnections) + " reached, rejecting");
    setTimeout(fd, SO_SNDTIMEO, std::chrono::seconds(1));
    HttpResponseWriter writer(fd, false, false);
    writer.sendSimple(503, "text/plain", "Too many connections\n", {{"Retry-After", "1"}});
    close(fd);
}

void HttpServer::reapConnections(bool all) {
    std::list<std::unique_ptr<Connection>> finished;
    {
        std::lock_guard<std::mutex> lock(connectionsMutex_);
        for (auto it = connections_.begin(); it != connections_.end();) {
            auto next = std::next(it);
            if (all || (*it)->done.load()) {
                finished.splice(finished.end(), connections_, it);
            }
            it = next;
        }
    }
    for (auto& connection : finished) {
        if (connection->thread.joinable()) {
            connection->thread.join();
        }
        close(connection->fd);
    }
}

void HttpServer::serveConnection(Connection& connection) {
    std::string buffer;

    while (running_.load() && !connection.cancel.isCancelled()) {
        HttpRequest request;
        request.remoteAddress = connection.remoteAddress;
        request.cancel = connection.cancel;

        int errorStatus = 0;
        if (!readRequest(connection, buffer, request, errorStatus)) {
            if (errorStatus != 0) {
                HttpResponseWriter writer(connection.fd, false, false);
                writer.sendSimple(errorStatus, "text/plain", std::string(statusReason(errorStatus)) + "\n");
            }
            break;
        }

        HttpResponseWriter writer(connection.fd, request.method == "HEAD", request.wantsKeepAlive());
        connection.busy = true;
        handler_(request, writer);
        connection.busy = false;
        if (!writer.headSent()) {
            writer.sendSimple(500, "text/plain", "Internal Server Error\n");
        }
        if (!writer.keepAlive()) {
            break;
        }
    }

    shutdown(connection.fd, SHUT_RDWR);
}

bool HttpServer::readRequest(Connection& connection, std::string& buffer, HttpRequest& request,
                             int& errorStatus) {
    size_t headEnd;
    while ((headEnd = buffer.find("\r\n\r\n")) == std::string::npos) {
        if (buffer.size() > config_.maxHeaderBytes) {
            errorStatus = 431;
            return false;
        }
        char chunk[4096];
        ssize_t received = recv(connection.fd, chunk, sizeof(chunk), 0);
        if (received == 0) {
            return false;
        }
        if (received < 0) {
            if (errno == EINTR) {
                continue;
            }
            if ((errno == EAGAIN || errno == EWOULDBLOCK) && !buffer.empty()) {
                errorStatus = 408;
            }
            return false;
        }
        buffer.append(chunk, static_cast<size_t>(received));
    }

    const std::string head = buffer.substr(0, headEnd);
    buffer.erase(0, headEnd + 4);
    errorStatus = 400;

    size_t lineEnd = head.find("\r\n");
    std::string requestLine = head.substr(0, lineEnd);
    size_t firstSpace = requestLine.find(' ');
    size_t secondSpace = requestLine.find(' ', firstSpace == std::string::npos ? 0 : firstSpace + 1);
    if (firstSpace == std::string::npos || secondSpace == std::string::npos) {
        return false;
    }
    request.method = requestLine.substr(0, firstSpace);
    request.target = requestLine.substr(firstSpace + 1, secondSpace - firstSpace - 1);
    request.version = requestLine.substr(secondSpace + 1);
    if (request.method.empty() || request.target.empty() ||
        request.version.compare(0, 7, "HTTP/1.") != 0) {
        return false;
    }

    size_t position = lineEnd == std::string::npos ? head.size() : lineEnd + 2;
    while (position < head.size()) {
        size_t next = head.find("\r\n", position);
        std::string line = head.substr(position, next == std::string::npos ? std::string::npos : next - position);
        position = next == std::string::npos ? head.size() : next + 2;
        if (line.empty()) {
            continue;
        }
        size_t colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            return false;
        }
        std::string name = toLower(trim(line.substr(0, colon)));
        std::string value = trim(line.substr(colon + 1));
        auto existing = request.headers.find(name);
        if (existing != request.headers.end()) {
            existing->second += ", " + value;
        } else {
            request.headers.emplace(name, value);
        }
    }

    size_t queryStart = request.target.find('?');
    std::string rawPath = request.target.substr(0, queryStart);
    if (queryStart != std::string::npos) {
        request.query = request.target.substr(queryStart + 1);
    }
    if (rawPath.empty() || rawPath[0] != '/' || !percentDecode(rawPath, request.path)) {
        return false;
    }

    if (!request.header("transfer-encoding").empty()) {
        return false;
    }
    std::string contentLength = request.header("content-length");
    if (!contentLength.empty()) {
        size_t length = 0;
        for (char c : contentLength) {
            if (c < '0' || c > '9') {
                return false;
            }
            length = length * 10 + static_cast<size_t>(c - '0');
            if (length > MAX_DISCARDED_BODY) {
                errorStatus = 413;
                return false;
            }
        }
        // Bodies are not used by any route; read past them.
        while (buffer.size() < length) {
            char chunk[4096];
            ssize_t received = recv(connection.fd, chunk, sizeof(chunk), 0);
            if (received <= 0) {
                if (received < 0 && errno == EINTR) {
                    continue;
                }
                errorStatus = 0;
                return false;
            }
            buffer.append(chunk, static_cast<size_t>(received));
        }
        buffer.erase(0, length);
    }

    errorStatus = 0;
    return true;
}

} // namespace http
} // namespace rangecast
