// RangeCast - Seekable media delivery engine
// Stream Handler Implementation

#include "rangecast/http/stream_handler.hpp"
#include "rangecast/http/range_header.hpp"
#include "rangecast/streaming/media_types.hpp"

#include <algorithm>

namespace rangecast {
namespace http {

using core::Error;
using core::ErrorCode;

namespace {

const char* const LOG_CATEGORY = "Http";
const std::string STREAM_PREFIX = "/stream/";

HttpHeaders withCors(HttpHeaders headers) {
    HttpHeaders cors = corsHeaders();
    headers.insert(headers.end(), cors.begin(), cors.end());
    return headers;
}

} // anonymous namespace

HttpHeaders corsHeaders() {
    return {
        {"Access-Control-Allow-Origin", "*"},
        {"Access-Control-Expose-Headers", "Content-Range, Content-Length, Accept-Ranges, X-Cache"},
    };
}

std::string contentDisposition(const std::string& fileName) {
    std::string safe;
    for (char c : fileName) {
        if (c == '"' || c == '\\') {
            safe += '_';
        } else if (static_cast<unsigned char>(c) >= 0x20 && c != 0x7f) {
            safe += c;
        }
    }
    if (safe.empty()) {
        safe = "download";
    }
    return "attachment; filename=\"" + safe + "\"";
}

StreamHandler::StreamHandler(streaming::ICatalog& catalog,
                             streaming::MediaCache& cache,
                             streaming::StreamCoordinator& coordinator,
                             std::shared_ptr<core::StructuredLogger> logger)
    : catalog_(catalog)
    , cache_(cache)
    , coordinator_(coordinator)
    , logger_(std::move(logger)) {
}

void StreamHandler::setStatusProvider(StatusProvider provider) {
    std::lock_guard<std::mutex> lock(statusMutex_);
    statusProvider_ = std::move(provider);
}

void StreamHandler::handle(const HttpRequest& request, HttpResponseWriter& writer) {
    if (request.path.compare(0, STREAM_PREFIX.size(), STREAM_PREFIX) == 0 &&
        request.path.size() > STREAM_PREFIX.size()) {
        handleStream(request, request.path.substr(STREAM_PREFIX.size()), writer);
        return;
    }
    if (request.path == "/status") {
        handleStatus(request, writer);
        return;
    }
    writer.sendSimple(404, "text/plain", "Not Found\n", corsHeaders());
    logAccess(request, writer, "no route");
}

// =============================================================================
// /stream/<catalogKey>
// =============================================================================

void StreamHandler::handleStream(const HttpRequest& request, const std::string& catalogKey,
                                 HttpResponseWriter& writer) {
    if (request.method == "OPTIONS") {
        writer.sendHead(204, withCors({
            {"Access-Control-Allow-Methods", "GET, HEAD, OPTIONS"},
            {"Access-Control-Allow-Headers", "Range"},
            {"Content-Length", "0"},
        }));
        logAccess(request, writer, "preflight");
        return;
    }
    if (request.method != "GET" && request.method != "HEAD") {
        writer.sendSimple(405, "text/plain", "Method Not Allowed\n",
                          withCors({{"Allow", "GET, HEAD, OPTIONS"}}));
        logAccess(request, writer, "");
        return;
    }

    auto file = catalog_.resolveFile(catalogKey);
    if (file.isError()) {
        sendError(writer, file.error());
        logAccess(request, writer, file.error().toString());
        return;
    }
    auto info = catalog_.objectInfo(file.value());
    if (info.isError()) {
        sendError(writer, info.error());
        logAccess(request, writer, info.error().toString());
        return;
    }
    const ObjectInfo& object = info.value();
    const ByteCount size = object.size;

    auto range = parseRangeHeader(request.header("range"), size);
    if (range.isError()) {
        if (range.error().code == ErrorCode::RangeNotSatisfiable) {
            writer.sendSimple(416, "text/plain", "416: Range not satisfiable\n",
                              withCors({{"Content-Range", unsatisfiedRangeValue(size)}}));
        } else {
            sendError(writer, range.error());
        }
        logAccess(request, writer, range.error().toString());
        return;
    }

    const bool partial = range.value().has_value();
    const ByteRange served = partial ? *range.value() : ByteRange::of(0, size);

    auto chunks = cache_.probe(file.value(), served, size);
    size_t hits = static_cast<size_t>(std::count_if(chunks.begin(), chunks.end(),
        [](const streaming::ChunkLookup& chunk) { return chunk.status == streaming::ChunkStatus::Hit; }));
    streaming::StreamSummary expected;
    expected.hitChunks = hits;
    expected.missChunks = chunks.size() - hits;
    const char* verdict = streaming::cacheVerdictToString(expected.verdict());

    std::string mimeType = object.mimeType.empty()
        ? streaming::guessMimeType(object.fileName) : object.mimeType;

    HttpHeaders headers{
        {"Content-Type", mimeType},
        {"Content-Length", std::to_string(served.length())},
        {"Accept-Ranges", "bytes"},
        {"Content-Disposition", contentDisposition(object.fileName)},
        {"X-Cache", verdict},
    };
    if (partial) {
        headers.emplace_back("Content-Range", contentRangeValue(served, size));
    }
    headers = withCors(std::move(headers));
    const int status = partial ? 206 : 200;

    if (request.method == "HEAD" || served.length() == 0) {
        writer.sendHead(status, headers);
        logAccess(request, writer, verdict);
        return;
    }

    // The head goes out with the first byte so that failures before any data
    // still get a proper status code.
    streaming::ByteSink sink = [&writer, &headers, status](const uint8_t* data, size_t length) {
        if (!writer.headSent() && !writer.sendHead(status, headers)) {
            return false;
        }
        return writer.sendBody(data, length);
    };

    auto result = coordinator_.stream(file.value(), object, served, sink, request.cancel);
    if (result.isSuccess()) {
        logAccess(request, writer, std::string(verdict) + " " + served.toString());
        return;
    }

    const Error& error = result.error();
    if (error.code == ErrorCode::Cancelled) {
        writer.closeAfterResponse();
        logAccess(request, writer, "client disconnected after " + std::to_string(writer.bodyBytes()) + " bytes");
        return;
    }
    if (!writer.headSent()) {
        sendError(writer, error);
    } else {
        // Status already sent; the client sees a short body.
        writer.closeAfterResponse();
        RANGECAST_LOG_WARNING(logger_, LOG_CATEGORY,
            "Response for " + catalogKey + " truncated at " + std::to_string(writer.bodyBytes()) +
            " bytes: " + error.toString());
    }
    logAccess(request, writer, error.toString());
}

// =============================================================================
// /status
// =============================================================================

void StreamHandler::handleStatus(const HttpRequest& request, HttpResponseWriter& writer) {
    if (request.method != "GET" && request.method != "HEAD") {
        writer.sendSimple(405, "text/plain", "Method Not Allowed\n", withCors({{"Allow", "GET, HEAD"}}));
        logAccess(request, writer, "");
        return;
    }

    StatusProvider provider;
    {
        std::lock_guard<std::mutex> lock(statusMutex_);
        provider = statusProvider_;
    }
    std::string body = provider ? provider() : "{}";
    writer.sendSimple(200, "application/json", body + "\n", withCors({{"Cache-Control", "no-store"}}));
    logAccess(request, writer, "");
}

// =============================================================================
// Helpers
// =============================================================================

void StreamHandler::sendError(HttpResponseWriter& writer, const Error& error) {
    const int status = core::httpStatusFor(error.code);
    HttpHeaders extra;
    if (status == 503) {
        auto seconds = (std::max<int64_t>(error.retryAfter.count(), 1) + 999) / 1000;
        extra.emplace_back("Retry-After", std::to_string(seconds));
    }
    writer.sendSimple(status, "text/plain",
                      std::to_string(status) + ": " + statusReason(status) + "\n",
                      withCors(std::move(extra)));
}

void StreamHandler::logAccess(const HttpRequest& request, const HttpResponseWriter& writer,
                              const std::string& detail) {
    if (!logger_ || !logger_->isEnabled(core::LogLevelConfig::Info)) {
        return;
    }
    std::string line = request.remoteAddress + " \"" + request.method + " " + request.target +
                       "\" " + std::to_string(writer.status()) + " " + std::to_string(writer.bodyBytes());
    if (!detail.empty()) {
        line += " " + detail;
    }
    logger_->info(line, LOG_CATEGORY);
}

} // namespace http
} // namespace rangecast
