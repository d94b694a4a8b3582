// RangeCast - Seekable media delivery engine
// Error codes and the Error structure shared by all layers

#ifndef RANGECAST_CORE_ERROR_CODES_HPP
#define RANGECAST_CORE_ERROR_CODES_HPP

#include <chrono>
#include <cstdint>
#include <string>

namespace rangecast {
namespace core {

/**
 * @brief Failure categories shared by the cache, fetch and HTTP layers.
 *
 * The hundreds digit names the layer that raised the error:
 * 0xx request and lifecycle, 1xx delivery, 2xx backend, 3xx storage,
 * 4xx configuration.
 */
enum class ErrorCode : uint32_t {
    Success = 0,
    Unknown = 1,
    InvalidArgument = 10,
    InvalidState = 11,
    NotFound = 12,
    NotSupported = 13,
    Timeout = 20,
    Cancelled = 21,

    RangeNotSatisfiable = 100,
    Unavailable = 101,
    ResourceExhausted = 102,

    BackendError = 200,
    RateLimited = 201,
    SessionRevoked = 202,

    IOError = 300,
    FileReadError = 301,
    FileWriteError = 302,

    ConfigError = 400,
    ConfigInvalid = 401,
};

/**
 * @brief Short description used as the prefix of Error::toString().
 */
inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "OK";
        case ErrorCode::Unknown: return "Unclassified failure";
        case ErrorCode::InvalidArgument: return "Bad argument";
        case ErrorCode::InvalidState: return "Wrong state";
        case ErrorCode::NotFound: return "No such object";
        case ErrorCode::NotSupported: return "Unsupported";
        case ErrorCode::Timeout: return "Timed out";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::RangeNotSatisfiable: return "Range not satisfiable";
        case ErrorCode::Unavailable: return "Unavailable";
        case ErrorCode::ResourceExhausted: return "Capacity reached";
        case ErrorCode::BackendError: return "Backend failure";
        case ErrorCode::RateLimited: return "Rate limited";
        case ErrorCode::SessionRevoked: return "Session revoked";
        case ErrorCode::IOError: return "Storage failure";
        case ErrorCode::FileReadError: return "Block read failed";
        case ErrorCode::FileWriteError: return "Block write failed";
        case ErrorCode::ConfigError: return "Bad configuration source";
        case ErrorCode::ConfigInvalid: return "Configuration rejected";
    }
    return "Unclassified failure";
}

/**
 * @brief Map an error code to the HTTP status reported to clients.
 *
 * RateLimited and SessionRevoked are recovered internally and only reach the
 * HTTP boundary as BackendError, so they map to 502 as well.
 */
inline int httpStatusFor(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return 200;
        case ErrorCode::InvalidArgument: return 400;
        case ErrorCode::NotFound: return 404;
        case ErrorCode::RangeNotSatisfiable: return 416;
        case ErrorCode::Unavailable: return 503;
        case ErrorCode::ResourceExhausted: return 503;
        case ErrorCode::Timeout: return 504;
        case ErrorCode::BackendError:
        case ErrorCode::RateLimited:
        case ErrorCode::SessionRevoked:
            return 502;
        default: return 500;
    }
}

/**
 * @brief Error with code, message, context and an optional retry hint.
 *
 * retryAfter is set for RateLimited (backend cooldown) and Unavailable
 * (suggested client back-off) errors.
 */
struct Error {
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
    std::string context;                   ///< Usually the file reference
    std::chrono::milliseconds retryAfter{0};

    Error() = default;
    Error(ErrorCode errorCode, std::string text = std::string(),
          std::string where = std::string())
        : code(errorCode), message(std::move(text)), context(std::move(where)) {}

    static Error rateLimited(std::chrono::milliseconds wait, std::string text = std::string()) {
        Error err(ErrorCode::RateLimited, std::move(text));
        err.retryAfter = wait;
        return err;
    }

    [[nodiscard]] bool isSuccess() const noexcept {
        return code == ErrorCode::Success;
    }

    /// "<description>: <message> [<context>] (retry after Nms)"; empty parts are left out.
    [[nodiscard]] std::string toString() const {
        std::string text = errorCodeToString(code);
        if (!message.empty()) {
            text.append(": ").append(message);
        }
        if (!context.empty()) {
            text.append(" [").append(context).append("]");
        }
        if (retryAfter.count() > 0) {
            text.append(" (retry after ").append(std::to_string(retryAfter.count())).append("ms)");
        }
        return text;
    }
};

} // namespace core
} // namespace rangecast

#endif // RANGECAST_CORE_ERROR_CODES_HPP
