// RangeCast - Seekable media delivery engine
// Structured Logging Component
//
// Line-oriented logging in plain text or JSON, routed to any number of
// pal::ILogSink destinations. Error records carry the delivery context
// (file reference, byte range, backend session, error code).

#ifndef RANGECAST_CORE_STRUCTURED_LOGGER_HPP
#define RANGECAST_CORE_STRUCTURED_LOGGER_HPP

#include "rangecast/core/types.hpp"
#include "rangecast/pal/log_pal.hpp"
#include "rangecast/pal/pal_types.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace rangecast {
namespace core {

/**
 * @brief Configurable log levels.
 *
 * Messages below the configured level are filtered out.
 */
enum class LogLevelConfig {
    Debug = 0,    ///< Detailed debugging information
    Info = 1,     ///< Informational messages about normal operation
    Warning = 2,  ///< Warning conditions that should be addressed
    Error = 3     ///< Error conditions that affect operation
};

/**
 * @brief Convert log level to string representation.
 */
std::string logLevelToString(LogLevelConfig level);

/**
 * @brief Convert string to log level (case-insensitive).
 * @param str String representation of log level
 * @return Corresponding LogLevelConfig, defaults to Info for unknown
 */
LogLevelConfig stringToLogLevel(const std::string& str);

/**
 * @brief Check whether a string names a log level.
 */
bool isValidLogLevel(const std::string& str);

/**
 * @brief Delivery context attached to warning and error records.
 *
 * Empty fields are omitted from the output.
 */
struct LogContext {
    std::string fileRef;     ///< File reference ("channel:message")
    std::string range;       ///< Byte range ("[start,end)")
    SessionId sessionId = 0; ///< Backend session identifier
    int32_t errorCode = 0;   ///< Error code for the operation

    LogContext() = default;
    LogContext(const FileReference& file, const ByteRange& r,
               SessionId session = 0, int32_t code = 0)
        : fileRef(file.toString())
        , range(r.toString())
        , sessionId(session)
        , errorCode(code) {}
};

/**
 * @brief Structured logger with JSON format support.
 *
 * - Configurable log levels (debug, info, warning, error)
 * - ISO 8601 UTC timestamps
 * - JSON line format for log aggregation systems
 * - Contextual records with file reference, range, session and error code
 *
 * ## Thread Safety
 * All methods are thread-safe. Log messages from different threads may
 * interleave but will not corrupt data structures.
 *
 * ## Usage Example
 * @code
 * auto logger = std::make_shared<StructuredLogger>();
 * logger->addSink(std::make_shared<pal::ConsoleLogSink>());
 * logger->info("Listening on port 8080", "Http");
 *
 * LogContext ctx(file, range, sessionId, static_cast<int32_t>(err.code));
 * logger->errorWithContext("Backend fetch failed", ctx, "Stream");
 * @endcode
 */
class StructuredLogger {
public:
    StructuredLogger();
    ~StructuredLogger();

    StructuredLogger(const StructuredLogger&) = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;
    StructuredLogger(StructuredLogger&&) = delete;
    StructuredLogger& operator=(StructuredLogger&&) = delete;

    // =========================================================================
    // Configuration
    // =========================================================================

    void setLevel(LogLevelConfig level);
    LogLevelConfig getLevel() const;

    /**
     * @brief Enable or disable JSON line format.
     */
    void setJsonFormat(bool enabled);
    bool isJsonFormat() const;

    /**
     * @brief Check whether messages at the given level are emitted.
     *
     * Lets callers skip building expensive messages.
     */
    bool isEnabled(LogLevelConfig level) const;

    // =========================================================================
    // Basic Logging Methods
    // =========================================================================

    void debug(const std::string& message, const std::string& category = "RangeCast");
    void info(const std::string& message, const std::string& category = "RangeCast");
    void warning(const std::string& message, const std::string& category = "RangeCast");
    void error(const std::string& message, const std::string& category = "RangeCast");

    // =========================================================================
    // Contextual Logging
    // =========================================================================

    /**
     * @brief Log an error with delivery context.
     *
     * @param message Error message
     * @param context File reference, range, session id and error code
     * @param category Log category
     */
    void errorWithContext(
        const std::string& message,
        const LogContext& context,
        const std::string& category = "RangeCast"
    );

    /**
     * @brief Log a warning with delivery context.
     */
    void warningWithContext(
        const std::string& message,
        const LogContext& context,
        const std::string& category = "RangeCast"
    );

    // =========================================================================
    // Sink Management
    // =========================================================================

    void addSink(std::shared_ptr<pal::ILogSink> sink);
    void removeSink(std::shared_ptr<pal::ILogSink> sink);
    void flush();

private:
    void log(LogLevelConfig level, const std::string& message,
             const std::string& category, const LogContext* context);

    std::atomic<LogLevelConfig> level_{LogLevelConfig::Info};
    std::atomic<bool> jsonFormat_{false};
    mutable std::mutex sinksMutex_;
    std::vector<std::shared_ptr<pal::ILogSink>> sinks_;
};

// =============================================================================
// Convenience Macros
// =============================================================================

// Components hold a nullable std::shared_ptr<StructuredLogger>; these skip
// message construction when there is no logger or the level is filtered.

#define RANGECAST_LOG(logger, lvl, method, category, message) \
    do { \
        if ((logger) && (logger)->isEnabled(lvl)) { \
            (logger)->method((message), (category)); \
        } \
    } while (0)

#define RANGECAST_LOG_DEBUG(logger, category, message) \
    RANGECAST_LOG(logger, ::rangecast::core::LogLevelConfig::Debug, debug, category, message)

#define RANGECAST_LOG_INFO(logger, category, message) \
    RANGECAST_LOG(logger, ::rangecast::core::LogLevelConfig::Info, info, category, message)

#define RANGECAST_LOG_WARNING(logger, category, message) \
    RANGECAST_LOG(logger, ::rangecast::core::LogLevelConfig::Warning, warning, category, message)

#define RANGECAST_LOG_ERROR(logger, category, message) \
    RANGECAST_LOG(logger, ::rangecast::core::LogLevelConfig::Error, error, category, message)

} // namespace core
} // namespace rangecast

#endif // RANGECAST_CORE_STRUCTURED_LOGGER_HPP
