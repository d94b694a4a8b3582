// RangeCast - Seekable media delivery engine
// Structured Logger Implementation

#include "rangecast/core/structured_logger.hpp"
#include "rangecast/core/json.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>

namespace rangecast {
namespace core {

namespace {

struct LevelName {
    LogLevelConfig level;
    const char* name;
    pal::LogLevel sinkLevel;
};

const LevelName LEVEL_NAMES[] = {
    {LogLevelConfig::Debug, "debug", pal::LogLevel::Debug},
    {LogLevelConfig::Info, "info", pal::LogLevel::Info},
    {LogLevelConfig::Warning, "warning", pal::LogLevel::Warning},
    {LogLevelConfig::Error, "error", pal::LogLevel::Error},
};

const LevelName& levelName(LogLevelConfig level) {
    for (const auto& entry : LEVEL_NAMES) {
        if (entry.level == level) {
            return entry;
        }
    }
    return LEVEL_NAMES[1];
}

const LevelName* findLevel(const std::string& text) {
    std::string lower(text.size(), '\0');
    std::transform(text.begin(), text.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "warn") {
        lower = "warning";
    }
    for (const auto& entry : LEVEL_NAMES) {
        if (lower == entry.name) {
            return &entry;
        }
    }
    return nullptr;
}

/// ISO 8601 UTC with milliseconds, e.g. 2024-05-01T12:00:00.042Z
std::string utcTimestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm utc;
    gmtime_r(&seconds, &utc);

    char buffer[32];
    size_t length = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &utc);
    std::snprintf(buffer + length, sizeof(buffer) - length, ".%03dZ", static_cast<int>(millis));
    return buffer;
}

std::string plainLine(const std::string& timestamp, const LevelName& level,
                      const std::string& message, const std::string& category,
                      const LogContext* context) {
    std::string line = "[" + timestamp + "] [" + level.name + "] [" + category + "] " + message;
    if (!context) {
        return line;
    }
    if (!context->fileRef.empty()) {
        line += ", File: " + context->fileRef;
    }
    if (!context->range.empty()) {
        line += ", Range: " + context->range;
    }
    if (context->sessionId != 0) {
        line += ", Session: " + std::to_string(context->sessionId);
    }
    if (context->errorCode != 0) {
        line += ", ErrorCode: " + std::to_string(context->errorCode);
    }
    return line;
}

std::string jsonLine(const std::string& timestamp, const LevelName& level,
                     const std::string& message, const std::string& category,
                     const LogContext* context) {
    std::string line = "{\"timestamp\":\"" + timestamp +
                       "\",\"level\":\"" + level.name +
                       "\",\"category\":\"" + escapeJson(category) +
                       "\",\"message\":\"" + escapeJson(message) + "\"";
    if (context) {
        if (!context->fileRef.empty()) {
            line += ",\"file\":\"" + escapeJson(context->fileRef) + "\"";
        }
        if (!context->range.empty()) {
            line += ",\"range\":\"" + escapeJson(context->range) + "\"";
        }
        if (context->sessionId != 0) {
            line += ",\"session_id\":" + std::to_string(context->sessionId);
        }
        if (context->errorCode != 0) {
            line += ",\"error_code\":" + std::to_string(context->errorCode);
        }
    }
    return line + "}";
}

} // anonymous namespace

std::string logLevelToString(LogLevelConfig level) {
    return levelName(level).name;
}

LogLevelConfig stringToLogLevel(const std::string& str) {
    const LevelName* found = findLevel(str);
    return found ? found->level : LogLevelConfig::Info;
}

bool isValidLogLevel(const std::string& str) {
    return findLevel(str) != nullptr;
}

// =============================================================================
// StructuredLogger
// =============================================================================

StructuredLogger::StructuredLogger() = default;

StructuredLogger::~StructuredLogger() {
    flush();
}

void StructuredLogger::setLevel(LogLevelConfig level) { level_ = level; }
LogLevelConfig StructuredLogger::getLevel() const { return level_; }
void StructuredLogger::setJsonFormat(bool enabled) { jsonFormat_ = enabled; }
bool StructuredLogger::isJsonFormat() const { return jsonFormat_; }

bool StructuredLogger::isEnabled(LogLevelConfig level) const {
    return static_cast<int>(level) >= static_cast<int>(level_.load());
}

void StructuredLogger::debug(const std::string& message, const std::string& category) {
    log(LogLevelConfig::Debug, message, category, nullptr);
}

void StructuredLogger::info(const std::string& message, const std::string& category) {
    log(LogLevelConfig::Info, message, category, nullptr);
}

void StructuredLogger::warning(const std::string& message, const std::string& category) {
    log(LogLevelConfig::Warning, message, category, nullptr);
}

void StructuredLogger::error(const std::string& message, const std::string& category) {
    log(LogLevelConfig::Error, message, category, nullptr);
}

void StructuredLogger::errorWithContext(const std::string& message, const LogContext& context,
                                        const std::string& category) {
    log(LogLevelConfig::Error, message, category, &context);
}

void StructuredLogger::warningWithContext(const std::string& message, const LogContext& context,
                                          const std::string& category) {
    log(LogLevelConfig::Warning, message, category, &context);
}

void StructuredLogger::addSink(std::shared_ptr<pal::ILogSink> sink) {
    if (sink) {
        std::lock_guard<std::mutex> lock(sinksMutex_);
        sinks_.push_back(std::move(sink));
    }
}

void StructuredLogger::removeSink(std::shared_ptr<pal::ILogSink> sink) {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void StructuredLogger::flush() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

void StructuredLogger::log(LogLevelConfig level, const std::string& message,
                           const std::string& category, const LogContext* context) {
    if (!isEnabled(level)) {
        return;
    }

    const LevelName& name = levelName(level);
    const std::string timestamp = utcTimestamp();
    const std::string line = jsonFormat_
        ? jsonLine(timestamp, name, message, category, context)
        : plainLine(timestamp, name, message, category, context);

    pal::LogContext sinkContext;
    if (context) {
        sinkContext.fileRef = context->fileRef;
        sinkContext.sessionId = context->sessionId;
    }

    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (auto& sink : sinks_) {
        sink->write(name.sinkLevel, line, category, sinkContext);
    }
}

} // namespace core
} // namespace rangecast
