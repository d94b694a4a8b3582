// RangeCast - Seekable media delivery engine
// Platform Abstraction Layer - Log sinks
//
// Sinks receive fully formatted log lines from the StructuredLogger and
// write them to their destination (stderr, a file, a test buffer).

#ifndef RANGECAST_PAL_LOG_PAL_HPP
#define RANGECAST_PAL_LOG_PAL_HPP

#include "rangecast/pal/pal_types.hpp"

#include <cstdio>
#include <memory>
#include <mutex>
#include <string>

namespace rangecast {
namespace pal {

/**
 * @brief Destination for finished log lines.
 *
 * write() is called from any thread that logs, so implementations
 * serialize internally.
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    /// @p line is already formatted; @p context repeats the file reference
    /// and session so sinks can filter without parsing the line.
    virtual void write(LogLevel level, const std::string& line,
                       const std::string& category, const LogContext& context) = 0;

    virtual void flush() = 0;

    /// Identifier shown in diagnostics ("console", "file:<path>").
    virtual std::string getName() const = 0;
};

/**
 * @brief Writes one line per message to stderr.
 */
class ConsoleLogSink : public ILogSink {
public:
    ConsoleLogSink() = default;

    void write(LogLevel level, const std::string& message,
               const std::string& category, const LogContext& context) override;
    void flush() override;
    std::string getName() const override { return "console"; }

private:
    std::mutex mutex_;
};

/**
 * @brief Appends one line per message to a file.
 *
 * The file is opened in append mode at construction; isOpen() reports
 * whether that succeeded. Writes to a sink that failed to open are dropped.
 */
class FileLogSink : public ILogSink {
public:
    explicit FileLogSink(const std::string& path);
    ~FileLogSink() override;

    FileLogSink(const FileLogSink&) = delete;
    FileLogSink& operator=(const FileLogSink&) = delete;

    void write(LogLevel level, const std::string& message,
               const std::string& category, const LogContext& context) override;
    void flush() override;
    std::string getName() const override { return "file:" + path_; }

    bool isOpen() const { return file_ != nullptr; }

private:
    std::string path_;
    std::FILE* file_ = nullptr;
    std::mutex mutex_;
};

} // namespace pal
} // namespace rangecast

#endif // RANGECAST_PAL_LOG_PAL_HPP
