// RangeCast - Seekable media delivery engine
// Console and file log sinks

#include "rangecast/pal/log_pal.hpp"

namespace rangecast {
namespace pal {

// =============================================================================
// ConsoleLogSink
// =============================================================================

void ConsoleLogSink::write(LogLevel /*level*/, const std::string& message,
                           const std::string& /*category*/, const LogContext& /*context*/) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fwrite(message.data(), 1, message.size(), stderr);
    std::fputc('\n', stderr);
}

void ConsoleLogSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fflush(stderr);
}

// =============================================================================
// FileLogSink
// =============================================================================

FileLogSink::FileLogSink(const std::string& path)
    : path_(path)
    , file_(std::fopen(path.c_str(), "a")) {
}

FileLogSink::~FileLogSink() {
    if (file_) {
        std::fclose(file_);
        file_ = nullptr;
    }
}

void FileLogSink::write(LogLevel /*level*/, const std::string& message,
                        const std::string& /*category*/, const LogContext& /*context*/) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!file_) {
        return;
    }
    std::fwrite(message.data(), 1, message.size(), file_);
    std::fputc('\n', file_);
}

void FileLogSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_) {
        std::fflush(file_);
    }
}

} // namespace pal
} // namespace rangecast
