// RangeCast - Seekable media delivery engine
// Types implementation

#include "rangecast/core/types.hpp"

#include <cerrno>
#include <cstdlib>

namespace rangecast {
namespace core {

namespace {

std::optional<int64_t> parseInt64(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(text.c_str(), &end, 10);
    if (errno != 0 || end == nullptr || *end != '\0') {
        return std::nullopt;
    }
    return static_cast<int64_t>(value);
}

} // anonymous namespace

std::optional<FileReference> FileReference::parse(const std::string& text) {
    size_t colon = text.find(':');
    if (colon == std::string::npos) {
        return std::nullopt;
    }

    auto channel = parseInt64(text.substr(0, colon));
    auto message = parseInt64(text.substr(colon + 1));
    if (!channel || !message) {
        return std::nullopt;
    }
    return FileReference(*channel, *message);
}

} // namespace core
} // namespace rangecast
