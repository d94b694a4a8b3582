// RangeCast - Seekable media delivery engine
// HTTP Range header parsing implementation

#include "rangecast/http/range_header.hpp"

#include <cctype>

namespace rangecast {
namespace http {

using core::Error;
using core::ErrorCode;
using RangeResult = core::Result<std::optional<ByteRange>, Error>;

namespace {

std::string trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return text.substr(begin, end - begin);
}

/// Decimal digits only; no sign, no whitespace, no overflow.
bool parseOffset(const std::string& text, ByteCount& out) {
    if (text.empty() || text.size() > 19) {
        return false;
    }
    ByteCount value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + static_cast<ByteCount>(c - '0');
    }
    out = value;
    return true;
}

RangeResult malformed(const std::string& value) {
    return RangeResult::error(Error(ErrorCode::InvalidArgument, "Malformed Range header", value));
}

RangeResult unsatisfiable(const std::string& value, ByteCount objectSize) {
    return RangeResult::error(Error(ErrorCode::RangeNotSatisfiable,
        "Range outside object of " + std::to_string(objectSize) + " bytes", value));
}

} // anonymous namespace

RangeResult parseRangeHeader(const std::string& value, ByteCount objectSize) {
    const std::string header = trim(value);
    if (header.empty()) {
        return RangeResult::success(std::nullopt);
    }

    const std::string prefix = "bytes=";
    if (header.size() <= prefix.size()) {
        return malformed(value);
    }
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(header[i])) != prefix[i]) {
            return malformed(value);
        }
    }

    const std::string rangeSet = trim(header.substr(prefix.size()));
    if (rangeSet.find(',') != std::string::npos) {
        return malformed(value);
    }
    const size_t dash = rangeSet.find('-');
    if (dash == std::string::npos) {
        return malformed(value);
    }
    const std::string first = trim(rangeSet.substr(0, dash));
    const std::string last = trim(rangeSet.substr(dash + 1));

    if (first.empty()) {
        // Suffix form: the final n bytes.
        ByteCount suffix = 0;
        if (!parseOffset(last, suffix)) {
            return malformed(value);
        }
        if (suffix == 0 || objectSize == 0) {
            return unsatisfiable(value, objectSize);
        }
        ByteCount start = suffix >= objectSize ? 0 : objectSize - suffix;
        return RangeResult::success(ByteRange::of(start, objectSize));
    }

    ByteCount start = 0;
    if (!parseOffset(first, start)) {
        return malformed(value);
    }
    ByteCount endInclusive = objectSize > 0 ? objectSize - 1 : 0;
    if (!last.empty()) {
        if (!parseOffset(last, endInclusive)) {
            return malformed(value);
        }
        if (endInclusive < start) {
            return unsatisfiable(value, objectSize);
        }
    }
    if (start >= objectSize) {
        return unsatisfiable(value, objectSize);
    }
    if (endInclusive >= objectSize) {
        endInclusive = objectSize - 1;
    }
    return RangeResult::success(ByteRange::of(start, endInclusive + 1));
}

std::string contentRangeValue(const ByteRange& range, ByteCount objectSize) {
    return "bytes " + std::to_string(range.start) + "-" + std::to_string(range.end - 1) +
           "/" + std::to_string(objectSize);
}

std::string unsatisfiedRangeValue(ByteCount objectSize) {
    return "bytes */" + std::to_string(objectSize);
}

} // namespace http
} // namespace rangecast
