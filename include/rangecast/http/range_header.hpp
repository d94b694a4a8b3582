// RangeCast - Seekable media delivery engine
// HTTP Range header parsing (single byte range)

#ifndef RANGECAST_HTTP_RANGE_HEADER_HPP
#define RANGECAST_HTTP_RANGE_HEADER_HPP

#include "rangecast/core/error_codes.hpp"
#include "rangecast/core/result.hpp"
#include "rangecast/core/types.hpp"

#include <optional>
#include <string>

namespace rangecast {
namespace http {

/**
 * @brief Resolve a Range header value against an object size.
 *
 * Accepted forms: "bytes=a-b", "bytes=a-" and "bytes=-n". An end past the
 * object is clamped to the last byte; a suffix longer than the object
 * selects the whole object.
 *
 * @param value Header value; empty means no Range header
 * @return std::nullopt when no range was requested, the half-open range
 *         otherwise; InvalidArgument for a malformed or multi-range value,
 *         RangeNotSatisfiable when the range selects no byte of the object
 */
core::Result<std::optional<ByteRange>, core::Error> parseRangeHeader(
    const std::string& value, ByteCount objectSize);

/**
 * @brief "bytes a-b/size" for a non-empty half-open range.
 */
std::string contentRangeValue(const ByteRange& range, ByteCount objectSize);

/// Content-Range value of a 416 response, e.g. "bytes */1000".
std::string unsatisfiedRangeValue(ByteCount objectSize);

} // namespace http
} // namespace rangecast

#endif // RANGECAST_HTTP_RANGE_HEADER_HPP
