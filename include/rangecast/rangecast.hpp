// RangeCast - Seekable media delivery engine
// Main header file

#ifndef RANGECAST_RANGECAST_HPP
#define RANGECAST_RANGECAST_HPP

/**
 * @file rangecast.hpp
 * @brief Main header file for the RangeCast library
 *
 * RangeCast serves seekable HTTP byte ranges of media stored behind a
 * rate-limited messaging backend, with a chunked LFU cache in front of a
 * pool of backend sessions.
 */

#define RANGECAST_VERSION_MAJOR 0
#define RANGECAST_VERSION_MINOR 1
#define RANGECAST_VERSION_PATCH 0
#define RANGECAST_VERSION_STRING "0.1.0"

#include "rangecast/core/result.hpp"
#include "rangecast/core/error_codes.hpp"
#include "rangecast/core/types.hpp"
#include "rangecast/api/media_server.hpp"

namespace rangecast {

/**
 * @brief Library version as "major.minor.patch".
 */
inline const char* version() {
    return RANGECAST_VERSION_STRING;
}

inline int versionMajor() {
    return RANGECAST_VERSION_MAJOR;
}

inline int versionMinor() {
    return RANGECAST_VERSION_MINOR;
}

inline int versionPatch() {
    return RANGECAST_VERSION_PATCH;
}

} // namespace rangecast

#endif // RANGECAST_RANGECAST_HPP
