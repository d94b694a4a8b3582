// RangeCast - Seekable media delivery engine
// Platform Abstraction Layer - Shared logging types

#ifndef RANGECAST_PAL_PAL_TYPES_HPP
#define RANGECAST_PAL_PAL_TYPES_HPP

#include <cstdint>
#include <string>

namespace rangecast {
namespace pal {

// =============================================================================
// Log Types
// =============================================================================

/**
 * @brief Severity levels understood by log sinks.
 */
enum class LogLevel : uint32_t {
    Debug = 1,
    Info = 2,
    Warning = 3,
    Error = 4
};

/**
 * @brief Delivery context a sink may index records by.
 *
 * Empty for records that are not about a particular file.
 */
struct LogContext {
    std::string fileRef;     ///< "channel:message"
    uint32_t sessionId = 0;  ///< Backend session, 0 if none
};

} // namespace pal
} // namespace rangecast

#endif // RANGECAST_PAL_PAL_TYPES_HPP
