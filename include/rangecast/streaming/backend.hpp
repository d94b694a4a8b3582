// RangeCast - Seekable media delivery engine
// Interfaces of the external collaborators: backend sessions and the catalog
//
// The delivery pipeline only sees these narrow capabilities. Everything
// specific to a messaging backend (auth keys, data centers, client objects)
// stays behind IBackendSession.

#ifndef RANGECAST_STREAMING_BACKEND_HPP
#define RANGECAST_STREAMING_BACKEND_HPP

#include "rangecast/core/error_codes.hpp"
#include "rangecast/core/result.hpp"
#include "rangecast/core/types.hpp"

#include <string>

namespace rangecast {
namespace streaming {

using core::Error;
using core::ErrorCode;
using core::Result;

/**
 * @brief One authenticated backend connection.
 *
 * downloadPart() is called with an offset aligned to the part size and a
 * limit equal to the part size; the backend returns at most limit bytes and
 * fewer only at the end of the object.
 *
 * Errors:
 * - RateLimited with retryAfter set when the backend asks us to wait
 * - SessionRevoked when the session's authorization is gone
 * - NotFound when the object no longer exists
 * - BackendError for anything else
 *
 * Implementations must accept concurrent calls; the pool may hand the same
 * session to several streams at once.
 */
class IBackendSession {
public:
    virtual ~IBackendSession() = default;

    /**
     * @brief Human-readable identity used in logs.
     */
    virtual std::string label() const = 0;

    /**
     * @brief Download one part of a file.
     *
     * @param file File to read
     * @param offset Part-aligned byte offset
     * @param limit Part size in bytes
     */
    virtual Result<Bytes, Error> downloadPart(
        const FileReference& file,
        ByteCount offset,
        ByteCount limit) = 0;
};

/**
 * @brief Read-only view of the media catalog.
 */
class ICatalog {
public:
    virtual ~ICatalog() = default;

    /**
     * @brief Resolve a public catalog key (URL path component) to a file.
     */
    virtual Result<FileReference, Error> resolveFile(const std::string& catalogKey) = 0;

    /**
     * @brief Size, MIME type, file name and series position of a file.
     */
    virtual Result<ObjectInfo, Error> objectInfo(const FileReference& file) = 0;

    /**
     * @brief Find the item at a position of a series.
     * @return NotFound if the series has no item at that position
     */
    virtual Result<FileReference, Error> findSeriesItem(
        const std::string& groupKey, int64_t index) = 0;
};

} // namespace streaming
} // namespace rangecast

#endif // RANGECAST_STREAMING_BACKEND_HPP
