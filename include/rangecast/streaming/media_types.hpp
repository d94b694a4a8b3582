// RangeCast - Seekable media delivery engine
// Media type helpers: MIME guessing and the cacheable-type filter

#ifndef RANGECAST_STREAMING_MEDIA_TYPES_HPP
#define RANGECAST_STREAMING_MEDIA_TYPES_HPP

#include <string>

namespace rangecast {
namespace streaming {

/// Fallback MIME type for unknown content.
constexpr const char* DEFAULT_MIME_TYPE = "application/octet-stream";

/**
 * @brief Guess a MIME type from a file name extension.
 * @return DEFAULT_MIME_TYPE when the extension is unknown
 */
std::string guessMimeType(const std::string& fileName);

/**
 * @brief Whether content of this type is worth caching.
 *
 * True for known video/audio MIME types or, failing that, known media
 * file extensions.
 */
bool isCacheableMedia(const std::string& mimeType, const std::string& fileName);

} // namespace streaming
} // namespace rangecast

#endif // RANGECAST_STREAMING_MEDIA_TYPES_HPP
