// RangeCast - Seekable media delivery engine
// Common type definitions

#ifndef RANGECAST_CORE_TYPES_HPP
#define RANGECAST_CORE_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace rangecast {
namespace core {

// Type aliases for handles and IDs
using SessionId = uint32_t;
using ChunkIndex = uint64_t;
using ByteCount = uint64_t;

constexpr SessionId INVALID_SESSION_ID = 0;

/// Upper bound on backend sessions in one pool.
constexpr size_t MAX_POOL_SESSIONS = 50;

/// Default cache chunk size (the messaging backend serves at most 1 MiB per part).
constexpr ByteCount DEFAULT_CHUNK_SIZE = 1024 * 1024;

using Bytes = std::vector<uint8_t>;

/**
 * @brief Time utilities.
 */
using SteadyClock = std::chrono::steady_clock;
using TimePoint = SteadyClock::time_point;
using Duration = std::chrono::milliseconds;

/**
 * @brief Identifies one media object stored in the backend.
 *
 * A file is addressed by the channel it was posted to and the message that
 * carries it. Immutable once resolved from the catalog.
 */
struct FileReference {
    int64_t channelId = 0;
    int64_t messageId = 0;

    FileReference() = default;
    FileReference(int64_t channel, int64_t message)
        : channelId(channel), messageId(message) {}

    /**
     * @brief Textual form "channel:message", used in logs and cache keys.
     */
    [[nodiscard]] std::string toString() const {
        return std::to_string(channelId) + ":" + std::to_string(messageId);
    }

    /**
     * @brief Parse the "channel:message" form.
     */
    static std::optional<FileReference> parse(const std::string& text);

    bool operator==(const FileReference& other) const {
        return channelId == other.channelId && messageId == other.messageId;
    }

    bool operator!=(const FileReference& other) const {
        return !(*this == other);
    }

    bool operator<(const FileReference& other) const {
        if (channelId != other.channelId) return channelId < other.channelId;
        return messageId < other.messageId;
    }
};

/**
 * @brief Half-open byte interval [start, end) or the whole object.
 *
 * A whole-object range is resolved against the object size with
 * resolve() before it reaches any component that touches the backend.
 */
struct ByteRange {
    ByteCount start = 0;
    ByteCount end = 0;
    bool wholeObject = false;

    static ByteRange whole() {
        ByteRange r;
        r.wholeObject = true;
        return r;
    }

    static ByteRange of(ByteCount start, ByteCount end) {
        ByteRange r;
        r.start = start;
        r.end = end;
        return r;
    }

    [[nodiscard]] ByteCount length() const {
        return end > start ? end - start : 0;
    }

    [[nodiscard]] bool empty() const {
        return !wholeObject && end <= start;
    }

    /**
     * @brief Concrete range for an object of the given size.
     * @return std::nullopt if the range does not fit inside the object
     */
    [[nodiscard]] std::optional<ByteRange> resolve(ByteCount objectSize) const {
        if (wholeObject) {
            return ByteRange::of(0, objectSize);
        }
        if (start > end || end > objectSize) {
            return std::nullopt;
        }
        return *this;
    }

    [[nodiscard]] std::string toString() const {
        if (wholeObject) {
            return "[whole]";
        }
        return "[" + std::to_string(start) + "," + std::to_string(end) + ")";
    }

    bool operator==(const ByteRange& other) const {
        return wholeObject == other.wholeObject &&
               (wholeObject || (start == other.start && end == other.end));
    }
};

/**
 * @brief Cache key: one fixed-size chunk of one file.
 */
struct ChunkKey {
    FileReference file;
    ChunkIndex index = 0;

    ChunkKey() = default;
    ChunkKey(FileReference f, ChunkIndex i) : file(f), index(i) {}

    [[nodiscard]] std::string toString() const {
        return file.toString() + "#" + std::to_string(index);
    }

    bool operator==(const ChunkKey& other) const {
        return file == other.file && index == other.index;
    }

    bool operator!=(const ChunkKey& other) const {
        return !(*this == other);
    }

    bool operator<(const ChunkKey& other) const {
        if (file != other.file) return file < other.file;
        return index < other.index;
    }
};

/**
 * @brief Position of a file inside a series (e.g. an episode of a season).
 */
struct SeriesPosition {
    std::string groupKey;
    int64_t index = 0;
};

/**
 * @brief Catalog metadata for one backend file.
 */
struct ObjectInfo {
    ByteCount size = 0;
    std::string mimeType;
    std::string fileName;
    std::optional<SeriesPosition> series;
};

/**
 * @brief Callback types.
 */
using WorkItem = std::function<void()>;

} // namespace core

// Re-export commonly used types to rangecast namespace
using core::SessionId;
using core::ChunkIndex;
using core::ByteCount;
using core::Bytes;
using core::FileReference;
using core::ByteRange;
using core::ChunkKey;
using core::SeriesPosition;
using core::ObjectInfo;

} // namespace rangecast

// Hash specializations for unordered containers
namespace std {
template<>
struct hash<rangecast::FileReference> {
    size_t operator()(const rangecast::FileReference& ref) const {
        size_t h1 = hash<int64_t>{}(ref.channelId);
        size_t h2 = hash<int64_t>{}(ref.messageId);
        return h1 ^ (h2 << 1);
    }
};

template<>
struct hash<rangecast::ChunkKey> {
    size_t operator()(const rangecast::ChunkKey& key) const {
        size_t h1 = hash<rangecast::FileReference>{}(key.file);
        size_t h2 = hash<uint64_t>{}(key.index);
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};
} // namespace std

#endif // RANGECAST_CORE_TYPES_HPP
