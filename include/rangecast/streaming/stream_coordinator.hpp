// RangeCast - Seekable media delivery engine
// Stream Coordinator - Serves one requested byte range end to end
//
// Responsibilities:
// - Split the range into cache chunks and serve HIT chunks from the cache
// - Coalesce MISS chunks: one leader fetches, followers subscribe
// - Forward bytes to the consumer in strictly ascending offset order
// - Hand in-flight fills over to a subscriber when the consumer disconnects
// - Notify the pre-cache scheduler after a successful stream

#ifndef RANGECAST_STREAMING_STREAM_COORDINATOR_HPP
#define RANGECAST_STREAMING_STREAM_COORDINATOR_HPP

#include "rangecast/core/cancellation.hpp"
#include "rangecast/core/error_codes.hpp"
#include "rangecast/core/result.hpp"
#include "rangecast/core/structured_logger.hpp"
#include "rangecast/core/types.hpp"
#include "rangecast/streaming/backend.hpp"
#include "rangecast/streaming/media_cache.hpp"
#include "rangecast/streaming/rotating_fetcher.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace rangecast {
namespace streaming {

/**
 * @brief Receives delivered bytes. Returning false means the consumer is gone.
 */
using ByteSink = std::function<bool(const uint8_t* data, size_t size)>;

/**
 * @brief Called after a range was streamed to a client successfully.
 */
using AccessListener = std::function<void(const FileReference& file, const ObjectInfo& info)>;

enum class CacheVerdict {
    Hit,      ///< Every chunk came from the cache
    Miss,     ///< No chunk came from the cache
    Partial   ///< Mixed
};

const char* cacheVerdictToString(CacheVerdict verdict);

/**
 * @brief Outcome of a successful stream.
 */
struct StreamSummary {
    ByteRange range;            ///< Resolved range that was served
    ByteCount bytesDelivered{0};
    size_t hitChunks{0};
    size_t missChunks{0};

    CacheVerdict verdict() const;
};

struct StreamCoordinatorStatistics {
    uint64_t activeStreams{0};
    uint64_t completedStreams{0};
    uint64_t cancelledStreams{0};
    uint64_t failedStreams{0};
    uint64_t prefetches{0};
    uint64_t bytesDelivered{0};
    uint64_t handoffs{0};       ///< Fills adopted after their leader left
};

/**
 * @brief Runs the HIT / MISS pipeline of one range.
 *
 * Error results: NotFound (catalog), RangeNotSatisfiable, Unavailable (no
 * session in time), BackendError, Cancelled (consumer gone).
 *
 * Thread Safety: stream() and prefetch() may run concurrently from any
 * number of threads.
 */
class StreamCoordinator {
public:
    StreamCoordinator(ICatalog& catalog, MediaCache& cache, RotatingFetcher& fetcher,
                      std::shared_ptr<core::StructuredLogger> logger = nullptr);

    StreamCoordinator(const StreamCoordinator&) = delete;
    StreamCoordinator& operator=(const StreamCoordinator&) = delete;

    void setAccessListener(AccessListener listener);

    /**
     * @brief Stream a range of a file, looking the file up in the catalog.
     */
    Result<StreamSummary, Error> stream(const FileReference& file, const ByteRange& range,
                                        const ByteSink& sink,
                                        core::CancellationToken cancel = core::CancellationToken());

    /**
     * @brief Stream a range of a file whose metadata the caller already has.
     */
    Result<StreamSummary, Error> stream(const FileReference& file, const ObjectInfo& info,
                                        const ByteRange& range, const ByteSink& sink,
                                        core::CancellationToken cancel = core::CancellationToken());

    /**
     * @brief Populate the cache for a range without a consumer.
     *
     * Cached chunks are skipped without touching their access statistics.
     */
    Result<StreamSummary, Error> prefetch(const FileReference& file, const ByteRange& range,
                                          core::CancellationToken cancel = core::CancellationToken());

    StreamCoordinatorStatistics statistics() const;

private:
    enum class ChunkOutcome {
        Done,
        Retry   ///< Chunk state changed under us; look it up again
    };

    struct Request {
        FileReference file;
        const ObjectInfo* info;
        ByteRange range;          ///< Resolved
        const ByteSink* sink;     ///< Null for prefetch
        core::CancellationToken cancel;
        StreamSummary summary;
    };

    Result<StreamSummary, Error> run(const FileReference& file, const ObjectInfo& info,
                                     const ByteRange& range, const ByteSink* sink,
                                     core::CancellationToken cancel);

    Result<ChunkOutcome, Error> serveCached(Request& request, const ChunkLookup& chunk);

    /**
     * @brief Fetch a run of chunks as one backend range and produce their fills.
     *
     * @param resumeAt Absolute offset to fetch from (inside the first chunk)
     */
    Result<void, Error> produce(Request& request, const std::vector<ChunkLookup>& chunks,
                                const std::vector<std::shared_ptr<ChunkFill>>& fills,
                                ByteCount resumeAt);

    Result<ChunkOutcome, Error> follow(Request& request, const ChunkLookup& chunk,
                                       const std::shared_ptr<ChunkFill>& fill);

    /// Forward the part of [offset, offset+size) that lies inside the request.
    bool forward(Request& request, ByteCount offset, const uint8_t* data, size_t size);

    Result<StreamSummary, Error> finish(Request& request, Result<void, Error> outcome);

    ICatalog& catalog_;
    MediaCache& cache_;
    RotatingFetcher& fetcher_;
    std::shared_ptr<core::StructuredLogger> logger_;

    mutable std::mutex listenerMutex_;
    AccessListener listener_;

    std::atomic<uint64_t> activeStreams_{0};
    std::atomic<uint64_t> completedStreams_{0};
    std::atomic<uint64_t> cancelledStreams_{0};
    std::atomic<uint64_t> failedStreams_{0};
    std::atomic<uint64_t> prefetches_{0};
    std::atomic<uint64_t> bytesDelivered_{0};
    std::atomic<uint64_t> handoffs_{0};
};

} // namespace streaming
} // namespace rangecast

#endif // RANGECAST_STREAMING_STREAM_COORDINATOR_HPP
