// RangeCast - Seekable media delivery engine
// Fetcher - Lazy part-by-part download of a byte range from one session

#ifndef RANGECAST_STREAMING_FETCHER_HPP
#define RANGECAST_STREAMING_FETCHER_HPP

#include "rangecast/core/cancellation.hpp"
#include "rangecast/core/error_codes.hpp"
#include "rangecast/core/result.hpp"
#include "rangecast/core/structured_logger.hpp"
#include "rangecast/core/types.hpp"
#include "rangecast/streaming/backend.hpp"

#include <atomic>
#include <memory>

namespace rangecast {
namespace streaming {

/**
 * @brief Fetcher configuration.
 */
struct FetcherConfig {
    /// Backend part size; every request offset is a multiple of it.
    ByteCount partSize{core::DEFAULT_CHUNK_SIZE};
};

/**
 * @brief Download counters shared by every stream of one Fetcher.
 */
struct FetcherStatistics {
    uint64_t partsDownloaded{0};
    uint64_t bytesDownloaded{0};
    uint64_t failedParts{0};
};

class Fetcher;

/**
 * @brief Lazy sequence of the bytes of one range, one backend part per step.
 *
 * The first part starts at the part boundary at or below range.start and
 * is cut at the front; the last part is cut at range.end. No backend call is
 * in flight between next() calls, so a consumer may simply stop calling.
 * The session must outlive the stream; the caller scopes the lease.
 */
class ChunkStream {
public:
    ChunkStream(Fetcher& fetcher, IBackendSession& session, const FileReference& file,
                const ByteRange& range, core::CancellationToken cancel);

    /**
     * @brief True while bytes of the range remain undelivered.
     */
    bool hasNext() const { return position_ < range_.end; }

    /**
     * @brief Download the next part and return its in-range bytes.
     *
     * @return Non-empty bytes, or RateLimited / SessionRevoked / NotFound /
     *         BackendError from the backend, Cancelled if the token is set,
     *         InvalidState when the stream is exhausted
     */
    Result<Bytes, Error> next();

    /**
     * @brief Absolute offset of the first byte not yet delivered.
     */
    ByteCount position() const { return position_; }

    const ByteRange& range() const { return range_; }

private:
    Fetcher& fetcher_;
    IBackendSession& session_;
    FileReference file_;
    ByteRange range_;
    ByteCount position_;
    core::CancellationToken cancel_;
};

/**
 * @brief Creates ChunkStreams and keeps download counters.
 *
 * Thread Safety: fetch() and statistics() may be called concurrently.
 */
class Fetcher {
public:
    explicit Fetcher(const FetcherConfig& config = FetcherConfig{},
                     std::shared_ptr<core::StructuredLogger> logger = nullptr);

    /**
     * @brief Begin a lazy download of a concrete (resolved) range.
     */
    ChunkStream fetch(IBackendSession& session, const FileReference& file,
                      const ByteRange& range,
                      core::CancellationToken cancel = core::CancellationToken());

    FetcherStatistics statistics() const;
    const FetcherConfig& config() const { return config_; }

private:
    friend class ChunkStream;

    void recordPart(ByteCount bytes);
    void recordFailure();

    FetcherConfig config_;
    std::shared_ptr<core::StructuredLogger> logger_;
    std::atomic<uint64_t> partsDownloaded_{0};
    std::atomic<uint64_t> bytesDownloaded_{0};
    std::atomic<uint64_t> failedParts_{0};
};

} // namespace streaming
} // namespace rangecast

#endif // RANGECAST_STREAMING_FETCHER_HPP
