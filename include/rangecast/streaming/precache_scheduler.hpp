// RangeCast - Seekable media delivery engine
// Pre-Cache Scheduler - Populates the leading bytes of the next series item
//
// Responsibilities:
// - Predict the next item of a series after a successful stream
// - Keep at most one outstanding task per series group
// - Run tasks on low-priority workers so foreground streams win
// - Retry a failed task once, then only log it

#ifndef RANGECAST_STREAMING_PRECACHE_SCHEDULER_HPP
#define RANGECAST_STREAMING_PRECACHE_SCHEDULER_HPP

#include "rangecast/core/cancellation.hpp"
#include "rangecast/core/structured_logger.hpp"
#include "rangecast/core/types.hpp"
#include "rangecast/core/worker_pool.hpp"
#include "rangecast/streaming/backend.hpp"
#include "rangecast/streaming/media_cache.hpp"
#include "rangecast/streaming/series.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace rangecast {
namespace streaming {

/**
 * @brief Populates the cache for a range (StreamCoordinator::prefetch).
 *
 * The token is cancelled when the scheduler shuts down.
 */
using PrefetchFunction = std::function<Result<void, Error>(
    const FileReference&, const ByteRange&, const core::CancellationToken&)>;

struct PreCacheSchedulerConfig {
    bool enabled{true};
    ByteCount bytes{core::DEFAULT_CHUNK_SIZE};  ///< Leading bytes to populate
    size_t workers{1};
    size_t maxQueued{16};
};

struct PreCacheStatistics {
    uint64_t scheduled{0};
    uint64_t skippedOutstanding{0};
    uint64_t skippedCached{0};
    uint64_t skippedMissing{0};   ///< No next item in the catalog
    uint64_t completed{0};
    uint64_t failed{0};
    uint64_t cancelled{0};        ///< Dropped or interrupted by shutdown()
};

class PreCacheScheduler {
public:
    PreCacheScheduler(const PreCacheSchedulerConfig& config,
                      ICatalog& catalog,
                      MediaCache& cache,
                      PrefetchFunction prefetch,
                      std::shared_ptr<ISeriesOrdering> ordering = nullptr,
                      std::shared_ptr<core::StructuredLogger> logger = nullptr);
    ~PreCacheScheduler();

    PreCacheScheduler(const PreCacheScheduler&) = delete;
    PreCacheScheduler& operator=(const PreCacheScheduler&) = delete;

    /**
     * @brief Schedule the item after (groupKey, index). Never blocks.
     */
    void onAccess(const std::string& groupKey, int64_t index);

    /**
     * @brief Schedule from a served file's metadata, if it is part of a series.
     */
    void onFileServed(const FileReference& file, const ObjectInfo& info);

    /**
     * @brief Cancel the running prefetch, drop queued tasks and stop the workers.
     *
     * Queued tasks still run to release their group, but return before
     * touching the catalog or the backend.
     */
    void shutdown();

    size_t outstandingCount() const;
    PreCacheStatistics statistics() const;

private:
    void runTask(const std::string& groupKey, int64_t index);
    Result<void, Error> precache(const std::string& groupKey, int64_t index);
    void finishTask(const std::string& groupKey);

    PreCacheSchedulerConfig config_;
    ICatalog& catalog_;
    MediaCache& cache_;
    PrefetchFunction prefetch_;
    std::shared_ptr<ISeriesOrdering> ordering_;
    std::shared_ptr<core::StructuredLogger> logger_;
    std::unique_ptr<core::WorkerPool> workers_;
    core::CancellationToken cancel_;

    mutable std::mutex mutex_;
    std::set<std::string> outstanding_;
    PreCacheStatistics stats_;
};

} // namespace streaming
} // namespace rangecast

#endif // RANGECAST_STREAMING_PRECACHE_SCHEDULER_HPP
