// RangeCast - Seekable media delivery engine
// Pre-Cache Scheduler Implementation

#include "rangecast/streaming/precache_scheduler.hpp"

#include <algorithm>

namespace rangecast {
namespace streaming {

namespace {

const char* const LOG_CATEGORY = "PreCache";
constexpr int MAX_ATTEMPTS = 2;

} // anonymous namespace

PreCacheScheduler::PreCacheScheduler(const PreCacheSchedulerConfig& config,
                                     ICatalog& catalog,
                                     MediaCache& cache,
                                     PrefetchFunction prefetch,
                                     std::shared_ptr<ISeriesOrdering> ordering,
                                     std::shared_ptr<core::StructuredLogger> logger)
    : config_(config)
    , catalog_(catalog)
    , cache_(cache)
    , prefetch_(std::move(prefetch))
    , ordering_(ordering ? std::move(ordering) : std::make_shared<NextIndexOrdering>())
    , logger_(std::move(logger)) {
    if (config_.enabled) {
        core::WorkerPoolOptions options;
        options.name = "precache";
        options.threads = std::max<size_t>(1, config_.workers);
        options.maxQueued = config_.maxQueued;
        options.lowPriority = true;
        workers_ = std::make_unique<core::WorkerPool>(options);
    }
}

PreCacheScheduler::~PreCacheScheduler() {
    shutdown();
}

void PreCacheScheduler::onFileServed(const FileReference& file, const ObjectInfo& info) {
    if (!config_.enabled) {
        return;
    }
    auto position = seriesPositionOf(info);
    if (!position) {
        return;
    }
    RANGECAST_LOG_DEBUG(logger_, LOG_CATEGORY,
        file.toString() + " is item " + std::to_string(position->index) +
        " of \"" + position->groupKey + "\"");
    onAccess(position->groupKey, position->index);
}

void PreCacheScheduler::onAccess(const std::string& groupKey, int64_t index) {
    if (!config_.enabled || !workers_) {
        return;
    }

    auto next = ordering_->next(SeriesPosition{groupKey, index});
    if (!next) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!outstanding_.insert(groupKey).second) {
            ++stats_.skippedOutstanding;
            return;
        }
        ++stats_.scheduled;
    }

    const int64_t nextIndex = *next;
    auto submitted = workers_->submit([this, groupKey, nextIndex]() {
        runTask(groupKey, nextIndex);
    });
    if (submitted.isError()) {
        RANGECAST_LOG_DEBUG(logger_, LOG_CATEGORY,
            "Not scheduling \"" + groupKey + "\": " + submitted.error().toString());
        finishTask(groupKey);
    }
}

void PreCacheScheduler::shutdown() {
    cancel_.cancel();
    if (workers_) {
        workers_->shutdown();
    }
}

size_t PreCacheScheduler::outstandingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outstanding_.size();
}

PreCacheStatistics PreCacheScheduler::statistics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

// =============================================================================
// Task
// =============================================================================

void PreCacheScheduler::runTask(const std::string& groupKey, int64_t index) {
    Result<void, Error> result = Result<void, Error>::success();
    for (int attempt = 1; attempt <= MAX_ATTEMPTS; ++attempt) {
        if (cancel_.isCancelled()) {
            result = Result<void, Error>::error(
                Error(ErrorCode::Cancelled, "Scheduler shutting down", groupKey));
            break;
        }
        result = precache(groupKey, index);
        if (result.isSuccess() || result.error().code == ErrorCode::NotFound ||
            result.error().code == ErrorCode::Cancelled) {
            break;
        }
        RANGECAST_LOG_DEBUG(logger_, LOG_CATEGORY,
            "Attempt " + std::to_string(attempt) + " for \"" + groupKey + "\" #" +
            std::to_string(index) + " failed: " + result.error().toString());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (result.isSuccess()) {
            ++stats_.completed;
        } else if (result.error().code == ErrorCode::NotFound) {
            ++stats_.skippedMissing;
        } else if (result.error().code == ErrorCode::Cancelled) {
            ++stats_.cancelled;
        } else {
            ++stats_.failed;
        }
    }
    if (result.isError() && result.error().code != ErrorCode::NotFound &&
        result.error().code != ErrorCode::Cancelled) {
        RANGECAST_LOG_WARNING(logger_, LOG_CATEGORY,
            "Pre-cache of \"" + groupKey + "\" #" + std::to_string(index) +
            " failed: " + result.error().toString());
    }
    finishTask(groupKey);
}

Result<void, Error> PreCacheScheduler::precache(const std::string& groupKey, int64_t index) {
    auto file = catalog_.findSeriesItem(groupKey, index);
    if (file.isError()) {
        return Result<void, Error>::error(file.error());
    }
    auto info = catalog_.objectInfo(file.value());
    if (info.isError()) {
        return Result<void, Error>::error(info.error());
    }
    if (!cache_.isCacheable(info.value()) || info.value().size == 0) {
        return Result<void, Error>::success();
    }

    const ByteCount end = std::min(info.value().size, std::max<ByteCount>(1, config_.bytes));
    const ByteCount chunkSize = cache_.chunkSize();
    bool cached = true;
    for (ChunkIndex chunk = 0; chunk * chunkSize < end; ++chunk) {
        if (!cache_.contains(file.value(), chunk)) {
            cached = false;
            break;
        }
    }
    if (cached) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.skippedCached;
        return Result<void, Error>::success();
    }

    RANGECAST_LOG_INFO(logger_, LOG_CATEGORY,
        "Pre-caching " + file.value().toString() + " (\"" + groupKey + "\" #" +
        std::to_string(index) + ", " + std::to_string(end) + " bytes)");
    return prefetch_(file.value(), ByteRange::of(0, end), cancel_);
}

void PreCacheScheduler::finishTask(const std::string& groupKey) {
    std::lock_guard<std::mutex> lock(mutex_);
    outstanding_.erase(groupKey);
}

} // namespace streaming
} // namespace rangecast
