// RangeCast - Seekable media delivery engine
// Fixed-size worker pool over a bounded FIFO queue
//
// Used for background work (pre-cache population) that must never compete
// with foreground streaming: workers can run at reduced scheduling priority.

#ifndef RANGECAST_CORE_WORKER_POOL_HPP
#define RANGECAST_CORE_WORKER_POOL_HPP

#include "rangecast/core/error_codes.hpp"
#include "rangecast/core/result.hpp"
#include "rangecast/core/types.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace rangecast {
namespace core {

/**
 * @brief Options for creating a worker pool.
 */
struct WorkerPoolOptions {
    std::string name = "worker";  ///< Thread name prefix (truncated to 15 chars by the kernel)
    size_t threads = 1;           ///< Number of worker threads
    size_t maxQueued = 64;        ///< Pending items before submit() fails
    bool lowPriority = false;     ///< Raise the nice value of worker threads
};

/**
 * @brief Fixed set of worker threads consuming a bounded FIFO queue.
 *
 * Thread Safety:
 * - submit() may be called from any thread
 * - shutdown() is idempotent; it drains queued items before joining
 */
class WorkerPool {
public:
    explicit WorkerPool(WorkerPoolOptions options);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Queue a work item.
     *
     * @return ResourceExhausted if the queue is full, InvalidState after
     *         shutdown, InvalidArgument for an empty item
     */
    Result<void, Error> submit(WorkItem work);

    /**
     * @brief Stop accepting work, run what is queued, join all workers.
     */
    void shutdown();

    size_t queuedCount() const;
    size_t threadCount() const { return workers_.size(); }

private:
    void workerLoop(size_t index);

    WorkerPoolOptions options_;
    std::vector<std::thread> workers_;

    mutable std::mutex queueMutex_;
    std::condition_variable workCondition_;
    std::queue<WorkItem> workQueue_;
    std::atomic<bool> shutdown_{false};
};

} // namespace core
} // namespace rangecast

#endif // RANGECAST_CORE_WORKER_POOL_HPP
