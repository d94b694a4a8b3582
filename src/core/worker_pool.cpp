// RangeCast - Seekable media delivery engine
// Worker pool implementation

#include "rangecast/core/worker_pool.hpp"

#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <unistd.h>

namespace rangecast {
namespace core {

namespace {

constexpr int LOW_PRIORITY_NICE = 10;

void configureCurrentThread(const std::string& name, bool lowPriority) {
    // Linux limits thread names to 16 bytes including the terminator
    std::string truncatedName = name.substr(0, 15);
    prctl(PR_SET_NAME, truncatedName.c_str(), 0, 0, 0);

    if (lowPriority) {
        // Nice values are per thread on Linux when addressed by tid.
        pid_t tid = static_cast<pid_t>(syscall(SYS_gettid));
        setpriority(PRIO_PROCESS, static_cast<id_t>(tid), LOW_PRIORITY_NICE);
    }
}

} // anonymous namespace

WorkerPool::WorkerPool(WorkerPoolOptions options)
    : options_(std::move(options)) {
    if (options_.threads == 0) {
        options_.threads = 1;
    }
    workers_.reserve(options_.threads);
    for (size_t i = 0; i < options_.threads; ++i) {
        workers_.emplace_back(&WorkerPool::workerLoop, this, i);
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

Result<void, Error> WorkerPool::submit(WorkItem work) {
    if (!work) {
        return Result<void, Error>::error(
            Error(ErrorCode::InvalidArgument, "Work item is null", options_.name));
    }

    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (shutdown_.load()) {
            return Result<void, Error>::error(
                Error(ErrorCode::InvalidState, "Worker pool is shutting down", options_.name));
        }
        if (workQueue_.size() >= options_.maxQueued) {
            return Result<void, Error>::error(
                Error(ErrorCode::ResourceExhausted, "Worker queue is full", options_.name));
        }
        workQueue_.push(std::move(work));
    }
    workCondition_.notify_one();

    return Result<void, Error>::success();
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (shutdown_.exchange(true)) {
            return;
        }
    }
    workCondition_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

size_t WorkerPool::queuedCount() const {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return workQueue_.size();
}

void WorkerPool::workerLoop(size_t index) {
    configureCurrentThread(options_.name + "-" + std::to_string(index), options_.lowPriority);

    while (true) {
        WorkItem work;

        {
            std::unique_lock<std::mutex> lock(queueMutex_);

            workCondition_.wait(lock, [this]() {
                return shutdown_.load() || !workQueue_.empty();
            });

            if (shutdown_.load() && workQueue_.empty()) {
                break;
            }

            work = std::move(workQueue_.front());
            workQueue_.pop();
        }

        // Execute work item outside the lock
        if (work) {
            work();
        }
    }
}

} // namespace core
} // namespace rangecast
