// RangeCast - Seekable media delivery engine
// Session Pool Implementation

#include "rangecast/streaming/session_pool.hpp"

#include <algorithm>

namespace rangecast {
namespace streaming {

namespace {

const char* const LOG_CATEGORY = "SessionPool";
const Duration ACQUIRE_POLL_INTERVAL{50};

Duration remainingUntil(TimePoint until, TimePoint now) {
    if (until <= now) {
        return Duration{0};
    }
    return std::chrono::duration_cast<Duration>(until - now);
}

} // anonymous namespace

// =============================================================================
// SessionLease Implementation
// =============================================================================

SessionLease::SessionLease(SessionPool* pool, SessionId id, std::shared_ptr<IBackendSession> session)
    : pool_(pool)
    , id_(id)
    , session_(std::move(session)) {
}

SessionLease::~SessionLease() {
    release();
}

SessionLease::SessionLease(SessionLease&& other) noexcept
    : pool_(other.pool_)
    , id_(other.id_)
    , session_(std::move(other.session_)) {
    other.pool_ = nullptr;
    other.id_ = core::INVALID_SESSION_ID;
}

SessionLease& SessionLease::operator=(SessionLease&& other) noexcept {
    if (this != &other) {
        release();
        pool_ = other.pool_;
        id_ = other.id_;
        session_ = std::move(other.session_);
        other.pool_ = nullptr;
        other.id_ = core::INVALID_SESSION_ID;
    }
    return *this;
}

void SessionLease::release() {
    if (pool_ != nullptr) {
        pool_->release(id_);
        pool_ = nullptr;
    }
}

// =============================================================================
// SessionPool Implementation
// =============================================================================

Result<std::unique_ptr<SessionPool>, Error> SessionPool::create(
    std::vector<std::shared_ptr<IBackendSession>> sessions,
    const SessionPoolConfig& config,
    std::shared_ptr<core::StructuredLogger> logger)
{
    using PoolResult = Result<std::unique_ptr<SessionPool>, Error>;

    if (sessions.empty() || sessions.size() > core::MAX_POOL_SESSIONS) {
        return PoolResult::error(Error(ErrorCode::InvalidArgument,
            "Session pool needs between 1 and " + std::to_string(core::MAX_POOL_SESSIONS) +
            " sessions, got " + std::to_string(sessions.size())));
    }
    for (const auto& session : sessions) {
        if (!session) {
            return PoolResult::error(Error(ErrorCode::InvalidArgument, "Null backend session"));
        }
    }

    return PoolResult::success(
        std::make_unique<SessionPool>(PrivateTag(), std::move(sessions), config, std::move(logger)));
}

SessionPool::SessionPool(
    PrivateTag,
    std::vector<std::shared_ptr<IBackendSession>> sessions,
    const SessionPoolConfig& config,
    std::shared_ptr<core::StructuredLogger> logger)
    : config_(config)
    , logger_(std::move(logger))
{
    sessions_.reserve(sessions.size());
    SessionId nextId = 1;
    for (auto& backend : sessions) {
        SessionEntry entry;
        entry.id = nextId++;
        entry.backend = std::move(backend);
        sessions_.push_back(std::move(entry));
    }

    RANGECAST_LOG_INFO(logger_, LOG_CATEGORY,
        "Session pool ready with " + std::to_string(sessions_.size()) + " session(s)");
}

Result<SessionLease, Error> SessionPool::acquire(
    const std::set<SessionId>& excluding,
    std::optional<Duration> timeout,
    const core::CancellationToken& cancel)
{
    const TimePoint deadline = core::SteadyClock::now() + timeout.value_or(config_.acquireTimeout);

    std::unique_lock<std::mutex> lock(mutex_);

    while (true) {
        if (cancel.isCancelled()) {
            return Result<SessionLease, Error>::error(
                Error(ErrorCode::Cancelled, "Acquire cancelled while waiting for a session"));
        }

        const TimePoint now = core::SteadyClock::now();
        SessionEntry* best = nullptr;
        TimePoint earliestExpiry = TimePoint::max();

        for (auto& entry : sessions_) {
            if (entry.failed || excluding.count(entry.id) > 0) {
                continue;
            }
            if (entry.cooldownUntil > now) {
                earliestExpiry = std::min(earliestExpiry, entry.cooldownUntil);
                continue;
            }
            // Sessions are ordered by id, so strict < keeps the lowest id on ties.
            if (best == nullptr || entry.load < best->load) {
                best = &entry;
            }
        }

        if (best != nullptr) {
            ++best->load;
            ++best->totalAcquires;
            return Result<SessionLease, Error>::success(
                SessionLease(this, best->id, best->backend));
        }

        if (earliestExpiry == TimePoint::max()) {
            ++unavailableCount_;
            return Result<SessionLease, Error>::error(Error(ErrorCode::Unavailable,
                "No usable backend session", "excluded=" + std::to_string(excluding.size())));
        }

        if (now >= deadline) {
            ++unavailableCount_;
            Error err(ErrorCode::Unavailable, "All backend sessions are cooling down");
            err.retryAfter = std::max(remainingUntil(earliestExpiry, now), Duration{1000});
            RANGECAST_LOG_WARNING(logger_, LOG_CATEGORY, err.toString());
            return Result<SessionLease, Error>::error(std::move(err));
        }

        available_.wait_until(lock,
            std::min({earliestExpiry, deadline, now + ACQUIRE_POLL_INTERVAL}));
    }
}

void SessionPool::release(SessionId id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        SessionEntry* entry = findEntry(id);
        if (entry == nullptr || entry->load == 0) {
            return;
        }
        --entry->load;
    }
    available_.notify_all();
}

void SessionPool::markCooldown(SessionId id, Duration duration) {
    std::lock_guard<std::mutex> lock(mutex_);
    SessionEntry* entry = findEntry(id);
    if (entry == nullptr) {
        return;
    }

    TimePoint until = core::SteadyClock::now() + duration;
    if (until > entry->cooldownUntil) {
        entry->cooldownUntil = until;
    }
    ++entry->rateLimitCount;

    RANGECAST_LOG_INFO(logger_, LOG_CATEGORY,
        "Session " + std::to_string(id) + " (" + entry->backend->label() +
        ") cooling down for " + std::to_string(duration.count()) + "ms");
}

void SessionPool::markFailed(SessionId id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        SessionEntry* entry = findEntry(id);
        if (entry == nullptr || entry->failed) {
            return;
        }
        entry->failed = true;

        RANGECAST_LOG_WARNING(logger_, LOG_CATEGORY,
            "Session " + std::to_string(id) + " (" + entry->backend->label() +
            ") permanently excluded");
    }
    available_.notify_all();
}

std::set<SessionId> SessionPool::healthySessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<SessionId> ids;
    for (const auto& entry : sessions_) {
        if (!entry.failed) {
            ids.insert(entry.id);
        }
    }
    return ids;
}

std::vector<SessionSnapshot> SessionPool::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const TimePoint now = core::SteadyClock::now();

    std::vector<SessionSnapshot> result;
    result.reserve(sessions_.size());
    for (const auto& entry : sessions_) {
        SessionSnapshot snap;
        snap.id = entry.id;
        snap.label = entry.backend->label();
        snap.load = entry.load;
        snap.cooldownRemaining = remainingUntil(entry.cooldownUntil, now);
        snap.failed = entry.failed;
        snap.totalAcquires = entry.totalAcquires;
        snap.rateLimitCount = entry.rateLimitCount;
        result.push_back(std::move(snap));
    }
    return result;
}

SessionPoolStatistics SessionPool::statistics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const TimePoint now = core::SteadyClock::now();

    SessionPoolStatistics stats;
    stats.sessionCount = sessions_.size();
    stats.unavailableCount = unavailableCount_;
    for (const auto& entry : sessions_) {
        stats.totalLoad += entry.load;
        stats.totalAcquires += entry.totalAcquires;
        stats.totalRateLimits += entry.rateLimitCount;
        if (entry.failed) {
            ++stats.failedCount;
        } else if (entry.cooldownUntil > now) {
            ++stats.coolingCount;
        } else {
            ++stats.usableCount;
        }
    }
    return stats;
}

SessionPool::SessionEntry* SessionPool::findEntry(SessionId id) {
    if (id == core::INVALID_SESSION_ID || id > sessions_.size()) {
        return nullptr;
    }
    return &sessions_[id - 1];
}

} // namespace streaming
} // namespace rangecast
