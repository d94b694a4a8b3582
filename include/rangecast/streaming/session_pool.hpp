// RangeCast - Seekable media delivery engine
// Session Pool - Load-balanced selection over a fixed set of backend sessions
//
// Responsibilities:
// - Own up to 50 backend sessions for the lifetime of the server
// - Pick the least-loaded usable session, skipping cooling and failed ones
// - Block callers (bounded) while every candidate is cooling down
// - Track per-session load, cooldown, failures and rate-limit counts

#ifndef RANGECAST_STREAMING_SESSION_POOL_HPP
#define RANGECAST_STREAMING_SESSION_POOL_HPP

#include "rangecast/core/cancellation.hpp"
#include "rangecast/core/error_codes.hpp"
#include "rangecast/core/result.hpp"
#include "rangecast/core/structured_logger.hpp"
#include "rangecast/core/types.hpp"
#include "rangecast/streaming/backend.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace rangecast {
namespace streaming {

using core::Duration;
using core::TimePoint;

// =============================================================================
// Configuration Types
// =============================================================================

/**
 * @brief Configuration for the session pool.
 */
struct SessionPoolConfig {
    /// Cooldown applied when the backend gives no retry-after
    Duration defaultCooldown{std::chrono::seconds(30)};

    /// Longest acquire() waits for a cooldown to expire
    Duration acquireTimeout{std::chrono::seconds(10)};
};

// =============================================================================
// Statistics Types
// =============================================================================

/**
 * @brief Point-in-time view of one session.
 */
struct SessionSnapshot {
    SessionId id{core::INVALID_SESSION_ID};
    std::string label;
    uint32_t load{0};
    Duration cooldownRemaining{0};
    bool failed{false};
    uint64_t totalAcquires{0};
    uint64_t rateLimitCount{0};
};

/**
 * @brief Aggregate pool counters.
 */
struct SessionPoolStatistics {
    size_t sessionCount{0};
    size_t usableCount{0};
    size_t coolingCount{0};
    size_t failedCount{0};
    uint32_t totalLoad{0};
    uint64_t totalAcquires{0};
    uint64_t totalRateLimits{0};
    uint64_t unavailableCount{0};
};

class SessionPool;

// =============================================================================
// Session Lease
// =============================================================================

/**
 * @brief Scoped acquisition of a pool session.
 *
 * Releases the session (decrements its load) on destruction or on an
 * explicit release(). Move-only.
 */
class SessionLease {
public:
    SessionLease() = default;
    SessionLease(SessionPool* pool, SessionId id, std::shared_ptr<IBackendSession> session);
    ~SessionLease();

    SessionLease(const SessionLease&) = delete;
    SessionLease& operator=(const SessionLease&) = delete;
    SessionLease(SessionLease&& other) noexcept;
    SessionLease& operator=(SessionLease&& other) noexcept;

    bool valid() const { return pool_ != nullptr; }
    SessionId id() const { return id_; }
    IBackendSession& session() const { return *session_; }

    /**
     * @brief Give the session back early. Idempotent.
     */
    void release();

private:
    SessionPool* pool_{nullptr};
    SessionId id_{core::INVALID_SESSION_ID};
    std::shared_ptr<IBackendSession> session_;
};

// =============================================================================
// Session Pool
// =============================================================================

/**
 * @brief Fixed set of backend sessions with load-based selection.
 *
 * Session ids are assigned 1..N in the order the sessions are given.
 * Cooldowns are checked lazily at acquire time; no timers are involved.
 *
 * Thread Safety:
 * - All public methods are thread-safe
 * - acquire() may block up to the acquire timeout, or until cancelled
 */
class SessionPool {
public:
    /**
     * @brief Build a pool.
     *
     * @return InvalidArgument unless 1..50 non-null sessions are given
     */
    static Result<std::unique_ptr<SessionPool>, Error> create(
        std::vector<std::shared_ptr<IBackendSession>> sessions,
        const SessionPoolConfig& config = SessionPoolConfig{},
        std::shared_ptr<core::StructuredLogger> logger = nullptr);

private:
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    /**
     * @brief Use create(), which validates the sessions first.
     */
    SessionPool(PrivateTag, std::vector<std::shared_ptr<IBackendSession>> sessions,
                const SessionPoolConfig& config,
                std::shared_ptr<core::StructuredLogger> logger);

    ~SessionPool() = default;

    SessionPool(const SessionPool&) = delete;
    SessionPool& operator=(const SessionPool&) = delete;

    /**
     * @brief Acquire the least-loaded usable session.
     *
     * Candidates are sessions not in excluding, not failed and not cooling
     * down. Ties go to the lowest SessionId. When every candidate is cooling
     * down, waits until one becomes usable, the timeout elapses or cancel
     * is set. Cancellation is polled every 50 ms.
     *
     * @param excluding Sessions the caller must not be given
     * @param timeout Wait bound; the configured acquire timeout if not given
     * @return Lease, Unavailable (retryAfter = time to the next expiry) or
     *         Cancelled
     */
    Result<SessionLease, Error> acquire(
        const std::set<SessionId>& excluding = {},
        std::optional<Duration> timeout = std::nullopt,
        const core::CancellationToken& cancel = core::CancellationToken());

    /**
     * @brief Decrement a session's load. Called by SessionLease.
     */
    void release(SessionId id);

    /**
     * @brief Keep a session out of selection for the given duration.
     *
     * Extends, never shortens, an existing cooldown.
     */
    void markCooldown(SessionId id, Duration duration);

    /**
     * @brief Permanently exclude a session (authorization revoked).
     */
    void markFailed(SessionId id);

    /**
     * @brief Ids of sessions that are not permanently failed.
     */
    std::set<SessionId> healthySessions() const;

    std::vector<SessionSnapshot> snapshot() const;
    SessionPoolStatistics statistics() const;

    size_t size() const { return sessions_.size(); }
    const SessionPoolConfig& config() const { return config_; }

private:
    struct SessionEntry {
        SessionId id{core::INVALID_SESSION_ID};
        std::shared_ptr<IBackendSession> backend;
        uint32_t load{0};
        TimePoint cooldownUntil{};
        bool failed{false};
        uint64_t totalAcquires{0};
        uint64_t rateLimitCount{0};
    };

    SessionEntry* findEntry(SessionId id);

    SessionPoolConfig config_;
    std::shared_ptr<core::StructuredLogger> logger_;

    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::vector<SessionEntry> sessions_;
    uint64_t unavailableCount_{0};
};

} // namespace streaming
} // namespace rangecast

#endif // RANGECAST_STREAMING_SESSION_POOL_HPP
