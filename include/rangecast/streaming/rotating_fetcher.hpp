// RangeCast - Seekable media delivery engine
// Rotating Fetch - Bounded retry state machine over the session pool
//
// Fetches a byte range through whichever session the pool hands out. When
// the backend rate-limits a session, that session is cooled down and the
// download resumes on another one from the first undelivered byte.

#ifndef RANGECAST_STREAMING_ROTATING_FETCHER_HPP
#define RANGECAST_STREAMING_ROTATING_FETCHER_HPP

#include "rangecast/core/cancellation.hpp"
#include "rangecast/core/error_codes.hpp"
#include "rangecast/core/result.hpp"
#include "rangecast/core/structured_logger.hpp"
#include "rangecast/core/types.hpp"
#include "rangecast/streaming/fetcher.hpp"
#include "rangecast/streaming/session_pool.hpp"

#include <cstdint>
#include <functional>
#include <memory>

namespace rangecast {
namespace streaming {

/**
 * @brief States of one rotating fetch.
 *
 * Selecting -> Fetching -> (Cooling -> Selecting)* -> done | Exhausted
 */
enum class FetchState {
    Selecting,  ///< Acquiring a session not yet tried
    Fetching,   ///< Downloading parts through the current session
    Cooling,    ///< Current session was rate-limited; cool it and rotate
    Exhausted   ///< Retry budget spent
};

const char* fetchStateToString(FetchState state);

/**
 * @brief Receives in-range bytes in ascending order.
 *
 * @return false to stop the fetch (the consumer went away)
 */
using PartConsumer = std::function<bool(const uint8_t* data, size_t size)>;

/**
 * @brief Retry policy.
 */
struct RotatingFetchConfig {
    /// Rotations (rate limits or revoked sessions) before BackendError
    uint32_t maxRetries{3};
};

/**
 * @brief Result of a completed rotating fetch.
 */
struct FetchOutcome {
    ByteCount bytesDelivered{0};
    uint32_t rotations{0};
    SessionId lastSession{core::INVALID_SESSION_ID};
};

/**
 * @brief Fetch a range with session rotation on rate limits.
 *
 * Error semantics:
 * - RateLimited: release + cool the session, exclude it, re-acquire,
 *   resume. Counts against the retry budget.
 * - SessionRevoked: mark the session failed, rotate. Counts as a retry.
 * - NotFound: terminal, returned immediately.
 * - Unavailable from the pool: returned as-is before the first rotation;
 *   after a rotation it counts as a retry, so a cooldown longer than the
 *   acquire timeout still ends in BackendError.
 * - Budget exhausted: BackendError.
 * - Consumer returned false or token cancelled: Cancelled.
 *
 * When the exclusion set would cover every healthy session it is reset, so
 * a single-session pool waits out its own cooldown and still ends after the
 * retry budget.
 *
 * Thread Safety: fetchRange() may be called concurrently; each call owns its
 * own state.
 */
class RotatingFetcher {
public:
    RotatingFetcher(SessionPool& pool, Fetcher& fetcher,
                    const RotatingFetchConfig& config = RotatingFetchConfig{},
                    std::shared_ptr<core::StructuredLogger> logger = nullptr);

    /**
     * @brief Deliver every byte of a concrete range to the consumer.
     */
    Result<FetchOutcome, Error> fetchRange(
        const FileReference& file,
        const ByteRange& range,
        const PartConsumer& consumer,
        core::CancellationToken cancel = core::CancellationToken());

    const RotatingFetchConfig& config() const { return config_; }

private:
    SessionPool& pool_;
    Fetcher& fetcher_;
    RotatingFetchConfig config_;
    std::shared_ptr<core::StructuredLogger> logger_;
};

} // namespace streaming
} // namespace rangecast

#endif // RANGECAST_STREAMING_ROTATING_FETCHER_HPP
