// RangeCast - Seekable media delivery engine
// Rotating Fetch Implementation

#include "rangecast/streaming/rotating_fetcher.hpp"

#include <algorithm>
#include <set>

namespace rangecast {
namespace streaming {

namespace {

const char* const LOG_CATEGORY = "Fetcher";

bool coversAll(const std::set<SessionId>& excluding, const std::set<SessionId>& healthy) {
    return std::includes(excluding.begin(), excluding.end(), healthy.begin(), healthy.end());
}

} // anonymous namespace

const char* fetchStateToString(FetchState state) {
    switch (state) {
        case FetchState::Selecting: return "selecting";
        case FetchState::Fetching: return "fetching";
        case FetchState::Cooling: return "cooling";
        case FetchState::Exhausted: return "exhausted";
        default: return "unknown";
    }
}

RotatingFetcher::RotatingFetcher(SessionPool& pool, Fetcher& fetcher,
                                 const RotatingFetchConfig& config,
                                 std::shared_ptr<core::StructuredLogger> logger)
    : pool_(pool)
    , fetcher_(fetcher)
    , config_(config)
    , logger_(std::move(logger)) {
}

Result<FetchOutcome, Error> RotatingFetcher::fetchRange(
    const FileReference& file,
    const ByteRange& range,
    const PartConsumer& consumer,
    core::CancellationToken cancel)
{
    using FetchResult = Result<FetchOutcome, Error>;

    FetchOutcome outcome;
    FetchState state = FetchState::Selecting;
    std::set<SessionId> excluding;
    SessionLease lease;
    ByteCount position = range.start;
    Error lastError;

    if (range.wholeObject) {
        return FetchResult::error(Error(ErrorCode::InvalidArgument,
            "Range must be resolved before fetching", file.toString()));
    }
    if (range.length() == 0) {
        return FetchResult::success(outcome);
    }

    while (true) {
        switch (state) {
            case FetchState::Selecting: {
                if (cancel.isCancelled()) {
                    return FetchResult::error(Error(ErrorCode::Cancelled, "Fetch cancelled", file.toString()));
                }

                std::set<SessionId> healthy = pool_.healthySessions();
                if (healthy.empty()) {
                    return FetchResult::error(Error(ErrorCode::BackendError,
                        "Every backend session has been revoked", file.toString()));
                }
                if (coversAll(excluding, healthy)) {
                    excluding.clear();
                }

                auto acquired = pool_.acquire(excluding, std::nullopt, cancel);
                if (acquired.isError()) {
                    // After a rate limit, waiting out a cooldown that outlasts the
                    // acquire timeout spends a retry like any other rotation.
                    if (acquired.error().code != ErrorCode::Unavailable || outcome.rotations == 0) {
                        return FetchResult::error(acquired.error());
                    }
                    lastError = acquired.error();
                    ++outcome.rotations;
                    if (outcome.rotations > config_.maxRetries) {
                        state = FetchState::Exhausted;
                    }
                    break;
                }
                lease = std::move(acquired).value();
                outcome.lastSession = lease.id();
                state = FetchState::Fetching;
                break;
            }

            case FetchState::Fetching: {
                ChunkStream stream = fetcher_.fetch(
                    lease.session(), file, ByteRange::of(position, range.end), cancel);

                bool failed = false;
                while (stream.hasNext()) {
                    auto part = stream.next();
                    if (part.isError()) {
                        lastError = part.error();
                        failed = true;
                        break;
                    }
                    const Bytes& bytes = part.value();
                    position += bytes.size();
                    outcome.bytesDelivered += bytes.size();
                    if (!consumer(bytes.data(), bytes.size())) {
                        return FetchResult::error(
                            Error(ErrorCode::Cancelled, "Consumer stopped", file.toString()));
                    }
                }

                if (!failed) {
                    return FetchResult::success(outcome);
                }

                switch (lastError.code) {
                    case ErrorCode::RateLimited:
                        state = FetchState::Cooling;
                        break;

                    case ErrorCode::SessionRevoked:
                        pool_.markFailed(lease.id());
                        excluding.insert(lease.id());
                        lease.release();
                        ++outcome.rotations;
                        state = outcome.rotations > config_.maxRetries
                            ? FetchState::Exhausted : FetchState::Selecting;
                        break;

                    default:
                        // NotFound, Cancelled and plain backend errors are not retried.
                        if (lastError.code != ErrorCode::Cancelled && logger_) {
                            logger_->errorWithContext("Backend fetch failed: " + lastError.toString(),
                                core::LogContext(file, ByteRange::of(position, range.end), lease.id(),
                                                 static_cast<int32_t>(lastError.code)),
                                LOG_CATEGORY);
                        }
                        return FetchResult::error(lastError);
                }
                break;
            }

            case FetchState::Cooling: {
                Duration wait = lastError.retryAfter.count() > 0
                    ? lastError.retryAfter : pool_.config().defaultCooldown;
                pool_.markCooldown(lease.id(), wait);
                excluding.insert(lease.id());

                RANGECAST_LOG_INFO(logger_, LOG_CATEGORY,
                    "Rate limited on session " + std::to_string(lease.id()) + " for " +
                    file.toString() + ", resuming at " + std::to_string(position));

                lease.release();
                ++outcome.rotations;
                state = outcome.rotations > config_.maxRetries
                    ? FetchState::Exhausted : FetchState::Selecting;
                break;
            }

            case FetchState::Exhausted: {
                Error err(ErrorCode::BackendError,
                    "Retry budget exhausted after " + std::to_string(outcome.rotations) +
                    " rotations (last: " + lastError.toString() + ")",
                    file.toString());
                if (logger_) {
                    logger_->errorWithContext(err.message,
                        core::LogContext(file, ByteRange::of(position, range.end), outcome.lastSession,
                                         static_cast<int32_t>(err.code)),
                        LOG_CATEGORY);
                }
                return FetchResult::error(std::move(err));
            }
        }
    }
}

} // namespace streaming
} // namespace rangecast
