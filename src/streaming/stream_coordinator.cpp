// RangeCast - Seekable media delivery engine
// Stream Coordinator Implementation

#include "rangecast/streaming/stream_coordinator.hpp"

#include <algorithm>

namespace rangecast {
namespace streaming {

namespace {

const char* const LOG_CATEGORY = "Stream";

Error cancelledError(const FileReference& file) {
    return Error(ErrorCode::Cancelled, "Consumer stopped reading", file.toString());
}

} // anonymous namespace

const char* cacheVerdictToString(CacheVerdict verdict) {
    switch (verdict) {
        case CacheVerdict::Hit: return "HIT";
        case CacheVerdict::Miss: return "MISS";
        case CacheVerdict::Partial: return "PARTIAL";
        default: return "MISS";
    }
}

CacheVerdict StreamSummary::verdict() const {
    if (hitChunks > 0 && missChunks == 0) {
        return CacheVerdict::Hit;
    }
    if (hitChunks > 0) {
        return CacheVerdict::Partial;
    }
    return CacheVerdict::Miss;
}

StreamCoordinator::StreamCoordinator(ICatalog& catalog, MediaCache& cache, RotatingFetcher& fetcher,
                                     std::shared_ptr<core::StructuredLogger> logger)
    : catalog_(catalog)
    , cache_(cache)
    , fetcher_(fetcher)
    , logger_(std::move(logger)) {
}

void StreamCoordinator::setAccessListener(AccessListener listener) {
    std::lock_guard<std::mutex> lock(listenerMutex_);
    listener_ = std::move(listener);
}

// =============================================================================
// Entry Points
// =============================================================================

Result<StreamSummary, Error> StreamCoordinator::stream(const FileReference& file, const ByteRange& range,
                                                       const ByteSink& sink,
                                                       core::CancellationToken cancel) {
    auto info = catalog_.objectInfo(file);
    if (info.isError()) {
        return Result<StreamSummary, Error>::error(info.error());
    }
    return run(file, info.value(), range, &sink, std::move(cancel));
}

Result<StreamSummary, Error> StreamCoordinator::stream(const FileReference& file, const ObjectInfo& info,
                                                       const ByteRange& range, const ByteSink& sink,
                                                       core::CancellationToken cancel) {
    return run(file, info, range, &sink, std::move(cancel));
}

Result<StreamSummary, Error> StreamCoordinator::prefetch(const FileReference& file, const ByteRange& range,
                                                         core::CancellationToken cancel) {
    auto info = catalog_.objectInfo(file);
    if (info.isError()) {
        return Result<StreamSummary, Error>::error(info.error());
    }
    ++prefetches_;
    return run(file, info.value(), range, nullptr, std::move(cancel));
}

StreamCoordinatorStatistics StreamCoordinator::statistics() const {
    StreamCoordinatorStatistics stats;
    stats.activeStreams = activeStreams_.load();
    stats.completedStreams = completedStreams_.load();
    stats.cancelledStreams = cancelledStreams_.load();
    stats.failedStreams = failedStreams_.load();
    stats.prefetches = prefetches_.load();
    stats.bytesDelivered = bytesDelivered_.load();
    stats.handoffs = handoffs_.load();
    return stats;
}

// =============================================================================
// Pipeline
// =============================================================================

Result<StreamSummary, Error> StreamCoordinator::run(const FileReference& file, const ObjectInfo& info,
                                                    const ByteRange& range, const ByteSink* sink,
                                                    core::CancellationToken cancel) {
    auto resolved = range.resolve(info.size);
    if (!resolved) {
        return Result<StreamSummary, Error>::error(Error(ErrorCode::RangeNotSatisfiable,
            "Range " + range.toString() + " outside object of " + std::to_string(info.size) + " bytes",
            file.toString()));
    }

    Request request{file, &info, *resolved, sink, std::move(cancel), StreamSummary()};
    request.summary.range = *resolved;
    ++activeStreams_;

    std::vector<ChunkLookup> chunks = cache_.lookup(file, *resolved, info.size);
    const bool admit = cache_.isCacheable(info);
    Result<void, Error> outcome = Result<void, Error>::success();

    size_t i = 0;
    while (i < chunks.size()) {
        if (request.cancel.isCancelled()) {
            outcome = Result<void, Error>::error(cancelledError(file));
            break;
        }
        ChunkLookup& chunk = chunks[i];

        if (chunk.status == ChunkStatus::Hit) {
            if (sink == nullptr) {
                ++request.summary.hitChunks;
                ++i;
                continue;
            }
            auto served = serveCached(request, chunk);
            if (served.isError()) {
                outcome = Result<void, Error>::error(served.error());
                break;
            }
            if (served.value() == ChunkOutcome::Done) {
                ++request.summary.hitChunks;
                ++i;
                continue;
            }
            chunk.status = ChunkStatus::Miss;
        }

        FillTicket ticket = cache_.beginFill(ChunkKey(file, chunk.index), chunk.chunkLength, admit);

        if (ticket.role == FillRole::Cached) {
            chunk.status = ChunkStatus::Hit;
            continue;
        }

        if (ticket.role == FillRole::Follower) {
            auto followed = follow(request, chunk, ticket.fill);
            if (followed.isError()) {
                outcome = Result<void, Error>::error(followed.error());
                break;
            }
            if (followed.value() == ChunkOutcome::Done) {
                ++request.summary.missChunks;
                ++i;
            }
            continue;
        }

        // Leader: claim the contiguous run of missing chunks that follows.
        std::vector<ChunkLookup> claimed{chunk};
        std::vector<std::shared_ptr<ChunkFill>> fills{ticket.fill};
        size_t j = i + 1;
        while (j < chunks.size() && chunks[j].status == ChunkStatus::Miss) {
            FillTicket next = cache_.beginFill(ChunkKey(file, chunks[j].index), chunks[j].chunkLength, admit);
            if (next.role != FillRole::Leader) {
                if (next.role == FillRole::Follower) {
                    cache_.unsubscribe(next.fill);
                }
                break;
            }
            claimed.push_back(chunks[j]);
            fills.push_back(next.fill);
            ++j;
        }

        auto produced = produce(request, claimed, fills, chunk.chunkStart);
        if (produced.isError()) {
            outcome = std::move(produced);
            break;
        }
        request.summary.missChunks += claimed.size();
        i = j;
    }

    return finish(request, std::move(outcome));
}

Result<StreamCoordinator::ChunkOutcome, Error> StreamCoordinator::serveCached(
    Request& request, const ChunkLookup& chunk)
{
    using OutcomeResult = Result<ChunkOutcome, Error>;

    const ByteCount chunkEnd = chunk.chunkStart + chunk.chunkLength;
    const ByteCount from = std::max(request.range.start, chunk.chunkStart);
    const ByteCount to = std::min(request.range.end, chunkEnd);

    auto data = cache_.read(request.file, chunk.index, from - chunk.chunkStart, to - from);
    if (data.isError()) {
        if (data.error().code == ErrorCode::NotFound) {
            return OutcomeResult::success(ChunkOutcome::Retry);
        }
        return OutcomeResult::error(data.error());
    }
    cache_.recordAccess(request.file, chunk.index);

    const Bytes& bytes = data.value();
    if (!forward(request, from, bytes.data(), bytes.size())) {
        return OutcomeResult::error(cancelledError(request.file));
    }
    return OutcomeResult::success(ChunkOutcome::Done);
}

Result<void, Error> StreamCoordinator::produce(Request& request, const std::vector<ChunkLookup>& chunks,
                                               const std::vector<std::shared_ptr<ChunkFill>>& fills,
                                               ByteCount resumeAt) {
    size_t current = 0;
    ByteCount position = resumeAt;

    auto chunkEnd = [&chunks](size_t index) {
        return chunks[index].chunkStart + chunks[index].chunkLength;
    };
    auto completeCurrent = [&]() {
        fills[current]->complete();
        cache_.completeFill(fills[current]);
        ++current;
    };

    // An adopted fill may already hold every byte.
    while (current < fills.size() && position == chunkEnd(current)) {
        completeCurrent();
    }
    if (current == fills.size()) {
        return Result<void, Error>::success();
    }

    PartConsumer consumer = [&](const uint8_t* data, size_t size) {
        while (size > 0 && current < fills.size()) {
            size_t take = static_cast<size_t>(std::min<ByteCount>(size, chunkEnd(current) - position));
            fills[current]->append(data, take);
            bool delivered = forward(request, position, data, take);

            position += take;
            data += take;
            size -= take;
            if (position == chunkEnd(current)) {
                completeCurrent();
            }
            if (!delivered) {
                return false;
            }
        }
        return true;
    };

    auto fetched = fetcher_.fetchRange(request.file, ByteRange::of(position, chunkEnd(fills.size() - 1)),
                                       consumer, request.cancel);

    if (fetched.isSuccess() && current == fills.size()) {
        return Result<void, Error>::success();
    }

    if (fetched.isError() && fetched.error().code == ErrorCode::Cancelled) {
        for (size_t k = current; k < fills.size(); ++k) {
            if (cache_.releaseFill(fills[k]) == FillState::Orphaned) {
                RANGECAST_LOG_DEBUG(logger_, LOG_CATEGORY,
                    "Handing off " + fills[k]->key().toString() + " to a subscriber");
            }
        }
        return Result<void, Error>::error(fetched.error());
    }

    Error err = fetched.isError()
        ? fetched.error()
        : Error(ErrorCode::BackendError, "Backend returned fewer bytes than expected",
                request.file.toString());
    for (size_t k = current; k < fills.size(); ++k) {
        cache_.failFill(fills[k], err);
    }
    return Result<void, Error>::error(err);
}

Result<StreamCoordinator::ChunkOutcome, Error> StreamCoordinator::follow(
    Request& request, const ChunkLookup& chunk, const std::shared_ptr<ChunkFill>& fill)
{
    using OutcomeResult = Result<ChunkOutcome, Error>;

    ByteCount cursor = 0;
    while (true) {
        FillRead read = fill->waitForData(cursor, request.cancel);

        switch (read.kind) {
            case FillRead::Kind::Data: {
                if (read.bytes.empty()) {
                    cache_.unsubscribe(fill);
                    return OutcomeResult::success(ChunkOutcome::Done);
                }
                bool delivered = forward(request, chunk.chunkStart + cursor,
                                         read.bytes.data(), read.bytes.size());
                cursor += read.bytes.size();
                if (!delivered) {
                    cache_.unsubscribe(fill);
                    return OutcomeResult::error(cancelledError(request.file));
                }
                // A consumer stops once its own range is covered; a prefetch
                // stays to the end so it can take over if the producer leaves.
                bool rangeCovered = request.sink != nullptr &&
                                    chunk.chunkStart + cursor >= request.range.end;
                if (cursor >= chunk.chunkLength || rangeCovered) {
                    cache_.unsubscribe(fill);
                    return OutcomeResult::success(ChunkOutcome::Done);
                }
                break;
            }

            case FillRead::Kind::Orphaned: {
                if (!fill->adopt()) {
                    break;
                }
                ++handoffs_;
                RANGECAST_LOG_DEBUG(logger_, LOG_CATEGORY,
                    "Adopted " + fill->key().toString() + " at " + std::to_string(fill->received()) + " bytes");

                Bytes pending = fill->snapshot();
                if (pending.size() > cursor) {
                    bool delivered = forward(request, chunk.chunkStart + cursor,
                                             pending.data() + cursor, pending.size() - cursor);
                    cursor = pending.size();
                    if (!delivered) {
                        cache_.releaseFill(fill);
                        return OutcomeResult::error(cancelledError(request.file));
                    }
                }

                auto produced = produce(request, {chunk}, {fill}, chunk.chunkStart + cursor);
                if (produced.isError()) {
                    return OutcomeResult::error(produced.error());
                }
                return OutcomeResult::success(ChunkOutcome::Done);
            }

            case FillRead::Kind::Failed:
                cache_.unsubscribe(fill);
                return OutcomeResult::error(read.error);

            case FillRead::Kind::Abandoned:
                cache_.unsubscribe(fill);
                return OutcomeResult::success(ChunkOutcome::Retry);

            case FillRead::Kind::Cancelled:
                cache_.unsubscribe(fill);
                return OutcomeResult::error(cancelledError(request.file));
        }
    }
}

bool StreamCoordinator::forward(Request& request, ByteCount offset, const uint8_t* data, size_t size) {
    if (request.sink == nullptr) {
        return true;
    }
    const ByteCount begin = std::max(offset, request.range.start);
    const ByteCount end = std::min(offset + size, request.range.end);
    if (begin >= end) {
        return true;
    }
    const size_t length = static_cast<size_t>(end - begin);
    if (!(*request.sink)(data + (begin - offset), length)) {
        return false;
    }
    request.summary.bytesDelivered += length;
    bytesDelivered_ += length;
    return true;
}

Result<StreamSummary, Error> StreamCoordinator::finish(Request& request, Result<void, Error> outcome) {
    --activeStreams_;

    if (outcome.isSuccess()) {
        ++completedStreams_;
        RANGECAST_LOG_DEBUG(logger_, LOG_CATEGORY,
            std::string(request.sink ? "Served " : "Prefetched ") + request.range.toString() +
            " of " + request.file.toString() + " (" + std::to_string(request.summary.hitChunks) +
            " hit, " + std::to_string(request.summary.missChunks) + " miss)");

        if (request.sink != nullptr) {
            AccessListener listener;
            {
                std::lock_guard<std::mutex> lock(listenerMutex_);
                listener = listener_;
            }
            if (listener) {
                listener(request.file, *request.info);
            }
        }
        return Result<StreamSummary, Error>::success(request.summary);
    }

    if (outcome.error().code == ErrorCode::Cancelled) {
        ++cancelledStreams_;
        RANGECAST_LOG_DEBUG(logger_, LOG_CATEGORY,
            "Consumer of " + request.file.toString() + " left after " +
            std::to_string(request.summary.bytesDelivered) + " bytes");
    } else {
        ++failedStreams_;
    }
    return Result<StreamSummary, Error>::error(outcome.error());
}

} // namespace streaming
} // namespace rangecast
