// RangeCast - Seekable media delivery engine
// Fetcher Implementation

#include "rangecast/streaming/fetcher.hpp"

#include <algorithm>

namespace rangecast {
namespace streaming {

namespace {

const char* const LOG_CATEGORY = "Fetcher";

} // anonymous namespace

// =============================================================================
// ChunkStream Implementation
// =============================================================================

ChunkStream::ChunkStream(Fetcher& fetcher, IBackendSession& session, const FileReference& file,
                         const ByteRange& range, core::CancellationToken cancel)
    : fetcher_(fetcher)
    , session_(session)
    , file_(file)
    , range_(range)
    , position_(range.start)
    , cancel_(std::move(cancel)) {
}

Result<Bytes, Error> ChunkStream::next() {
    if (range_.wholeObject) {
        return Result<Bytes, Error>::error(Error(ErrorCode::InvalidArgument,
            "Range must be resolved against the object size before fetching", file_.toString()));
    }
    if (!hasNext()) {
        return Result<Bytes, Error>::error(Error(ErrorCode::InvalidState,
            "Stream exhausted", file_.toString()));
    }
    if (cancel_.isCancelled()) {
        return Result<Bytes, Error>::error(Error(ErrorCode::Cancelled,
            "Fetch cancelled", file_.toString()));
    }

    const ByteCount partSize = fetcher_.config().partSize;
    const ByteCount partOffset = (position_ / partSize) * partSize;

    auto downloaded = session_.downloadPart(file_, partOffset, partSize);
    if (downloaded.isError()) {
        fetcher_.recordFailure();
        Error err = downloaded.error();
        if (err.context.empty()) {
            err.context = file_.toString() + "@" + std::to_string(partOffset);
        }
        return Result<Bytes, Error>::error(std::move(err));
    }

    Bytes part = std::move(downloaded).value();
    fetcher_.recordPart(part.size());

    const ByteCount cutFront = position_ - partOffset;
    if (part.size() <= cutFront) {
        fetcher_.recordFailure();
        return Result<Bytes, Error>::error(Error(ErrorCode::BackendError,
            "Backend returned a short part (" + std::to_string(part.size()) + " bytes at offset " +
            std::to_string(partOffset) + ")", file_.toString()));
    }

    const ByteCount available = static_cast<ByteCount>(part.size()) - cutFront;
    const ByteCount take = std::min(available, range_.end - position_);

    Bytes slice;
    if (cutFront == 0 && take == part.size()) {
        slice = std::move(part);
    } else {
        slice.assign(part.begin() + static_cast<std::ptrdiff_t>(cutFront),
                     part.begin() + static_cast<std::ptrdiff_t>(cutFront + take));
    }
    position_ += take;

    RANGECAST_LOG_DEBUG(fetcher_.logger_, LOG_CATEGORY,
        "Fetched " + std::to_string(take) + " bytes of " + file_.toString() +
        " via " + session_.label() + ", at " + std::to_string(position_) +
        "/" + std::to_string(range_.end));

    return Result<Bytes, Error>::success(std::move(slice));
}

// =============================================================================
// Fetcher Implementation
// =============================================================================

Fetcher::Fetcher(const FetcherConfig& config, std::shared_ptr<core::StructuredLogger> logger)
    : config_(config)
    , logger_(std::move(logger)) {
    if (config_.partSize == 0) {
        config_.partSize = core::DEFAULT_CHUNK_SIZE;
    }
}

ChunkStream Fetcher::fetch(IBackendSession& session, const FileReference& file,
                           const ByteRange& range, core::CancellationToken cancel) {
    return ChunkStream(*this, session, file, range, std::move(cancel));
}

FetcherStatistics Fetcher::statistics() const {
    FetcherStatistics stats;
    stats.partsDownloaded = partsDownloaded_.load();
    stats.bytesDownloaded = bytesDownloaded_.load();
    stats.failedParts = failedParts_.load();
    return stats;
}

void Fetcher::recordPart(ByteCount bytes) {
    partsDownloaded_.fetch_add(1, std::memory_order_relaxed);
    bytesDownloaded_.fetch_add(bytes, std::memory_order_relaxed);
}

void Fetcher::recordFailure() {
    failedParts_.fetch_add(1, std::memory_order_relaxed);
}

} // namespace streaming
} // namespace rangecast
