// RangeCast - Seekable media delivery engine
// ChunkFill Implementation

#include "rangecast/streaming/chunk_fill.hpp"

#include <algorithm>

namespace rangecast {
namespace streaming {

const char* fillStateToString(FillState state) {
    switch (state) {
        case FillState::Active: return "active";
        case FillState::Orphaned: return "orphaned";
        case FillState::Complete: return "complete";
        case FillState::Failed: return "failed";
        case FillState::Abandoned: return "abandoned";
        default: return "unknown";
    }
}

ChunkFill::ChunkFill(const ChunkKey& key, ByteCount expectedLength, bool admit)
    : key_(key)
    , expectedLength_(expectedLength)
    , admit_(admit) {
    data_.reserve(static_cast<size_t>(expectedLength));
}

size_t ChunkFill::append(const uint8_t* data, size_t size) {
    size_t accepted = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != FillState::Active) {
            return 0;
        }
        ByteCount room = expectedLength_ - data_.size();
        accepted = static_cast<size_t>(std::min<ByteCount>(room, size));
        data_.insert(data_.end(), data, data + accepted);
    }
    if (accepted > 0) {
        changed_.notify_all();
    }
    return accepted;
}

bool ChunkFill::complete() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != FillState::Active || data_.size() != expectedLength_) {
            return false;
        }
        state_ = FillState::Complete;
    }
    changed_.notify_all();
    return true;
}

void ChunkFill::fail(const core::Error& error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == FillState::Complete || state_ == FillState::Abandoned) {
            return;
        }
        state_ = FillState::Failed;
        error_ = error;
    }
    changed_.notify_all();
}

bool ChunkFill::adopt() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != FillState::Orphaned) {
        return false;
    }
    state_ = FillState::Active;
    // The adopter stops being a subscriber and becomes the producer.
    if (subscribers_ > 0) {
        --subscribers_;
    }
    return true;
}

FillRead ChunkFill::waitForData(ByteCount cursor, const core::CancellationToken& cancel,
                                std::chrono::milliseconds pollInterval) {
    FillRead result;
    std::unique_lock<std::mutex> lock(mutex_);

    while (true) {
        if (data_.size() > cursor) {
            result.kind = FillRead::Kind::Data;
            result.bytes.assign(data_.begin() + static_cast<std::ptrdiff_t>(cursor), data_.end());
            return result;
        }
        switch (state_) {
            case FillState::Orphaned:
                result.kind = FillRead::Kind::Orphaned;
                return result;
            case FillState::Failed:
                result.kind = FillRead::Kind::Failed;
                result.error = error_;
                return result;
            case FillState::Abandoned:
                result.kind = FillRead::Kind::Abandoned;
                return result;
            case FillState::Complete:
                // Cursor at or past the end of a complete fill.
                result.kind = FillRead::Kind::Data;
                return result;
            case FillState::Active:
                break;
        }
        if (cancel.isCancelled()) {
            result.kind = FillRead::Kind::Cancelled;
            return result;
        }
        changed_.wait_for(lock, pollInterval);
    }
}

Bytes ChunkFill::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_;
}

ByteCount ChunkFill::received() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.size();
}

FillState ChunkFill::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

size_t ChunkFill::subscriberCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_;
}

bool ChunkFill::admit() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return admit_;
}

void ChunkFill::addSubscriber() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++subscribers_;
}

void ChunkFill::removeSubscriber() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (subscribers_ > 0) {
        --subscribers_;
    }
}

void ChunkFill::setAdmit(bool admit) {
    std::lock_guard<std::mutex> lock(mutex_);
    admit_ = admit;
}

FillState ChunkFill::detachLeader() {
    FillState next;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != FillState::Active) {
            return state_;
        }
        state_ = subscribers_ > 0 ? FillState::Orphaned : FillState::Abandoned;
        next = state_;
    }
    changed_.notify_all();
    return next;
}

void ChunkFill::abandon() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == FillState::Complete || state_ == FillState::Failed) {
            return;
        }
        state_ = FillState::Abandoned;
    }
    changed_.notify_all();
}

} // namespace streaming
} // namespace rangecast
