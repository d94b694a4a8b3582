// RangeCast - Seekable media delivery engine
// ChunkFill - One in-flight population of one cache chunk
//
// A fill has exactly one producer (the leader) at a time and any number of
// subscribers (followers). The leader appends bytes as the backend delivers
// them; every follower reads with its own cursor and sees appended bytes at
// once. Memory is bounded by one chunk per fill.
//
// Lifecycle:
//   Active --complete()--> Complete
//   Active --fail()------> Failed
//   Active --leader leaves, subscribers remain--> Orphaned --adopt()--> Active
//   Active/Orphaned --nobody left--> Abandoned
//
// Transitions that depend on the subscriber count are driven by MediaCache
// under its own lock (cache mutex before fill mutex).

#ifndef RANGECAST_STREAMING_CHUNK_FILL_HPP
#define RANGECAST_STREAMING_CHUNK_FILL_HPP

#include "rangecast/core/cancellation.hpp"
#include "rangecast/core/error_codes.hpp"
#include "rangecast/core/types.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>

namespace rangecast {
namespace streaming {

enum class FillState {
    Active,     ///< A leader is producing
    Orphaned,   ///< Leader left; waiting for a subscriber to adopt
    Complete,   ///< All expected bytes received
    Failed,     ///< Producer hit a terminal error
    Abandoned   ///< Nobody left to produce or consume
};

const char* fillStateToString(FillState state);

/**
 * @brief Outcome of waiting on a fill.
 */
struct FillRead {
    enum class Kind {
        Data,       ///< bytes holds new data starting at the cursor
        Orphaned,   ///< Producer left; try adopt()
        Failed,     ///< error holds the producer's error
        Abandoned,  ///< Fill discarded
        Cancelled   ///< Caller's token was cancelled
    };

    Kind kind{Kind::Data};
    Bytes bytes;
    core::Error error;
};

/**
 * @brief Shared buffer of one chunk being populated.
 *
 * Thread Safety: all methods are thread-safe.
 */
class ChunkFill {
public:
    ChunkFill(const ChunkKey& key, ByteCount expectedLength, bool admit);

    ChunkFill(const ChunkFill&) = delete;
    ChunkFill& operator=(const ChunkFill&) = delete;

    const ChunkKey& key() const { return key_; }
    ByteCount expectedLength() const { return expectedLength_; }

    // =========================================================================
    // Producer side
    // =========================================================================

    /**
     * @brief Append bytes; bytes beyond expectedLength are dropped.
     * @return Bytes accepted
     */
    size_t append(const uint8_t* data, size_t size);

    /**
     * @brief Mark complete. Requires received() == expectedLength().
     * @return false if bytes are missing or the fill is not active
     */
    bool complete();

    void fail(const core::Error& error);

    /**
     * @brief Take over production of an orphaned fill.
     * @return true if the caller is now the leader
     */
    bool adopt();

    // =========================================================================
    // Consumer side
    // =========================================================================

    /**
     * @brief Wait until bytes past cursor exist or the state changes.
     *
     * Data is returned as long as bytes past the cursor exist, whatever the
     * state. Cancellation is polled every pollInterval.
     */
    FillRead waitForData(ByteCount cursor, const core::CancellationToken& cancel,
                         std::chrono::milliseconds pollInterval = std::chrono::milliseconds(50));

    /**
     * @brief Copy of all received bytes.
     */
    Bytes snapshot() const;

    ByteCount received() const;
    FillState state() const;
    bool isComplete() const { return state() == FillState::Complete; }
    size_t subscriberCount() const;

    /**
     * @brief Whether the completed chunk should be admitted to the cache.
     */
    bool admit() const;

private:
    friend class MediaCache;

    // Called by MediaCache with the cache lock held.
    void addSubscriber();
    void removeSubscriber();
    void setAdmit(bool admit);
    /// Leader leaves: Orphaned if subscribers remain, else Abandoned.
    FillState detachLeader();
    void abandon();

    const ChunkKey key_;
    const ByteCount expectedLength_;

    mutable std::mutex mutex_;
    std::condition_variable changed_;
    Bytes data_;
    FillState state_{FillState::Active};
    size_t subscribers_{0};
    bool admit_{true};
    core::Error error_;
};

} // namespace streaming
} // namespace rangecast

#endif // RANGECAST_STREAMING_CHUNK_FILL_HPP
