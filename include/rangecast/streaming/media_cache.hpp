// RangeCast - Seekable media delivery engine
// Media Cache - Size-bounded LFU cache of fixed-size file chunks
//
// Responsibilities:
// - Answer which chunks of a range are cached (HIT) or not (MISS)
// - Admit complete chunks, evicting least-frequently-used entries first
// - Coalesce concurrent populations of the same chunk into one ChunkFill
// - Persist and restore the index of cached chunks
//
// Accounting: every readable entry and every pinned reservation (a fill in
// progress) counts against capacity. Space is made by eviction before an
// entry is inserted; a chunk that still does not fit is passed through.

#ifndef RANGECAST_STREAMING_MEDIA_CACHE_HPP
#define RANGECAST_STREAMING_MEDIA_CACHE_HPP

#include "rangecast/core/error_codes.hpp"
#include "rangecast/core/result.hpp"
#include "rangecast/core/structured_logger.hpp"
#include "rangecast/core/types.hpp"
#include "rangecast/streaming/block_store.hpp"
#include "rangecast/streaming/chunk_fill.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <tuple>
#include <vector>

namespace rangecast {
namespace streaming {

// =============================================================================
// Configuration Types
// =============================================================================

struct MediaCacheConfig {
    bool enabled{true};
    ByteCount capacityBytes{4ULL * 1024 * 1024 * 1024};
    ByteCount chunkSize{core::DEFAULT_CHUNK_SIZE};
    bool cacheAllTypes{false};  ///< Admit non-media content too
};

// =============================================================================
// Lookup and Fill Types
// =============================================================================

enum class ChunkStatus {
    Hit,
    Miss
};

/**
 * @brief One chunk touched by a range.
 */
struct ChunkLookup {
    ChunkIndex index{0};
    ChunkStatus status{ChunkStatus::Miss};
    ByteCount chunkStart{0};   ///< Absolute offset of the chunk
    ByteCount chunkLength{0};  ///< Chunk length (shorter for the last chunk)
};

enum class FillRole {
    Leader,    ///< Caller must fetch and produce the chunk
    Follower,  ///< Caller subscribes to another caller's fill
    Cached     ///< Chunk became readable meanwhile; read it from the cache
};

struct FillTicket {
    std::shared_ptr<ChunkFill> fill;
    FillRole role{FillRole::Leader};
};

/**
 * @brief Accounting view of one entry (tests, diagnostics).
 */
struct CacheEntryInfo {
    ByteCount size{0};
    uint64_t frequency{0};
    uint64_t lastAccess{0};
    bool pinned{false};
};

struct CleanupReport {
    size_t removedEntries{0};
    size_t removedBlocks{0};
};

struct MediaCacheStatistics {
    ByteCount usedBytes{0};      ///< Readable entries plus pinned reservations
    ByteCount reservedBytes{0};  ///< Pinned reservations only
    ByteCount capacityBytes{0};
    size_t entryCount{0};
    size_t pinnedCount{0};
    size_t activeFills{0};
    uint64_t hits{0};
    uint64_t misses{0};
    uint64_t evictions{0};
    uint64_t passThrough{0};
    uint64_t coalescedJoins{0};
    uint64_t fillsStarted{0};
    uint64_t fillsCompleted{0};
    uint64_t fillsAbandoned{0};
    uint64_t fillsFailed{0};
    uint64_t missingBlocks{0};
};

// =============================================================================
// Media Cache
// =============================================================================

/**
 * @brief LFU cache of file chunks over an IBlockStore.
 *
 * Eviction order is ascending frequency, ties broken by the oldest last
 * access. Last access is a logical tick, so ordering is deterministic.
 * Pinned entries (fills in progress) are never evicted.
 *
 * Thread Safety: all methods are thread-safe. Block reads and writes run
 * outside the cache lock. Lock order is cache mutex, then fill mutex.
 */
class MediaCache {
public:
    MediaCache(const MediaCacheConfig& config, std::shared_ptr<IBlockStore> store,
               std::shared_ptr<core::StructuredLogger> logger = nullptr);

    MediaCache(const MediaCache&) = delete;
    MediaCache& operator=(const MediaCache&) = delete;

    // =========================================================================
    // Lookup and Read
    // =========================================================================

    /**
     * @brief Status of every chunk touched by a concrete range.
     */
    std::vector<ChunkLookup> lookup(const FileReference& file, const ByteRange& range,
                                    ByteCount objectSize);

    /**
     * @brief Same as lookup() without touching the hit/miss counters.
     */
    std::vector<ChunkLookup> probe(const FileReference& file, const ByteRange& range,
                                   ByteCount objectSize) const;

    bool contains(const FileReference& file, ChunkIndex index) const;

    /**
     * @brief Read bytes of a readable chunk.
     *
     * A block that vanished from the store is detected here: the entry is
     * dropped and NotFound returned so the caller refetches.
     */
    Result<Bytes, Error> read(const FileReference& file, ChunkIndex index,
                              ByteCount offset, ByteCount length);

    /**
     * @brief Count one read hit.
     */
    void recordAccess(const FileReference& file, ChunkIndex index);

    // =========================================================================
    // Population
    // =========================================================================

    /**
     * @brief Admit a complete chunk.
     *
     * A new entry starts at frequency 1. Re-populating a readable entry keeps
     * its frequency and refreshes its last access.
     *
     * @return true if admitted, false if passed through uncached
     */
    Result<bool, Error> populate(const FileReference& file, ChunkIndex index, const Bytes& bytes);

    /**
     * @brief Drop every chunk of a file.
     *
     * Fills of the file in progress continue but are not admitted.
     */
    void invalidate(const FileReference& file);

    /**
     * @brief Join or start the single in-flight population of a chunk.
     *
     * A leader gets a pinned reservation when admit is true and the chunk
     * fits; otherwise the fill runs uncached.
     *
     * @param length Chunk length
     * @param admit False for content that must not be cached
     */
    FillTicket beginFill(const ChunkKey& key, ByteCount length, bool admit = true);

    /**
     * @brief Admit a completed fill and retire it.
     */
    void completeFill(const std::shared_ptr<ChunkFill>& fill);

    /**
     * @brief Fail a fill; subscribers receive the error.
     */
    void failFill(const std::shared_ptr<ChunkFill>& fill, const Error& error);

    /**
     * @brief The leader stops producing before completion.
     *
     * @return Orphaned if subscribers remain (one of them adopts it),
     *         Abandoned if the fill was discarded
     */
    FillState releaseFill(const std::shared_ptr<ChunkFill>& fill);

    /**
     * @brief A follower stops consuming.
     */
    void unsubscribe(const std::shared_ptr<ChunkFill>& fill);

    // =========================================================================
    // Persistence
    // =========================================================================

    /**
     * @brief Write the index of readable entries to the store.
     */
    Result<void, Error> saveIndex();

    /**
     * @brief Rebuild entries from the stored index, dropping orphans.
     * @return Number of entries restored
     */
    Result<size_t, Error> loadIndex();

    /**
     * @brief Remove entries without blocks and blocks without entries.
     */
    CleanupReport cleanup();

    // =========================================================================
    // Introspection
    // =========================================================================

    /**
     * @brief Whether content described by info may be admitted.
     */
    bool isCacheable(const ObjectInfo& info) const;

    std::optional<CacheEntryInfo> entryInfo(const ChunkKey& key) const;
    MediaCacheStatistics statistics() const;

    ByteCount chunkSize() const { return config_.chunkSize; }
    bool enabled() const { return config_.enabled; }
    const MediaCacheConfig& config() const { return config_; }
    IBlockStore& store() { return *store_; }

private:
    struct Entry {
        ByteCount size{0};
        uint64_t frequency{0};
        uint64_t lastAccess{0};
        uint64_t generation{0};
        bool pinned{true};
    };

    struct FillSlot {
        std::shared_ptr<ChunkFill> fill;
        uint64_t generation{0};  ///< Reservation generation, 0 if none
    };

    using LfuKey = std::tuple<uint64_t, uint64_t, ChunkKey>;

    // All helpers below require mutex_ to be held.
    static LfuKey lfuKey(const ChunkKey& key, const Entry& entry);
    bool makeRoom(ByteCount size);
    void eraseEntry(std::map<ChunkKey, Entry>::iterator it, bool removeBlock);
    uint64_t reserve(const ChunkKey& key, ByteCount size);
    void dropReservation(const ChunkKey& key, uint64_t generation);
    void finalize(const ChunkKey& key, uint64_t generation, ByteCount size);
    void retireFill(const std::shared_ptr<ChunkFill>& fill, bool keepReservation);

    MediaCacheConfig config_;
    std::shared_ptr<IBlockStore> store_;
    std::shared_ptr<core::StructuredLogger> logger_;

    mutable std::mutex mutex_;
    std::map<ChunkKey, Entry> entries_;
    std::set<LfuKey> lfu_;  ///< Readable (unpinned) entries in eviction order
    std::map<ChunkKey, FillSlot> fills_;
    ByteCount usedBytes_{0};
    ByteCount reservedBytes_{0};
    uint64_t tick_{0};
    uint64_t nextGeneration_{1};
    MediaCacheStatistics counters_;
};

} // namespace streaming
} // namespace rangecast

#endif // RANGECAST_STREAMING_MEDIA_CACHE_HPP
