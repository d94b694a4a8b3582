// RangeCast - Seekable media delivery engine
// Media Cache Implementation

#include "rangecast/streaming/media_cache.hpp"
#include "rangecast/core/json.hpp"
#include "rangecast/streaming/media_types.hpp"

#include <algorithm>
#include <iterator>
#include <sstream>

namespace rangecast {
namespace streaming {

namespace {

const char* const LOG_CATEGORY = "MediaCache";
constexpr int INDEX_VERSION = 1;

} // anonymous namespace

MediaCache::MediaCache(const MediaCacheConfig& config, std::shared_ptr<IBlockStore> store,
                       std::shared_ptr<core::StructuredLogger> logger)
    : config_(config)
    , store_(store ? std::move(store) : std::make_shared<MemoryBlockStore>())
    , logger_(std::move(logger)) {
    if (config_.chunkSize == 0) {
        config_.chunkSize = core::DEFAULT_CHUNK_SIZE;
    }
    counters_.capacityBytes = config_.capacityBytes;

    RANGECAST_LOG_INFO(logger_, LOG_CATEGORY,
        std::string(config_.enabled ? "Cache enabled" : "Cache disabled") +
        " (" + store_->describe() + ", capacity " + std::to_string(config_.capacityBytes) +
        " bytes, chunk " + std::to_string(config_.chunkSize) + " bytes)");
}

// =============================================================================
// Lookup and Read
// =============================================================================

std::vector<ChunkLookup> MediaCache::lookup(const FileReference& file, const ByteRange& range,
                                            ByteCount objectSize) {
    std::vector<ChunkLookup> chunks = probe(file, range, objectSize);

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& chunk : chunks) {
        if (chunk.status == ChunkStatus::Hit) {
            ++counters_.hits;
        } else {
            ++counters_.misses;
        }
    }
    return chunks;
}

std::vector<ChunkLookup> MediaCache::probe(const FileReference& file, const ByteRange& range,
                                           ByteCount objectSize) const {
    std::vector<ChunkLookup> chunks;
    auto resolved = range.resolve(objectSize);
    if (!resolved || resolved->length() == 0) {
        return chunks;
    }

    const ChunkIndex first = resolved->start / config_.chunkSize;
    const ChunkIndex last = (resolved->end - 1) / config_.chunkSize;

    std::lock_guard<std::mutex> lock(mutex_);
    for (ChunkIndex index = first; index <= last; ++index) {
        ChunkLookup chunk;
        chunk.index = index;
        chunk.chunkStart = index * config_.chunkSize;
        chunk.chunkLength = std::min(config_.chunkSize, objectSize - chunk.chunkStart);

        auto it = entries_.find(ChunkKey(file, index));
        bool hit = it != entries_.end() && !it->second.pinned;
        chunk.status = hit ? ChunkStatus::Hit : ChunkStatus::Miss;
        chunks.push_back(chunk);
    }
    return chunks;
}

bool MediaCache::contains(const FileReference& file, ChunkIndex index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(ChunkKey(file, index));
    return it != entries_.end() && !it->second.pinned;
}

Result<Bytes, Error> MediaCache::read(const FileReference& file, ChunkIndex index,
                                      ByteCount offset, ByteCount length) {
    const ChunkKey key(file, index);
    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end() || it->second.pinned) {
            return Result<Bytes, Error>::error(
                Error(ErrorCode::NotFound, "Chunk not cached", key.toString()));
        }
        if (offset + length > it->second.size) {
            return Result<Bytes, Error>::error(
                Error(ErrorCode::InvalidArgument, "Read past end of chunk", key.toString()));
        }
        generation = it->second.generation;
    }

    auto data = store_->readBlock(key, offset, length);
    if (data.isSuccess()) {
        return data;
    }

    // The block vanished or was truncated behind our back.
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end() && !it->second.pinned && it->second.generation == generation) {
            eraseEntry(it, true);
            ++counters_.missingBlocks;
        }
    }
    if (logger_) {
        logger_->warningWithContext("Cached block unreadable, dropping entry: " + data.error().toString(),
            core::LogContext(file, ByteRange::of(index * config_.chunkSize + offset,
                                                 index * config_.chunkSize + offset + length)),
            LOG_CATEGORY);
    }
    return Result<Bytes, Error>::error(
        Error(ErrorCode::NotFound, "Cached block missing", key.toString()));
}

void MediaCache::recordAccess(const FileReference& file, ChunkIndex index) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(ChunkKey(file, index));
    if (it == entries_.end() || it->second.pinned) {
        return;
    }
    lfu_.erase(lfuKey(it->first, it->second));
    ++it->second.frequency;
    it->second.lastAccess = ++tick_;
    lfu_.insert(lfuKey(it->first, it->second));
}

// =============================================================================
// Population
// =============================================================================

Result<bool, Error> MediaCache::populate(const FileReference& file, ChunkIndex index,
                                         const Bytes& bytes) {
    const ChunkKey key(file, index);
    const ByteCount size = bytes.size();

    if (!config_.enabled || size == 0) {
        return Result<bool, Error>::success(false);
    }
    if (size > config_.chunkSize) {
        return Result<bool, Error>::error(Error(ErrorCode::InvalidArgument,
            "Chunk larger than the chunk size (" + std::to_string(size) + " bytes)", key.toString()));
    }

    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fills_.count(key) > 0) {
            // The in-flight fill admits this chunk when it completes.
            return Result<bool, Error>::success(false);
        }

        auto it = entries_.find(key);
        if (it != entries_.end() && !it->second.pinned && it->second.size == size) {
            lfu_.erase(lfuKey(it->first, it->second));
            it->second.lastAccess = ++tick_;
            lfu_.insert(lfuKey(it->first, it->second));
            return Result<bool, Error>::success(true);
        }
        if (it != entries_.end() && it->second.pinned) {
            // Another admission of this chunk is being written.
            return Result<bool, Error>::success(false);
        }
        if (it != entries_.end()) {
            eraseEntry(it, true);
        }

        generation = reserve(key, size);
        if (generation == 0) {
            ++counters_.passThrough;
            return Result<bool, Error>::success(false);
        }
    }

    auto written = store_->writeBlock(key, bytes);

    std::lock_guard<std::mutex> lock(mutex_);
    if (written.isError()) {
        dropReservation(key, generation);
        ++counters_.passThrough;
        RANGECAST_LOG_WARNING(logger_, LOG_CATEGORY,
            "Admission of " + key.toString() + " failed, passing through: " + written.error().toString());
        return Result<bool, Error>::success(false);
    }
    finalize(key, generation, size);
    return Result<bool, Error>::success(entries_.count(key) > 0);
}

void MediaCache::invalidate(const FileReference& file) {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t dropped = 0;
    auto it = entries_.lower_bound(ChunkKey(file, 0));
    while (it != entries_.end() && it->first.file == file) {
        auto next = std::next(it);
        eraseEntry(it, !it->second.pinned);
        ++dropped;
        it = next;
    }

    for (auto fit = fills_.lower_bound(ChunkKey(file, 0));
         fit != fills_.end() && fit->first.file == file; ++fit) {
        fit->second.fill->setAdmit(false);
        fit->second.generation = 0;
    }

    RANGECAST_LOG_INFO(logger_, LOG_CATEGORY,
        "Invalidated " + file.toString() + " (" + std::to_string(dropped) + " entries)");
}

FillTicket MediaCache::beginFill(const ChunkKey& key, ByteCount length, bool admit) {
    std::lock_guard<std::mutex> lock(mutex_);

    FillTicket ticket;

    auto entry = entries_.find(key);
    if (entry != entries_.end() && !entry->second.pinned) {
        ticket.role = FillRole::Cached;
        return ticket;
    }

    auto slot = fills_.find(key);
    if (slot != fills_.end()) {
        slot->second.fill->addSubscriber();
        ++counters_.coalescedJoins;
        ticket.fill = slot->second.fill;
        ticket.role = FillRole::Follower;
        return ticket;
    }

    uint64_t generation = 0;
    if (admit && config_.enabled) {
        generation = reserve(key, length);
        if (generation == 0) {
            ++counters_.passThrough;
        }
    }

    auto fill = std::make_shared<ChunkFill>(key, length, generation != 0);
    fills_[key] = FillSlot{fill, generation};
    ++counters_.fillsStarted;

    ticket.fill = std::move(fill);
    ticket.role = FillRole::Leader;
    return ticket;
}

void MediaCache::completeFill(const std::shared_ptr<ChunkFill>& fill) {
    if (!fill || !fill->isComplete()) {
        return;
    }
    const ChunkKey key = fill->key();

    bool admit = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto slot = fills_.find(key);
        admit = slot != fills_.end() && slot->second.fill == fill &&
                slot->second.generation != 0 && fill->admit();
    }

    Result<void, Error> written = Result<void, Error>::success();
    if (admit) {
        written = store_->writeBlock(key, fill->snapshot());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto slot = fills_.find(key);
    if (slot == fills_.end() || slot->second.fill != fill) {
        return;
    }
    const uint64_t generation = slot->second.generation;
    fills_.erase(slot);
    ++counters_.fillsCompleted;

    if (generation == 0) {
        // Invalidated while the block was being written.
        if (admit && written.isSuccess() && entries_.find(key) == entries_.end()) {
            store_->removeBlock(key);
        }
        return;
    }
    if (!admit || written.isError()) {
        dropReservation(key, generation);
        ++counters_.passThrough;
        if (written.isError()) {
            RANGECAST_LOG_WARNING(logger_, LOG_CATEGORY,
                "Admission of " + key.toString() + " failed, passing through: " + written.error().toString());
        }
        return;
    }
    finalize(key, generation, fill->expectedLength());
    RANGECAST_LOG_DEBUG(logger_, LOG_CATEGORY,
        "Cached " + key.toString() + " (" + std::to_string(fill->expectedLength()) + " bytes, " +
        std::to_string(usedBytes_) + "/" + std::to_string(config_.capacityBytes) + " used)");
}

void MediaCache::failFill(const std::shared_ptr<ChunkFill>& fill, const Error& error) {
    if (!fill) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    fill->fail(error);
    retireFill(fill, false);
    ++counters_.fillsFailed;
}

FillState MediaCache::releaseFill(const std::shared_ptr<ChunkFill>& fill) {
    if (!fill) {
        return FillState::Abandoned;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    FillState state = fill->detachLeader();
    if (state == FillState::Abandoned) {
        retireFill(fill, false);
        ++counters_.fillsAbandoned;
    } else if (state == FillState::Orphaned) {
        RANGECAST_LOG_DEBUG(logger_, LOG_CATEGORY,
            "Fill " + fill->key().toString() + " orphaned at " + std::to_string(fill->received()) +
            " bytes with " + std::to_string(fill->subscriberCount()) + " subscriber(s)");
    }
    return state;
}

void MediaCache::unsubscribe(const std::shared_ptr<ChunkFill>& fill) {
    if (!fill) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    fill->removeSubscriber();
    if (fill->state() == FillState::Orphaned && fill->subscriberCount() == 0) {
        fill->abandon();
        retireFill(fill, false);
        ++counters_.fillsAbandoned;
    }
}

// =============================================================================
// Persistence
// =============================================================================

Result<void, Error> MediaCache::saveIndex() {
    std::ostringstream doc;
    size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        doc << "{\"version\":" << INDEX_VERSION
            << ",\"chunkSize\":" << config_.chunkSize
            << ",\"tick\":" << tick_
            << ",\"entries\":[";
        bool first = true;
        for (const auto& item : entries_) {
            if (item.second.pinned) {
                continue;
            }
            doc << (first ? "" : ",")
                << "{\"file\":\"" << core::escapeJson(item.first.file.toString()) << "\""
                << ",\"chunk\":" << item.first.index
                << ",\"size\":" << item.second.size
                << ",\"freq\":" << item.second.frequency
                << ",\"tick\":" << item.second.lastAccess << "}";
            first = false;
            ++count;
        }
        doc << "]}";
    }

    auto written = store_->writeIndex(doc.str());
    if (written.isSuccess()) {
        RANGECAST_LOG_INFO(logger_, LOG_CATEGORY,
            "Saved cache index with " + std::to_string(count) + " entries");
    }
    return written;
}

Result<size_t, Error> MediaCache::loadIndex() {
    auto text = store_->readIndex();
    if (text.isError()) {
        if (text.error().code == ErrorCode::NotFound) {
            cleanup();
            return Result<size_t, Error>::success(0);
        }
        return Result<size_t, Error>::error(text.error());
    }

    auto parsed = core::parseJson(text.value());
    if (parsed.isError()) {
        RANGECAST_LOG_WARNING(logger_, LOG_CATEGORY,
            "Cache index unreadable, starting empty: " + parsed.error().message);
        cleanup();
        return Result<size_t, Error>::success(0);
    }

    const core::JsonValue& root = parsed.value();
    if (root["version"].getInt() != INDEX_VERSION ||
        root["chunkSize"].getUInt() != config_.chunkSize) {
        RANGECAST_LOG_WARNING(logger_, LOG_CATEGORY,
            "Cache index has a different layout, starting empty");
        cleanup();
        return Result<size_t, Error>::success(0);
    }

    size_t restored = 0;
    size_t orphans = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tick_ = std::max(tick_, root["tick"].getUInt());

        for (const auto& item : root["entries"].arrayValue) {
            auto file = FileReference::parse(item["file"].getString());
            if (!file) {
                ++orphans;
                continue;
            }
            ChunkKey key(*file, item["chunk"].getUInt());
            ByteCount size = item["size"].getUInt();

            if (entries_.count(key) > 0) {
                continue;
            }
            auto stored = store_->blockSize(key);
            if (size == 0 || size > config_.chunkSize || !stored || *stored != size ||
                usedBytes_ + size > config_.capacityBytes) {
                store_->removeBlock(key);
                ++orphans;
                continue;
            }

            Entry entry;
            entry.size = size;
            entry.frequency = std::max<uint64_t>(1, item["freq"].getUInt());
            entry.lastAccess = item["tick"].getUInt();
            entry.generation = nextGeneration_++;
            entry.pinned = false;
            tick_ = std::max(tick_, entry.lastAccess);

            auto inserted = entries_.emplace(key, entry).first;
            lfu_.insert(lfuKey(inserted->first, inserted->second));
            usedBytes_ += size;
            ++restored;
        }
    }

    CleanupReport report = cleanup();
    RANGECAST_LOG_INFO(logger_, LOG_CATEGORY,
        "Restored " + std::to_string(restored) + " cached chunks (" +
        std::to_string(orphans) + " orphaned entries, " +
        std::to_string(report.removedBlocks) + " stray blocks removed)");
    return Result<size_t, Error>::success(restored);
}

CleanupReport MediaCache::cleanup() {
    CleanupReport report;
    std::lock_guard<std::mutex> lock(mutex_);

    for (auto it = entries_.begin(); it != entries_.end();) {
        auto next = std::next(it);
        if (!it->second.pinned) {
            auto stored = store_->blockSize(it->first);
            if (!stored || *stored != it->second.size) {
                eraseEntry(it, true);
                ++report.removedEntries;
            }
        }
        it = next;
    }

    for (const auto& key : store_->listBlocks()) {
        if (entries_.count(key) == 0 && fills_.count(key) == 0) {
            store_->removeBlock(key);
            ++report.removedBlocks;
        }
    }
    return report;
}

// =============================================================================
// Introspection
// =============================================================================

bool MediaCache::isCacheable(const ObjectInfo& info) const {
    return config_.enabled &&
           (config_.cacheAllTypes || isCacheableMedia(info.mimeType, info.fileName));
}

std::optional<CacheEntryInfo> MediaCache::entryInfo(const ChunkKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    CacheEntryInfo info;
    info.size = it->second.size;
    info.frequency = it->second.frequency;
    info.lastAccess = it->second.lastAccess;
    info.pinned = it->second.pinned;
    return info;
}

MediaCacheStatistics MediaCache::statistics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    MediaCacheStatistics stats = counters_;
    stats.usedBytes = usedBytes_;
    stats.reservedBytes = reservedBytes_;
    stats.capacityBytes = config_.capacityBytes;
    stats.entryCount = entries_.size();
    stats.pinnedCount = entries_.size() - lfu_.size();
    stats.activeFills = fills_.size();
    return stats;
}

// =============================================================================
// Private Helpers
// =============================================================================

MediaCache::LfuKey MediaCache::lfuKey(const ChunkKey& key, const Entry& entry) {
    return LfuKey(entry.frequency, entry.lastAccess, key);
}

bool MediaCache::makeRoom(ByteCount size) {
    // Pinned reservations cannot be evicted; give up early if they alone block us.
    if (size > config_.capacityBytes || reservedBytes_ + size > config_.capacityBytes) {
        return false;
    }

    while (usedBytes_ + size > config_.capacityBytes) {
        if (lfu_.empty()) {
            return false;
        }
        const ChunkKey victim = std::get<2>(*lfu_.begin());
        auto it = entries_.find(victim);
        const uint64_t frequency = it->second.frequency;
        eraseEntry(it, true);
        ++counters_.evictions;

        RANGECAST_LOG_INFO(logger_, LOG_CATEGORY,
            "Evicted " + victim.toString() + " (frequency " + std::to_string(frequency) + ")");
    }
    return true;
}

void MediaCache::eraseEntry(std::map<ChunkKey, Entry>::iterator it, bool removeBlock) {
    if (it->second.pinned) {
        reservedBytes_ -= it->second.size;
    } else {
        lfu_.erase(lfuKey(it->first, it->second));
    }
    usedBytes_ -= it->second.size;
    if (removeBlock) {
        store_->removeBlock(it->first);
    }
    entries_.erase(it);
}

uint64_t MediaCache::reserve(const ChunkKey& key, ByteCount size) {
    if (size == 0 || entries_.count(key) > 0 || !makeRoom(size)) {
        return 0;
    }
    Entry entry;
    entry.size = size;
    entry.generation = nextGeneration_++;
    entry.pinned = true;
    entries_.emplace(key, entry);
    usedBytes_ += size;
    reservedBytes_ += size;
    return entry.generation;
}

void MediaCache::dropReservation(const ChunkKey& key, uint64_t generation) {
    auto it = entries_.find(key);
    if (it != entries_.end() && it->second.pinned && it->second.generation == generation) {
        eraseEntry(it, false);
    }
}

void MediaCache::finalize(const ChunkKey& key, uint64_t generation, ByteCount size) {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        // Invalidated while the block was being written.
        store_->removeBlock(key);
        return;
    }
    if (!it->second.pinned || it->second.generation != generation) {
        return;
    }
    it->second.pinned = false;
    it->second.size = size;
    it->second.frequency = 1;
    it->second.lastAccess = ++tick_;
    reservedBytes_ -= size;
    lfu_.insert(lfuKey(it->first, it->second));
}

void MediaCache::retireFill(const std::shared_ptr<ChunkFill>& fill, bool keepReservation) {
    auto slot = fills_.find(fill->key());
    if (slot == fills_.end() || slot->second.fill != fill) {
        return;
    }
    if (!keepReservation && slot->second.generation != 0) {
        dropReservation(fill->key(), slot->second.generation);
    }
    fills_.erase(slot);
}

} // namespace streaming
} // namespace rangecast
