// RangeCast - Seekable media delivery engine
// Block Store - Addressable storage of cached chunk blocks
//
// Two implementations:
// - FileBlockStore: one file per chunk under a directory, plus index.json
// - MemoryBlockStore: in-process only; nothing survives a restart

#ifndef RANGECAST_STREAMING_BLOCK_STORE_HPP
#define RANGECAST_STREAMING_BLOCK_STORE_HPP

#include "rangecast/core/error_codes.hpp"
#include "rangecast/core/result.hpp"
#include "rangecast/core/types.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace rangecast {
namespace streaming {

using core::Error;
using core::ErrorCode;
using core::Result;

/**
 * @brief Storage backend of the media cache.
 *
 * The cache owns accounting and eviction; a store only keeps bytes. Calls
 * for different keys may run concurrently.
 */
class IBlockStore {
public:
    virtual ~IBlockStore() = default;

    /**
     * @brief Store a complete block, replacing any previous one.
     */
    virtual Result<void, Error> writeBlock(const ChunkKey& key, const Bytes& data) = 0;

    /**
     * @brief Read part of a block.
     * @return NotFound if the block is gone, FileReadError on a short read
     */
    virtual Result<Bytes, Error> readBlock(const ChunkKey& key, ByteCount offset, ByteCount length) = 0;

    virtual void removeBlock(const ChunkKey& key) = 0;

    /**
     * @brief Size of a stored block, or nullopt if it does not exist.
     */
    virtual std::optional<ByteCount> blockSize(const ChunkKey& key) const = 0;

    /**
     * @brief Keys of every block present in the store.
     */
    virtual std::vector<ChunkKey> listBlocks() const = 0;

    /**
     * @brief Whether blocks and the index survive a restart.
     */
    virtual bool isPersistent() const = 0;

    virtual Result<void, Error> writeIndex(const std::string& document) = 0;

    /**
     * @brief The last index written.
     * @return NotFound if there is none
     */
    virtual Result<std::string, Error> readIndex() const = 0;

    virtual std::string describe() const = 0;
};

// =============================================================================
// FileBlockStore
// =============================================================================

/**
 * @brief Blocks as files named "<hex(fileRef)>_<chunkIndex>.blk".
 *
 * Writes go to a temporary file that is renamed into place, so a reader
 * never sees a partially written block.
 */
class FileBlockStore : public IBlockStore {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    /**
     * @brief Open (creating if needed) a store rooted at directory.
     */
    static Result<std::unique_ptr<FileBlockStore>, Error> open(const std::string& directory);

    FileBlockStore(PrivateTag, std::filesystem::path directory);

    Result<void, Error> writeBlock(const ChunkKey& key, const Bytes& data) override;
    Result<Bytes, Error> readBlock(const ChunkKey& key, ByteCount offset, ByteCount length) override;
    void removeBlock(const ChunkKey& key) override;
    std::optional<ByteCount> blockSize(const ChunkKey& key) const override;
    std::vector<ChunkKey> listBlocks() const override;
    bool isPersistent() const override { return true; }
    Result<void, Error> writeIndex(const std::string& document) override;
    Result<std::string, Error> readIndex() const override;
    std::string describe() const override { return "disk:" + directory_.string(); }

    /**
     * @brief File name of a block, relative to the store directory.
     */
    static std::string blockFileName(const ChunkKey& key);

    /**
     * @brief Inverse of blockFileName().
     */
    static std::optional<ChunkKey> parseBlockFileName(const std::string& name);

    std::filesystem::path blockPath(const ChunkKey& key) const;
    const std::filesystem::path& directory() const { return directory_; }

private:
    std::filesystem::path directory_;
};

// =============================================================================
// MemoryBlockStore
// =============================================================================

/**
 * @brief Blocks held in process memory.
 *
 * Used when the cache is configured as ephemeral and by tests.
 */
class MemoryBlockStore : public IBlockStore {
public:
    MemoryBlockStore() = default;

    Result<void, Error> writeBlock(const ChunkKey& key, const Bytes& data) override;
    Result<Bytes, Error> readBlock(const ChunkKey& key, ByteCount offset, ByteCount length) override;
    void removeBlock(const ChunkKey& key) override;
    std::optional<ByteCount> blockSize(const ChunkKey& key) const override;
    std::vector<ChunkKey> listBlocks() const override;
    bool isPersistent() const override { return false; }
    Result<void, Error> writeIndex(const std::string& document) override;
    Result<std::string, Error> readIndex() const override;
    std::string describe() const override { return "memory"; }

private:
    mutable std::mutex mutex_;
    std::map<ChunkKey, std::shared_ptr<const Bytes>> blocks_;
    std::optional<std::string> index_;
};

} // namespace streaming
} // namespace rangecast

#endif // RANGECAST_STREAMING_BLOCK_STORE_HPP
