// RangeCast - Seekable media delivery engine
// Block Store Implementation

#include "rangecast/streaming/block_store.hpp"

#include <atomic>
#include <cstring>
#include <fstream>
#include <sstream>

namespace rangecast {
namespace streaming {

namespace fs = std::filesystem;

namespace {

const char* const INDEX_FILE_NAME = "index.json";
const char* const BLOCK_EXTENSION = ".blk";

std::string hexEncode(const std::string& text) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(text.size() * 2);
    for (unsigned char c : text) {
        out += digits[c >> 4];
        out += digits[c & 0x0F];
    }
    return out;
}

std::optional<std::string> hexDecode(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }
    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };
    std::string out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = nibble(hex[i]);
        int lo = nibble(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        out += static_cast<char>((hi << 4) | lo);
    }
    return out;
}

// Unique suffix for temporary files written by concurrent fills.
std::string tempSuffix() {
    static std::atomic<uint64_t> counter{0};
    return ".tmp" + std::to_string(counter.fetch_add(1));
}

Result<void, Error> writeFileAtomically(const fs::path& target, const char* data, size_t size) {
    fs::path temp = target;
    temp += tempSuffix();

    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return Result<void, Error>::error(
                Error(ErrorCode::FileWriteError, "Cannot open for writing", temp.string()));
        }
        out.write(data, static_cast<std::streamsize>(size));
        if (!out) {
            std::error_code ec;
            fs::remove(temp, ec);
            return Result<void, Error>::error(
                Error(ErrorCode::FileWriteError, "Write failed", temp.string()));
        }
    }

    std::error_code ec;
    fs::rename(temp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        return Result<void, Error>::error(
            Error(ErrorCode::FileWriteError, "Rename failed: " + ec.message(), target.string()));
    }
    return Result<void, Error>::success();
}

} // anonymous namespace

// =============================================================================
// FileBlockStore Implementation
// =============================================================================

FileBlockStore::FileBlockStore(PrivateTag, fs::path directory)
    : directory_(std::move(directory)) {
}

Result<std::unique_ptr<FileBlockStore>, Error> FileBlockStore::open(const std::string& directory) {
    using OpenResult = Result<std::unique_ptr<FileBlockStore>, Error>;

    if (directory.empty()) {
        return OpenResult::error(Error(ErrorCode::InvalidArgument, "Cache directory is empty"));
    }

    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec || !fs::is_directory(directory, ec)) {
        return OpenResult::error(Error(ErrorCode::IOError,
            "Cannot create cache directory: " + ec.message(), directory));
    }

    return OpenResult::success(std::make_unique<FileBlockStore>(PrivateTag(), directory));
}

std::string FileBlockStore::blockFileName(const ChunkKey& key) {
    return hexEncode(key.file.toString()) + "_" + std::to_string(key.index) + BLOCK_EXTENSION;
}

std::optional<ChunkKey> FileBlockStore::parseBlockFileName(const std::string& name) {
    const size_t extLen = std::strlen(BLOCK_EXTENSION);
    if (name.size() <= extLen || name.compare(name.size() - extLen, extLen, BLOCK_EXTENSION) != 0) {
        return std::nullopt;
    }
    std::string stem = name.substr(0, name.size() - extLen);
    size_t sep = stem.rfind('_');
    if (sep == std::string::npos || sep + 1 >= stem.size()) {
        return std::nullopt;
    }

    auto decoded = hexDecode(stem.substr(0, sep));
    if (!decoded) {
        return std::nullopt;
    }
    auto file = FileReference::parse(*decoded);
    if (!file) {
        return std::nullopt;
    }

    const std::string indexText = stem.substr(sep + 1);
    ChunkIndex index = 0;
    for (char c : indexText) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        index = index * 10 + static_cast<ChunkIndex>(c - '0');
    }
    return ChunkKey(*file, index);
}

fs::path FileBlockStore::blockPath(const ChunkKey& key) const {
    return directory_ / blockFileName(key);
}

Result<void, Error> FileBlockStore::writeBlock(const ChunkKey& key, const Bytes& data) {
    return writeFileAtomically(blockPath(key),
                               reinterpret_cast<const char*>(data.data()), data.size());
}

Result<Bytes, Error> FileBlockStore::readBlock(const ChunkKey& key, ByteCount offset, ByteCount length) {
    fs::path path = blockPath(key);
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return Result<Bytes, Error>::error(
            Error(ErrorCode::NotFound, "Cached block missing", path.string()));
    }

    in.seekg(static_cast<std::streamoff>(offset));
    Bytes data(static_cast<size_t>(length));
    in.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(length));
    if (static_cast<ByteCount>(in.gcount()) != length) {
        return Result<Bytes, Error>::error(Error(ErrorCode::FileReadError,
            "Short read of cached block (" + std::to_string(in.gcount()) + " of " +
            std::to_string(length) + " bytes)", path.string()));
    }
    return Result<Bytes, Error>::success(std::move(data));
}

void FileBlockStore::removeBlock(const ChunkKey& key) {
    std::error_code ec;
    fs::remove(blockPath(key), ec);
}

std::optional<ByteCount> FileBlockStore::blockSize(const ChunkKey& key) const {
    std::error_code ec;
    auto size = fs::file_size(blockPath(key), ec);
    if (ec) {
        return std::nullopt;
    }
    return static_cast<ByteCount>(size);
}

std::vector<ChunkKey> FileBlockStore::listBlocks() const {
    std::vector<ChunkKey> keys;
    std::error_code ec;
    for (fs::directory_iterator it(directory_, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) {
            continue;
        }
        if (auto key = parseBlockFileName(it->path().filename().string())) {
            keys.push_back(*key);
        }
    }
    return keys;
}

Result<void, Error> FileBlockStore::writeIndex(const std::string& document) {
    return writeFileAtomically(directory_ / INDEX_FILE_NAME, document.data(), document.size());
}

Result<std::string, Error> FileBlockStore::readIndex() const {
    fs::path path = directory_ / INDEX_FILE_NAME;
    std::ifstream in(path);
    if (!in.is_open()) {
        return Result<std::string, Error>::error(
            Error(ErrorCode::NotFound, "No cache index", path.string()));
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        return Result<std::string, Error>::error(
            Error(ErrorCode::FileReadError, "Error reading cache index", path.string()));
    }
    return Result<std::string, Error>::success(ss.str());
}

// =============================================================================
// MemoryBlockStore Implementation
// =============================================================================

Result<void, Error> MemoryBlockStore::writeBlock(const ChunkKey& key, const Bytes& data) {
    auto block = std::make_shared<const Bytes>(data);
    std::lock_guard<std::mutex> lock(mutex_);
    blocks_[key] = std::move(block);
    return Result<void, Error>::success();
}

Result<Bytes, Error> MemoryBlockStore::readBlock(const ChunkKey& key, ByteCount offset, ByteCount length) {
    std::shared_ptr<const Bytes> block;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = blocks_.find(key);
        if (it == blocks_.end()) {
            return Result<Bytes, Error>::error(
                Error(ErrorCode::NotFound, "Cached block missing", key.toString()));
        }
        block = it->second;
    }

    if (offset + length > block->size()) {
        return Result<Bytes, Error>::error(Error(ErrorCode::FileReadError,
            "Read past end of cached block", key.toString()));
    }
    auto first = block->begin() + static_cast<std::ptrdiff_t>(offset);
    return Result<Bytes, Error>::success(Bytes(first, first + static_cast<std::ptrdiff_t>(length)));
}

void MemoryBlockStore::removeBlock(const ChunkKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    blocks_.erase(key);
}

std::optional<ByteCount> MemoryBlockStore::blockSize(const ChunkKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = blocks_.find(key);
    if (it == blocks_.end()) {
        return std::nullopt;
    }
    return static_cast<ByteCount>(it->second->size());
}

std::vector<ChunkKey> MemoryBlockStore::listBlocks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ChunkKey> keys;
    keys.reserve(blocks_.size());
    for (const auto& entry : blocks_) {
        keys.push_back(entry.first);
    }
    return keys;
}

Result<void, Error> MemoryBlockStore::writeIndex(const std::string& document) {
    std::lock_guard<std::mutex> lock(mutex_);
    index_ = document;
    return Result<void, Error>::success();
}

Result<std::string, Error> MemoryBlockStore::readIndex() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!index_) {
        return Result<std::string, Error>::error(Error(ErrorCode::NotFound, "No cache index"));
    }
    return Result<std::string, Error>::success(*index_);
}

} // namespace streaming
} // namespace rangecast
