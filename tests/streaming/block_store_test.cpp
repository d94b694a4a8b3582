// RangeCast - Seekable media delivery engine
// Tests for the file and memory block stores

#include <gtest/gtest.h>
#include "rangecast/streaming/block_store.hpp"
#include "support/fake_backend.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>

#include <unistd.h>

namespace rangecast {
namespace streaming {
namespace test {

namespace fs = std::filesystem;
using rangecast::test::patternBytes;

class FileBlockStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() / ("rangecast_blocks_" + std::to_string(getpid()));
        fs::remove_all(dir_);
        auto opened = FileBlockStore::open(dir_.string());
        ASSERT_TRUE(opened.isSuccess()) << opened.error().toString();
        store_ = std::move(opened).value();
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path dir_;
    std::unique_ptr<FileBlockStore> store_;
};

TEST_F(FileBlockStoreTest, WriteThenReadSlices) {
    ChunkKey key(FileReference(-100123, 45), 3);
    Bytes data = patternBytes(4096, 1);

    ASSERT_TRUE(store_->writeBlock(key, data).isSuccess());
    ASSERT_EQ(store_->blockSize(key), std::optional<ByteCount>(4096));

    auto slice = store_->readBlock(key, 1000, 24);
    ASSERT_TRUE(slice.isSuccess());
    EXPECT_EQ(slice.value(), rangecast::test::sliceOf(data, 1000, 1024));
}

TEST_F(FileBlockStoreTest, MissingAndShortBlocksAreReported) {
    ChunkKey key(FileReference(1, 1), 0);

    auto missing = store_->readBlock(key, 0, 10);
    ASSERT_TRUE(missing.isError());
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);

    ASSERT_TRUE(store_->writeBlock(key, patternBytes(10)).isSuccess());
    auto shortRead = store_->readBlock(key, 5, 10);
    ASSERT_TRUE(shortRead.isError());
    EXPECT_EQ(shortRead.error().code, ErrorCode::FileReadError);
}

TEST_F(FileBlockStoreTest, BlockFileNamesRoundTrip) {
    ChunkKey key(FileReference(-42, 7), 12);
    std::string name = FileBlockStore::blockFileName(key);

    auto parsed = FileBlockStore::parseBlockFileName(name);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, key);

    EXPECT_FALSE(FileBlockStore::parseBlockFileName("index.json").has_value());
    EXPECT_FALSE(FileBlockStore::parseBlockFileName("zz_1.blk").has_value());
    EXPECT_FALSE(FileBlockStore::parseBlockFileName(name + ".tmp3").has_value());
}

TEST_F(FileBlockStoreTest, ListSkipsForeignFiles) {
    ChunkKey a(FileReference(1, 2), 0);
    ChunkKey b(FileReference(1, 2), 1);
    ASSERT_TRUE(store_->writeBlock(a, patternBytes(8)).isSuccess());
    ASSERT_TRUE(store_->writeBlock(b, patternBytes(8)).isSuccess());
    std::ofstream(dir_ / "notes.txt") << "not a block";

    auto keys = store_->listBlocks();
    std::sort(keys.begin(), keys.end());
    ASSERT_EQ(keys.size(), 2u);
    EXPECT_EQ(keys[0], a);
    EXPECT_EQ(keys[1], b);

    store_->removeBlock(a);
    EXPECT_FALSE(store_->blockSize(a).has_value());
    EXPECT_EQ(store_->listBlocks().size(), 1u);
}

TEST_F(FileBlockStoreTest, IndexSurvivesReopen) {
    auto none = store_->readIndex();
    ASSERT_TRUE(none.isError());
    EXPECT_EQ(none.error().code, ErrorCode::NotFound);

    ASSERT_TRUE(store_->writeIndex("{\"version\":1}").isSuccess());

    auto reopened = FileBlockStore::open(dir_.string());
    ASSERT_TRUE(reopened.isSuccess());
    EXPECT_TRUE(reopened.value()->isPersistent());
    auto index = reopened.value()->readIndex();
    ASSERT_TRUE(index.isSuccess());
    EXPECT_EQ(index.value(), "{\"version\":1}");
}

TEST(FileBlockStoreOpenTest, RejectsEmptyDirectory) {
    auto opened = FileBlockStore::open("");
    ASSERT_TRUE(opened.isError());
    EXPECT_EQ(opened.error().code, ErrorCode::InvalidArgument);
}

TEST(MemoryBlockStoreTest, BehavesLikeAnEphemeralStore) {
    MemoryBlockStore store;
    ChunkKey key(FileReference(3, 4), 0);
    Bytes data = patternBytes(100, 2);

    EXPECT_FALSE(store.isPersistent());
    ASSERT_TRUE(store.writeBlock(key, data).isSuccess());
    EXPECT_EQ(store.blockSize(key), std::optional<ByteCount>(100));

    auto slice = store.readBlock(key, 90, 10);
    ASSERT_TRUE(slice.isSuccess());
    EXPECT_EQ(slice.value(), rangecast::test::sliceOf(data, 90, 100));
    EXPECT_TRUE(store.readBlock(key, 95, 10).isError());

    store.removeBlock(key);
    EXPECT_EQ(store.readBlock(key, 0, 1).error().code, ErrorCode::NotFound);
    EXPECT_TRUE(store.listBlocks().empty());
}

} // namespace test
} // namespace streaming
} // namespace rangecast
