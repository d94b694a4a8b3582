// RangeCast - Seekable media delivery engine
// Tests for MIME guessing and the cacheable-type filter

#include <gtest/gtest.h>
#include "rangecast/streaming/media_types.hpp"

namespace rangecast {
namespace streaming {
namespace test {

TEST(MediaTypesTest, GuessesFromExtensionIgnoringCase) {
    EXPECT_EQ(guessMimeType("Movie.MKV"), "video/x-matroska");
    EXPECT_EQ(guessMimeType("clip.mp4"), "video/mp4");
    EXPECT_EQ(guessMimeType("song.flac"), "audio/flac");
    EXPECT_EQ(guessMimeType("notes.txt"), "text/plain");
}

TEST(MediaTypesTest, UnknownOrMissingExtensionFallsBack) {
    EXPECT_EQ(guessMimeType("archive.xyz"), DEFAULT_MIME_TYPE);
    EXPECT_EQ(guessMimeType("README"), DEFAULT_MIME_TYPE);
    EXPECT_EQ(guessMimeType("dir.v2/README"), DEFAULT_MIME_TYPE);
    EXPECT_EQ(std::string(DEFAULT_MIME_TYPE), "application/octet-stream");
}

TEST(MediaTypesTest, CacheableByMimeTypeOrExtension) {
    EXPECT_TRUE(isCacheableMedia("video/webm", ""));
    EXPECT_TRUE(isCacheableMedia("", "episode.mkv"));
    EXPECT_TRUE(isCacheableMedia("application/octet-stream", "track.MP3"));

    EXPECT_FALSE(isCacheableMedia("application/pdf", "book.pdf"));
    EXPECT_FALSE(isCacheableMedia("image/png", "cover.png"));
    EXPECT_FALSE(isCacheableMedia("", ""));
}

} // namespace test
} // namespace streaming
} // namespace rangecast
