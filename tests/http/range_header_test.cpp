// RangeCast - Seekable media delivery engine
// Tests for Range header parsing

#include <gtest/gtest.h>
#include "rangecast/http/range_header.hpp"

namespace rangecast {
namespace http {
namespace test {

using core::ErrorCode;

void expectRange(const std::string& header, ByteCount size, ByteCount start, ByteCount end) {
    auto parsed = parseRangeHeader(header, size);
    ASSERT_TRUE(parsed.isSuccess()) << header << ": " << parsed.error().toString();
    ASSERT_TRUE(parsed.value().has_value()) << header;
    EXPECT_EQ(parsed.value()->start, start) << header;
    EXPECT_EQ(parsed.value()->end, end) << header;
}

void expectError(const std::string& header, ByteCount size, ErrorCode code) {
    auto parsed = parseRangeHeader(header, size);
    ASSERT_TRUE(parsed.isError()) << header;
    EXPECT_EQ(parsed.error().code, code) << header;
}

TEST(RangeHeaderTest, AbsentHeaderMeansWholeObject) {
    auto parsed = parseRangeHeader("", 1000);
    ASSERT_TRUE(parsed.isSuccess());
    EXPECT_FALSE(parsed.value().has_value());

    EXPECT_FALSE(parseRangeHeader("   ", 1000).value().has_value());
}

TEST(RangeHeaderTest, ClosedRangeIsInclusive) {
    expectRange("bytes=0-499", 1000, 0, 500);
    expectRange("bytes=500-999", 1000, 500, 1000);
    expectRange("bytes=7-7", 1000, 7, 8);
    expectRange("Bytes= 10 - 20 ", 1000, 10, 21);
}

TEST(RangeHeaderTest, OpenEndedRunsToLastByte) {
    expectRange("bytes=100-", 1000, 100, 1000);
    expectRange("bytes=999-", 1000, 999, 1000);
}

TEST(RangeHeaderTest, EndPastObjectIsClamped) {
    expectRange("bytes=900-5000", 1000, 900, 1000);
}

TEST(RangeHeaderTest, SuffixSelectsFinalBytes) {
    expectRange("bytes=-100", 1000, 900, 1000);
    expectRange("bytes=-5000", 1000, 0, 1000);
}

TEST(RangeHeaderTest, UnsatisfiableRanges) {
    expectError("bytes=1000-", 1000, ErrorCode::RangeNotSatisfiable);
    expectError("bytes=1500-1600", 1000, ErrorCode::RangeNotSatisfiable);
    expectError("bytes=20-10", 1000, ErrorCode::RangeNotSatisfiable);
    expectError("bytes=-0", 1000, ErrorCode::RangeNotSatisfiable);
    expectError("bytes=0-", 0, ErrorCode::RangeNotSatisfiable);
}

TEST(RangeHeaderTest, MalformedHeaders) {
    expectError("bytes=", 1000, ErrorCode::InvalidArgument);
    expectError("items=0-10", 1000, ErrorCode::InvalidArgument);
    expectError("bytes=abc-10", 1000, ErrorCode::InvalidArgument);
    expectError("bytes=10", 1000, ErrorCode::InvalidArgument);
    expectError("bytes=-", 1000, ErrorCode::InvalidArgument);
    expectError("bytes=+5-10", 1000, ErrorCode::InvalidArgument);
    expectError("bytes=0-10,20-30", 1000, ErrorCode::InvalidArgument);
    expectError("bytes=99999999999999999999-", 1000, ErrorCode::InvalidArgument);
}

TEST(RangeHeaderTest, ResponseHeaderValues) {
    EXPECT_EQ(contentRangeValue(ByteRange::of(0, 500), 1000), "bytes 0-499/1000");
    EXPECT_EQ(contentRangeValue(ByteRange::of(999, 1000), 1000), "bytes 999-999/1000");
    EXPECT_EQ(unsatisfiedRangeValue(1000), "bytes */1000");
}

} // namespace test
} // namespace http
} // namespace rangecast
