// RangeCast - Seekable media delivery engine
// Tests for Result, Error and the common value types

#include <gtest/gtest.h>
#include "rangecast/core/error_codes.hpp"
#include "rangecast/core/result.hpp"
#include "rangecast/core/types.hpp"
#include "rangecast/rangecast.hpp"

#include <memory>
#include <stdexcept>
#include <string>

namespace rangecast {
namespace core {
namespace test {

// =============================================================================
// Result
// =============================================================================

TEST(ResultTest, SuccessValueConstruction) {
    Result<int, std::string> result = Result<int, std::string>::success(42);

    EXPECT_TRUE(result.isSuccess());
    EXPECT_FALSE(result.isError());
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, ErrorValueConstruction) {
    Result<int, std::string> result = Result<int, std::string>::error("Something went wrong");

    EXPECT_FALSE(result.isSuccess());
    EXPECT_TRUE(result.isError());
    EXPECT_EQ(result.error(), "Something went wrong");
}

TEST(ResultTest, VoidSuccessAndError) {
    auto ok = Result<void, Error>::success();
    auto failed = Result<void, Error>::error(Error(ErrorCode::IOError, "disk full"));

    EXPECT_TRUE(ok.isSuccess());
    EXPECT_TRUE(failed.isError());
    EXPECT_EQ(failed.error().code, ErrorCode::IOError);
}

TEST(ResultTest, MoveOnlyValue) {
    auto result = Result<std::unique_ptr<int>, Error>::success(std::make_unique<int>(7));
    std::unique_ptr<int> owned = std::move(result).value();

    ASSERT_NE(owned, nullptr);
    EXPECT_EQ(*owned, 7);
}

TEST(ResultTest, SameTypeForValueAndError) {
    auto result = Result<std::string, std::string>::error("bad");

    EXPECT_TRUE(result.isError());
    EXPECT_EQ(result.error(), "bad");
}

TEST(ResultTest, ValueOr) {
    EXPECT_EQ((Result<int, std::string>::success(42).valueOr(0)), 42);
    EXPECT_EQ((Result<int, std::string>::error("error").valueOr(0)), 0);
}

TEST(ResultTest, WrongAccessThrowsLogicError) {
    auto result = Result<int, Error>::error(Error(ErrorCode::NotFound));

    EXPECT_THROW((void)result.value(), std::logic_error);
    EXPECT_THROW(((void)Result<int, Error>::success(1).error()), std::logic_error);
}

// =============================================================================
// Error
// =============================================================================

TEST(ErrorTest, ToStringCarriesContextAndRetryHint) {
    Error err = Error::rateLimited(std::chrono::milliseconds(1500), "flood wait");
    err.context = "7:42";

    EXPECT_EQ(err.code, ErrorCode::RateLimited);
    EXPECT_EQ(err.toString(), "Rate limited: flood wait [7:42] (retry after 1500ms)");
}

TEST(ErrorTest, HttpStatusMapping) {
    EXPECT_EQ(httpStatusFor(ErrorCode::NotFound), 404);
    EXPECT_EQ(httpStatusFor(ErrorCode::RangeNotSatisfiable), 416);
    EXPECT_EQ(httpStatusFor(ErrorCode::Unavailable), 503);
    EXPECT_EQ(httpStatusFor(ErrorCode::BackendError), 502);
    EXPECT_EQ(httpStatusFor(ErrorCode::RateLimited), 502);
    EXPECT_EQ(httpStatusFor(ErrorCode::InvalidArgument), 400);
    EXPECT_EQ(httpStatusFor(ErrorCode::IOError), 500);
}

// =============================================================================
// Value Types
// =============================================================================

TEST(FileReferenceTest, ParseRoundTripsToString) {
    FileReference ref(-1001234, 77);
    auto parsed = FileReference::parse(ref.toString());

    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, ref);
}

TEST(FileReferenceTest, ParseRejectsGarbage) {
    EXPECT_FALSE(FileReference::parse("").has_value());
    EXPECT_FALSE(FileReference::parse("12").has_value());
    EXPECT_FALSE(FileReference::parse("a:b").has_value());
    EXPECT_FALSE(FileReference::parse("1:2:3").has_value());
}

TEST(ByteRangeTest, WholeResolvesToObjectSize) {
    auto resolved = ByteRange::whole().resolve(1000);

    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(resolved->start, 0u);
    EXPECT_EQ(resolved->end, 1000u);
    EXPECT_FALSE(resolved->wholeObject);
}

TEST(ByteRangeTest, RangePastObjectDoesNotResolve) {
    EXPECT_FALSE(ByteRange::of(10, 1001).resolve(1000).has_value());
    EXPECT_TRUE(ByteRange::of(10, 1000).resolve(1000).has_value());
    EXPECT_EQ(ByteRange::of(5, 9).length(), 4u);
    EXPECT_EQ(ByteRange::of(5, 9).toString(), "[5,9)");
}

TEST(ChunkKeyTest, OrdersByFileThenIndex) {
    ChunkKey a(FileReference(1, 1), 5);
    ChunkKey b(FileReference(1, 2), 0);
    ChunkKey c(FileReference(1, 2), 1);

    EXPECT_TRUE(a < b);
    EXPECT_TRUE(b < c);
    EXPECT_EQ(c.toString(), "1:2#1");
}

TEST(VersionTest, StringMatchesComponents) {
    std::string expected = std::to_string(versionMajor()) + "." +
                           std::to_string(versionMinor()) + "." +
                           std::to_string(versionPatch());
    EXPECT_EQ(std::string(version()), expected);
}

} // namespace test
} // namespace core
} // namespace rangecast
