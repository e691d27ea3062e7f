/**
 * @file address_resolver_test.cpp
 * @brief Unit tests for snapshot path construction and parsing
 */

#include "storage/address_resolver.h"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

using namespace snapkeep::storage;
using namespace std::chrono;
using snapkeep::utils::ErrorCode;

namespace {

// 2024-03-05T07:08:09Z
constexpr double kCaptureSeconds = 1709622489.0;

TimePoint Capture(int64_t micros = 0) {
  return TimePoint{sys_days{2024y / March / 5} + hours{7} + minutes{8} + seconds{9}} + microseconds{micros};
}

}  // namespace

// ========== Unix seconds ==========

TEST(AddressResolverTest, FromUnixSeconds) {
  auto whole = FromUnixSeconds(kCaptureSeconds);
  ASSERT_TRUE(whole);
  EXPECT_EQ(*whole, Capture());

  auto fractional = FromUnixSeconds(kCaptureSeconds + 0.25);
  ASSERT_TRUE(fractional);
  EXPECT_EQ(*fractional, Capture(250000));

  EXPECT_DOUBLE_EQ(ToUnixSeconds(Capture()), kCaptureSeconds);
}

TEST(AddressResolverTest, FromUnixSecondsRejectsGarbage) {
  EXPECT_EQ(FromUnixSeconds(-1.0).error().code(), ErrorCode::kInvalidTimestamp);
  EXPECT_EQ(FromUnixSeconds(std::nan("")).error().code(), ErrorCode::kInvalidTimestamp);
  EXPECT_EQ(FromUnixSeconds(std::numeric_limits<double>::infinity()).error().code(), ErrorCode::kInvalidTimestamp);
  EXPECT_EQ(FromUnixSeconds(1e15).error().code(), ErrorCode::kInvalidTimestamp);
}

// ========== Construction ==========

TEST(AddressResolverTest, DirectoryPath) {
  auto dir = ConstructDirectoryPath("/storage", "gate-cam", Capture(), "recordings");
  ASSERT_TRUE(dir);
  EXPECT_EQ(*dir, "/storage/gate-cam/snapshots/recordings/2024/03/05/07/");

  auto no_root = ConstructDirectoryPath("", "gate-cam", Capture(), "timelapse");
  ASSERT_TRUE(no_root);
  EXPECT_EQ(*no_root, "/gate-cam/snapshots/timelapse/2024/03/05/07/");
}

TEST(AddressResolverTest, FileNameWholeSecondIsPadded) {
  auto name = ConstructFileName(Capture());
  ASSERT_TRUE(name);
  EXPECT_EQ(*name, "08_09_000.jpg");
}

TEST(AddressResolverTest, FileNameFractionIsTruncatedToMilliseconds) {
  auto name = ConstructFileName(Capture(123456));
  ASSERT_TRUE(name);
  EXPECT_EQ(*name, "08_09_123.jpg");

  auto small = ConstructFileName(Capture(5999));
  ASSERT_TRUE(small);
  EXPECT_EQ(*small, "08_09_005.jpg");
}

TEST(AddressResolverTest, FormatFileNameLengthRules) {
  EXPECT_EQ(*FormatFileName("08_09_"), "08_09_000.jpg");
  EXPECT_EQ(*FormatFileName("08_09_123"), "08_09_123.jpg");
  EXPECT_EQ(*FormatFileName("08_09_123456"), "08_09_123.jpg");

  EXPECT_EQ(FormatFileName("08_09_1").error().code(), ErrorCode::kInvalidTimestamp);
  EXPECT_EQ(FormatFileName("08_09_12").error().code(), ErrorCode::kInvalidTimestamp);
  EXPECT_EQ(FormatFileName("08_09").error().code(), ErrorCode::kInvalidTimestamp);
  EXPECT_EQ(FormatFileName("").error().code(), ErrorCode::kInvalidTimestamp);
}

TEST(AddressResolverTest, ResolveUsesTagDirectory) {
  auto address = Resolve("/archive", "gate-cam", Capture(500000), SourceTag::kSnapmail);
  ASSERT_TRUE(address);
  EXPECT_EQ(address->directory_path, "/archive/gate-cam/snapshots/snapmail/2024/03/05/07/");
  EXPECT_EQ(address->file_name, "08_09_500.jpg");
  EXPECT_EQ(address->FullPath(), "/archive/gate-cam/snapshots/snapmail/2024/03/05/07/08_09_500.jpg");
}

TEST(AddressResolverTest, ResolveRejectsPreEpoch) {
  auto address = Resolve("/storage", "gate-cam", TimePoint{microseconds{-1}}, SourceTag::kRecordings);
  ASSERT_FALSE(address);
  EXPECT_EQ(address.error().code(), ErrorCode::kInvalidTimestamp);
}

TEST(AddressResolverTest, ThumbnailAndRootPaths) {
  EXPECT_EQ(SnapshotsRoot("/storage", "gate-cam"), "/storage/gate-cam/snapshots");
  EXPECT_EQ(ThumbnailPath("/storage", "gate-cam"), "/storage/gate-cam/snapshots/thumbnail.jpg");
}

// ========== Parsing ==========

TEST(AddressResolverTest, ParseRecoversSecondPrecision) {
  auto address = Resolve("/storage", "gate-cam", Capture(987654), SourceTag::kRecordings);
  ASSERT_TRUE(address);

  auto parsed = ParseSnapshotPath(address->directory_path, address->file_name);
  ASSERT_TRUE(parsed);
  EXPECT_EQ(*parsed, Capture());
}

TEST(AddressResolverTest, ParseWithoutTrailingSlash) {
  auto parsed = ParseSnapshotPath("gate-cam/snapshots/archives/1999/12/31/23", "59_58_001.jpg");
  ASSERT_TRUE(parsed);
  EXPECT_EQ(*parsed, TimePoint{sys_days{1999y / December / 31} + hours{23} + minutes{59} + seconds{58}});
}

TEST(AddressResolverTest, ParseRejectsMalformedPaths) {
  EXPECT_EQ(ParseSnapshotPath("/2024/03/05", "08_09_000.jpg").error().code(), ErrorCode::kInvalidSnapshotPath);
  EXPECT_EQ(ParseSnapshotPath("/c/snapshots/recordings/2024/3/05/07/", "08_09_000.jpg").error().code(),
            ErrorCode::kInvalidSnapshotPath);
  EXPECT_EQ(ParseSnapshotPath("/c/snapshots/recordings/2024/02/30/07/", "08_09_000.jpg").error().code(),
            ErrorCode::kInvalidSnapshotPath);
  EXPECT_EQ(ParseSnapshotPath("/c/snapshots/recordings/2024/03/05/07/", "thumbnail.jpg").error().code(),
            ErrorCode::kInvalidSnapshotPath);
  EXPECT_EQ(ParseSnapshotPath("/c/snapshots/recordings/2024/03/05/07/", "61_09_000.jpg").error().code(),
            ErrorCode::kInvalidSnapshotPath);
}

// ========== Snapshot ids ==========

TEST(AddressResolverTest, SnapshotIdFormat) {
  EXPECT_EQ(FormatSnapshotId(42, Capture(123456)), "42_20240305070809123456");
  EXPECT_EQ(FormatSnapshotId(7, Capture()), "7_20240305070809000000");
}

TEST(AddressResolverTest, SnapshotIdDecodesToMicroseconds) {
  auto decoded = DecodeSnapshotId(FormatSnapshotId(42, Capture(123456)));
  ASSERT_TRUE(decoded);
  EXPECT_EQ(*decoded, Capture(123456));

  auto short_fraction = DecodeSnapshotId("42_20240305070809123");
  ASSERT_TRUE(short_fraction);
  EXPECT_EQ(*short_fraction, Capture(123000));

  auto no_fraction = DecodeSnapshotId("20240305070809");
  ASSERT_TRUE(no_fraction);
  EXPECT_EQ(*no_fraction, Capture());
}

TEST(AddressResolverTest, SnapshotIdSortsChronologically) {
  EXPECT_LT(FormatSnapshotId(42, Capture(1)), FormatSnapshotId(42, Capture(2)));
  EXPECT_LT(FormatSnapshotId(42, Capture()), FormatSnapshotId(42, Capture() + hours{1}));
}

TEST(AddressResolverTest, SnapshotIdRejectsGarbage) {
  EXPECT_EQ(DecodeSnapshotId("42_2024").error().code(), ErrorCode::kInvalidSnapshotId);
  EXPECT_EQ(DecodeSnapshotId("42_2024030507080x").error().code(), ErrorCode::kInvalidSnapshotId);
  EXPECT_EQ(DecodeSnapshotId("42_202403050708091234567").error().code(), ErrorCode::kInvalidSnapshotId);
  EXPECT_EQ(DecodeSnapshotId("42_20241305070809").error().code(), ErrorCode::kInvalidSnapshotId);
}
