/**
 * @file address_resolver.h
 * @brief Time-partitioned snapshot addressing
 *
 * Every snapshot lives at
 *   {root}/{camera}/snapshots/{source_tag}/{YYYY}/{MM}/{DD}/{HH}/{mm}_{ss}_{fff}.jpg
 * under both the remote object store (root = remote prefix) and the local
 * disk cache (root = local root). The path is the only metadata a stored
 * snapshot carries, so it must be reversible: ParseSnapshotPath recovers
 * the capture time down to the second.
 *
 * All functions here are pure (no I/O).
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include "storage/source_tag.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace snapkeep::storage {

/// Capture time with microsecond precision (UTC)
using TimePoint = std::chrono::sys_time<std::chrono::microseconds>;

/// Name of the per-camera "latest thumbnail" file under {root}/{camera}/snapshots/
inline constexpr std::string_view kThumbnailFileName = "thumbnail.jpg";

/// Width of the trailing "YYYY/MM/DD/HH/mm_ss_fff.jpg" part of a snapshot path
inline constexpr size_t kPathTimeSuffixLength = 27;

/**
 * @brief Resolved location of one snapshot
 */
struct SnapshotAddress {
  std::string directory_path;  ///< "{root}/{camera}/snapshots/{tag}/YYYY/MM/DD/HH/"
  std::string file_name;       ///< "mm_ss_fff.jpg"

  std::string FullPath() const { return directory_path + file_name; }
};

/**
 * @brief Convert unix seconds (fraction allowed) to a TimePoint
 *
 * @return kInvalidTimestamp for NaN, infinity, negative values or years past 9999
 */
utils::Expected<TimePoint, utils::Error> FromUnixSeconds(double seconds);

/**
 * @brief Convert a TimePoint back to unix seconds
 */
double ToUnixSeconds(TimePoint timestamp);

/**
 * @brief Build the hour-partition directory for a timestamp
 *
 * @param root Storage root prefix (local root or remote prefix; may be empty)
 * @param camera_exid Camera external id
 * @param timestamp Capture time
 * @param source_dir Source tag directory name (as listed; not restricted to known tags)
 */
utils::Expected<std::string, utils::Error> ConstructDirectoryPath(std::string_view root, std::string_view camera_exid,
                                                                  TimePoint timestamp, std::string_view source_dir);

/**
 * @brief Build the file name for a timestamp ("mm_ss_fff.jpg")
 */
utils::Expected<std::string, utils::Error> ConstructFileName(TimePoint timestamp);

/**
 * @brief Apply the file-name rule to a raw minute/second[/fraction] field
 *
 * - exactly 6 bytes ("mm_ss_"): zero sub-second, "000" is appended
 * - 9 bytes or more ("mm_ss_fff..."): truncated to the first 9 bytes
 * - any other length: kInvalidTimestamp
 *
 * ".jpg" is always appended.
 */
utils::Expected<std::string, utils::Error> FormatFileName(std::string_view field);

/**
 * @brief Resolve the full address of a snapshot
 */
utils::Expected<SnapshotAddress, utils::Error> Resolve(std::string_view root, std::string_view camera_exid,
                                                       TimePoint timestamp, SourceTag tag);

/**
 * @brief Recover the capture time (second precision) from a directory path and file name
 *
 * The last four components of directory_path are YYYY/MM/DD/HH; the first
 * two '_'-separated fields of file_name are minute and second.
 */
utils::Expected<TimePoint, utils::Error> ParseSnapshotPath(std::string_view directory_path,
                                                           std::string_view file_name);

/**
 * @brief "{root}/{camera}/snapshots"
 */
std::string SnapshotsRoot(std::string_view root, std::string_view camera_exid);

/**
 * @brief "{root}/{camera}/snapshots/thumbnail.jpg"
 */
std::string ThumbnailPath(std::string_view root, std::string_view camera_exid);

/**
 * @brief Sortable snapshot key: "{camera_id}_{YYYYMMDDHHMMSSffffff}"
 */
std::string FormatSnapshotId(int64_t camera_id, TimePoint timestamp);

/**
 * @brief Decode the timestamp embedded in a snapshot id
 *
 * Uses the part after the last '_': 14 digits of date/time followed by
 * up to 6 fraction digits.
 */
utils::Expected<TimePoint, utils::Error> DecodeSnapshotId(std::string_view snapshot_id);

}  // namespace snapkeep::storage
