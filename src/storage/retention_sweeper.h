/**
 * @file retention_sweeper.h
 * @brief Per-camera deletion of expired local day-partitions
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "config/config.h"
#include "storage/local_disk_store.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace snapkeep::storage {

/// storage_duration value meaning "keep forever"
inline constexpr int kKeepForever = -1;

/**
 * @brief One camera's retention setting
 */
struct RetentionTarget {
  std::string camera_exid;
  int storage_duration = kKeepForever;  ///< Days to keep, or kKeepForever
};

/**
 * @brief Deletes "{local_root}/{camera}/snapshots/recordings/YYYY/MM/DD" trees older than the cutoff
 *
 * The cutoff day is `today - storage_duration days`; only days strictly
 * before it are removed, always as whole day-partitions. Deletion pauses
 * between entries and runs in the idle I/O class so live writes keep
 * priority. A sweep is not transactional but is safe to rerun.
 */
class RetentionSweeper {
 public:
  RetentionSweeper(LocalDiskStore& local, std::string local_root, config::RetentionConfig config);

  /**
   * @brief Sweep one camera using the current UTC date
   */
  utils::Expected<size_t, utils::Error> Cleanup(const std::string& camera_exid, int storage_duration);

  /**
   * @brief Sweep one camera against an explicit "today"
   *
   * @return Number of day-partitions removed; kRetentionParseError when a
   *         YYYY/MM/DD directory is not a calendar date (nothing is deleted)
   */
  utils::Expected<size_t, utils::Error> Cleanup(const std::string& camera_exid, int storage_duration,
                                                std::chrono::year_month_day today);

  /**
   * @brief Sweep every camera, logging and skipping failures
   * @return Total day-partitions removed
   */
  size_t CleanupAll(const std::vector<RetentionTarget>& targets);

 private:
  struct DayPartition {
    std::string path;
    std::chrono::year_month_day date;
  };

  utils::Expected<std::vector<DayPartition>, utils::Error> ListDayPartitions(const std::string& recordings_root);

  LocalDiskStore& local_;
  std::string local_root_;
  config::RetentionConfig config_;
};

}  // namespace snapkeep::storage
