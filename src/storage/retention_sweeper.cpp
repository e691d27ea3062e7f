/**
 * @file retention_sweeper.cpp
 * @brief Retention sweeper implementation
 */

#include "storage/retention_sweeper.h"

#include <linux/ioprio.h>
#include <sys/syscall.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cstdio>
#include <cstring>
#include <functional>
#include <iterator>
#include <thread>

#include "storage/address_resolver.h"
#include "storage/source_tag.h"
#include "utils/structured_log.h"

namespace snapkeep::storage {

namespace {

/**
 * @brief Moves the calling thread into the idle I/O scheduling class for its lifetime
 */
class ScopedIdleIoPriority {
 public:
  explicit ScopedIdleIoPriority(bool enabled) {
    if (!enabled) {
      return;
    }
    previous_ = static_cast<int>(syscall(SYS_ioprio_get, IOPRIO_WHO_PROCESS, 0));
    if (previous_ < 0) {
      utils::LogStorageWarning("ioprio_get", "", std::strerror(errno));
      return;
    }
    if (syscall(SYS_ioprio_set, IOPRIO_WHO_PROCESS, 0, IOPRIO_PRIO_VALUE(IOPRIO_CLASS_IDLE, 0)) != 0) {
      utils::LogStorageWarning("ioprio_set", "", std::strerror(errno));
      previous_ = -1;
    }
  }

  ~ScopedIdleIoPriority() {
    if (previous_ >= 0 && syscall(SYS_ioprio_set, IOPRIO_WHO_PROCESS, 0, previous_) != 0) {
      utils::LogStorageWarning("ioprio_restore", "", std::strerror(errno));
    }
  }

  ScopedIdleIoPriority(const ScopedIdleIoPriority&) = delete;
  ScopedIdleIoPriority& operator=(const ScopedIdleIoPriority&) = delete;
  ScopedIdleIoPriority(ScopedIdleIoPriority&&) = delete;
  ScopedIdleIoPriority& operator=(ScopedIdleIoPriority&&) = delete;

 private:
  int previous_ = -1;
};

bool IsDigits(const std::string& text, size_t width) {
  return text.size() == width &&
         std::all_of(text.begin(), text.end(), [](unsigned char chr) { return std::isdigit(chr) != 0; });
}

unsigned ToUnsigned(const std::string& digits) {
  unsigned value = 0;
  std::from_chars(digits.data(), digits.data() + digits.size(), value);
  return value;
}

/**
 * @brief Sorted child directories of `directory` with exactly `width` digits
 *
 * A directory that disappeared concurrently lists as empty.
 */
utils::Expected<std::vector<std::string>, utils::Error> DigitChildren(LocalDiskStore& local,
                                                                      const std::string& directory, size_t width) {
  auto children = local.ListSubdirectories(directory);
  if (!children) {
    if (children.error().code() == utils::ErrorCode::kNotFound) {
      return std::vector<std::string>();
    }
    return utils::MakeUnexpected(children.error());
  }
  std::vector<std::string> matching;
  std::copy_if(children->begin(), children->end(), std::back_inserter(matching),
               [width](const std::string& name) { return IsDigits(name, width); });
  std::sort(matching.begin(), matching.end());
  return matching;
}

std::string FormatDay(const std::chrono::year_month_day& date) {
  char buffer[16];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", static_cast<int>(date.year()),
                static_cast<unsigned>(date.month()), static_cast<unsigned>(date.day()));
  return buffer;
}

}  // namespace

RetentionSweeper::RetentionSweeper(LocalDiskStore& local, std::string local_root, config::RetentionConfig config)
    : local_(local), local_root_(std::move(local_root)), config_(config) {}

utils::Expected<size_t, utils::Error> RetentionSweeper::Cleanup(const std::string& camera_exid,
                                                                int storage_duration) {
  const auto today = std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now());
  return Cleanup(camera_exid, storage_duration, std::chrono::year_month_day{today});
}

utils::Expected<size_t, utils::Error> RetentionSweeper::Cleanup(const std::string& camera_exid, int storage_duration,
                                                                std::chrono::year_month_day today) {
  if (storage_duration == kKeepForever) {
    return size_t{0};
  }
  if (storage_duration < 0) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kInvalidArgument,
                                                  "storage_duration must be -1 or non-negative",
                                                  std::to_string(storage_duration)));
  }
  if (camera_exid.empty()) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kInvalidArgument, "Empty camera id"));
  }

  const std::chrono::year_month_day cutoff{std::chrono::sys_days{today} - std::chrono::days{storage_duration}};
  utils::StructuredLog()
      .Event("snapshot_delete_disk")
      .Field("camera", camera_exid)
      .Field("cutoff", FormatDay(cutoff))
      .Info();

  const std::string recordings_root =
      SnapshotsRoot(local_root_, camera_exid) + "/" + std::string(ToDirectoryName(SourceTag::kRecordings));
  auto partitions = ListDayPartitions(recordings_root);
  if (!partitions) {
    return utils::MakeUnexpected(partitions.error());
  }

  ScopedIdleIoPriority idle_priority(config_.idle_io_priority);
  const auto pause = std::chrono::milliseconds(config_.delete_pause_ms);
  const std::function<void()> between_entries = [pause]() {
    if (pause.count() > 0) {
      std::this_thread::sleep_for(pause);
    }
  };

  size_t removed_days = 0;
  for (const auto& partition : *partitions) {
    if (std::chrono::sys_days{partition.date} >= std::chrono::sys_days{cutoff}) {
      continue;
    }
    auto removed = local_.RemoveTree(partition.path, between_entries);
    if (!removed) {
      return utils::MakeUnexpected(removed.error());
    }
    utils::LogRetentionDelete(camera_exid, FormatDay(partition.date), *removed);
    ++removed_days;
  }
  return removed_days;
}

size_t RetentionSweeper::CleanupAll(const std::vector<RetentionTarget>& targets) {
  size_t total = 0;
  for (const auto& target : targets) {
    auto removed = Cleanup(target.camera_exid, target.storage_duration);
    if (!removed) {
      utils::LogRetentionError(target.camera_exid, removed.error().ToString());
      continue;
    }
    total += *removed;
  }
  return total;
}

utils::Expected<std::vector<RetentionSweeper::DayPartition>, utils::Error> RetentionSweeper::ListDayPartitions(
    const std::string& recordings_root) {
  std::vector<DayPartition> partitions;

  auto years = DigitChildren(local_, recordings_root, 4);
  if (!years) {
    return utils::MakeUnexpected(years.error());
  }
  for (const auto& year : *years) {
    const std::string year_path = recordings_root + "/" + year;
    auto months = DigitChildren(local_, year_path, 2);
    if (!months) {
      return utils::MakeUnexpected(months.error());
    }
    for (const auto& month : *months) {
      const std::string month_path = year_path + "/" + month;
      auto days = DigitChildren(local_, month_path, 2);
      if (!days) {
        return utils::MakeUnexpected(days.error());
      }
      for (const auto& day : *days) {
        const std::chrono::year_month_day date{std::chrono::year{static_cast<int>(ToUnsigned(year))},
                                               std::chrono::month{ToUnsigned(month)},
                                               std::chrono::day{ToUnsigned(day)}};
        if (!date.ok()) {
          return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kRetentionParseError,
                                                        "Day partition is not a calendar date",
                                                        month_path + "/" + day));
        }
        partitions.push_back(DayPartition{month_path + "/" + day, date});
      }
    }
  }
  return partitions;
}

}  // namespace snapkeep::storage
