/**
 * @file address_resolver.cpp
 * @brief Snapshot addressing implementation
 */

#include "storage/address_resolver.h"

#include <charconv>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <vector>

namespace snapkeep::storage {

namespace {

constexpr int64_t kMicrosPerSecond = 1000000;
constexpr int kMinYear = 1970;
constexpr int kMaxYear = 9999;
constexpr size_t kWholeSecondFieldLength = 6;  // "mm_ss_"
constexpr size_t kFractionFieldLength = 9;     // "mm_ss_fff"
constexpr size_t kSnapshotIdDateTimeDigits = 14;
constexpr size_t kSnapshotIdFractionDigits = 6;

/**
 * @brief Broken-down UTC time
 */
struct CivilTime {
  int year = 0;
  unsigned month = 0;
  unsigned day = 0;
  int64_t hour = 0;
  int64_t minute = 0;
  int64_t second = 0;
  int64_t microsecond = 0;
};

utils::Error InvalidTimestamp(const std::string& message) {
  return utils::MakeError(utils::ErrorCode::kInvalidTimestamp, message);
}

utils::Expected<CivilTime, utils::Error> BreakDown(TimePoint timestamp) {
  const auto day_point = std::chrono::floor<std::chrono::days>(timestamp);
  const std::chrono::year_month_day ymd{day_point};
  const int year = static_cast<int>(ymd.year());
  if (timestamp.time_since_epoch().count() < 0 || year < kMinYear || year > kMaxYear) {
    return utils::MakeUnexpected(
        InvalidTimestamp("timestamp out of range: " + std::to_string(timestamp.time_since_epoch().count()) + "us"));
  }

  const std::chrono::hh_mm_ss<std::chrono::microseconds> time_of_day{timestamp - day_point};

  CivilTime civil;
  civil.year = year;
  civil.month = static_cast<unsigned>(ymd.month());
  civil.day = static_cast<unsigned>(ymd.day());
  civil.hour = time_of_day.hours().count();
  civil.minute = time_of_day.minutes().count();
  civil.second = time_of_day.seconds().count();
  civil.microsecond = time_of_day.subseconds().count();
  return civil;
}

/**
 * @brief Parse a field that must consist of exactly `width` decimal digits
 */
bool ParseDigits(std::string_view text, size_t width, int64_t& out) {
  if (text.size() != width) {
    return false;
  }
  for (char chr : text) {
    if (chr < '0' || chr > '9') {
      return false;
    }
  }
  const auto* first = text.data();
  const auto* last = text.data() + text.size();  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc() && ptr == last;
}

std::vector<std::string_view> Split(std::string_view text, char delimiter) {
  std::vector<std::string_view> parts;
  size_t start = 0;
  while (start <= text.size()) {
    const size_t pos = text.find(delimiter, start);
    if (pos == std::string_view::npos) {
      parts.push_back(text.substr(start));
      break;
    }
    parts.push_back(text.substr(start, pos - start));
    start = pos + 1;
  }
  return parts;
}

/**
 * @brief Assemble a TimePoint from validated civil fields
 */
utils::Expected<TimePoint, utils::Error> MakeTimePoint(int64_t year, int64_t month, int64_t day, int64_t hour,
                                                       int64_t minute, int64_t second, int64_t microsecond) {
  const std::chrono::year_month_day ymd{std::chrono::year{static_cast<int>(year)},
                                        std::chrono::month{static_cast<unsigned>(month)},
                                        std::chrono::day{static_cast<unsigned>(day)}};
  if (!ymd.ok() || year < kMinYear || year > kMaxYear) {
    return utils::MakeUnexpected(InvalidTimestamp("invalid calendar date"));
  }
  if (hour > 23 || minute > 59 || second > 59) {
    return utils::MakeUnexpected(InvalidTimestamp("invalid time of day"));
  }
  return TimePoint{std::chrono::sys_days{ymd}} + std::chrono::hours{hour} + std::chrono::minutes{minute} +
         std::chrono::seconds{second} + std::chrono::microseconds{microsecond};
}

std::string JoinRoot(std::string_view root, std::string_view camera_exid) {
  std::string path(root);
  path += '/';
  path += camera_exid;
  path += "/snapshots";
  return path;
}

}  // namespace

utils::Expected<TimePoint, utils::Error> FromUnixSeconds(double seconds) {
  if (!std::isfinite(seconds) || seconds < 0.0) {
    return utils::MakeUnexpected(InvalidTimestamp("timestamp must be a finite, non-negative number of seconds"));
  }
  const auto micros = static_cast<double>(kMicrosPerSecond) * seconds;
  // 9999-12-31T23:59:59Z
  constexpr double kMaxSeconds = 253402300799.0;
  if (seconds > kMaxSeconds) {
    return utils::MakeUnexpected(InvalidTimestamp("timestamp past year 9999"));
  }
  return TimePoint{std::chrono::microseconds{std::llround(micros)}};
}

double ToUnixSeconds(TimePoint timestamp) {
  return static_cast<double>(timestamp.time_since_epoch().count()) / static_cast<double>(kMicrosPerSecond);
}

utils::Expected<std::string, utils::Error> ConstructDirectoryPath(std::string_view root, std::string_view camera_exid,
                                                                  TimePoint timestamp, std::string_view source_dir) {
  auto civil = BreakDown(timestamp);
  if (!civil) {
    return utils::MakeUnexpected(civil.error());
  }

  std::ostringstream path;
  path << JoinRoot(root, camera_exid) << '/' << source_dir << '/' << std::setfill('0') << std::setw(4) << civil->year
       << '/' << std::setw(2) << civil->month << '/' << std::setw(2) << civil->day << '/' << std::setw(2)
       << civil->hour << '/';
  return path.str();
}

utils::Expected<std::string, utils::Error> ConstructFileName(TimePoint timestamp) {
  auto civil = BreakDown(timestamp);
  if (!civil) {
    return utils::MakeUnexpected(civil.error());
  }

  // Whole-second captures carry no fraction digits; FormatFileName pads them
  std::ostringstream field;
  field << std::setfill('0') << std::setw(2) << civil->minute << '_' << std::setw(2) << civil->second << '_';
  if (civil->microsecond != 0) {
    field << std::setw(6) << civil->microsecond;
  }
  return FormatFileName(field.str());
}

utils::Expected<std::string, utils::Error> FormatFileName(std::string_view field) {
  if (field.size() == kWholeSecondFieldLength) {
    return std::string(field) + "000.jpg";
  }
  if (field.size() >= kFractionFieldLength) {
    return std::string(field.substr(0, kFractionFieldLength)) + ".jpg";
  }
  return utils::MakeUnexpected(
      InvalidTimestamp("file name field must be 6 or at least 9 bytes (got " + std::to_string(field.size()) + ")"));
}

utils::Expected<SnapshotAddress, utils::Error> Resolve(std::string_view root, std::string_view camera_exid,
                                                       TimePoint timestamp, SourceTag tag) {
  auto directory = ConstructDirectoryPath(root, camera_exid, timestamp, ToDirectoryName(tag));
  if (!directory) {
    return utils::MakeUnexpected(directory.error());
  }
  auto file_name = ConstructFileName(timestamp);
  if (!file_name) {
    return utils::MakeUnexpected(file_name.error());
  }
  return SnapshotAddress{std::move(*directory), std::move(*file_name)};
}

utils::Expected<TimePoint, utils::Error> ParseSnapshotPath(std::string_view directory_path,
                                                           std::string_view file_name) {
  std::vector<std::string_view> components;
  for (auto part : Split(directory_path, '/')) {
    if (!part.empty()) {
      components.push_back(part);
    }
  }
  if (components.size() < 4) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kInvalidSnapshotPath,
                                                  "directory has no YYYY/MM/DD/HH partition",
                                                  std::string(directory_path)));
  }

  const size_t base = components.size() - 4;
  int64_t year = 0;
  int64_t month = 0;
  int64_t day = 0;
  int64_t hour = 0;
  if (!ParseDigits(components[base], 4, year) || !ParseDigits(components[base + 1], 2, month) ||
      !ParseDigits(components[base + 2], 2, day) || !ParseDigits(components[base + 3], 2, hour)) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kInvalidSnapshotPath,
                                                  "malformed date partition", std::string(directory_path)));
  }

  auto fields = Split(file_name, '_');
  int64_t minute = 0;
  int64_t second = 0;
  if (fields.size() != 3 || !ParseDigits(fields[0], 2, minute) || !ParseDigits(fields[1], 2, second)) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kInvalidSnapshotPath, "malformed file name",
                                                  std::string(file_name)));
  }

  auto timestamp = MakeTimePoint(year, month, day, hour, minute, second, 0);
  if (!timestamp) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kInvalidSnapshotPath,
                                                  timestamp.error().message(),
                                                  std::string(directory_path) + std::string(file_name)));
  }
  return timestamp;
}

std::string SnapshotsRoot(std::string_view root, std::string_view camera_exid) {
  return JoinRoot(root, camera_exid);
}

std::string ThumbnailPath(std::string_view root, std::string_view camera_exid) {
  return JoinRoot(root, camera_exid) + "/" + std::string(kThumbnailFileName);
}

std::string FormatSnapshotId(int64_t camera_id, TimePoint timestamp) {
  const auto day_point = std::chrono::floor<std::chrono::days>(timestamp);
  const std::chrono::year_month_day ymd{day_point};
  const std::chrono::hh_mm_ss<std::chrono::microseconds> time_of_day{timestamp - day_point};

  std::ostringstream id;
  id << camera_id << '_' << std::setfill('0') << std::setw(4) << static_cast<int>(ymd.year()) << std::setw(2)
     << static_cast<unsigned>(ymd.month()) << std::setw(2) << static_cast<unsigned>(ymd.day()) << std::setw(2)
     << time_of_day.hours().count() << std::setw(2) << time_of_day.minutes().count() << std::setw(2)
     << time_of_day.seconds().count() << std::setw(6) << time_of_day.subseconds().count();
  return id.str();
}

utils::Expected<TimePoint, utils::Error> DecodeSnapshotId(std::string_view snapshot_id) {
  const size_t separator = snapshot_id.rfind('_');
  const std::string_view digits = separator == std::string_view::npos ? snapshot_id : snapshot_id.substr(separator + 1);

  if (digits.size() < kSnapshotIdDateTimeDigits ||
      digits.size() > kSnapshotIdDateTimeDigits + kSnapshotIdFractionDigits) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kInvalidSnapshotId,
                                                  "snapshot id must end in 14 to 20 digits", std::string(snapshot_id)));
  }

  int64_t year = 0;
  int64_t month = 0;
  int64_t day = 0;
  int64_t hour = 0;
  int64_t minute = 0;
  int64_t second = 0;
  int64_t fraction = 0;
  const std::string_view fraction_digits = digits.substr(kSnapshotIdDateTimeDigits);
  if (!ParseDigits(digits.substr(0, 4), 4, year) || !ParseDigits(digits.substr(4, 2), 2, month) ||
      !ParseDigits(digits.substr(6, 2), 2, day) || !ParseDigits(digits.substr(8, 2), 2, hour) ||
      !ParseDigits(digits.substr(10, 2), 2, minute) || !ParseDigits(digits.substr(12, 2), 2, second) ||
      (!fraction_digits.empty() && !ParseDigits(fraction_digits, fraction_digits.size(), fraction))) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kInvalidSnapshotId,
                                                  "snapshot id timestamp is not numeric", std::string(snapshot_id)));
  }

  // Right-pad the fraction to microseconds ("123" -> 123000us)
  for (size_t i = fraction_digits.size(); i < kSnapshotIdFractionDigits; ++i) {
    fraction *= 10;
  }

  auto timestamp = MakeTimePoint(year, month, day, hour, minute, second, fraction);
  if (!timestamp) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kInvalidSnapshotId, timestamp.error().message(),
                                                  std::string(snapshot_id)));
  }
  return timestamp;
}

}  // namespace snapkeep::storage
