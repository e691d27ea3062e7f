/**
 * @file error.h
 * @brief Error codes and error value type for snapkeep
 *
 * Every fallible operation in snapkeep reports failures as an Error carried
 * inside utils::Expected. Error codes are grouped by subsystem.
 */

#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace snapkeep::utils {

/**
 * @brief Error codes
 *
 * Ranges:
 * - 0-99:    generic
 * - 100-199: configuration
 * - 200-299: snapshot addressing
 * - 300-399: storage backends
 * - 400-499: retention
 * - 500-599: liveness
 */
enum class ErrorCode : std::uint16_t {
  kSuccess = 0,
  kUnknown = 1,
  kInvalidArgument = 2,
  kNotFound = 3,
  kTimeout = 4,
  kOutOfRange = 5,
  kInternalError = 6,
  kUnavailable = 7,

  kConfigFileNotFound = 100,
  kConfigYamlError = 101,
  kConfigParseError = 102,
  kConfigInvalidValue = 103,
  kConfigValidationError = 104,

  kInvalidTimestamp = 200,
  kInvalidSnapshotId = 201,
  kInvalidSnapshotPath = 202,

  kBackendFault = 300,
  kStorageReadError = 301,
  kStorageWriteError = 302,
  kStorageDeleteError = 303,

  kRetentionParseError = 400,

  kCameraNotFound = 500,
  kPersistenceFailed = 501,
};

/**
 * @brief Get a short, stable name for an error code (used in logs)
 */
inline const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "success";
    case ErrorCode::kUnknown:
      return "unknown";
    case ErrorCode::kInvalidArgument:
      return "invalid_argument";
    case ErrorCode::kNotFound:
      return "not_found";
    case ErrorCode::kTimeout:
      return "timeout";
    case ErrorCode::kOutOfRange:
      return "out_of_range";
    case ErrorCode::kInternalError:
      return "internal_error";
    case ErrorCode::kUnavailable:
      return "unavailable";
    case ErrorCode::kConfigFileNotFound:
      return "config_file_not_found";
    case ErrorCode::kConfigYamlError:
      return "config_yaml_error";
    case ErrorCode::kConfigParseError:
      return "config_parse_error";
    case ErrorCode::kConfigInvalidValue:
      return "config_invalid_value";
    case ErrorCode::kConfigValidationError:
      return "config_validation_error";
    case ErrorCode::kInvalidTimestamp:
      return "invalid_timestamp";
    case ErrorCode::kInvalidSnapshotId:
      return "invalid_snapshot_id";
    case ErrorCode::kInvalidSnapshotPath:
      return "invalid_snapshot_path";
    case ErrorCode::kBackendFault:
      return "backend_fault";
    case ErrorCode::kStorageReadError:
      return "storage_read_error";
    case ErrorCode::kStorageWriteError:
      return "storage_write_error";
    case ErrorCode::kStorageDeleteError:
      return "storage_delete_error";
    case ErrorCode::kRetentionParseError:
      return "retention_parse_error";
    case ErrorCode::kCameraNotFound:
      return "camera_not_found";
    case ErrorCode::kPersistenceFailed:
      return "persistence_failed";
  }
  return "unknown";
}

/**
 * @brief Error value: code, human-readable message and optional context
 */
class Error {
 public:
  Error() = default;
  explicit Error(ErrorCode code, std::string message = "", std::string context = "")
      : code_(code), message_(std::move(message)), context_(std::move(context)) {}

  ErrorCode code() const { return code_; }
  const std::string& message() const { return message_; }
  const std::string& context() const { return context_; }

  /**
   * @brief Format as "code_name: message (context)"
   */
  std::string ToString() const {
    std::string out = ErrorCodeName(code_);
    if (!message_.empty()) {
      out += ": " + message_;
    }
    if (!context_.empty()) {
      out += " (" + context_ + ")";
    }
    return out;
  }

 private:
  ErrorCode code_ = ErrorCode::kUnknown;
  std::string message_;
  std::string context_;
};

/**
 * @brief Create an Error
 */
inline Error MakeError(ErrorCode code, std::string message = "", std::string context = "") {
  return Error(code, std::move(message), std::move(context));
}

}  // namespace snapkeep::utils
