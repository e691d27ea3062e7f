/**
 * @file structured_log.h
 * @brief Structured logging utilities for JSON-formatted logs
 *
 * Every storage, retention and liveness event is logged through the
 * StructuredLog builder so that per-camera activity can be grepped or
 * parsed by field (camera, operation, status, error_code).
 */

#pragma once

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

namespace snapkeep::utils {

/**
 * @brief Log output format
 */
enum class LogFormat : std::uint8_t {
  JSON,  // {"event":"name","field":"value"}
  TEXT   // event=name field=value
};

/**
 * @brief Structured log line builder
 *
 * @code
 * StructuredLog()
 *   .Event("storage_error")
 *   .Field("operation", "remote_save")
 *   .Field("camera", camera_exid)
 *   .Error();
 * @endcode
 *
 * The output format is process-wide (SetFormat), chosen from logging.json.
 */
class StructuredLog {
 public:
  StructuredLog() = default;

  static void SetFormat(LogFormat format) { format_.store(format, std::memory_order_relaxed); }
  static LogFormat GetFormat() { return format_.load(std::memory_order_relaxed); }

  StructuredLog& Event(std::string_view event) {
    event_ = event;
    return *this;
  }

  StructuredLog& Field(std::string_view key, std::string_view value) {
    fields_.push_back({std::string(key), std::string(value)});
    return *this;
  }

  StructuredLog& Field(std::string_view key, const char* value) { return Field(key, std::string_view(value)); }

  StructuredLog& Field(std::string_view key, const std::string& value) { return Field(key, std::string_view(value)); }

  StructuredLog& Field(std::string_view key, int64_t value) { return Field(key, std::to_string(value)); }

  StructuredLog& Field(std::string_view key, uint64_t value) { return Field(key, std::to_string(value)); }

  void Error() const { spdlog::error("{}", Build()); }
  void Warn() const { spdlog::warn("{}", Build()); }
  void Info() const { spdlog::info("{}", Build()); }

  /**
   * @brief Render the line in the current format
   *
   * JSON values are always strings. TEXT values are quoted only when they
   * contain whitespace or a quote.
   */
  std::string Build() const {
    const bool json = GetFormat() == LogFormat::JSON;
    std::string out = json ? "{" : "";
    bool first = true;
    auto append = [&](const std::string& key, const std::string& value) {
      if (!first) {
        out += json ? "," : " ";
      }
      first = false;
      if (json) {
        out += "\"" + key + "\":\"" + EscapeJson(value) + "\"";
      } else if (value.find_first_of(" \t\n\r\"") != std::string::npos) {
        out += key + "=\"" + EscapeText(value) + "\"";
      } else {
        out += key + "=" + value;
      }
    };
    if (!event_.empty()) {
      append("event", event_);
    }
    for (const auto& field : fields_) {
      append(field.key, field.value);
    }
    if (json) {
      out += "}";
    }
    return out;
  }

 private:
  struct KeyValue {
    std::string key;
    std::string value;
  };

  static std::string EscapeText(const std::string& str) {
    std::string escaped;
    escaped.reserve(str.size());
    for (char chr : str) {
      switch (chr) {
        case '"':
        case '\\':
          escaped += '\\';
          escaped += chr;
          break;
        case '\n':
          escaped += "\\n";
          break;
        case '\r':
          escaped += "\\r";
          break;
        case '\t':
          escaped += "\\t";
          break;
        default:
          escaped += chr;
      }
    }
    return escaped;
  }

  static std::string EscapeJson(const std::string& str) {
    std::string escaped;
    escaped.reserve(str.size());
    for (char chr : str) {
      const auto byte = static_cast<unsigned char>(chr);
      if (chr == '"' || chr == '\\') {
        escaped += '\\';
        escaped += chr;
      } else if (chr == '\n') {
        escaped += "\\n";
      } else if (chr == '\r') {
        escaped += "\\r";
      } else if (chr == '\t') {
        escaped += "\\t";
      } else if (byte < 0x20) {
        char code[7];
        std::snprintf(code, sizeof(code), "\\u%04x", byte);
        escaped += code;
      } else {
        escaped += chr;
      }
    }
    return escaped;
  }

  std::string event_;
  std::vector<KeyValue> fields_;
  static inline std::atomic<LogFormat> format_{LogFormat::JSON};
};

/**
 * @brief Log storage error in structured format
 */
inline void LogStorageError(const std::string& operation, const std::string& path, const std::string& error_msg) {
  StructuredLog()
      .Event("storage_error")
      .Field("operation", operation)
      .Field("path", path)
      .Field("error", error_msg)
      .Error();
}

/**
 * @brief Log storage info in structured format
 */
inline void LogStorageInfo(const std::string& operation, const std::string& message) {
  StructuredLog().Event("storage_info").Field("operation", operation).Field("message", message).Info();
}

/**
 * @brief Log storage warning in structured format
 */
inline void LogStorageWarning(const std::string& operation, const std::string& path, const std::string& message) {
  StructuredLog()
      .Event("storage_warning")
      .Field("operation", operation)
      .Field("path", path)
      .Field("message", message)
      .Warn();
}

/**
 * @brief Log a camera status decision ([camera] [update_status] [status] ...)
 */
inline void LogLivenessTransition(const std::string& camera, const std::string& status,
                                  const std::string& error_code = "") {
  auto log = StructuredLog().Event("update_status").Field("camera", camera).Field("status", status);
  if (!error_code.empty()) {
    log.Field("error_code", error_code);
  }
  log.Warn();
}

/**
 * @brief Log an accumulated snapshot error that did not flip the status
 */
inline void LogLivenessWarning(const std::string& camera, const std::string& error_code, int error_total) {
  StructuredLog()
      .Event("update_status")
      .Field("camera", camera)
      .Field("status", "error")
      .Field("error_code", error_code)
      .Field("error_total", static_cast<int64_t>(error_total))
      .Warn();
}

/**
 * @brief Log liveness persistence or notification failure
 */
inline void LogLivenessError(const std::string& operation, const std::string& camera, const std::string& error_msg) {
  StructuredLog()
      .Event("liveness_error")
      .Field("operation", operation)
      .Field("camera", camera)
      .Field("error", error_msg)
      .Error();
}

/**
 * @brief Log deletion of an expired day-partition
 */
inline void LogRetentionDelete(const std::string& camera, const std::string& day, uint64_t removed_entries) {
  StructuredLog()
      .Event("snapshot_delete_disk")
      .Field("camera", camera)
      .Field("day", day)
      .Field("removed_entries", removed_entries)
      .Info();
}

/**
 * @brief Log a failed retention sweep for one camera
 */
inline void LogRetentionError(const std::string& camera, const std::string& error_msg) {
  StructuredLog().Event("snapshot_delete_disk_error").Field("camera", camera).Field("error", error_msg).Error();
}

}  // namespace snapkeep::utils
