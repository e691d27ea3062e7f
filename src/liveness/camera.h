/**
 * @file camera.h
 * @brief Camera entity and the rows the liveness core writes
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "storage/address_resolver.h"

namespace snapkeep::liveness {

using storage::TimePoint;

/**
 * @brief Subset of the camera row read and mutated by this core
 */
struct Camera {
  int64_t id = 0;
  std::string exid;                   ///< Unique external id
  std::string owner;                  ///< Owner username (notification recipient)
  bool is_online = false;
  std::optional<TimePoint> last_online_at;
  std::optional<TimePoint> last_polled_at;
  std::optional<TimePoint> updated_at;
  int storage_duration = -1;          ///< Retention in days, -1 keeps forever
  bool is_online_email_owner_notification = false;
};

/**
 * @brief Field changes written when a camera's status is persisted
 *
 * updated_at and last_polled_at are always written; is_online only when
 * the status changes; last_online_at only when coming online.
 */
struct CameraStatusUpdate {
  TimePoint updated_at;
  TimePoint last_polled_at;
  std::optional<bool> is_online;
  std::optional<TimePoint> last_online_at;
};

/**
 * @brief Build the status update for `camera` observed with status `online` at `timestamp`
 */
inline CameraStatusUpdate MakeStatusUpdate(const Camera& camera, TimePoint timestamp, bool online) {
  CameraStatusUpdate update{timestamp, timestamp, std::nullopt, std::nullopt};
  if (camera.is_online != online) {
    update.is_online = online;
    if (online) {
      update.last_online_at = timestamp;
    }
  }
  return update;
}

/**
 * @brief Apply a status update to an in-memory camera
 */
inline Camera ApplyStatusUpdate(Camera camera, const CameraStatusUpdate& update) {
  camera.updated_at = update.updated_at;
  camera.last_polled_at = update.last_polled_at;
  if (update.is_online) {
    camera.is_online = *update.is_online;
  }
  if (update.last_online_at) {
    camera.last_online_at = update.last_online_at;
  }
  return camera;
}

/**
 * @brief Append-only camera activity row ("online" / "offline")
 */
struct CameraActivity {
  int64_t camera_id = 0;
  std::string action;
  TimePoint done_at;
};

/**
 * @brief Append-only metadata row for one stored snapshot
 */
struct SnapshotRecord {
  int64_t camera_id = 0;
  TimePoint created_at;
  std::string notes;
  std::optional<double> motion_level;
  std::string snapshot_id;
};

/**
 * @brief Result of one snapshot capture attempt
 */
struct SnapshotOutcome {
  bool success = false;
  TimePoint timestamp;
  std::string error_class = "generic";
  int error_weight = 0;

  static SnapshotOutcome Success(TimePoint timestamp) { return SnapshotOutcome{true, timestamp, "generic", 0}; }

  static SnapshotOutcome Failure(TimePoint timestamp, std::string error_class, int error_weight) {
    return SnapshotOutcome{false, timestamp, std::move(error_class), error_weight};
  }
};

}  // namespace snapkeep::liveness
