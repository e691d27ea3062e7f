/**
 * @file collaborators.h
 * @brief External services consumed by the liveness core
 *
 * The relational store, user directory, broadcast channel, job queue,
 * mailer and motion comparison live outside this project; they are
 * injected through these interfaces.
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "liveness/camera.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace snapkeep::liveness {

/**
 * @brief Durable camera, activity and snapshot rows
 */
class CameraRepository {
 public:
  virtual ~CameraRepository() = default;

  /**
   * @return kCameraNotFound when no camera has this exid
   */
  virtual utils::Expected<Camera, utils::Error> GetCamera(const std::string& exid) = 0;

  virtual utils::Expected<void, utils::Error> UpdateCameraStatus(const Camera& camera,
                                                                 const CameraStatusUpdate& update) = 0;

  virtual utils::Expected<void, utils::Error> InsertActivity(const CameraActivity& activity) = 0;

  virtual utils::Expected<void, utils::Error> InsertSnapshotRecord(const SnapshotRecord& record) = 0;
};

class UserDirectory {
 public:
  virtual ~UserDirectory() = default;

  /**
   * @brief Usernames of every user with access to `camera`
   */
  virtual utils::Expected<std::vector<std::string>, utils::Error> UsersWithAccess(const Camera& camera) = 0;
};

class StatusBroadcaster {
 public:
  virtual ~StatusBroadcaster() = default;

  virtual void Broadcast(const std::string& exid, bool is_online, const std::string& username) = 0;
};

/**
 * @brief Background job queue shared with other services
 */
class JobQueue {
 public:
  virtual ~JobQueue() = default;

  virtual utils::Expected<void, utils::Error> Enqueue(const std::string& queue, const std::string& worker,
                                                      const std::string& argument) = 0;
};

class Mailer {
 public:
  virtual ~Mailer() = default;

  virtual utils::Expected<void, utils::Error> CameraOnline(const Camera& camera) = 0;
  virtual utils::Expected<void, utils::Error> CameraOffline(const Camera& camera) = 0;
};

/**
 * @brief Opaque motion comparison between two consecutive images
 */
class MotionComparator {
 public:
  virtual ~MotionComparator() = default;

  virtual utils::Expected<double, utils::Error> Compare(const std::string& exid, std::string_view current,
                                                        std::string_view previous) = 0;
};

}  // namespace snapkeep::liveness
