/**
 * @file liveness_test_fakes.h
 * @brief Recording fakes for the liveness collaborators
 */

#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "liveness/collaborators.h"

namespace snapkeep::liveness::testing {

/**
 * @brief Ordered record of collaborator calls shared by all fakes
 */
class CallLog {
 public:
  void Add(const std::string& call) {
    std::lock_guard lock(mutex_);
    calls_.push_back(call);
  }

  std::vector<std::string> Calls() const {
    std::lock_guard lock(mutex_);
    return calls_;
  }

  /// Position of the first call equal to `call`, -1 when absent
  int IndexOf(const std::string& call) const {
    std::lock_guard lock(mutex_);
    for (size_t i = 0; i < calls_.size(); ++i) {
      if (calls_[i] == call) {
        return static_cast<int>(i);
      }
    }
    return -1;
  }

  int Count(const std::string& call) const {
    std::lock_guard lock(mutex_);
    int count = 0;
    for (const auto& entry : calls_) {
      count += entry == call ? 1 : 0;
    }
    return count;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<std::string> calls_;
};

class FakeCameraRepository : public CameraRepository {
 public:
  explicit FakeCameraRepository(CallLog& log) : log_(log) {}

  utils::Expected<Camera, utils::Error> GetCamera(const std::string& exid) override {
    std::lock_guard lock(mutex_);
    log_.Add("get_camera:" + exid);
    auto iter = cameras_.find(exid);
    if (iter == cameras_.end()) {
      return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kNotFound, "Camera not found", exid));
    }
    return iter->second;
  }

  utils::Expected<void, utils::Error> UpdateCameraStatus(const Camera& camera,
                                                         const CameraStatusUpdate& update) override {
    if (update_delay.count() > 0) {
      std::this_thread::sleep_for(update_delay);
    }
    std::lock_guard lock(mutex_);
    log_.Add("update_status:" + camera.exid);
    if (fail_updates) {
      return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kInternalError, "database unavailable"));
    }
    cameras_[camera.exid] = ApplyStatusUpdate(cameras_[camera.exid], update);
    updates.push_back(update);
    return {};
  }

  utils::Expected<void, utils::Error> InsertActivity(const CameraActivity& activity) override {
    std::lock_guard lock(mutex_);
    log_.Add("activity:" + activity.action);
    activities.push_back(activity);
    return {};
  }

  utils::Expected<void, utils::Error> InsertSnapshotRecord(const SnapshotRecord& record) override {
    std::lock_guard lock(mutex_);
    log_.Add("snapshot_record:" + record.snapshot_id);
    if (fail_snapshot_records) {
      return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kInternalError, "insert failed"));
    }
    records.push_back(record);
    return {};
  }

  void AddCamera(const Camera& camera) {
    std::lock_guard lock(mutex_);
    cameras_[camera.exid] = camera;
  }

  Camera Stored(const std::string& exid) {
    std::lock_guard lock(mutex_);
    return cameras_[exid];
  }

  std::chrono::milliseconds update_delay{0};
  bool fail_updates = false;
  bool fail_snapshot_records = false;
  std::vector<CameraStatusUpdate> updates;
  std::vector<CameraActivity> activities;
  std::vector<SnapshotRecord> records;

 private:
  CallLog& log_;
  std::mutex mutex_;
  std::map<std::string, Camera> cameras_;
};

class FakeUserDirectory : public UserDirectory {
 public:
  explicit FakeUserDirectory(CallLog& log) : log_(log) {}

  utils::Expected<std::vector<std::string>, utils::Error> UsersWithAccess(const Camera& camera) override {
    log_.Add("users:" + camera.exid);
    return users;
  }

  std::vector<std::string> users;

 private:
  CallLog& log_;
};

class FakeBroadcaster : public StatusBroadcaster {
 public:
  explicit FakeBroadcaster(CallLog& log) : log_(log) {}

  void Broadcast(const std::string& exid, bool is_online, const std::string& username) override {
    log_.Add("broadcast:" + exid + ":" + (is_online ? "online" : "offline") + ":" + username);
  }

 private:
  CallLog& log_;
};

class FakeJobQueue : public JobQueue {
 public:
  explicit FakeJobQueue(CallLog& log) : log_(log) {}

  utils::Expected<void, utils::Error> Enqueue(const std::string& queue, const std::string& worker,
                                              const std::string& argument) override {
    log_.Add("enqueue:" + queue + ":" + worker + ":" + argument);
    return {};
  }

 private:
  CallLog& log_;
};

class FakeMailer : public Mailer {
 public:
  explicit FakeMailer(CallLog& log) : log_(log) {}

  utils::Expected<void, utils::Error> CameraOnline(const Camera& camera) override {
    log_.Add("mail_online:" + camera.owner);
    return {};
  }

  utils::Expected<void, utils::Error> CameraOffline(const Camera& camera) override {
    log_.Add("mail_offline:" + camera.owner);
    return {};
  }

 private:
  CallLog& log_;
};

}  // namespace snapkeep::liveness::testing
