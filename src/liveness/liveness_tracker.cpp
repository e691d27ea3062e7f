/**
 * @file liveness_tracker.cpp
 * @brief Liveness state machine implementation
 */

#include "liveness/liveness_tracker.h"

#include "utils/structured_log.h"

namespace snapkeep::liveness {

const char* TransitionName(Transition transition) {
  switch (transition) {
    case Transition::kNone:
      return "none";
    case Transition::kWentOnline:
      return "online";
    case Transition::kWentOffline:
      return "offline";
  }
  return "unknown";
}

LivenessTracker::LivenessTracker(LivenessServices services, cache::KeyValueCache<int>& error_totals,
                                 cache::KeyValueCache<Camera>& cameras, const config::LivenessConfig& config)
    : services_(services),
      error_totals_(error_totals),
      cameras_(cameras),
      offline_threshold_(config.offline_threshold),
      persist_timeout_(config.persist_timeout_ms),
      runner_(std::make_unique<utils::TaskRunner>(static_cast<size_t>(config.notify_threads),
                                                  static_cast<size_t>(config.notify_queue_size))) {}

LivenessTracker::~LivenessTracker() {
  runner_->Shutdown(true);
}

utils::Expected<Transition, utils::Error> LivenessTracker::Update(const std::string& exid,
                                                                  const SnapshotOutcome& outcome) {
  if (exid.empty()) {
    return Transition::kNone;
  }

  auto camera = GetCamera(exid);
  if (!camera) {
    return utils::MakeUnexpected(camera.error());
  }

  if (outcome.success) {
    error_totals_.Put(exid, 0);
    if (camera->is_online) {
      return Transition::kNone;
    }
    ChangeStatus(*camera, outcome.timestamp, true);
    utils::LogLivenessTransition(exid, "online");
    return Transition::kWentOnline;
  }

  const int weight = outcome.error_weight;
  const int error_total = error_totals_.Update(exid, 0, [weight](const int& current) { return current + weight; });

  if (!camera->is_online) {
    return Transition::kNone;
  }
  if (error_total >= offline_threshold_) {
    ChangeStatus(*camera, outcome.timestamp, false);
    error_totals_.Put(exid, 0);
    utils::LogLivenessTransition(exid, "offline", outcome.error_class);
    return Transition::kWentOffline;
  }
  utils::LogLivenessWarning(exid, outcome.error_class, error_total);
  return Transition::kNone;
}

utils::Expected<Camera, utils::Error> LivenessTracker::GetCamera(const std::string& exid) {
  if (auto cached = cameras_.Get(exid)) {
    return std::move(*cached);
  }
  auto camera = services_.repository.GetCamera(exid);
  if (!camera) {
    return utils::MakeUnexpected(camera.error());
  }
  cameras_.Put(exid, *camera);
  return camera;
}

void LivenessTracker::InvalidateCamera(const std::string& exid) {
  cameras_.Delete(exid);
}

int LivenessTracker::ErrorTotal(const std::string& exid) const {
  return error_totals_.GetOrDefault(exid, 0);
}

void LivenessTracker::WaitIdle() {
  runner_->WaitIdle();
}

void LivenessTracker::ChangeStatus(const Camera& camera, TimePoint timestamp, bool online) {
  const CameraStatusUpdate update = MakeStatusUpdate(camera, timestamp, online);
  const Camera updated = ApplyStatusUpdate(camera, update);
  cameras_.Put(camera.exid, updated);

  auto persisted = runner_->RunWithTimeout(
      [this, camera, update, updated]() { return Persist(camera, update, updated); }, persist_timeout_);
  if (!persisted) {
    utils::LogLivenessError("change_camera_status", camera.exid, persisted.error().ToString());
  }

  const bool posted = runner_->Post([this, updated, timestamp, online]() { LogActivity(updated, timestamp, online); });
  if (!posted) {
    utils::LogLivenessError("log_camera_status", camera.exid, "notification queue full or shut down");
  }
}

utils::Expected<void, utils::Error> LivenessTracker::Persist(const Camera& camera, const CameraStatusUpdate& update,
                                                             const Camera& updated) {
  auto written = services_.repository.UpdateCameraStatus(camera, update);
  if (!written) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kPersistenceFailed,
                                                  written.error().message(), camera.exid));
  }

  cameras_.Delete(camera.exid);

  auto enqueued = services_.jobs.Enqueue(kCacheInvalidationQueue, kCacheInvalidationWorker, camera.exid);
  if (!enqueued) {
    return utils::MakeUnexpected(enqueued.error());
  }

  auto users = services_.users.UsersWithAccess(updated);
  if (!users) {
    return utils::MakeUnexpected(users.error());
  }
  for (const auto& username : *users) {
    services_.broadcaster.Broadcast(updated.exid, updated.is_online, username);
  }
  return {};
}

void LivenessTracker::LogActivity(const Camera& camera, TimePoint timestamp, bool online) {
  auto inserted = services_.repository.InsertActivity(CameraActivity{camera.id, online ? "online" : "offline", timestamp});
  if (!inserted) {
    utils::LogLivenessError("insert_activity", camera.exid, inserted.error().ToString());
  }

  if (!camera.is_online_email_owner_notification) {
    return;
  }
  auto mailed = online ? services_.mailer.CameraOnline(camera) : services_.mailer.CameraOffline(camera);
  if (!mailed) {
    utils::LogLivenessError("owner_notification", camera.exid, mailed.error().ToString());
  }
}

}  // namespace snapkeep::liveness
