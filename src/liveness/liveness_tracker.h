/**
 * @file liveness_tracker.h
 * @brief Online/offline state machine driven by snapshot outcomes
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "cache/kv_cache.h"
#include "config/config.h"
#include "liveness/camera.h"
#include "liveness/collaborators.h"
#include "utils/error.h"
#include "utils/expected.h"
#include "utils/task_runner.h"

namespace snapkeep::liveness {

/**
 * @brief Status change produced by one outcome
 */
enum class Transition : std::uint8_t {
  kNone,
  kWentOnline,
  kWentOffline,
};

const char* TransitionName(Transition transition);

/**
 * @brief Injected services used on a transition
 */
struct LivenessServices {
  CameraRepository& repository;
  UserDirectory& users;
  StatusBroadcaster& broadcaster;
  JobQueue& jobs;
  Mailer& mailer;
};

/// Queue and worker receiving downstream cache invalidation jobs
inline constexpr const char* kCacheInvalidationQueue = "cache";
inline constexpr const char* kCacheInvalidationWorker = "CacheInvalidationWorker";

/**
 * @brief Per-camera liveness with failure hysteresis
 *
 * - A success brings an offline camera online immediately and always
 *   resets the error accumulator.
 * - Failures add their weight to the accumulator; an online camera goes
 *   offline once it reaches `offline_threshold`.
 *
 * On a transition the cached camera view is updated first, then the
 * durable update, cache invalidation and user broadcast run on a worker
 * bounded by `persist_timeout_ms`. Failure or timeout there is logged and
 * not rolled back. The activity row and owner email are posted
 * independently and never block the caller.
 *
 * Outcomes for one camera are expected to arrive serialized; different
 * cameras may be updated concurrently.
 */
class LivenessTracker {
 public:
  /**
   * @param services Collaborators (must outlive the tracker)
   * @param error_totals Error accumulator cache, keyed by exid
   * @param cameras Full camera view cache, keyed by exid
   * @param config Thresholds and notification pool settings
   */
  LivenessTracker(LivenessServices services, cache::KeyValueCache<int>& error_totals,
                  cache::KeyValueCache<Camera>& cameras, const config::LivenessConfig& config);

  ~LivenessTracker();

  LivenessTracker(const LivenessTracker&) = delete;
  LivenessTracker& operator=(const LivenessTracker&) = delete;
  LivenessTracker(LivenessTracker&&) = delete;
  LivenessTracker& operator=(LivenessTracker&&) = delete;

  /**
   * @brief Feed one capture outcome
   *
   * An empty exid is ignored.
   *
   * @return The transition taken, or kCameraNotFound when the camera is unknown
   */
  utils::Expected<Transition, utils::Error> Update(const std::string& exid, const SnapshotOutcome& outcome);

  /**
   * @brief Camera from the cached view, loading it from the repository on a miss
   */
  utils::Expected<Camera, utils::Error> GetCamera(const std::string& exid);

  /**
   * @brief Drop the cached view of a camera edited elsewhere
   *
   * The next outcome for it reloads the durable row.
   */
  void InvalidateCamera(const std::string& exid);

  /**
   * @brief Current accumulated failure weight for a camera
   */
  int ErrorTotal(const std::string& exid) const;

  /**
   * @brief Wait for all persistence and notification work queued so far
   */
  void WaitIdle();

 private:
  void ChangeStatus(const Camera& camera, TimePoint timestamp, bool online);
  utils::Expected<void, utils::Error> Persist(const Camera& camera, const CameraStatusUpdate& update,
                                              const Camera& updated);
  void LogActivity(const Camera& camera, TimePoint timestamp, bool online);

  LivenessServices services_;
  cache::KeyValueCache<int>& error_totals_;
  cache::KeyValueCache<Camera>& cameras_;
  int offline_threshold_;
  std::chrono::milliseconds persist_timeout_;

  // Declared last: joined before the members its tasks use are destroyed
  std::unique_ptr<utils::TaskRunner> runner_;
};

}  // namespace snapkeep::liveness
