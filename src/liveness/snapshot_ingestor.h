/**
 * @file snapshot_ingestor.h
 * @brief Entry point for capture outcomes: store, record and track liveness
 */

#pragma once

#include <string>

#include "cache/kv_cache.h"
#include "liveness/camera.h"
#include "liveness/collaborators.h"
#include "liveness/liveness_tracker.h"
#include "storage/snapshot_store.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace snapkeep::liveness {

/**
 * @brief Last image seen for a camera (motion level reference)
 */
struct CachedImage {
  std::string image;
  TimePoint timestamp;
  std::string notes;
};

/**
 * @brief Routes capture results to storage, the snapshot table and the liveness tracker
 */
class SnapshotIngestor {
 public:
  SnapshotIngestor(storage::SnapshotStore& store, LivenessTracker& tracker, CameraRepository& repository,
                   MotionComparator& comparator, cache::KeyValueCache<CachedImage>& last_images);

  /**
   * @brief Handle a successful capture
   *
   * Computes the motion level against the previous image, marks the camera
   * alive, stores the image under the recordings tag and appends its
   * snapshot row.
   *
   * @return The appended record; a storage or repository error otherwise
   */
  utils::Expected<SnapshotRecord, utils::Error> OnSnapshot(const std::string& exid, TimePoint timestamp,
                                                           std::string image);

  /**
   * @brief Handle a failed capture
   */
  utils::Expected<Transition, utils::Error> OnSnapshotError(const std::string& exid, TimePoint timestamp,
                                                            const std::string& error_class, int error_weight);

 private:
  std::optional<double> MotionLevel(const std::string& exid, const std::string& image) const;

  storage::SnapshotStore& store_;
  LivenessTracker& tracker_;
  CameraRepository& repository_;
  MotionComparator& comparator_;
  cache::KeyValueCache<CachedImage>& last_images_;
};

}  // namespace snapkeep::liveness
