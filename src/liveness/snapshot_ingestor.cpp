/**
 * @file snapshot_ingestor.cpp
 * @brief Snapshot ingestor implementation
 */

#include "liveness/snapshot_ingestor.h"

#include "storage/address_resolver.h"
#include "storage/source_tag.h"
#include "utils/structured_log.h"

namespace snapkeep::liveness {

SnapshotIngestor::SnapshotIngestor(storage::SnapshotStore& store, LivenessTracker& tracker,
                                   CameraRepository& repository, MotionComparator& comparator,
                                   cache::KeyValueCache<CachedImage>& last_images)
    : store_(store), tracker_(tracker), repository_(repository), comparator_(comparator), last_images_(last_images) {}

utils::Expected<SnapshotRecord, utils::Error> SnapshotIngestor::OnSnapshot(const std::string& exid,
                                                                          TimePoint timestamp, std::string image) {
  auto camera = tracker_.GetCamera(exid);
  if (!camera) {
    return utils::MakeUnexpected(camera.error());
  }

  const auto tag = storage::SourceTag::kRecordings;
  const std::string notes(storage::TagToNotes(tag));
  const auto motion_level = MotionLevel(exid, image);

  auto transition = tracker_.Update(exid, SnapshotOutcome::Success(timestamp));
  if (!transition) {
    utils::LogLivenessError("update_camera_status", exid, transition.error().ToString());
  }

  auto saved = store_.Save(exid, timestamp, image, tag);
  last_images_.Put(exid, CachedImage{std::move(image), timestamp, notes});
  if (!saved) {
    utils::LogStorageError("save", exid, saved.error().ToString());
    return utils::MakeUnexpected(saved.error());
  }

  SnapshotRecord record{camera->id, timestamp, notes, motion_level, storage::FormatSnapshotId(camera->id, timestamp)};
  auto inserted = repository_.InsertSnapshotRecord(record);
  if (!inserted) {
    return utils::MakeUnexpected(inserted.error());
  }
  return record;
}

utils::Expected<Transition, utils::Error> SnapshotIngestor::OnSnapshotError(const std::string& exid,
                                                                            TimePoint timestamp,
                                                                            const std::string& error_class,
                                                                            int error_weight) {
  return tracker_.Update(exid, SnapshotOutcome::Failure(timestamp, error_class, error_weight));
}

std::optional<double> SnapshotIngestor::MotionLevel(const std::string& exid, const std::string& image) const {
  auto previous = last_images_.Get(exid);
  if (!previous) {
    return std::nullopt;
  }
  auto level = comparator_.Compare(exid, image, previous->image);
  if (!level) {
    utils::StructuredLog()
        .Event("motion_level_error")
        .Field("camera", exid)
        .Field("error", level.error().ToString())
        .Warn();
    return std::nullopt;
  }
  return *level;
}

}  // namespace snapkeep::liveness
