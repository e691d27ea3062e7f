/**
 * @file snapshot_store.cpp
 * @brief Dual-backend snapshot store implementation
 */

#include "storage/snapshot_store.h"

#include <iterator>

#include "storage/latest_locator.h"
#include "utils/structured_log.h"

namespace snapkeep::storage {

SnapshotStore::SnapshotStore(ObjectStore& remote, LocalDiskStore& local, config::StorageConfig config)
    : remote_(remote), local_(local), config_(std::move(config)) {}

utils::Expected<void, utils::Error> SnapshotStore::Save(const std::string& camera_exid, TimePoint timestamp,
                                                        std::string_view image, SourceTag tag) {
  auto address = Resolve(config_.remote_root, camera_exid, timestamp, tag);
  if (!address) {
    return utils::MakeUnexpected(address.error());
  }

  auto created = remote_.Create(address->FullPath(), image);
  if (!created) {
    return utils::MakeUnexpected(created.error());
  }

  const std::string thumbnail = ThumbnailPath(config_.local_root, camera_exid);
  auto written = local_.Write(thumbnail, image);
  if (!written) {
    utils::LogStorageWarning("thumbnail_save", thumbnail, written.error().ToString());
  }
  return {};
}

utils::Expected<void, utils::Error> SnapshotStore::SaveThumbnailOverride(const std::string& path,
                                                                         std::string_view image) {
  const std::string remote_path = ToRemotePath(path);

  auto exists = remote_.Exists(remote_path);
  if (!exists) {
    utils::LogStorageError("thumbnail_export", remote_path, exists.error().ToString());
    return utils::MakeUnexpected(exists.error());
  }
  return *exists ? remote_.Replace(remote_path, image) : remote_.Create(remote_path, image);
}

utils::Expected<std::string, utils::Error> SnapshotStore::Load(const std::string& camera_exid,
                                                               std::string_view snapshot_id, SourceTag tag) {
  auto timestamp = DecodeSnapshotId(snapshot_id);
  if (!timestamp) {
    return utils::MakeUnexpected(timestamp.error());
  }

  auto remote_address = Resolve(config_.remote_root, camera_exid, *timestamp, tag);
  if (!remote_address) {
    return utils::MakeUnexpected(remote_address.error());
  }

  auto bytes = remote_.Get(remote_address->FullPath());
  if (bytes || bytes.error().code() != utils::ErrorCode::kNotFound) {
    return bytes;
  }

  auto local_address = Resolve(config_.local_root, camera_exid, *timestamp, tag);
  if (!local_address) {
    return utils::MakeUnexpected(local_address.error());
  }
  return local_.Read(local_address->FullPath());
}

utils::Expected<std::string, utils::Error> SnapshotStore::LoadThumbnail(const std::string& camera_exid) const {
  const std::string path = ThumbnailPath(config_.local_root, camera_exid);
  auto bytes = local_.Read(path);
  if (!bytes) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kUnavailable, "Thumbnail unavailable", bytes.error().ToString()));
  }
  return bytes;
}

utils::Expected<std::vector<SnapshotDescriptor>, utils::Error> SnapshotStore::LoadRange(const std::string& camera_exid,
                                                                                       TimePoint from) {
  auto tags = remote_.ListSubdirectories(SnapshotsRoot(config_.remote_root, camera_exid));
  if (!tags) {
    return utils::MakeUnexpected(tags.error());
  }

  std::vector<SnapshotDescriptor> snapshots;
  for (const auto& tag_directory : *tags) {
    auto listed = ListTag(camera_exid, from, tag_directory);
    if (!listed) {
      utils::LogStorageWarning("load_range", tag_directory, listed.error().ToString());
      continue;
    }
    snapshots.insert(snapshots.end(), std::make_move_iterator(listed->begin()),
                     std::make_move_iterator(listed->end()));
  }
  return snapshots;
}

utils::Expected<std::vector<SnapshotDescriptor>, utils::Error> SnapshotStore::ListTag(
    const std::string& camera_exid, TimePoint from, const std::string& tag_directory) {
  auto directory = ConstructDirectoryPath(config_.remote_root, camera_exid, from, tag_directory);
  if (!directory) {
    return utils::MakeUnexpected(directory.error());
  }

  auto files = remote_.ListFiles(*directory, 0);
  if (!files) {
    if (files.error().code() == utils::ErrorCode::kNotFound) {
      return std::vector<SnapshotDescriptor>();
    }
    return utils::MakeUnexpected(files.error());
  }

  const std::string notes(DirectoryNameToNotes(tag_directory));
  std::vector<SnapshotDescriptor> snapshots;
  snapshots.reserve(files->size());
  for (const auto& file_name : *files) {
    auto created_at = ParseSnapshotPath(*directory, file_name);
    if (!created_at) {
      utils::LogStorageWarning("load_range", *directory + file_name, created_at.error().message());
      continue;
    }
    snapshots.push_back(SnapshotDescriptor{*created_at, notes, std::nullopt});
  }
  return snapshots;
}

utils::Expected<std::optional<std::string>, utils::Error> SnapshotStore::Latest(const std::string& camera_exid) {
  return FindLatestSnapshot(local_, SnapshotsRoot(config_.local_root, camera_exid));
}

utils::Expected<std::optional<std::string>, utils::Error> SnapshotStore::LatestRemote(const std::string& camera_exid) {
  return FindLatestSnapshot(remote_, SnapshotsRoot(config_.remote_root, camera_exid));
}

std::string SnapshotStore::ToRemotePath(const std::string& local_path) const {
  std::string_view relative = local_path;
  const std::string_view local_root = config_.local_root;
  if (!local_root.empty() && relative.starts_with(local_root) &&
      (relative.size() == local_root.size() || relative[local_root.size()] == '/')) {
    relative.remove_prefix(local_root.size());
  }
  return config_.remote_root + std::string(relative);
}

}  // namespace snapkeep::storage
