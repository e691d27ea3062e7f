/**
 * @file snapshot_store.h
 * @brief Dual-backend snapshot store (remote object store + local disk)
 *
 * Writes go to the remote store, with the local "latest thumbnail" refreshed
 * on every save. Reads prefer the remote store and fall back to local disk
 * only on a confirmed remote "not found".
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "config/config.h"
#include "storage/address_resolver.h"
#include "storage/local_disk_store.h"
#include "storage/object_store.h"
#include "storage/source_tag.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace snapkeep::storage {

/**
 * @brief Snapshot metadata recovered from a stored file's path
 */
struct SnapshotDescriptor {
  TimePoint created_at;
  std::string notes;
  std::optional<double> motion_level;  ///< Never known from a listing
};

/**
 * @brief Snapshot persistence and retrieval across both backends
 *
 * Thread-safe as long as the backends are (both shipped backends are).
 */
class SnapshotStore {
 public:
  /**
   * @param remote Remote object store (canonical copy)
   * @param local Local disk store (thumbnail cache and fallback reads)
   * @param config Storage roots
   */
  SnapshotStore(ObjectStore& remote, LocalDiskStore& local, config::StorageConfig config);

  /**
   * @brief Store a snapshot and refresh the local thumbnail
   *
   * The remote write must succeed; the thumbnail refresh is best-effort and
   * only logged on failure.
   */
  utils::Expected<void, utils::Error> Save(const std::string& camera_exid, TimePoint timestamp,
                                           std::string_view image, SourceTag tag);

  /**
   * @brief Upload an externally supplied thumbnail, creating or replacing it
   *
   * @param path Local-style path; the local root prefix is rewritten to the remote root
   * @return kBackendFault when the existence probe fails
   */
  utils::Expected<void, utils::Error> SaveThumbnailOverride(const std::string& path, std::string_view image);

  /**
   * @brief Load a snapshot by id
   *
   * Falls back to local disk only when the remote store answers "not found".
   */
  utils::Expected<std::string, utils::Error> Load(const std::string& camera_exid, std::string_view snapshot_id,
                                                  SourceTag tag);

  /**
   * @brief Read the local "latest thumbnail"
   * @return kUnavailable when the thumbnail cannot be read
   */
  utils::Expected<std::string, utils::Error> LoadThumbnail(const std::string& camera_exid) const;

  /**
   * @brief List the snapshots of every source tag in the hour-partition of `from`
   *
   * A failing source tag contributes no descriptors; a failing top-level
   * listing fails the call.
   */
  utils::Expected<std::vector<SnapshotDescriptor>, utils::Error> LoadRange(const std::string& camera_exid,
                                                                          TimePoint from);

  /**
   * @brief Newest snapshot path on local disk
   */
  utils::Expected<std::optional<std::string>, utils::Error> Latest(const std::string& camera_exid);

  /**
   * @brief Newest snapshot path in the remote store
   */
  utils::Expected<std::optional<std::string>, utils::Error> LatestRemote(const std::string& camera_exid);

  /**
   * @brief Map a local-style path into the remote namespace
   */
  std::string ToRemotePath(const std::string& local_path) const;

  const config::StorageConfig& GetConfig() const { return config_; }

 private:
  utils::Expected<std::vector<SnapshotDescriptor>, utils::Error> ListTag(const std::string& camera_exid,
                                                                        TimePoint from,
                                                                        const std::string& tag_directory);

  ObjectStore& remote_;
  LocalDiskStore& local_;
  config::StorageConfig config_;
};

}  // namespace snapkeep::storage
