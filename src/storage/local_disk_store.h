/**
 * @file local_disk_store.h
 * @brief Local disk backend: thumbnail cache, fallback reads and retention deletes
 */

#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "storage/directory_lister.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace snapkeep::storage {

/**
 * @brief Local filesystem access for snapshot files
 *
 * Paths are absolute filesystem paths (already resolved against the local
 * root). All operations are stateless and thread-safe.
 */
class LocalDiskStore : public DirectoryLister {
 public:
  LocalDiskStore() = default;

  /**
   * @brief Read a whole file
   * @return File bytes, kNotFound if absent, kStorageReadError otherwise
   */
  utils::Expected<std::string, utils::Error> Read(const std::string& path) const;

  /**
   * @brief Replace a file's contents, creating parent directories as needed
   *
   * Writes to a sibling temporary file and renames it over the target so a
   * concurrent reader never observes a partially written image.
   */
  utils::Expected<void, utils::Error> Write(const std::string& path, std::string_view bytes);

  utils::Expected<std::vector<std::string>, utils::Error> ListSubdirectories(const std::string& directory) override;

  utils::Expected<std::vector<std::string>, utils::Error> ListFiles(const std::string& directory,
                                                                   size_t limit) override;

  /**
   * @brief Delete a directory tree one entry at a time, deepest first
   *
   * A missing directory is not an error (returns 0).
   *
   * @param path Directory to delete
   * @param between_entries Called after each deleted entry (throttling hook; may be empty)
   * @return Number of entries removed, including `path` itself
   */
  utils::Expected<uint64_t, utils::Error> RemoveTree(const std::string& path,
                                                     const std::function<void()>& between_entries);
};

}  // namespace snapkeep::storage
