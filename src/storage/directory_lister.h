/**
 * @file directory_lister.h
 * @brief Abstract directory listing over local disk or a remote object store
 *
 * Snapshot lookups walk the YYYY/MM/DD/HH hierarchy through this interface
 * so the same traversal works against the local cache and the remote store.
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "utils/error.h"
#include "utils/expected.h"

namespace snapkeep::storage {

/**
 * @brief Directory listing capability
 *
 * Contract:
 * - Names are returned without their parent path, in no particular order.
 * - A directory that does not exist yields kNotFound.
 * - Any other failure yields kBackendFault (remote) or kStorageReadError (local).
 */
class DirectoryLister {
 public:
  virtual ~DirectoryLister() = default;

  /**
   * @brief List the child directories of `directory`
   */
  virtual utils::Expected<std::vector<std::string>, utils::Error> ListSubdirectories(const std::string& directory) = 0;

  /**
   * @brief List the regular files of `directory`
   * @param limit Maximum number of names returned (0 = no limit)
   */
  virtual utils::Expected<std::vector<std::string>, utils::Error> ListFiles(const std::string& directory,
                                                                           size_t limit) = 0;
};

}  // namespace snapkeep::storage
