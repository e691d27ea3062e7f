/**
 * @file object_store.h
 * @brief Remote distributed object store interface
 *
 * The remote store holds the canonical copy of every snapshot. Paths are
 * absolute within the store's namespace ("/{camera}/snapshots/...").
 */

#pragma once

#include <string>
#include <string_view>

#include "storage/directory_lister.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace snapkeep::storage {

/**
 * @brief Remote object store client
 *
 * Error contract:
 * - kNotFound only for a definitive "not found" answer from the store.
 * - kBackendFault for everything else (connection failure, timeout,
 *   5xx, malformed listing body). A fault is never reported as absence.
 */
class ObjectStore : public DirectoryLister {
 public:
  ~ObjectStore() override = default;

  /**
   * @brief Lightweight existence probe (metadata only)
   */
  virtual utils::Expected<bool, utils::Error> Exists(const std::string& path) = 0;

  /**
   * @brief Upload a new object
   */
  virtual utils::Expected<void, utils::Error> Create(const std::string& path, std::string_view bytes) = 0;

  /**
   * @brief Replace an existing object
   */
  virtual utils::Expected<void, utils::Error> Replace(const std::string& path, std::string_view bytes) = 0;

  /**
   * @brief Download an object
   */
  virtual utils::Expected<std::string, utils::Error> Get(const std::string& path) = 0;
};

}  // namespace snapkeep::storage
