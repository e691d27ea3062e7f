/**
 * @file latest_locator.h
 * @brief Locate the most recent snapshot of a camera without a full listing
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "storage/directory_lister.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace snapkeep::storage {

/**
 * @brief Find the newest snapshot under "{root}/{camera}/snapshots"
 *
 * For every source tag directory, descends YYYY -> MM -> DD -> HH taking the
 * lexicographically last child at each level, then the last "mm_ss_fff.jpg"
 * file of that hour. Candidates from different tags are compared by their
 * trailing "YYYY/MM/DD/HH/mm_ss_fff.jpg" suffix.
 *
 * A tag whose hierarchy is empty (or vanishes mid-descent) contributes no
 * candidate. A missing snapshots root yields std::nullopt.
 *
 * @param lister Local or remote directory listing
 * @param snapshots_root "{root}/{camera}/snapshots" (no trailing slash)
 * @return Full path of the newest snapshot, std::nullopt if none exist
 */
utils::Expected<std::optional<std::string>, utils::Error> FindLatestSnapshot(DirectoryLister& lister,
                                                                             const std::string& snapshots_root);

/**
 * @brief True for names of the form "mm_ss_fff.jpg"
 */
bool IsSnapshotFileName(std::string_view name);

}  // namespace snapkeep::storage
