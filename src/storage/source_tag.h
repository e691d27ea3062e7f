/**
 * @file source_tag.h
 * @brief Snapshot source categories and their human-readable labels
 *
 * A source tag names the directory a snapshot is stored under
 * (`<camera>/snapshots/<tag>/...`). Snapshot records carry the matching
 * label in their `notes` column.
 *
 * The label/tag mapping is total in both directions but not symmetric:
 * any unrecognised label maps to `archives`, and `archives` maps back to
 * "User Created". Existing records depend on this categorisation.
 */

#pragma once

#include <cstdint>
#include <string_view>

namespace snapkeep::storage {

/**
 * @brief Snapshot source category
 */
enum class SourceTag : std::uint8_t {
  kRecordings,  ///< Periodic proxy recording ("Proxy")
  kThumbnail,   ///< Thumbnail capture ("Thumbnail")
  kTimelapse,   ///< Timelapse capture ("Timelapse")
  kSnapmail,    ///< SnapMail capture ("SnapMail")
  kArchives,    ///< Anything else ("User Created")
};

/**
 * @brief Directory name used for a tag ("recordings", "thumbnail", ...)
 */
std::string_view ToDirectoryName(SourceTag tag);

/**
 * @brief Parse a directory name; unknown names map to kArchives
 */
SourceTag ParseDirectoryName(std::string_view name);

/**
 * @brief Map a notes label to its tag; unknown labels map to kArchives
 */
SourceTag NotesToTag(std::string_view notes);

/**
 * @brief Map a tag to its notes label
 */
std::string_view TagToNotes(SourceTag tag);

/**
 * @brief Label for a raw directory name as found in a listing
 */
inline std::string_view DirectoryNameToNotes(std::string_view name) {
  return TagToNotes(ParseDirectoryName(name));
}

}  // namespace snapkeep::storage
