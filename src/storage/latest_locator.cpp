/**
 * @file latest_locator.cpp
 * @brief Latest snapshot locator implementation
 */

#include "storage/latest_locator.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <vector>

#include "storage/address_resolver.h"

namespace snapkeep::storage {

namespace {

// Widths of the YYYY, MM, DD and HH directory levels
constexpr std::array<size_t, 4> kLevelWidths = {4, 2, 2, 2};

bool IsDigits(std::string_view text, size_t width) {
  return text.size() == width &&
         std::all_of(text.begin(), text.end(), [](unsigned char chr) { return std::isdigit(chr) != 0; });
}

std::string Join(const std::string& directory, const std::string& name) {
  if (!directory.empty() && directory.back() == '/') {
    return directory + name;
  }
  return directory + "/" + name;
}

std::string_view TimeSuffix(std::string_view path) {
  return path.size() <= kPathTimeSuffixLength ? path : path.substr(path.size() - kPathTimeSuffixLength);
}

/**
 * @brief Last (in sorted order) name accepted by `accept`, or empty when none
 */
template <typename Predicate>
std::string LastMatching(std::vector<std::string> names, Predicate accept) {
  std::sort(names.begin(), names.end());
  for (auto iter = names.rbegin(); iter != names.rend(); ++iter) {
    if (accept(*iter)) {
      return *iter;
    }
  }
  return {};
}

/**
 * @brief Descend one source tag directory
 * @return Newest snapshot path of this tag, empty string when the tag has none
 */
utils::Expected<std::string, utils::Error> LatestInTag(DirectoryLister& lister, const std::string& tag_directory) {
  std::string directory = tag_directory;
  for (size_t width : kLevelWidths) {
    auto children = lister.ListSubdirectories(directory);
    if (!children) {
      if (children.error().code() == utils::ErrorCode::kNotFound) {
        return std::string();
      }
      return utils::MakeUnexpected(children.error());
    }
    auto last = LastMatching(std::move(*children), [width](const std::string& name) { return IsDigits(name, width); });
    if (last.empty()) {
      return std::string();
    }
    directory = Join(directory, last);
  }

  auto files = lister.ListFiles(directory, 0);
  if (!files) {
    if (files.error().code() == utils::ErrorCode::kNotFound) {
      return std::string();
    }
    return utils::MakeUnexpected(files.error());
  }
  auto last = LastMatching(std::move(*files), [](const std::string& name) { return IsSnapshotFileName(name); });
  if (last.empty()) {
    return std::string();
  }
  return Join(directory, last);
}

}  // namespace

bool IsSnapshotFileName(std::string_view name) {
  // mm_ss_fff.jpg
  constexpr size_t kLength = 13;
  if (name.size() != kLength || name == kThumbnailFileName) {
    return false;
  }
  return IsDigits(name.substr(0, 2), 2) && name[2] == '_' && IsDigits(name.substr(3, 2), 2) && name[5] == '_' &&
         IsDigits(name.substr(6, 3), 3) && name.substr(9) == ".jpg";
}

utils::Expected<std::optional<std::string>, utils::Error> FindLatestSnapshot(DirectoryLister& lister,
                                                                             const std::string& snapshots_root) {
  auto tags = lister.ListSubdirectories(snapshots_root);
  if (!tags) {
    if (tags.error().code() == utils::ErrorCode::kNotFound) {
      return std::optional<std::string>();
    }
    return utils::MakeUnexpected(tags.error());
  }

  std::optional<std::string> latest;
  for (const auto& tag : *tags) {
    auto candidate = LatestInTag(lister, Join(snapshots_root, tag));
    if (!candidate) {
      return utils::MakeUnexpected(candidate.error());
    }
    if (candidate->empty()) {
      continue;
    }
    if (!latest || TimeSuffix(*candidate) > TimeSuffix(*latest)) {
      latest = std::move(*candidate);
    }
  }
  return latest;
}

}  // namespace snapkeep::storage
