/**
 * @file source_tag.cpp
 * @brief Source tag mapping
 */

#include "storage/source_tag.h"

namespace snapkeep::storage {

namespace {

constexpr std::string_view kProxyNotes = "Proxy";
constexpr std::string_view kThumbnailNotes = "Thumbnail";
constexpr std::string_view kTimelapseNotes = "Timelapse";
constexpr std::string_view kSnapmailNotes = "SnapMail";
constexpr std::string_view kUserCreatedNotes = "User Created";

}  // namespace

std::string_view ToDirectoryName(SourceTag tag) {
  switch (tag) {
    case SourceTag::kRecordings:
      return "recordings";
    case SourceTag::kThumbnail:
      return "thumbnail";
    case SourceTag::kTimelapse:
      return "timelapse";
    case SourceTag::kSnapmail:
      return "snapmail";
    case SourceTag::kArchives:
      return "archives";
  }
  return "archives";
}

SourceTag ParseDirectoryName(std::string_view name) {
  if (name == "recordings") {
    return SourceTag::kRecordings;
  }
  if (name == "thumbnail") {
    return SourceTag::kThumbnail;
  }
  if (name == "timelapse") {
    return SourceTag::kTimelapse;
  }
  if (name == "snapmail") {
    return SourceTag::kSnapmail;
  }
  return SourceTag::kArchives;
}

SourceTag NotesToTag(std::string_view notes) {
  if (notes == kProxyNotes) {
    return SourceTag::kRecordings;
  }
  if (notes == kThumbnailNotes) {
    return SourceTag::kThumbnail;
  }
  if (notes == kTimelapseNotes) {
    return SourceTag::kTimelapse;
  }
  if (notes == kSnapmailNotes) {
    return SourceTag::kSnapmail;
  }
  return SourceTag::kArchives;
}

std::string_view TagToNotes(SourceTag tag) {
  switch (tag) {
    case SourceTag::kRecordings:
      return kProxyNotes;
    case SourceTag::kThumbnail:
      return kThumbnailNotes;
    case SourceTag::kTimelapse:
      return kTimelapseNotes;
    case SourceTag::kSnapmail:
      return kSnapmailNotes;
    case SourceTag::kArchives:
      return kUserCreatedNotes;
  }
  return kUserCreatedNotes;
}

}  // namespace snapkeep::storage
