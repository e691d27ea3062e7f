/**
 * @file local_disk_store.cpp
 * @brief Local disk backend implementation
 */

#include "storage/local_disk_store.h"

#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string_view>
#include <system_error>
#include <utility>

#include "utils/structured_log.h"

namespace snapkeep::storage {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kTempMarker = ".tmp.";

std::atomic<uint64_t> g_temp_sequence{0};

// Unique per process and per call, so concurrent writers of one path never share a temp file
std::string TempPathFor(const std::string& path) {
  return path + std::string(kTempMarker) + std::to_string(::getpid()) + "." +
         std::to_string(g_temp_sequence.fetch_add(1));
}

utils::Expected<std::vector<std::string>, utils::Error> ListEntries(const std::string& directory, bool directories,
                                                                    size_t limit) {
  std::error_code ec;
  if (!fs::is_directory(directory, ec)) {
    if (ec && ec != std::errc::no_such_file_or_directory) {
      return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kStorageReadError, ec.message(), directory));
    }
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kNotFound, "directory not found", directory));
  }

  std::vector<std::string> names;
  fs::directory_iterator iter(directory, ec);
  if (ec) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kStorageReadError, ec.message(), directory));
  }
  for (const auto& entry : iter) {
    std::error_code type_ec;
    const bool matches = directories ? entry.is_directory(type_ec) : entry.is_regular_file(type_ec);
    if (type_ec || !matches) {
      continue;
    }
    std::string name = entry.path().filename().string();
    if (!directories && name.find(kTempMarker) != std::string::npos) {
      continue;  // in-flight write
    }
    names.push_back(std::move(name));
  }

  if (limit > 0 && names.size() > limit) {
    std::sort(names.begin(), names.end());
    names.resize(limit);
  }
  return names;
}

}  // namespace

utils::Expected<std::string, utils::Error> LocalDiskStore::Read(const std::string& path) const {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kNotFound, "file not found", path));
  }

  std::ifstream input(path, std::ios::binary);
  if (!input) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kStorageReadError, "failed to open file", path));
  }

  std::ostringstream contents;
  contents << input.rdbuf();
  if (input.bad()) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kStorageReadError, "failed to read file", path));
  }
  return contents.str();
}

utils::Expected<void, utils::Error> LocalDiskStore::Write(const std::string& path, std::string_view bytes) {
  const fs::path target(path);
  std::error_code ec;
  if (target.has_parent_path()) {
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
      utils::LogStorageError("create_directories", target.parent_path().string(), ec.message());
      return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kStorageWriteError, ec.message(), path));
    }
  }

  const std::string temp_path = TempPathFor(path);
  {
    std::ofstream output(temp_path, std::ios::binary | std::ios::trunc);
    if (!output) {
      utils::LogStorageError("write", temp_path, "failed to open file for writing");
      return utils::MakeUnexpected(
          utils::MakeError(utils::ErrorCode::kStorageWriteError, "failed to open file for writing", temp_path));
    }
    output.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    output.flush();
    if (!output) {
      utils::LogStorageError("write", temp_path, "short write");
      fs::remove(temp_path, ec);
      return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kStorageWriteError, "short write", temp_path));
    }
  }

  fs::rename(temp_path, target, ec);
  if (ec) {
    utils::LogStorageError("rename", path, ec.message());
    std::error_code cleanup_ec;
    fs::remove(temp_path, cleanup_ec);
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kStorageWriteError, ec.message(), path));
  }
  return {};
}

utils::Expected<std::vector<std::string>, utils::Error> LocalDiskStore::ListSubdirectories(
    const std::string& directory) {
  return ListEntries(directory, true, 0);
}

utils::Expected<std::vector<std::string>, utils::Error> LocalDiskStore::ListFiles(const std::string& directory,
                                                                                 size_t limit) {
  return ListEntries(directory, false, limit);
}

utils::Expected<uint64_t, utils::Error> LocalDiskStore::RemoveTree(const std::string& path,
                                                                   const std::function<void()>& between_entries) {
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    return uint64_t{0};
  }

  std::vector<fs::path> entries;
  for (fs::recursive_directory_iterator iter(path, ec), end; !ec && iter != end; iter.increment(ec)) {
    entries.push_back(iter->path());
  }
  if (ec) {
    utils::LogStorageError("remove_tree", path, ec.message());
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kStorageDeleteError, ec.message(), path));
  }

  // Reverse lexicographic order visits children before their parent directory
  std::sort(entries.begin(), entries.end(), [](const fs::path& lhs, const fs::path& rhs) { return rhs < lhs; });
  entries.emplace_back(path);

  uint64_t removed = 0;
  for (const auto& entry : entries) {
    if (fs::remove(entry, ec)) {
      ++removed;
    }
    if (ec) {
      utils::LogStorageError("remove_tree", entry.string(), ec.message());
      return utils::MakeUnexpected(
          utils::MakeError(utils::ErrorCode::kStorageDeleteError, ec.message(), entry.string()));
    }
    if (between_entries) {
      between_entries();
    }
  }
  return removed;
}

}  // namespace snapkeep::storage
