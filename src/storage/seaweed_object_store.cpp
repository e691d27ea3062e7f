/**
 * @file seaweed_object_store.cpp
 * @brief Filer HTTP client implementation
 */

#include "storage/seaweed_object_store.h"

#include <nlohmann/json.hpp>

#include "utils/structured_log.h"

using json = nlohmann::json;

namespace snapkeep::storage {

namespace {

// HTTP status codes
constexpr int kHttpOk = 200;
constexpr int kHttpCreated = 201;
constexpr int kHttpNoContent = 204;
constexpr int kHttpNotFound = 404;

constexpr const char* kImageContentType = "image/jpeg";

bool IsSuccess(int status) {
  return status == kHttpOk || status == kHttpCreated || status == kHttpNoContent;
}

std::string FileNameOf(const std::string& path) {
  auto pos = path.rfind('/');
  return pos == std::string::npos ? path : path.substr(pos + 1);
}

std::string ListingTarget(const std::string& directory, size_t limit) {
  std::string target = directory;
  if (target.empty() || target.back() != '/') {
    target += '/';
  }
  if (limit > 0) {
    target += "?limit=" + std::to_string(limit);
  }
  return target;
}

utils::Error TransportFault(const char* operation, const std::string& path, const httplib::Result& result) {
  return utils::MakeError(utils::ErrorCode::kBackendFault,
                          std::string(operation) + " failed: " + httplib::to_string(result.error()), path);
}

utils::Error StatusFault(const char* operation, const std::string& path, int status) {
  return utils::MakeError(utils::ErrorCode::kBackendFault,
                          std::string(operation) + " returned HTTP " + std::to_string(status), path);
}

/**
 * @brief Extract an entry name; the filer uses "Name" for directories and "name" for files
 */
bool EntryName(const json& entry, std::string& name) {
  if (entry.is_string()) {
    name = entry.get<std::string>();
    return true;
  }
  if (!entry.is_object()) {
    return false;
  }
  for (const char* key : {"Name", "name"}) {
    auto iter = entry.find(key);
    if (iter != entry.end() && iter->is_string()) {
      name = iter->get<std::string>();
      return true;
    }
  }
  return false;
}

}  // namespace

SeaweedObjectStore::SeaweedObjectStore(SeaweedOptions options)
    : options_(std::move(options)),
      upload_pool_(std::make_shared<HttpClientPool>(options_.base_url, options_.upload_pool_size, options_.timeouts)),
      download_pool_(
          std::make_shared<HttpClientPool>(options_.base_url, options_.download_pool_size, options_.timeouts)) {}

utils::Expected<bool, utils::Error> SeaweedObjectStore::Exists(const std::string& path) {
  // existence probes precede uploads, so they share the upload pool
  auto client = upload_pool_->Acquire();
  auto result = client->Head(path);
  if (!result) {
    return utils::MakeUnexpected(TransportFault("HEAD", path, result));
  }
  if (result->status == kHttpOk) {
    return true;
  }
  if (result->status == kHttpNotFound) {
    return false;
  }
  return utils::MakeUnexpected(StatusFault("HEAD", path, result->status));
}

utils::Expected<void, utils::Error> SeaweedObjectStore::Create(const std::string& path, std::string_view bytes) {
  return Upload("POST", path, bytes);
}

utils::Expected<void, utils::Error> SeaweedObjectStore::Replace(const std::string& path, std::string_view bytes) {
  return Upload("PUT", path, bytes);
}

utils::Expected<void, utils::Error> SeaweedObjectStore::Upload(const std::string& method, const std::string& path,
                                                               std::string_view bytes) {
  httplib::MultipartFormDataItems items = {
      {"file", std::string(bytes), FileNameOf(path), kImageContentType},
  };

  auto client = upload_pool_->Acquire();
  auto result = method == "PUT" ? client->Put(path, items) : client->Post(path, items);
  if (!result) {
    auto error = TransportFault(method.c_str(), path, result);
    utils::LogStorageError("upload", path, error.message());
    return utils::MakeUnexpected(error);
  }
  if (!IsSuccess(result->status)) {
    auto error = StatusFault(method.c_str(), path, result->status);
    utils::LogStorageError("upload", path, error.message());
    return utils::MakeUnexpected(error);
  }
  return {};
}

utils::Expected<std::string, utils::Error> SeaweedObjectStore::Get(const std::string& path) {
  auto client = download_pool_->Acquire();
  auto result = client->Get(path);
  if (!result) {
    return utils::MakeUnexpected(TransportFault("GET", path, result));
  }
  if (result->status == kHttpNotFound) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kNotFound, "Object not found", path));
  }
  if (result->status != kHttpOk) {
    return utils::MakeUnexpected(StatusFault("GET", path, result->status));
  }
  return std::move(result->body);
}

utils::Expected<std::vector<std::string>, utils::Error> SeaweedObjectStore::ListSubdirectories(
    const std::string& directory) {
  return List(directory, "Subdirectories", 0);
}

utils::Expected<std::vector<std::string>, utils::Error> SeaweedObjectStore::ListFiles(const std::string& directory,
                                                                                     size_t limit) {
  return List(directory, "Files", limit == 0 ? options_.listing_page_size : limit);
}

utils::Expected<std::vector<std::string>, utils::Error> SeaweedObjectStore::List(const std::string& directory,
                                                                                const char* field, size_t limit) {
  const std::string target = ListingTarget(directory, limit);
  const httplib::Headers headers = {{"Accept", "application/json"}};

  auto client = download_pool_->Acquire();
  auto result = client->Get(target, headers);
  if (!result) {
    return utils::MakeUnexpected(TransportFault("LIST", directory, result));
  }
  if (result->status == kHttpNotFound) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kNotFound, "Directory not found", directory));
  }
  if (result->status != kHttpOk) {
    return utils::MakeUnexpected(StatusFault("LIST", directory, result->status));
  }

  json body;
  try {
    body = json::parse(result->body);
  } catch (const json::parse_error& e) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kBackendFault,
                                                  "Invalid listing JSON: " + std::string(e.what()), directory));
  }

  auto entries = body.is_object() ? body.find(field) : body.end();
  // The filer serializes an empty listing as null
  if (entries != body.end() && entries->is_null()) {
    return std::vector<std::string>();
  }
  if (entries == body.end() || !entries->is_array()) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kBackendFault,
                                                  std::string("Listing has no '") + field + "' array", directory));
  }

  std::vector<std::string> names;
  names.reserve(entries->size());
  for (const auto& entry : *entries) {
    std::string name;
    if (!EntryName(entry, name)) {
      return utils::MakeUnexpected(
          utils::MakeError(utils::ErrorCode::kBackendFault, "Listing entry without a name", directory));
    }
    names.push_back(std::move(name));
  }
  return names;
}

}  // namespace snapkeep::storage
