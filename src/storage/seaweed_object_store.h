/**
 * @file seaweed_object_store.h
 * @brief ObjectStore over a SeaweedFS-style filer HTTP API
 *
 * - HEAD   {path}                 existence probe
 * - POST   {path} (multipart)     create
 * - PUT    {path} (multipart)     replace
 * - GET    {path}                 download
 * - GET    {dir}/?limit=N         JSON listing ({"Subdirectories": [...], "Files": [...]})
 */

#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "storage/http_client_pool.h"
#include "storage/object_store.h"

namespace snapkeep::storage {

/**
 * @brief Remote filer client configuration
 */
struct SeaweedOptions {
  std::string base_url;  ///< "http://host:port"
  size_t upload_pool_size = 4;
  size_t download_pool_size = 8;
  size_t listing_page_size = 3600;  ///< Used when ListFiles is called with limit 0
  HttpTimeouts timeouts;
};

/**
 * @brief Filer HTTP client
 *
 * Uploads (with their HEAD probes) and downloads use separate connection
 * pools so a burst of listing traffic cannot starve ingestion.
 */
class SeaweedObjectStore : public ObjectStore {
 public:
  explicit SeaweedObjectStore(SeaweedOptions options);

  utils::Expected<bool, utils::Error> Exists(const std::string& path) override;
  utils::Expected<void, utils::Error> Create(const std::string& path, std::string_view bytes) override;
  utils::Expected<void, utils::Error> Replace(const std::string& path, std::string_view bytes) override;
  utils::Expected<std::string, utils::Error> Get(const std::string& path) override;

  utils::Expected<std::vector<std::string>, utils::Error> ListSubdirectories(const std::string& directory) override;
  utils::Expected<std::vector<std::string>, utils::Error> ListFiles(const std::string& directory,
                                                                   size_t limit) override;

 private:
  utils::Expected<std::vector<std::string>, utils::Error> List(const std::string& directory, const char* field,
                                                              size_t limit);
  utils::Expected<void, utils::Error> Upload(const std::string& method, const std::string& path,
                                             std::string_view bytes);

  SeaweedOptions options_;
  std::shared_ptr<HttpClientPool> upload_pool_;
  std::shared_ptr<HttpClientPool> download_pool_;
};

}  // namespace snapkeep::storage
