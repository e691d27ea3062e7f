/**
 * @file config.h
 * @brief Configuration structures and YAML parser for snapkeep
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "utils/error.h"
#include "utils/expected.h"

namespace snapkeep::config {

// Default values for configuration
namespace defaults {

// Storage defaults
constexpr const char* kLocalRoot = "/storage";
constexpr const char* kRemoteUrl = "http://localhost:8888";

// Remote backend defaults
constexpr int kUploadPoolSize = 4;
constexpr int kDownloadPoolSize = 8;
constexpr int kConnectTimeoutMs = 3000;
constexpr int kReadTimeoutMs = 10000;
constexpr int kWriteTimeoutMs = 10000;
constexpr int kListingPageSize = 3600;  // one file per second of an hour-partition

// Retention defaults
constexpr int kDeletePauseMs = 10;

// Liveness defaults
constexpr int kOfflineThreshold = 100;
constexpr int kPersistTimeoutMs = 1000;
constexpr int kNotifyThreads = 2;
constexpr int kNotifyQueueSize = 1024;

// Cache defaults
constexpr size_t kCacheMaxEntries = 100000;
constexpr int kCameraTtlSeconds = 300;

}  // namespace defaults

/**
 * @brief Storage layout configuration
 */
struct StorageConfig {
  std::string local_root = defaults::kLocalRoot;  ///< Local disk cache root
  std::string remote_url = defaults::kRemoteUrl;  ///< Remote object store base URL
  std::string remote_root;                        ///< Path prefix inside the remote namespace (empty = none)
};

/**
 * @brief Remote object store client configuration
 */
struct RemoteConfig {
  int upload_pool_size = defaults::kUploadPoolSize;      ///< Connections reserved for uploads
  int download_pool_size = defaults::kDownloadPoolSize;  ///< Connections reserved for downloads/listings
  int connect_timeout_ms = defaults::kConnectTimeoutMs;
  int read_timeout_ms = defaults::kReadTimeoutMs;
  int write_timeout_ms = defaults::kWriteTimeoutMs;
  int listing_page_size = defaults::kListingPageSize;  ///< `limit` query parameter for file listings
};

/**
 * @brief Retention sweeper configuration
 */
struct RetentionConfig {
  int delete_pause_ms = defaults::kDeletePauseMs;  ///< Pause between deleted entries
  bool idle_io_priority = true;                    ///< Run sweeps in the idle I/O scheduling class
};

/**
 * @brief Liveness state machine configuration
 */
struct LivenessConfig {
  int offline_threshold = defaults::kOfflineThreshold;    ///< Accumulated error weight that flips a camera offline
  int persist_timeout_ms = defaults::kPersistTimeoutMs;  ///< Bound on transition persistence
  int notify_threads = defaults::kNotifyThreads;          ///< Workers for fire-and-forget notifications
  int notify_queue_size = defaults::kNotifyQueueSize;     ///< Pending notification bound
};

/**
 * @brief Ephemeral cache configuration
 */
struct CacheConfig {
  size_t max_entries = defaults::kCacheMaxEntries;       ///< Per-cache entry bound
  int camera_ttl_seconds = defaults::kCameraTtlSeconds;  ///< Cached camera view lifetime (0 = no TTL)
};

/**
 * @brief Logging configuration
 */
struct LoggingConfig {
  std::string level = "info";  ///< Log level: trace, debug, info, warn, error
  bool json = true;            ///< Use structured JSON logging
  std::string file;            ///< Log file path (empty = stderr console)
};

/**
 * @brief Root configuration
 */
struct Config {
  StorageConfig storage;      ///< Storage layout
  RemoteConfig remote;        ///< Remote object store client
  RetentionConfig retention;  ///< Retention sweeper
  LivenessConfig liveness;    ///< Liveness state machine
  CacheConfig cache;          ///< Ephemeral caches
  LoggingConfig logging;      ///< Logging
};

/**
 * @brief Load configuration from YAML file
 *
 * @param path Path to YAML configuration file
 * @return Expected<Config, Error> with configuration or error
 */
utils::Expected<Config, utils::Error> LoadConfig(const std::string& path);

/**
 * @brief Validate configuration
 *
 * @param config Configuration to validate
 * @return Expected<void, Error> with success or validation error
 */
utils::Expected<void, utils::Error> ValidateConfig(const Config& config);

}  // namespace snapkeep::config
