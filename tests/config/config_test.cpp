/**
 * @file config_test.cpp
 * @brief Unit tests for configuration parser
 */

#include "config/config.h"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>

using namespace snapkeep::config;

namespace {

void WriteFile(const char* path, const char* contents) {
  std::ofstream file(path);
  file << contents;
}

}  // namespace

/**
 * @brief Test loading valid configuration file
 */
TEST(ConfigTest, LoadValidConfig) {
  auto config_result = LoadConfig("test_config.yaml");
  ASSERT_TRUE(config_result) << "Failed to load config: " << config_result.error().message();
  Config config = *config_result;

  // Storage config
  EXPECT_EQ(config.storage.local_root, "/tmp/snapkeep_test_storage");
  EXPECT_EQ(config.storage.remote_url, "http://127.0.0.1:18888");
  EXPECT_EQ(config.storage.remote_root, "/archive");

  // Remote config
  EXPECT_EQ(config.remote.upload_pool_size, 2);
  EXPECT_EQ(config.remote.download_pool_size, 3);
  EXPECT_EQ(config.remote.connect_timeout_ms, 500);
  EXPECT_EQ(config.remote.read_timeout_ms, 2000);
  EXPECT_EQ(config.remote.write_timeout_ms, 2500);
  EXPECT_EQ(config.remote.listing_page_size, 600);

  // Retention config
  EXPECT_EQ(config.retention.delete_pause_ms, 0);
  EXPECT_FALSE(config.retention.idle_io_priority);

  // Liveness config
  EXPECT_EQ(config.liveness.offline_threshold, 50);
  EXPECT_EQ(config.liveness.persist_timeout_ms, 250);
  EXPECT_EQ(config.liveness.notify_threads, 1);
  EXPECT_EQ(config.liveness.notify_queue_size, 64);

  // Cache config
  EXPECT_EQ(config.cache.max_entries, 5000U);
  EXPECT_EQ(config.cache.camera_ttl_seconds, 30);

  // Logging config
  EXPECT_EQ(config.logging.level, "debug");
  EXPECT_FALSE(config.logging.json);
  EXPECT_EQ(config.logging.file, "/tmp/snapkeep_test.log");
}

/**
 * @brief Test loading non-existent configuration file
 */
TEST(ConfigTest, LoadNonExistentFile) {
  auto config_result = LoadConfig("nonexistent_config.yaml");
  EXPECT_FALSE(config_result);
  EXPECT_EQ(config_result.error().code(), snapkeep::utils::ErrorCode::kConfigFileNotFound);
}

/**
 * @brief Test configuration validation with invalid values
 */
TEST(ConfigTest, ValidateInvalidConfig) {
  Config config;

  config.storage.remote_url = "ftp://filer:21";
  auto result = ValidateConfig(config);
  EXPECT_FALSE(result);
  EXPECT_EQ(result.error().code(), snapkeep::utils::ErrorCode::kConfigInvalidValue);

  config.storage.remote_url = "https://filer.example.com";
  config.storage.remote_root = "/archive/";
  result = ValidateConfig(config);
  EXPECT_FALSE(result);
  EXPECT_EQ(result.error().code(), snapkeep::utils::ErrorCode::kConfigInvalidValue);

  config.storage.remote_root = "/archive";
  config.remote.download_pool_size = 0;
  result = ValidateConfig(config);
  EXPECT_FALSE(result);
  EXPECT_EQ(result.error().code(), snapkeep::utils::ErrorCode::kConfigInvalidValue);

  config.remote.download_pool_size = 8;
  config.liveness.offline_threshold = 0;
  result = ValidateConfig(config);
  EXPECT_FALSE(result);
  EXPECT_EQ(result.error().code(), snapkeep::utils::ErrorCode::kConfigInvalidValue);

  config.liveness.offline_threshold = 100;
  config.retention.delete_pause_ms = -1;
  result = ValidateConfig(config);
  EXPECT_FALSE(result);
  EXPECT_EQ(result.error().code(), snapkeep::utils::ErrorCode::kConfigInvalidValue);

  config.retention.delete_pause_ms = 10;
  config.cache.camera_ttl_seconds = -1;
  result = ValidateConfig(config);
  EXPECT_FALSE(result);
  EXPECT_EQ(result.error().code(), snapkeep::utils::ErrorCode::kConfigInvalidValue);

  config.cache.camera_ttl_seconds = 0;
  config.logging.level = "verbose";
  result = ValidateConfig(config);
  EXPECT_FALSE(result);
  EXPECT_EQ(result.error().code(), snapkeep::utils::ErrorCode::kConfigInvalidValue);

  config.logging.level = "warn";
  EXPECT_TRUE(ValidateConfig(config));
}

/**
 * @brief Test valid configuration passes validation
 */
TEST(ConfigTest, ValidateValidConfig) {
  Config config;
  auto result = ValidateConfig(config);
  EXPECT_TRUE(result) << "Validation failed: " << result.error().message();
}

/**
 * @brief Test loading configuration with minimal settings
 */
TEST(ConfigTest, LoadMinimalConfig) {
  const char* minimal_config = R"(
storage:
  local_root: "/srv/snapshots"
)";
  WriteFile("minimal_test_config.yaml", minimal_config);

  auto config_result = LoadConfig("minimal_test_config.yaml");
  ASSERT_TRUE(config_result) << "Failed to load minimal config: " << config_result.error().message();

  EXPECT_EQ(config_result->storage.local_root, "/srv/snapshots");
  EXPECT_EQ(config_result->storage.remote_url, defaults::kRemoteUrl);
  EXPECT_EQ(config_result->storage.remote_root, "");
  EXPECT_EQ(config_result->remote.listing_page_size, defaults::kListingPageSize);
  EXPECT_EQ(config_result->liveness.offline_threshold, defaults::kOfflineThreshold);

  std::remove("minimal_test_config.yaml");
}

/**
 * @brief Test loading invalid YAML syntax
 */
TEST(ConfigTest, LoadInvalidYAML) {
  const char* invalid_yaml = R"(
storage:
  local_root: "/srv
  remote_url: [unclosed
)";
  WriteFile("invalid_test_config.yaml", invalid_yaml);

  auto config_result = LoadConfig("invalid_test_config.yaml");
  EXPECT_FALSE(config_result);
  EXPECT_EQ(config_result.error().code(), snapkeep::utils::ErrorCode::kConfigYamlError);

  std::remove("invalid_test_config.yaml");
}

/**
 * @brief Unknown keys and wrong types are rejected by the schema
 */
TEST(ConfigTest, SchemaRejectsUnknownKeys) {
  WriteFile("unknown_key_config.yaml", "liveness:\n  offline_treshold: 80\n");
  auto unknown = LoadConfig("unknown_key_config.yaml");
  EXPECT_FALSE(unknown);
  EXPECT_EQ(unknown.error().code(), snapkeep::utils::ErrorCode::kConfigValidationError);
  std::remove("unknown_key_config.yaml");

  WriteFile("wrong_type_config.yaml", "remote:\n  upload_pool_size: \"many\"\n");
  auto wrong_type = LoadConfig("wrong_type_config.yaml");
  EXPECT_FALSE(wrong_type);
  EXPECT_EQ(wrong_type.error().code(), snapkeep::utils::ErrorCode::kConfigValidationError);
  std::remove("wrong_type_config.yaml");
}

/**
 * @brief Semantic rules run after the schema
 */
TEST(ConfigTest, LoadRejectsBadRemoteUrl) {
  WriteFile("bad_url_config.yaml", "storage:\n  remote_url: \"filer:8888\"\n");
  auto config_result = LoadConfig("bad_url_config.yaml");
  EXPECT_FALSE(config_result);
  EXPECT_EQ(config_result.error().code(), snapkeep::utils::ErrorCode::kConfigInvalidValue);
  std::remove("bad_url_config.yaml");
}

/**
 * @brief Test default values
 */
TEST(ConfigTest, DefaultValues) {
  Config config;

  EXPECT_EQ(config.storage.local_root, "/storage");
  EXPECT_EQ(config.storage.remote_url, "http://localhost:8888");
  EXPECT_TRUE(config.storage.remote_root.empty());

  EXPECT_EQ(config.remote.upload_pool_size, 4);
  EXPECT_EQ(config.remote.download_pool_size, 8);
  EXPECT_EQ(config.remote.listing_page_size, 3600);

  EXPECT_EQ(config.retention.delete_pause_ms, 10);
  EXPECT_TRUE(config.retention.idle_io_priority);

  EXPECT_EQ(config.liveness.offline_threshold, 100);
  EXPECT_EQ(config.liveness.persist_timeout_ms, 1000);

  EXPECT_EQ(config.cache.max_entries, 100000U);
  EXPECT_EQ(config.cache.camera_ttl_seconds, 300);

  EXPECT_EQ(config.logging.level, "info");
  EXPECT_TRUE(config.logging.json);
  EXPECT_TRUE(config.logging.file.empty());
}
