/**
 * @file config.cpp
 * @brief Configuration parser implementation for snapkeep
 */

#include "config/config.h"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json-schema.hpp>
#include <nlohmann/json.hpp>

#include "config/config_schema_embedded.h"
#include "utils/error.h"
#include "utils/structured_log.h"

using nlohmann::json;
using nlohmann::json_schema::json_validator;

namespace snapkeep::config {

namespace {

/**
 * @brief Convert YAML node to JSON (recursive)
 *
 * @param yaml_node YAML node to convert
 * @return nlohmann::json JSON representation
 */
nlohmann::json YamlToJson(const YAML::Node& yaml_node) {
  if (yaml_node.IsNull()) {
    return nlohmann::json();
  }

  if (yaml_node.IsScalar()) {
    // Try different types
    try {
      return yaml_node.as<int64_t>();
    } catch (const YAML::Exception&) {
      try {
        return yaml_node.as<double>();
      } catch (const YAML::Exception&) {
        try {
          return yaml_node.as<bool>();
        } catch (const YAML::Exception&) {
          return yaml_node.as<std::string>();
        }
      }
    }
  }

  if (yaml_node.IsSequence()) {
    nlohmann::json json_array = nlohmann::json::array();
    for (const auto& item : yaml_node) {
      json_array.push_back(YamlToJson(item));
    }
    return json_array;
  }

  if (yaml_node.IsMap()) {
    nlohmann::json json_object;
    for (const auto& pair : yaml_node) {
      std::string key = pair.first.as<std::string>();
      json_object[key] = YamlToJson(pair.second);
    }
    return json_object;
  }

  return nlohmann::json();
}

/**
 * @brief Read an optional scalar, keeping the default when the key is absent
 */
template <typename T>
T GetYamlValue(const YAML::Node& node, const std::string& key, const T& default_value) {
  if (!node[key]) {
    return default_value;
  }
  try {
    return node[key].as<T>();
  } catch (const YAML::Exception& e) {
    std::stringstream err;
    err << "Failed to parse config key '" << key << "': " << e.what();
    throw std::runtime_error(err.str());
  }
}

/**
 * @brief Parse storage configuration
 */
StorageConfig ParseStorageConfig(const YAML::Node& node) {
  StorageConfig config;

  config.local_root = GetYamlValue<std::string>(node, "local_root", config.local_root);
  config.remote_url = GetYamlValue<std::string>(node, "remote_url", config.remote_url);
  config.remote_root = GetYamlValue<std::string>(node, "remote_root", config.remote_root);

  return config;
}

/**
 * @brief Parse remote object store configuration
 */
RemoteConfig ParseRemoteConfig(const YAML::Node& node) {
  RemoteConfig config;

  if (node["upload_pool_size"]) {
    config.upload_pool_size = node["upload_pool_size"].as<int>();
  }
  if (node["download_pool_size"]) {
    config.download_pool_size = node["download_pool_size"].as<int>();
  }
  if (node["connect_timeout_ms"]) {
    config.connect_timeout_ms = node["connect_timeout_ms"].as<int>();
  }
  if (node["read_timeout_ms"]) {
    config.read_timeout_ms = node["read_timeout_ms"].as<int>();
  }
  if (node["write_timeout_ms"]) {
    config.write_timeout_ms = node["write_timeout_ms"].as<int>();
  }
  if (node["listing_page_size"]) {
    config.listing_page_size = node["listing_page_size"].as<int>();
  }

  return config;
}

/**
 * @brief Parse retention configuration
 */
RetentionConfig ParseRetentionConfig(const YAML::Node& node) {
  RetentionConfig config;

  if (node["delete_pause_ms"]) {
    config.delete_pause_ms = node["delete_pause_ms"].as<int>();
  }
  if (node["idle_io_priority"]) {
    config.idle_io_priority = node["idle_io_priority"].as<bool>();
  }

  return config;
}

/**
 * @brief Parse liveness configuration
 */
LivenessConfig ParseLivenessConfig(const YAML::Node& node) {
  LivenessConfig config;

  if (node["offline_threshold"]) {
    config.offline_threshold = node["offline_threshold"].as<int>();
  }
  if (node["persist_timeout_ms"]) {
    config.persist_timeout_ms = node["persist_timeout_ms"].as<int>();
  }
  if (node["notify_threads"]) {
    config.notify_threads = node["notify_threads"].as<int>();
  }
  if (node["notify_queue_size"]) {
    config.notify_queue_size = node["notify_queue_size"].as<int>();
  }

  return config;
}

/**
 * @brief Parse cache configuration
 */
CacheConfig ParseCacheConfig(const YAML::Node& node) {
  CacheConfig config;

  if (node["max_entries"]) {
    config.max_entries = node["max_entries"].as<size_t>();
  }
  if (node["camera_ttl_seconds"]) {
    config.camera_ttl_seconds = node["camera_ttl_seconds"].as<int>();
  }

  return config;
}

/**
 * @brief Parse logging configuration
 */
LoggingConfig ParseLoggingConfig(const YAML::Node& node) {
  LoggingConfig config;

  if (node["level"]) {
    config.level = node["level"].as<std::string>();
  }
  if (node["json"]) {
    config.json = node["json"].as<bool>();
  }
  if (node["file"]) {
    config.file = node["file"].as<std::string>();
  }

  return config;
}

/**
 * @brief Validate configuration against JSON Schema
 *
 * @param config_json JSON representation of configuration
 * @return Expected<void, Error> with success or validation error
 */
utils::Expected<void, utils::Error> ValidateConfigSchema(const nlohmann::json& config_json) {
  try {
    // Parse embedded schema
    json schema_json = json::parse(kConfigSchemaJson);

    // Create validator
    json_validator validator;
    validator.set_root_schema(schema_json);

    // Validate
    try {
      validator.validate(config_json);
      utils::StructuredLog().Event("config_validation").Field("status", "passed").Info();
    } catch (const std::exception& e) {
      std::stringstream err_msg;
      err_msg << "Configuration validation failed:\n";
      err_msg << "  " << e.what() << "\n\n";
      err_msg << "  Common configuration issues:\n";
      err_msg << "    - Unknown keys (check section and key spelling)\n";
      err_msg << "    - Invalid data types (string instead of number, etc.)\n";
      err_msg << "    - Invalid enum values (check allowed values)\n";
      err_msg << "    - Out of range values (check min/max constraints)\n\n";
      err_msg << "  Please check your configuration against config_schema.json.";
      return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kConfigValidationError, err_msg.str()));
    }
  } catch (const json::parse_error& e) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigParseError, std::string("JSON parse error: ") + e.what()));
  }

  return {};
}

}  // namespace

utils::Expected<Config, utils::Error> LoadConfig(const std::string& path) {
  try {
    // Load YAML file
    YAML::Node root = YAML::LoadFile(path);

    // Convert to JSON for schema validation
    nlohmann::json config_json = YamlToJson(root);

    // Validate against JSON Schema
    auto validation_result = ValidateConfigSchema(config_json);
    if (!validation_result) {
      return utils::MakeUnexpected(validation_result.error());
    }

    Config config;

    // Parse each section
    if (root["storage"]) {
      config.storage = ParseStorageConfig(root["storage"]);
    }
    if (root["remote"]) {
      config.remote = ParseRemoteConfig(root["remote"]);
    }
    if (root["retention"]) {
      config.retention = ParseRetentionConfig(root["retention"]);
    }
    if (root["liveness"]) {
      config.liveness = ParseLivenessConfig(root["liveness"]);
    }
    if (root["cache"]) {
      config.cache = ParseCacheConfig(root["cache"]);
    }
    if (root["logging"]) {
      config.logging = ParseLoggingConfig(root["logging"]);
    }

    // Validate configuration (semantic validation)
    auto semantic_validation = ValidateConfig(config);
    if (!semantic_validation) {
      return utils::MakeUnexpected(semantic_validation.error());
    }

    return config;

  } catch (const YAML::BadFile& e) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigFileNotFound, "Failed to open config file: " + std::string(e.what())));
  } catch (const YAML::Exception& e) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigYamlError, "YAML parsing error: " + std::string(e.what())));
  } catch (const std::exception& e) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigParseError, "Configuration error: " + std::string(e.what())));
  }
}

utils::Expected<void, utils::Error> ValidateConfig(const Config& config) {
  // Validate storage configuration
  if (config.storage.local_root.empty()) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigInvalidValue, "storage.local_root must not be empty"));
  }
  if (config.storage.remote_url.rfind("http://", 0) != 0 && config.storage.remote_url.rfind("https://", 0) != 0) {
    return utils::MakeUnexpected(utils::MakeError(
        utils::ErrorCode::kConfigInvalidValue,
        "storage.remote_url must start with http:// or https:// (got: " + config.storage.remote_url + ")"));
  }
  if (!config.storage.remote_root.empty() && config.storage.remote_root.back() == '/') {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigInvalidValue, "storage.remote_root must not end with '/'"));
  }

  // Validate remote configuration
  if (config.remote.upload_pool_size <= 0) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigInvalidValue, "remote.upload_pool_size must be greater than 0"));
  }
  if (config.remote.download_pool_size <= 0) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigInvalidValue, "remote.download_pool_size must be greater than 0"));
  }
  if (config.remote.connect_timeout_ms <= 0 || config.remote.read_timeout_ms <= 0 ||
      config.remote.write_timeout_ms <= 0) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigInvalidValue, "remote timeouts must be greater than 0"));
  }
  if (config.remote.listing_page_size <= 0) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigInvalidValue, "remote.listing_page_size must be greater than 0"));
  }

  // Validate retention configuration
  if (config.retention.delete_pause_ms < 0) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigInvalidValue, "retention.delete_pause_ms must be >= 0"));
  }

  // Validate liveness configuration
  if (config.liveness.offline_threshold <= 0) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigInvalidValue, "liveness.offline_threshold must be greater than 0"));
  }
  if (config.liveness.persist_timeout_ms <= 0) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigInvalidValue, "liveness.persist_timeout_ms must be greater than 0"));
  }
  if (config.liveness.notify_threads <= 0) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigInvalidValue, "liveness.notify_threads must be greater than 0"));
  }
  if (config.liveness.notify_queue_size < 0) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kConfigInvalidValue,
                                                  "liveness.notify_queue_size must be >= 0 (0 = unbounded)"));
  }

  // Validate cache configuration
  if (config.cache.max_entries == 0) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigInvalidValue, "cache.max_entries must be greater than 0"));
  }
  if (config.cache.camera_ttl_seconds < 0) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kConfigInvalidValue,
                                                  "cache.camera_ttl_seconds must be >= 0 (0 = no TTL)"));
  }

  // Validate logging configuration
  if (config.logging.level != "trace" && config.logging.level != "debug" && config.logging.level != "info" &&
      config.logging.level != "warn" && config.logging.level != "error") {
    return utils::MakeUnexpected(utils::MakeError(
        utils::ErrorCode::kConfigInvalidValue,
        "logging.level must be one of: trace, debug, info, warn, error (got: " + config.logging.level + ")"));
  }

  return {};
}

}  // namespace snapkeep::config
