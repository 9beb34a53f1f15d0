#pragma once

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "batch_core/services/encryption_key_service.hpp"

namespace batch_cli {

class AppConfig {
 public:
  static constexpr const char* DEFAULT_FILE = "batchrc.json";

  std::string database_path;
  // Empty means "<database_path>.key"
  std::string key_file;
  int pool_size;
  bool enqueue_pending_on_run;

  // Load configuration from a JSON file at the given path
  static AppConfig from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename + "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static AppConfig from_json(const nlohmann::json& json_config) {
    if (!json_config.is_object()) {
      throw std::runtime_error("Config must be a JSON object");
    }

    AppConfig config;
    config.database_path = string_or(json_config, "database_path", "./data/batchforge.db");
    config.key_file = string_or(json_config, "key_file", "");

    try {
      config.pool_size = json_config.contains("pool_size") ? json_config.at("pool_size").get<int>() : 4;
    } catch (const nlohmann::json::exception&) {
      // Fallback to default if wrong type provided
      config.pool_size = 4;
    }

    const auto enqueue = json_config.find("enqueue_pending_on_run");
    config.enqueue_pending_on_run =
        (enqueue != json_config.end() && enqueue->is_boolean()) ? enqueue->get<bool>() : true;

    config.validate();
    return config;
  }

  // --config wins; otherwise batchrc.json in the working directory if present
  static AppConfig load(const std::string& explicit_path) {
    if (!explicit_path.empty()) {
      return from_file(explicit_path);
    }
    if (std::filesystem::exists(DEFAULT_FILE)) {
      return from_file(DEFAULT_FILE);
    }
    return from_json(nlohmann::json::object());
  }

  std::filesystem::path resolved_key_file() const {
    if (!key_file.empty()) {
      return key_file;
    }
    return batch_core::EncryptionKeyService::default_key_file(database_path);
  }

 private:
  static std::string string_or(const nlohmann::json& json_config, const char* key, const std::string& fallback) {
    const auto it = json_config.find(key);
    if (it == json_config.end() || !it->is_string()) {
      return fallback;
    }
    return it->get<std::string>();
  }

  void validate() const {
    if (database_path.empty()) {
      throw std::runtime_error("database_path cannot be empty");
    }
    if (pool_size <= 0) {
      throw std::runtime_error("pool_size must be greater than 0");
    }
  }
};

}  // namespace batch_cli
