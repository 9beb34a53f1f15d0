#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>
#include <sqlite_modern_cpp.h>

#include "batch_core/db/database_manager.hpp"
#include "batch_core/db/models/task_center_config.hpp"
#include "batch_core/errors.hpp"

namespace batch_core {

class ConfigRepoError : public StoreError {
 public:
  using StoreError::StoreError;
};

// Key/value tunables. Values are stored as serialized JSON.
class ConfigRepo {
 public:
  explicit ConfigRepo(DatabaseManager& db_manager);

  // Defaults overlaid with stored values. Missing or unparsable values keep
  // their default.
  TaskCenterConfig get_all();
  std::optional<nlohmann::json> get(const std::string& key);

  // Known keys are validated first. Throws ValidationError without writing.
  void set(const std::string& key, const nlohmann::json& value);
  void set_many(const TaskCenterConfigPatch& patch);
  void set_many(const nlohmann::json& values);

  // Rewrites every known key to its default. Unknown keys are kept.
  void reset_to_default();

  void seed_defaults();
  // INSERT OR IGNORE of every default, on an already open connection
  static void seed_defaults(sqlite::database& db);

 private:
  void upsert_all(const nlohmann::json& values, const char* operation);

  DatabaseManager& db_manager_;
};

}  // namespace batch_core
