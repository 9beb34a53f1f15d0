#include "batch_core/db/config_repo.hpp"

#include "batch_core/db/pooled_connection.hpp"
#include "batch_core/db/sqlite_error_utils.hpp"
#include "batch_core/db/time_utils.hpp"
#include "batch_core/db/transaction.hpp"

namespace batch_core {

namespace {

bool is_known_key(const std::string& key) {
  for (const auto& entry : default_config_entries()) {
    if (entry.first == key) {
      return true;
    }
  }
  return false;
}

}  // namespace

ConfigRepo::ConfigRepo(DatabaseManager& db_manager) : db_manager_(db_manager) {}

TaskCenterConfig ConfigRepo::get_all() {
  nlohmann::json stored = nlohmann::json::object();
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT key, value FROM config" >> [&](std::string key, std::string value) {
      auto parsed = nlohmann::json::parse(value, nullptr, false);
      if (!parsed.is_discarded()) {
        stored[key] = std::move(parsed);
      }
    };
  } catch (const sqlite::sqlite_exception& e) {
    throw ConfigRepoError(format_db_error("config get_all", e));
  }
  return merge_config(TaskCenterConfig{}, stored);
}

std::optional<nlohmann::json> ConfigRepo::get(const std::string& key) {
  std::optional<nlohmann::json> result;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT value FROM config WHERE key = ?" << key >> [&](std::string value) {
      auto parsed = nlohmann::json::parse(value, nullptr, false);
      if (!parsed.is_discarded()) {
        result = std::move(parsed);
      }
    };
  } catch (const sqlite::sqlite_exception& e) {
    throw ConfigRepoError(format_db_error("config get", e));
  }
  return result;
}

void ConfigRepo::set(const std::string& key, const nlohmann::json& value) {
  nlohmann::json values = nlohmann::json::object();
  values[key] = value;
  if (is_known_key(key)) {
    patch_from_json(values);
  }
  upsert_all(values, "config set");
}

void ConfigRepo::set_many(const TaskCenterConfigPatch& patch) {
  validate_patch(patch);
  upsert_all(to_json(patch), "config set_many");
}

void ConfigRepo::set_many(const nlohmann::json& values) {
  set_many(patch_from_json(values));
}

void ConfigRepo::reset_to_default() {
  nlohmann::json defaults = nlohmann::json::object();
  for (const auto& entry : default_config_entries()) {
    defaults[entry.first] = entry.second;
  }
  upsert_all(defaults, "config reset_to_default");
}

void ConfigRepo::seed_defaults() {
  PooledConnection conn(db_manager_);
  seed_defaults(*conn);
}

void ConfigRepo::seed_defaults(sqlite::database& db) {
  try {
    Transaction tx(db, "config seed_defaults");
    const long long now = now_millis();
    for (const auto& entry : default_config_entries()) {
      db << "INSERT OR IGNORE INTO config (key, value, updated_at) VALUES (?, ?, ?)"
         << entry.first << entry.second.dump() << now;
    }
    tx.commit();
  } catch (const sqlite::sqlite_exception& e) {
    throw ConfigRepoError(format_db_error("config seed_defaults", e));
  }
}

void ConfigRepo::upsert_all(const nlohmann::json& values, const char* operation) {
  if (values.empty()) {
    return;
  }
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, operation);
    const long long now = now_millis();
    for (auto it = values.begin(); it != values.end(); ++it) {
      *conn << "INSERT INTO config (key, value, updated_at) VALUES (?, ?, ?) "
               "ON CONFLICT(key) DO UPDATE SET value = excluded.value, "
               "updated_at = excluded.updated_at"
            << it.key() << it.value().dump() << now;
    }
    tx.commit();
  } catch (const sqlite::sqlite_exception& e) {
    throw ConfigRepoError(format_db_error(operation, e));
  }
}

}  // namespace batch_core
