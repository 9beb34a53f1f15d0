#include "batch_core/db/database_manager.hpp"

#include <iostream>

#include "batch_core/db/config_repo.hpp"
#include "batch_core/db/migrations.hpp"
#include "batch_core/errors.hpp"

namespace batch_core {

DatabaseManager& DatabaseManager::get_instance() {
  static DatabaseManager instance;
  return instance;
}

void DatabaseManager::initialize(const std::filesystem::path& db_path,
                                 const std::string& db_key,
                                 int pool_size) {
  PoolOptions options;
  options.size = pool_size;
  initialize(db_path, db_key, options);
}

void DatabaseManager::initialize(const std::filesystem::path& db_path,
                                 const std::string& db_key,
                                 const PoolOptions& options) {
  std::lock_guard<std::mutex> lock(init_mtx_);
  if (initialized_) {
    return;
  }

  if (db_path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(db_path.parent_path(), ec);
    if (ec) {
      throw StoreError("Cannot create " + db_path.parent_path().string() + ": " + ec.message());
    }
  }

  schema_version_ = prepare_schema(db_path, db_key, options);
  pool_ = std::make_shared<ConnectionPool>(db_path.string(), db_key, options);
  db_path_ = db_path;
  initialized_ = true;
}

void DatabaseManager::shutdown() {
  std::lock_guard<std::mutex> lock(init_mtx_);
  if (!initialized_) {
    return;
  }
  initialized_ = false;
  pool_->close();
  pool_.reset();
}

std::shared_ptr<ConnectionPool> DatabaseManager::current_pool() {
  std::lock_guard<std::mutex> lock(init_mtx_);
  if (!pool_) {
    throw StoreError("Task store is not open");
  }
  return pool_;
}

int DatabaseManager::prepare_schema(const std::filesystem::path& db_path,
                                    const std::string& db_key,
                                    const PoolOptions& options) {
  auto db = ConnectionPool::open_keyed(db_path.string(), db_key, options.busy_timeout);

  const int applied = run_migrations(*db);
  const int version = current_version(*db);
  if (applied > 0) {
    std::cout << "[DatabaseManager] Migrated " << db_path.filename().string() << " to schema v"
              << version << " (" << applied << " step(s))" << std::endl;
  }

  ConfigRepo::seed_defaults(*db);
  return version;
}

}  // namespace batch_core
