#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

#include "batch_core/db/connection_pool.hpp"

namespace batch_core {

// Process-wide owner of the task store. Migrates the schema on a dedicated
// connection, then serves the pool to PooledConnection guards.
class DatabaseManager {
 public:
  static DatabaseManager& get_instance();

  // Creates the parent directory if needed. Calling again while initialized
  // does nothing, even with different arguments.
  void initialize(const std::filesystem::path& db_path, const std::string& db_key,
                  const PoolOptions& options);
  void initialize(const std::filesystem::path& db_path, const std::string& db_key, int pool_size);

  // Closes the pool. Guards still holding a connection drop it on release.
  void shutdown();

  bool is_initialized() const { return initialized_.load(); }
  const std::filesystem::path& db_path() const { return db_path_; }
  int schema_version() const { return schema_version_; }

  DatabaseManager(const DatabaseManager&) = delete;
  DatabaseManager& operator=(const DatabaseManager&) = delete;

 private:
  friend class PooledConnection;

  DatabaseManager() = default;

  // Throws StoreError when the store is not open
  std::shared_ptr<ConnectionPool> current_pool();

  int prepare_schema(const std::filesystem::path& db_path, const std::string& db_key,
                     const PoolOptions& options);

  std::mutex init_mtx_;
  std::atomic<bool> initialized_{false};
  std::shared_ptr<ConnectionPool> pool_;
  std::filesystem::path db_path_;
  int schema_version_ = 0;
};

}  // namespace batch_core
