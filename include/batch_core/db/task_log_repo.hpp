#pragma once

#include <optional>
#include <string>
#include <vector>

#include "batch_core/db/database_manager.hpp"
#include "batch_core/db/models/task_log.hpp"
#include "batch_core/errors.hpp"

namespace batch_core {

class TaskLogRepoError : public StoreError {
 public:
  using StoreError::StoreError;
};

// Append-only per-task log lines.
class TaskLogRepo {
 public:
  explicit TaskLogRepo(DatabaseManager& db_manager);

  TaskLog add_log(long long task_id, LogLevel level, const std::string& message,
                  const std::optional<std::string>& raw = std::nullopt);

  // Oldest first
  std::vector<TaskLog> get_task_logs(long long task_id, int limit = 1000, int offset = 0);

  // The newest `limit` lines across all tasks, returned oldest first with the
  // owning task's type attached.
  std::vector<TaskLog> get_recent_logs(int limit = 100);

  int get_log_count(std::optional<long long> task_id = std::nullopt);
  // Rough byte size of stored log payloads
  long long get_log_size_bytes();

  int clear_task_logs(long long task_id);
  int clear_all_logs();

 private:
  DatabaseManager& db_manager_;
};

}  // namespace batch_core
