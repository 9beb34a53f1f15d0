#include "batch_core/db/task_log_repo.hpp"

#include <sqlite_modern_cpp.h>

#include <algorithm>

#include "batch_core/db/pooled_connection.hpp"
#include "batch_core/db/sqlite_error_utils.hpp"
#include "batch_core/db/time_utils.hpp"

namespace batch_core {

namespace {

// Per-row overhead added to the payload length
constexpr long long kLogRowOverheadBytes = 50;

TaskLog make_log(long long id, long long task_id, long long timestamp, const std::string& level,
                 std::string message, std::optional<std::string> raw) {
  TaskLog log;
  log.id = id;
  log.task_id = task_id;
  log.timestamp = millis_to_time_point(timestamp);
  log.level = log_level_from_string(level);
  log.message = std::move(message);
  log.raw = std::move(raw);
  return log;
}

}  // namespace

TaskLogRepo::TaskLogRepo(DatabaseManager& db_manager) : db_manager_(db_manager) {}

TaskLog TaskLogRepo::add_log(long long task_id, LogLevel level, const std::string& message,
                             const std::optional<std::string>& raw) {
  try {
    PooledConnection conn(db_manager_);
    const long long timestamp = now_millis();
    *conn << "INSERT INTO task_logs (task_id, timestamp, level, message, raw) "
             "VALUES (?, ?, ?, ?, ?)"
          << task_id << timestamp << to_string(level) << message << raw;
    return make_log(static_cast<long long>(conn->last_insert_rowid()), task_id, timestamp,
                    to_string(level), message, raw);
  } catch (const sqlite::sqlite_exception& e) {
    if (classify_db_failure(e) == DbFailure::MissingTask) {
      throw NotFoundError(task_id);
    }
    throw TaskLogRepoError(format_db_error("add_log", e));
  }
}

std::vector<TaskLog> TaskLogRepo::get_task_logs(long long task_id, int limit, int offset) {
  try {
    PooledConnection conn(db_manager_);
    std::vector<TaskLog> logs;
    *conn << "SELECT id, task_id, timestamp, level, message, raw FROM task_logs "
             "WHERE task_id = ? ORDER BY timestamp ASC, id ASC LIMIT ? OFFSET ?"
          << task_id << std::max(0, limit) << std::max(0, offset) >>
        [&](long long id, long long owner, long long timestamp, std::string level,
            std::string message, std::optional<std::string> raw) {
          logs.push_back(make_log(id, owner, timestamp, level, std::move(message), std::move(raw)));
        };
    return logs;
  } catch (const sqlite::sqlite_exception& e) {
    throw TaskLogRepoError(format_db_error("get_task_logs", e));
  }
}

std::vector<TaskLog> TaskLogRepo::get_recent_logs(int limit) {
  try {
    PooledConnection conn(db_manager_);
    std::vector<TaskLog> logs;
    *conn << "SELECT tl.id, tl.task_id, tl.timestamp, tl.level, tl.message, tl.raw, t.type "
             "FROM task_logs tl LEFT JOIN tasks t ON tl.task_id = t.id "
             "ORDER BY tl.timestamp DESC, tl.id DESC LIMIT ?"
          << std::max(0, limit) >>
        [&](long long id, long long owner, long long timestamp, std::string level,
            std::string message, std::optional<std::string> raw,
            std::optional<std::string> task_type) {
          TaskLog log =
              make_log(id, owner, timestamp, level, std::move(message), std::move(raw));
          log.task_type = std::move(task_type);
          logs.push_back(std::move(log));
        };
    std::reverse(logs.begin(), logs.end());
    return logs;
  } catch (const sqlite::sqlite_exception& e) {
    throw TaskLogRepoError(format_db_error("get_recent_logs", e));
  }
}

int TaskLogRepo::get_log_count(std::optional<long long> task_id) {
  try {
    PooledConnection conn(db_manager_);
    int count = 0;
    if (task_id) {
      *conn << "SELECT COUNT(*) FROM task_logs WHERE task_id = ?" << *task_id >> count;
    } else {
      *conn << "SELECT COUNT(*) FROM task_logs" >> count;
    }
    return count;
  } catch (const sqlite::sqlite_exception& e) {
    throw TaskLogRepoError(format_db_error("get_log_count", e));
  }
}

long long TaskLogRepo::get_log_size_bytes() {
  try {
    PooledConnection conn(db_manager_);
    long long size = 0;
    *conn << "SELECT COALESCE(SUM(LENGTH(message) + COALESCE(LENGTH(raw), 0) + ?), 0) "
             "FROM task_logs"
          << kLogRowOverheadBytes >>
        size;
    return size;
  } catch (const sqlite::sqlite_exception& e) {
    throw TaskLogRepoError(format_db_error("get_log_size_bytes", e));
  }
}

int TaskLogRepo::clear_task_logs(long long task_id) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "DELETE FROM task_logs WHERE task_id = ?" << task_id;
    return conn->rows_modified();
  } catch (const sqlite::sqlite_exception& e) {
    throw TaskLogRepoError(format_db_error("clear_task_logs", e));
  }
}

int TaskLogRepo::clear_all_logs() {
  try {
    PooledConnection conn(db_manager_);
    *conn << "DELETE FROM task_logs";
    return conn->rows_modified();
  } catch (const sqlite::sqlite_exception& e) {
    throw TaskLogRepoError(format_db_error("clear_all_logs", e));
  }
}

}  // namespace batch_core
