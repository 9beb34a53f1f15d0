#include "batch_core/db/task_repo.hpp"

#include <sqlite_modern_cpp.h>

#include <algorithm>
#include <variant>

#include "batch_core/db/pooled_connection.hpp"
#include "batch_core/db/sqlite_error_utils.hpp"
#include "batch_core/db/time_utils.hpp"
#include "batch_core/db/transaction.hpp"

namespace batch_core {

namespace {

using SqlParam = std::variant<long long, std::string>;

constexpr const char* kTaskColumns =
    "id, type, name, status, priority, created_at, updated_at, started_at, completed_at, "
    "execution_time, output_dir, params, progress, current_step, retry_count, max_retry, "
    "error_code, error_message, error_stack, pid, pid_started_at";

constexpr long long kMillisPerDay = 24LL * 60 * 60 * 1000;

template <typename Binder>
void read_tasks(Binder&& binder, std::vector<Task>& out) {
  binder >> [&](long long id, std::string type, std::string name, std::string status,
                int priority, long long created_at, long long updated_at,
                std::optional<long long> started_at, std::optional<long long> completed_at,
                long long execution_time, std::string output_dir, std::string params,
                int progress, std::optional<std::string> current_step, int retry_count,
                int max_retry, std::optional<std::string> error_code,
                std::optional<std::string> error_message, std::optional<std::string> error_stack,
                std::optional<int> pid, std::optional<long long> pid_started_at) {
    Task task;
    task.id = id;
    task.type = task_type_from_string(type);
    task.name = std::move(name);
    task.status = task_status_from_string(status);
    task.priority = priority;
    task.created_at = millis_to_time_point(created_at);
    task.updated_at = millis_to_time_point(updated_at);
    task.started_at = millis_to_time_point(started_at);
    task.completed_at = millis_to_time_point(completed_at);
    task.execution_time_ms = execution_time;
    task.output_dir = std::move(output_dir);
    task.config = nlohmann::json::parse(params, nullptr, false);
    if (task.config.is_discarded() || !task.config.is_object()) {
      task.config = nlohmann::json::object();
    }
    task.progress = progress;
    task.current_step = std::move(current_step);
    task.retry_count = retry_count;
    task.max_retry = max_retry;
    // Error columns outlive a retry; they are only surfaced on a failed task
    if (task.status == TaskStatus::FAILED && (error_message || error_code)) {
      TaskError error;
      error.code = std::move(error_code);
      error.message = error_message.value_or("");
      error.stack = std::move(error_stack);
      task.error = std::move(error);
    }
    task.pid = pid;
    task.pid_started_at = millis_to_time_point(pid_started_at);
    out.push_back(std::move(task));
  };
}

template <typename Binder>
void bind_params(Binder& binder, const std::vector<SqlParam>& params) {
  for (const auto& param : params) {
    std::visit([&binder](const auto& value) { binder << value; }, param);
  }
}

std::string escape_like(const std::string& text) {
  std::string escaped;
  escaped.reserve(text.size());
  for (char c : text) {
    if (c == '%' || c == '_' || c == '\\') {
      escaped.push_back('\\');
    }
    escaped.push_back(c);
  }
  return escaped;
}

std::string placeholders(size_t count) {
  std::string out;
  for (size_t i = 0; i < count; ++i) {
    out += (i == 0) ? "?" : ", ?";
  }
  return out;
}

const char* sort_column(TaskSortField field) {
  switch (field) {
    case TaskSortField::CREATED_AT: return "created_at";
    case TaskSortField::UPDATED_AT: return "updated_at";
    case TaskSortField::PRIORITY: return "priority";
    case TaskSortField::PROGRESS: return "progress";
  }
  return "created_at";
}

}  // namespace

TaskRepo::TaskRepo(DatabaseManager& db_manager) : db_manager_(db_manager) {}

Task TaskRepo::create_task(const NewTask& new_task) {
  long long task_id = 0;
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, "create_task");
    const long long now = now_millis();
    *conn << "INSERT INTO tasks (type, name, status, priority, created_at, updated_at, "
             "output_dir, params, progress, retry_count, max_retry) "
             "VALUES (?, ?, ?, ?, ?, ?, ?, ?, 0, 0, ?)"
          << to_string(new_task.type) << new_task.name << to_string(TaskStatus::PENDING)
          << new_task.priority << now << now << new_task.output_dir << new_task.config.dump()
          << new_task.max_retry;
    task_id = static_cast<long long>(conn->last_insert_rowid());

    int sort_order = 0;
    for (const auto& file : new_task.files) {
      *conn << "INSERT INTO task_files (task_id, path, category, category_label, sort_order) "
               "VALUES (?, ?, ?, ?, ?)"
            << task_id << file.path << file.category << file.category_label << sort_order;
      ++sort_order;
    }
    tx.commit();
  } catch (const sqlite::sqlite_exception& e) {
    throw TaskRepoError(format_db_error("create_task", e));
  }

  auto created = get_task_by_id(task_id, true, false);
  if (!created) {
    throw TaskRepoError("create_task failed: task " + std::to_string(task_id) +
                        " vanished after insert");
  }
  return *created;
}

std::optional<Task> TaskRepo::get_task_by_id(long long task_id, bool with_files,
                                             bool with_outputs) {
  std::vector<Task> found;
  try {
    PooledConnection conn(db_manager_);
    read_tasks(*conn << (std::string("SELECT ") + kTaskColumns + " FROM tasks WHERE id = ?")
                     << task_id,
               found);
  } catch (const sqlite::sqlite_exception& e) {
    throw TaskRepoError(format_db_error("get_task_by_id", e));
  }
  if (found.empty()) {
    return std::nullopt;
  }

  Task task = std::move(found.front());
  if (with_files) {
    task.files = get_task_files(task_id);
  }
  if (with_outputs) {
    task.outputs = get_task_outputs(task_id);
  }
  return task;
}

std::vector<TaskFile> TaskRepo::get_task_files(long long task_id) {
  try {
    PooledConnection conn(db_manager_);
    std::vector<TaskFile> files;
    *conn << "SELECT id, path, category, category_label, sort_order FROM task_files "
             "WHERE task_id = ? ORDER BY sort_order ASC, id ASC"
          << task_id >>
        [&](long long id, std::string path, std::string category, std::string category_label,
            int sort_order) {
          TaskFile file;
          file.id = id;
          file.path = std::move(path);
          file.category = std::move(category);
          file.category_label = std::move(category_label);
          file.sort_order = sort_order;
          files.push_back(std::move(file));
        };
    return files;
  } catch (const sqlite::sqlite_exception& e) {
    throw TaskRepoError(format_db_error("get_task_files", e));
  }
}

std::vector<TaskOutput> TaskRepo::get_task_outputs(long long task_id) {
  try {
    PooledConnection conn(db_manager_);
    std::vector<TaskOutput> outputs;
    *conn << "SELECT id, path, type, size, created_at FROM task_outputs "
             "WHERE task_id = ? ORDER BY created_at ASC, id ASC"
          << task_id >>
        [&](long long id, std::string path, std::string type, std::optional<long long> size,
            long long created_at) {
          TaskOutput output;
          output.id = id;
          output.path = std::move(path);
          output.kind = output_kind_from_string(type);
          output.size = size;
          output.created_at = millis_to_time_point(created_at);
          outputs.push_back(std::move(output));
        };
    return outputs;
  } catch (const sqlite::sqlite_exception& e) {
    throw TaskRepoError(format_db_error("get_task_outputs", e));
  }
}

std::vector<Task> TaskRepo::get_tasks_by_status(TaskStatus status) {
  try {
    PooledConnection conn(db_manager_);
    std::vector<Task> tasks;
    read_tasks(*conn << (std::string("SELECT ") + kTaskColumns +
                         " FROM tasks WHERE status = ? ORDER BY created_at ASC, id ASC")
                     << to_string(status),
               tasks);
    return tasks;
  } catch (const sqlite::sqlite_exception& e) {
    throw TaskRepoError(format_db_error("get_tasks_by_status", e));
  }
}

TaskListResult TaskRepo::get_tasks(const TaskListOptions& options) {
  std::vector<std::string> clauses;
  std::vector<SqlParam> params;
  const TaskFilter& filter = options.filter;

  if (!filter.statuses.empty()) {
    clauses.push_back("status IN (" + placeholders(filter.statuses.size()) + ")");
    for (TaskStatus status : filter.statuses) {
      params.emplace_back(to_string(status));
    }
  }
  if (!filter.types.empty()) {
    clauses.push_back("type IN (" + placeholders(filter.types.size()) + ")");
    for (TaskType type : filter.types) {
      params.emplace_back(to_string(type));
    }
  }
  if (filter.search && !filter.search->empty()) {
    clauses.push_back("name LIKE ? ESCAPE '\\'");
    params.emplace_back("%" + escape_like(*filter.search) + "%");
  }
  if (filter.created_from) {
    clauses.push_back("created_at >= ?");
    params.emplace_back(time_point_to_millis(*filter.created_from));
  }
  if (filter.created_to) {
    clauses.push_back("created_at <= ?");
    params.emplace_back(time_point_to_millis(*filter.created_to));
  }

  std::string where;
  for (size_t i = 0; i < clauses.size(); ++i) {
    where += (i == 0 ? " WHERE " : " AND ") + clauses[i];
  }

  const int page = std::max(1, options.page);
  const int page_size = std::max(1, options.page_size);
  const char* direction = options.sort.order == SortOrder::ASC ? "ASC" : "DESC";

  TaskListResult result;
  result.page = page;
  result.page_size = page_size;

  try {
    PooledConnection conn(db_manager_);

    auto count_query = *conn << ("SELECT COUNT(*) FROM tasks" + where);
    bind_params(count_query, params);
    count_query >> result.total;

    auto list_query = *conn << (std::string("SELECT ") + kTaskColumns + " FROM tasks" + where +
                                " ORDER BY " + sort_column(options.sort.field) + " " + direction +
                                ", id " + direction + " LIMIT ? OFFSET ?");
    bind_params(list_query, params);
    list_query << static_cast<long long>(page_size)
               << static_cast<long long>(page - 1) * page_size;
    read_tasks(list_query, result.tasks);
  } catch (const sqlite::sqlite_exception& e) {
    throw TaskRepoError(format_db_error("get_tasks", e));
  }

  if (options.with_files || options.with_outputs) {
    for (auto& task : result.tasks) {
      if (options.with_files) {
        task.files = get_task_files(task.id);
      }
      if (options.with_outputs) {
        task.outputs = get_task_outputs(task.id);
      }
    }
  }

  result.stats = get_task_stats();
  return result;
}

TaskStats TaskRepo::get_task_stats() {
  try {
    PooledConnection conn(db_manager_);
    TaskStats stats;
    *conn << "SELECT status, COUNT(*) FROM tasks GROUP BY status" >>
        [&](std::string status, int count) {
          switch (task_status_from_string(status)) {
            case TaskStatus::PENDING:
            case TaskStatus::QUEUED:
            case TaskStatus::PAUSED:
              stats.pending += count;
              break;
            case TaskStatus::RUNNING:
              stats.running += count;
              break;
            case TaskStatus::COMPLETED:
              stats.completed += count;
              break;
            case TaskStatus::FAILED:
              stats.failed += count;
              break;
            case TaskStatus::CANCELLED:
              stats.cancelled += count;
              break;
          }
        };
    *conn << "SELECT COALESCE(SUM(execution_time), 0) FROM tasks WHERE status = ?"
          << to_string(TaskStatus::COMPLETED) >>
        stats.total_execution_time_ms;
    return stats;
  } catch (const sqlite::sqlite_exception& e) {
    throw TaskRepoError(format_db_error("get_task_stats", e));
  }
}

void TaskRepo::update_task_status(long long task_id, TaskStatus status,
                                  const StatusExtras& extras) {
  try {
    PooledConnection conn(db_manager_);
    const long long now = now_millis();
    const int entering_running = status == TaskStatus::RUNNING ? 1 : 0;
    const int entering_terminal = is_terminal(status) ? 1 : 0;
    std::optional<int> progress;
    if (extras.progress) {
      progress = std::clamp(*extras.progress, 0, 100);
    }
    *conn << "UPDATE tasks SET status = ?, updated_at = ?, "
             "started_at = CASE WHEN ? = 1 THEN COALESCE(started_at, ?) ELSE started_at END, "
             "completed_at = CASE WHEN ? = 1 THEN ? ELSE completed_at END, "
             "progress = COALESCE(?, progress), "
             "current_step = COALESCE(?, current_step), "
             "error_code = CASE WHEN ? IS NULL THEN error_code ELSE ? END, "
             "error_message = COALESCE(?, error_message), "
             "error_stack = CASE WHEN ? IS NULL THEN error_stack ELSE ? END, "
             "execution_time = COALESCE(?, execution_time) "
             "WHERE id = ?"
          << to_string(status) << now << entering_running << now << entering_terminal << now
          << progress << extras.current_step << extras.error_message << extras.error_code
          << extras.error_message << extras.error_message << extras.error_stack
          << extras.execution_time_ms << task_id;
  } catch (const sqlite::sqlite_exception& e) {
    throw TaskRepoError(format_db_error("update_task_status", e));
  }
}

void TaskRepo::update_task_progress(long long task_id, int progress,
                                    const std::optional<std::string>& current_step) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "UPDATE tasks SET progress = ?, current_step = COALESCE(?, current_step), "
             "updated_at = ? WHERE id = ?"
          << std::clamp(progress, 0, 100) << current_step << now_millis() << task_id;
  } catch (const sqlite::sqlite_exception& e) {
    throw TaskRepoError(format_db_error("update_task_progress", e));
  }
}

void TaskRepo::increment_execution_time(long long task_id, long long ms) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "UPDATE tasks SET execution_time = execution_time + ?, updated_at = ? WHERE id = ?"
          << ms << now_millis() << task_id;
  } catch (const sqlite::sqlite_exception& e) {
    throw TaskRepoError(format_db_error("increment_execution_time", e));
  }
}

void TaskRepo::increment_retry_count(long long task_id) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "UPDATE tasks SET retry_count = retry_count + 1, updated_at = ? WHERE id = ?"
          << now_millis() << task_id;
  } catch (const sqlite::sqlite_exception& e) {
    throw TaskRepoError(format_db_error("increment_retry_count", e));
  }
}

void TaskRepo::update_task_pid(long long task_id, int pid) {
  try {
    PooledConnection conn(db_manager_);
    const long long now = now_millis();
    *conn << "UPDATE tasks SET pid = ?, pid_started_at = ?, updated_at = ? WHERE id = ?" << pid
          << now << now << task_id;
  } catch (const sqlite::sqlite_exception& e) {
    throw TaskRepoError(format_db_error("update_task_pid", e));
  }
}

void TaskRepo::clear_task_pid(long long task_id) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "UPDATE tasks SET pid = NULL, pid_started_at = NULL, updated_at = ? WHERE id = ?"
          << now_millis() << task_id;
  } catch (const sqlite::sqlite_exception& e) {
    throw TaskRepoError(format_db_error("clear_task_pid", e));
  }
}

TaskOutput TaskRepo::add_task_output(long long task_id, const TaskOutput& output) {
  try {
    PooledConnection conn(db_manager_);
    TaskOutput stored = output;
    const long long created_at = now_millis();
    *conn << "INSERT INTO task_outputs (task_id, path, type, size, created_at) "
             "VALUES (?, ?, ?, ?, ?)"
          << task_id << output.path << to_string(output.kind) << output.size << created_at;
    stored.id = static_cast<long long>(conn->last_insert_rowid());
    stored.created_at = millis_to_time_point(created_at);
    return stored;
  } catch (const sqlite::sqlite_exception& e) {
    if (classify_db_failure(e) == DbFailure::MissingTask) {
      throw NotFoundError(task_id);
    }
    throw TaskRepoError(format_db_error("add_task_output", e));
  }
}

void TaskRepo::update_task_output_dir(long long task_id, const std::string& output_dir) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "UPDATE tasks SET output_dir = ?, updated_at = ? WHERE id = ?" << output_dir
          << now_millis() << task_id;
  } catch (const sqlite::sqlite_exception& e) {
    throw TaskRepoError(format_db_error("update_task_output_dir", e));
  }
}

bool TaskRepo::delete_task(long long task_id) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "DELETE FROM tasks WHERE id = ?" << task_id;
    return conn->rows_modified() > 0;
  } catch (const sqlite::sqlite_exception& e) {
    throw TaskRepoError(format_db_error("delete_task", e));
  }
}

int TaskRepo::delete_completed_tasks(int before_days) {
  try {
    PooledConnection conn(db_manager_);
    if (before_days > 0) {
      const long long cutoff = now_millis() - static_cast<long long>(before_days) * kMillisPerDay;
      *conn << "DELETE FROM tasks WHERE status = ? AND completed_at < ?"
            << to_string(TaskStatus::COMPLETED) << cutoff;
    } else {
      *conn << "DELETE FROM tasks WHERE status = ?" << to_string(TaskStatus::COMPLETED);
    }
    return conn->rows_modified();
  } catch (const sqlite::sqlite_exception& e) {
    throw TaskRepoError(format_db_error("delete_completed_tasks", e));
  }
}

int TaskRepo::delete_failed_tasks() {
  try {
    PooledConnection conn(db_manager_);
    *conn << "DELETE FROM tasks WHERE status = ?" << to_string(TaskStatus::FAILED);
    return conn->rows_modified();
  } catch (const sqlite::sqlite_exception& e) {
    throw TaskRepoError(format_db_error("delete_failed_tasks", e));
  }
}

int TaskRepo::delete_cancelled_tasks() {
  try {
    PooledConnection conn(db_manager_);
    *conn << "DELETE FROM tasks WHERE status = ?" << to_string(TaskStatus::CANCELLED);
    return conn->rows_modified();
  } catch (const sqlite::sqlite_exception& e) {
    throw TaskRepoError(format_db_error("delete_cancelled_tasks", e));
  }
}

DatabaseStats TaskRepo::get_database_stats() {
  try {
    PooledConnection conn(db_manager_);
    DatabaseStats stats;
    *conn << "SELECT COUNT(*) FROM tasks" >> stats.task_count;
    *conn << "SELECT COUNT(*) FROM task_logs" >> stats.log_count;
    *conn << "SELECT COUNT(*) FROM task_outputs" >> stats.output_count;
    *conn << "SELECT MIN(created_at), MAX(created_at) FROM tasks" >>
        [&](std::optional<long long> oldest, std::optional<long long> newest) {
          stats.oldest_task = millis_to_time_point(oldest);
          stats.newest_task = millis_to_time_point(newest);
        };
    return stats;
  } catch (const sqlite::sqlite_exception& e) {
    throw TaskRepoError(format_db_error("get_database_stats", e));
  }
}

}  // namespace batch_core
