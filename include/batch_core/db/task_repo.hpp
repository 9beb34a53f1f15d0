#pragma once

#include <optional>
#include <string>
#include <vector>

#include "batch_core/db/database_manager.hpp"
#include "batch_core/db/models/task.hpp"
#include "batch_core/db/models/task_query.hpp"
#include "batch_core/errors.hpp"

namespace batch_core {

class TaskRepoError : public StoreError {
 public:
  using StoreError::StoreError;
};

class TaskRepo {
 public:
  explicit TaskRepo(DatabaseManager& db_manager);

  // Task row and file rows are written in one transaction
  Task create_task(const NewTask& new_task);

  std::optional<Task> get_task_by_id(long long task_id, bool with_files = true,
                                     bool with_outputs = true);
  std::vector<TaskFile> get_task_files(long long task_id);
  std::vector<TaskOutput> get_task_outputs(long long task_id);
  // Oldest first
  std::vector<Task> get_tasks_by_status(TaskStatus status);

  TaskListResult get_tasks(const TaskListOptions& options);
  TaskStats get_task_stats();

  // started_at is only set the first time a task runs. completed_at is set on
  // every terminal status. A new error message replaces the stored code and
  // stack along with it.
  void update_task_status(long long task_id, TaskStatus status,
                          const StatusExtras& extras = StatusExtras{});
  // progress is clamped to [0, 100]
  void update_task_progress(long long task_id, int progress,
                            const std::optional<std::string>& current_step = std::nullopt);
  void increment_execution_time(long long task_id, long long ms);
  void increment_retry_count(long long task_id);
  void update_task_pid(long long task_id, int pid);
  void clear_task_pid(long long task_id);
  TaskOutput add_task_output(long long task_id, const TaskOutput& output);
  void update_task_output_dir(long long task_id, const std::string& output_dir);

  bool delete_task(long long task_id);
  // before_days == 0 removes every completed task
  int delete_completed_tasks(int before_days = 0);
  int delete_failed_tasks();
  int delete_cancelled_tasks();

  DatabaseStats get_database_stats();

 private:
  DatabaseManager& db_manager_;
};

}  // namespace batch_core
