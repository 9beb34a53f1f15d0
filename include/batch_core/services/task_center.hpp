#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "batch_core/async/event_sink.hpp"
#include "batch_core/async/execution_adapter.hpp"
#include "batch_core/async/task_scheduler.hpp"
#include "batch_core/db/config_repo.hpp"
#include "batch_core/db/database_manager.hpp"
#include "batch_core/db/task_log_repo.hpp"
#include "batch_core/db/task_repo.hpp"

namespace batch_core {

struct BatchSubmitError {
  size_t index = 0;
  std::string message;
};

struct BatchSubmitResult {
  std::vector<Task> tasks;
  std::vector<BatchSubmitError> errors;
};

struct CpuInfo {
  int cores = 1;
  std::string model;
  int recommended_max_concurrent_tasks = 1;
  int recommended_threads_per_task = 1;
};

nlohmann::json to_json(const BatchSubmitResult &result);
nlohmann::json to_json(const CpuInfo &info);

// Recommended concurrency for a machine with `cores` logical CPUs
CpuInfo recommend_for_cores(int cores, std::string model);

/**
 * @class TaskCenter
 * @brief The in-process control surface: submission, queries, lifecycle
 *        control, config and logs.
 *
 * Owns the repositories and the scheduler. Automatic retry of failed tasks
 * (autoRetryFailed / maxRetryCount) is applied here, through the
 * scheduler's failure observer.
 */
class TaskCenter {
 public:
  TaskCenter(DatabaseManager &db_manager, async::IExecutionAdapter &adapter,
             async::IEventSink &events);
  ~TaskCenter();

  TaskCenter(const TaskCenter &) = delete;
  TaskCenter &operator=(const TaskCenter &) = delete;

  // Recovers interrupted work and starts admitting queued tasks.
  void initialize();
  void shutdown();

  // Throws ValidationError before anything is written.
  Task submit(const NewTask &new_task);
  // Invalid items are reported per index; valid ones are still created.
  BatchSubmitResult submit_batch(const std::vector<NewTask> &new_tasks);

  std::optional<Task> get(long long task_id);
  TaskListResult list(const TaskListOptions &options);

  // pending, failed, cancelled, or completed as an explicit resubmission
  bool start(long long task_id);
  bool cancel(long long task_id);
  bool retry(long long task_id);
  // Cancels the task if needed, then deletes it with its files, outputs and logs.
  bool remove(long long task_id);

  int pause_all();
  int resume_all();
  int cancel_all();

  int clear_completed(int before_days = 0);
  int clear_failed();
  int clear_cancelled();
  // Applies keepCompletedDays. 0 keeps completed tasks forever.
  int cleanup_expired();

  TaskCenterConfig set_config(const TaskCenterConfigPatch &patch);
  TaskCenterConfig set_config(const nlohmann::json &values);
  TaskCenterConfig reset_config();
  TaskCenterConfig get_config() const;
  QueueStatus get_queue_status() const;

  std::vector<TaskLog> get_logs(long long task_id, int limit = 1000, int offset = 0);
  std::vector<TaskLog> get_recent_logs(int limit = 100);
  int clear_logs(long long task_id);

  bool update_output_dir(long long task_id, const std::string &output_dir);

  CpuInfo get_cpu_info() const;
  DatabaseStats get_database_stats();

  bool wait_until_idle(std::chrono::milliseconds timeout);

 private:
  void validate_submission(const NewTask &new_task) const;
  Task create_and_announce(const NewTask &new_task, bool auto_start);
  void on_task_failed(const Task &task);
  void emit(async::TaskEventKind kind, long long task_id, const std::optional<Task> &task);

  TaskRepo task_repo_;
  TaskLogRepo log_repo_;
  ConfigRepo config_repo_;
  async::IEventSink &events_;
  // Declared last so runner threads are joined before the repositories go away
  async::TaskScheduler scheduler_;
};

}  // namespace batch_core
