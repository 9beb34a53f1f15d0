#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace batch_core {

// Typed snapshot of the persisted config table. Keys are the camelCase names
// stored in the `config` table.
struct TaskCenterConfig {
  int max_concurrent_tasks = 2;
  int threads_per_task = 4;

  bool auto_start_tasks = true;
  bool auto_retry_failed = false;
  int max_retry_count = 3;
  bool show_notification = true;

  int keep_completed_days = 7;
  bool auto_backup = true;
  int max_backup_count = 5;
};

// Partial update. Unset members are left alone.
struct TaskCenterConfigPatch {
  std::optional<int> max_concurrent_tasks;
  std::optional<int> threads_per_task;
  std::optional<bool> auto_start_tasks;
  std::optional<bool> auto_retry_failed;
  std::optional<int> max_retry_count;
  std::optional<bool> show_notification;
  std::optional<int> keep_completed_days;
  std::optional<bool> auto_backup;
  std::optional<int> max_backup_count;

  bool empty() const;
};

namespace config_keys {
inline constexpr const char *MAX_CONCURRENT_TASKS = "maxConcurrentTasks";
inline constexpr const char *THREADS_PER_TASK = "threadsPerTask";
inline constexpr const char *AUTO_START_TASKS = "autoStartTasks";
inline constexpr const char *AUTO_RETRY_FAILED = "autoRetryFailed";
inline constexpr const char *MAX_RETRY_COUNT = "maxRetryCount";
inline constexpr const char *SHOW_NOTIFICATION = "showNotification";
inline constexpr const char *KEEP_COMPLETED_DAYS = "keepCompletedDays";
inline constexpr const char *AUTO_BACKUP = "autoBackup";
inline constexpr const char *MAX_BACKUP_COUNT = "maxBackupCount";
}  // namespace config_keys

// key -> default value, in a stable order
const std::vector<std::pair<std::string, nlohmann::json>> &default_config_entries();

nlohmann::json to_json(const TaskCenterConfig &config);
nlohmann::json to_json(const TaskCenterConfigPatch &patch);

// Overlays the recognised keys of `values` onto `base`. A value of the wrong
// JSON type leaves the base value untouched.
TaskCenterConfig merge_config(TaskCenterConfig base, const nlohmann::json &values);

// Strict conversion used for writes. Throws ValidationError on unknown keys,
// wrong value types or out-of-range values.
TaskCenterConfigPatch patch_from_json(const nlohmann::json &values);
void validate_patch(const TaskCenterConfigPatch &patch);

TaskCenterConfig apply_patch(TaskCenterConfig base, const TaskCenterConfigPatch &patch);

struct QueueStatus {
  int running = 0;
  int queued = 0;
  int max_concurrent = 0;
  int threads_per_task = 0;
  int total_threads = 0;
};

nlohmann::json to_json(const QueueStatus &status);

}  // namespace batch_core
