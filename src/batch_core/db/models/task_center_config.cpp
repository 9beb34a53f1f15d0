#include "batch_core/db/models/task_center_config.hpp"

#include "batch_core/errors.hpp"

namespace batch_core {

namespace {

void overlay_int(const nlohmann::json &values, const char *key, int &target) {
  auto it = values.find(key);
  if (it != values.end() && it->is_number_integer()) {
    target = it->get<int>();
  }
}

void overlay_bool(const nlohmann::json &values, const char *key, bool &target) {
  auto it = values.find(key);
  if (it != values.end() && it->is_boolean()) {
    target = it->get<bool>();
  }
}

std::optional<int> strict_int(const nlohmann::json &value, const std::string &key) {
  if (!value.is_number_integer()) {
    throw ValidationError("Config key '" + key + "' expects an integer, got " + value.dump());
  }
  return value.get<int>();
}

std::optional<bool> strict_bool(const nlohmann::json &value, const std::string &key) {
  if (!value.is_boolean()) {
    throw ValidationError("Config key '" + key + "' expects a boolean, got " + value.dump());
  }
  return value.get<bool>();
}

}  // namespace

bool TaskCenterConfigPatch::empty() const {
  return !max_concurrent_tasks && !threads_per_task && !auto_start_tasks && !auto_retry_failed &&
         !max_retry_count && !show_notification && !keep_completed_days && !auto_backup &&
         !max_backup_count;
}

const std::vector<std::pair<std::string, nlohmann::json>> &default_config_entries() {
  static const std::vector<std::pair<std::string, nlohmann::json>> entries = [] {
    const nlohmann::json defaults = to_json(TaskCenterConfig{});
    std::vector<std::pair<std::string, nlohmann::json>> out;
    for (const char *key :
         {config_keys::MAX_CONCURRENT_TASKS, config_keys::THREADS_PER_TASK,
          config_keys::AUTO_START_TASKS, config_keys::AUTO_RETRY_FAILED,
          config_keys::MAX_RETRY_COUNT, config_keys::SHOW_NOTIFICATION,
          config_keys::KEEP_COMPLETED_DAYS, config_keys::AUTO_BACKUP,
          config_keys::MAX_BACKUP_COUNT}) {
      out.emplace_back(key, defaults.at(key));
    }
    return out;
  }();
  return entries;
}

nlohmann::json to_json(const TaskCenterConfig &config) {
  return {{config_keys::MAX_CONCURRENT_TASKS, config.max_concurrent_tasks},
          {config_keys::THREADS_PER_TASK, config.threads_per_task},
          {config_keys::AUTO_START_TASKS, config.auto_start_tasks},
          {config_keys::AUTO_RETRY_FAILED, config.auto_retry_failed},
          {config_keys::MAX_RETRY_COUNT, config.max_retry_count},
          {config_keys::SHOW_NOTIFICATION, config.show_notification},
          {config_keys::KEEP_COMPLETED_DAYS, config.keep_completed_days},
          {config_keys::AUTO_BACKUP, config.auto_backup},
          {config_keys::MAX_BACKUP_COUNT, config.max_backup_count}};
}

nlohmann::json to_json(const TaskCenterConfigPatch &patch) {
  nlohmann::json j = nlohmann::json::object();
  if (patch.max_concurrent_tasks) j[config_keys::MAX_CONCURRENT_TASKS] = *patch.max_concurrent_tasks;
  if (patch.threads_per_task) j[config_keys::THREADS_PER_TASK] = *patch.threads_per_task;
  if (patch.auto_start_tasks) j[config_keys::AUTO_START_TASKS] = *patch.auto_start_tasks;
  if (patch.auto_retry_failed) j[config_keys::AUTO_RETRY_FAILED] = *patch.auto_retry_failed;
  if (patch.max_retry_count) j[config_keys::MAX_RETRY_COUNT] = *patch.max_retry_count;
  if (patch.show_notification) j[config_keys::SHOW_NOTIFICATION] = *patch.show_notification;
  if (patch.keep_completed_days) j[config_keys::KEEP_COMPLETED_DAYS] = *patch.keep_completed_days;
  if (patch.auto_backup) j[config_keys::AUTO_BACKUP] = *patch.auto_backup;
  if (patch.max_backup_count) j[config_keys::MAX_BACKUP_COUNT] = *patch.max_backup_count;
  return j;
}

TaskCenterConfig merge_config(TaskCenterConfig base, const nlohmann::json &values) {
  if (!values.is_object()) {
    return base;
  }
  overlay_int(values, config_keys::MAX_CONCURRENT_TASKS, base.max_concurrent_tasks);
  overlay_int(values, config_keys::THREADS_PER_TASK, base.threads_per_task);
  overlay_bool(values, config_keys::AUTO_START_TASKS, base.auto_start_tasks);
  overlay_bool(values, config_keys::AUTO_RETRY_FAILED, base.auto_retry_failed);
  overlay_int(values, config_keys::MAX_RETRY_COUNT, base.max_retry_count);
  overlay_bool(values, config_keys::SHOW_NOTIFICATION, base.show_notification);
  overlay_int(values, config_keys::KEEP_COMPLETED_DAYS, base.keep_completed_days);
  overlay_bool(values, config_keys::AUTO_BACKUP, base.auto_backup);
  overlay_int(values, config_keys::MAX_BACKUP_COUNT, base.max_backup_count);
  return base;
}

TaskCenterConfigPatch patch_from_json(const nlohmann::json &values) {
  if (!values.is_object()) {
    throw ValidationError("Config patch must be a JSON object");
  }
  TaskCenterConfigPatch patch;
  for (auto it = values.begin(); it != values.end(); ++it) {
    const std::string &key = it.key();
    if (key == config_keys::MAX_CONCURRENT_TASKS) {
      patch.max_concurrent_tasks = strict_int(it.value(), key);
    } else if (key == config_keys::THREADS_PER_TASK) {
      patch.threads_per_task = strict_int(it.value(), key);
    } else if (key == config_keys::AUTO_START_TASKS) {
      patch.auto_start_tasks = strict_bool(it.value(), key);
    } else if (key == config_keys::AUTO_RETRY_FAILED) {
      patch.auto_retry_failed = strict_bool(it.value(), key);
    } else if (key == config_keys::MAX_RETRY_COUNT) {
      patch.max_retry_count = strict_int(it.value(), key);
    } else if (key == config_keys::SHOW_NOTIFICATION) {
      patch.show_notification = strict_bool(it.value(), key);
    } else if (key == config_keys::KEEP_COMPLETED_DAYS) {
      patch.keep_completed_days = strict_int(it.value(), key);
    } else if (key == config_keys::AUTO_BACKUP) {
      patch.auto_backup = strict_bool(it.value(), key);
    } else if (key == config_keys::MAX_BACKUP_COUNT) {
      patch.max_backup_count = strict_int(it.value(), key);
    } else {
      throw ValidationError("Unknown config key: " + key);
    }
  }
  validate_patch(patch);
  return patch;
}

void validate_patch(const TaskCenterConfigPatch &patch) {
  if (patch.max_concurrent_tasks && *patch.max_concurrent_tasks < 1) {
    throw ValidationError("maxConcurrentTasks must be at least 1");
  }
  if (patch.threads_per_task && *patch.threads_per_task < 1) {
    throw ValidationError("threadsPerTask must be at least 1");
  }
  if (patch.max_retry_count && *patch.max_retry_count < 0) {
    throw ValidationError("maxRetryCount cannot be negative");
  }
  if (patch.keep_completed_days && *patch.keep_completed_days < 0) {
    throw ValidationError("keepCompletedDays cannot be negative");
  }
  if (patch.max_backup_count && *patch.max_backup_count < 0) {
    throw ValidationError("maxBackupCount cannot be negative");
  }
}

TaskCenterConfig apply_patch(TaskCenterConfig base, const TaskCenterConfigPatch &patch) {
  return merge_config(base, to_json(patch));
}

nlohmann::json to_json(const QueueStatus &status) {
  return {{"running", status.running},
          {"queued", status.queued},
          {"maxConcurrent", status.max_concurrent},
          {"threadsPerTask", status.threads_per_task},
          {"totalThreads", status.total_threads}};
}

}  // namespace batch_core
