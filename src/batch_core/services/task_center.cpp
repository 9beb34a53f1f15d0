#include "batch_core/services/task_center.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <thread>

#include "batch_core/async/process_execution_adapter.hpp"

namespace batch_core {

namespace {

std::string read_cpu_model() {
  std::ifstream cpuinfo("/proc/cpuinfo");
  std::string line;
  while (std::getline(cpuinfo, line)) {
    if (line.rfind("model name", 0) == 0) {
      const auto colon = line.find(':');
      if (colon != std::string::npos) {
        const auto start = line.find_first_not_of(' ', colon + 1);
        return start == std::string::npos ? "Unknown" : line.substr(start);
      }
    }
  }
  return "Unknown";
}

}  // namespace

nlohmann::json to_json(const BatchSubmitResult &result) {
  nlohmann::json tasks = nlohmann::json::array();
  for (const auto &task : result.tasks) {
    tasks.push_back(to_json(task));
  }
  nlohmann::json errors = nlohmann::json::array();
  for (const auto &error : result.errors) {
    errors.push_back({{"index", error.index}, {"error", error.message}});
  }
  return {{"tasks", tasks},
          {"successCount", result.tasks.size()},
          {"failCount", result.errors.size()},
          {"errors", errors}};
}

nlohmann::json to_json(const CpuInfo &info) {
  return {{"cores", info.cores},
          {"model", info.model},
          {"recommendedConcurrency",
           {{"maxConcurrentTasks", info.recommended_max_concurrent_tasks},
            {"threadsPerTask", info.recommended_threads_per_task}}}};
}

CpuInfo recommend_for_cores(int cores, std::string model) {
  CpuInfo info;
  info.cores = std::max(1, cores);
  info.model = std::move(model);
  info.recommended_max_concurrent_tasks = std::max(1, info.cores / 4);
  info.recommended_threads_per_task = std::max(1, std::min(info.cores - 1, 8));
  return info;
}

TaskCenter::TaskCenter(DatabaseManager &db_manager, async::IExecutionAdapter &adapter,
                       async::IEventSink &events)
    : task_repo_(db_manager),
      log_repo_(db_manager),
      config_repo_(db_manager),
      events_(events),
      scheduler_(task_repo_, log_repo_, config_repo_, adapter, events) {
  scheduler_.set_failure_observer([this](const Task &task) { on_task_failed(task); });
}

TaskCenter::~TaskCenter() {
  scheduler_.shutdown();
}

void TaskCenter::initialize() {
  for (TaskStatus status : {TaskStatus::RUNNING, TaskStatus::PAUSED}) {
    for (const Task &task : task_repo_.get_tasks_by_status(status)) {
      if (task.pid && async::ProcessExecutionAdapter::is_process_alive(*task.pid)) {
        std::cerr << "[TaskCenter] Worker pid " << *task.pid << " of interrupted task " << task.id
                  << " is still alive" << std::endl;
      }
    }
  }
  scheduler_.start();
}

void TaskCenter::shutdown() {
  scheduler_.shutdown();
}

void TaskCenter::validate_submission(const NewTask &new_task) const {
  if (new_task.output_dir.empty()) {
    throw ValidationError("outputDir is required");
  }
  if (!new_task.config.is_object()) {
    throw ValidationError("Task config must be a JSON object");
  }
  if (new_task.max_retry < 0) {
    throw ValidationError("maxRetry cannot be negative");
  }
  // Every job type transforms input media
  if (new_task.files.empty()) {
    throw ValidationError("Task type " + to_string(new_task.type) + " needs at least one input file");
  }
  for (const auto &file : new_task.files) {
    if (file.path.empty()) {
      throw ValidationError("Input file paths cannot be empty");
    }
  }
}

Task TaskCenter::create_and_announce(const NewTask &new_task, bool auto_start) {
  Task task = task_repo_.create_task(new_task);
  emit(async::TaskEventKind::Created, task.id, task);
  if (auto_start) {
    scheduler_.enqueue(task.id);
    if (auto refreshed = task_repo_.get_task_by_id(task.id, true, false)) {
      task = std::move(*refreshed);
    }
  }
  return task;
}

Task TaskCenter::submit(const NewTask &new_task) {
  validate_submission(new_task);
  return create_and_announce(new_task, scheduler_.config().auto_start_tasks);
}

BatchSubmitResult TaskCenter::submit_batch(const std::vector<NewTask> &new_tasks) {
  BatchSubmitResult result;
  const bool auto_start = scheduler_.config().auto_start_tasks;
  for (size_t i = 0; i < new_tasks.size(); ++i) {
    try {
      validate_submission(new_tasks[i]);
      result.tasks.push_back(create_and_announce(new_tasks[i], auto_start));
    } catch (const ValidationError &e) {
      result.errors.push_back({i, e.what()});
    } catch (const StoreError &e) {
      result.errors.push_back({i, e.what()});
    }
  }
  return result;
}

std::optional<Task> TaskCenter::get(long long task_id) {
  return task_repo_.get_task_by_id(task_id, true, true);
}

TaskListResult TaskCenter::list(const TaskListOptions &options) {
  return task_repo_.get_tasks(options);
}

bool TaskCenter::start(long long task_id) {
  return scheduler_.enqueue(task_id);
}

bool TaskCenter::cancel(long long task_id) {
  return scheduler_.cancel(task_id);
}

bool TaskCenter::retry(long long task_id) {
  return scheduler_.retry(task_id);
}

bool TaskCenter::remove(long long task_id) {
  auto task = task_repo_.get_task_by_id(task_id, false, false);
  if (!task) {
    throw NotFoundError(task_id);
  }
  if (task->status == TaskStatus::QUEUED || task->status == TaskStatus::RUNNING ||
      task->status == TaskStatus::PAUSED) {
    scheduler_.cancel(task_id);
  }
  const bool deleted = task_repo_.delete_task(task_id);
  if (deleted) {
    emit(async::TaskEventKind::Deleted, task_id, std::nullopt);
  }
  return deleted;
}

int TaskCenter::pause_all() {
  return scheduler_.pause_all();
}

int TaskCenter::resume_all() {
  return scheduler_.resume_all();
}

int TaskCenter::cancel_all() {
  return scheduler_.cancel_all();
}

int TaskCenter::clear_completed(int before_days) {
  return task_repo_.delete_completed_tasks(std::max(0, before_days));
}

int TaskCenter::clear_failed() {
  return task_repo_.delete_failed_tasks();
}

int TaskCenter::clear_cancelled() {
  return task_repo_.delete_cancelled_tasks();
}

int TaskCenter::cleanup_expired() {
  const int keep_days = scheduler_.config().keep_completed_days;
  if (keep_days <= 0) {
    return 0;
  }
  const int removed = task_repo_.delete_completed_tasks(keep_days);
  if (removed > 0) {
    std::cout << "[TaskCenter] Removed " << removed << " completed task(s) older than "
              << keep_days << " day(s)" << std::endl;
  }
  return removed;
}

TaskCenterConfig TaskCenter::set_config(const TaskCenterConfigPatch &patch) {
  scheduler_.update_config(patch);
  return scheduler_.config();
}

TaskCenterConfig TaskCenter::set_config(const nlohmann::json &values) {
  return set_config(patch_from_json(values));
}

TaskCenterConfig TaskCenter::reset_config() {
  config_repo_.reset_to_default();
  scheduler_.reload_config();
  return scheduler_.config();
}

TaskCenterConfig TaskCenter::get_config() const {
  return scheduler_.config();
}

QueueStatus TaskCenter::get_queue_status() const {
  return scheduler_.get_queue_status();
}

std::vector<TaskLog> TaskCenter::get_logs(long long task_id, int limit, int offset) {
  return log_repo_.get_task_logs(task_id, limit, offset);
}

std::vector<TaskLog> TaskCenter::get_recent_logs(int limit) {
  return log_repo_.get_recent_logs(limit);
}

int TaskCenter::clear_logs(long long task_id) {
  return log_repo_.clear_task_logs(task_id);
}

bool TaskCenter::update_output_dir(long long task_id, const std::string &output_dir) {
  if (output_dir.empty()) {
    throw ValidationError("outputDir is required");
  }
  auto task = task_repo_.get_task_by_id(task_id, false, false);
  if (!task) {
    throw NotFoundError(task_id);
  }
  if (scheduler_.is_executing(task_id)) {
    return false;
  }
  task_repo_.update_task_output_dir(task_id, output_dir);
  task->output_dir = output_dir;
  emit(async::TaskEventKind::Updated, task_id, task);
  return true;
}

CpuInfo TaskCenter::get_cpu_info() const {
  return recommend_for_cores(static_cast<int>(std::thread::hardware_concurrency()),
                             read_cpu_model());
}

DatabaseStats TaskCenter::get_database_stats() {
  return task_repo_.get_database_stats();
}

bool TaskCenter::wait_until_idle(std::chrono::milliseconds timeout) {
  return scheduler_.wait_until_idle(timeout);
}

void TaskCenter::on_task_failed(const Task &task) {
  const TaskCenterConfig config = scheduler_.config();
  if (!config.auto_retry_failed) {
    return;
  }
  const int limit = std::min(task.max_retry, config.max_retry_count);
  if (task.retry_count >= limit) {
    return;
  }

  try {
    log_repo_.add_log(task.id, LogLevel::Warning,
                      "Retrying automatically (attempt " + std::to_string(task.retry_count + 1) +
                          " of " + std::to_string(limit) + ")");
    scheduler_.retry(task.id);
  } catch (const BatchError &e) {
    std::cerr << "[TaskCenter] Automatic retry of task " << task.id << " failed: " << e.what()
              << std::endl;
  }
}

void TaskCenter::emit(async::TaskEventKind kind, long long task_id,
                      const std::optional<Task> &task) {
  async::TaskEvent event;
  event.kind = kind;
  event.task_id = task_id;
  event.task = task;
  async::notify_safely(events_, event);
}

}  // namespace batch_core
