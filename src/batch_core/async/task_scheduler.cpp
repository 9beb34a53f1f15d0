#include "batch_core/async/task_scheduler.hpp"

#include <algorithm>
#include <iostream>
#include <system_error>

#include "batch_core/db/config_repo.hpp"
#include "batch_core/db/task_log_repo.hpp"
#include "batch_core/db/task_repo.hpp"

namespace batch_core::async {

TaskScheduler::TaskScheduler(TaskRepo& task_repo, TaskLogRepo& log_repo, ConfigRepo& config_repo,
                             IExecutionAdapter& adapter, IEventSink& events)
    : task_repo_(task_repo),
      log_repo_(log_repo),
      config_repo_(config_repo),
      adapter_(adapter),
      events_(events),
      config_(config_repo.get_all()) {}

TaskScheduler::~TaskScheduler() {
  shutdown();
}

void TaskScheduler::start() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    stopping_ = false;
  }
  const int abandoned = reconcile_abandoned();
  if (abandoned > 0) {
    std::cerr << "[TaskScheduler] " << abandoned
              << " task(s) were interrupted by a previous shutdown and marked failed" << std::endl;
  }

  EventFlush flush(*this);
  std::lock_guard<std::mutex> lock(mtx_);
  std::cout << "[TaskScheduler] Started with " << config_.max_concurrent_tasks
            << " slot(s), " << wait_list_.size() << " task(s) waiting" << std::endl;
  admit_locked();
}

void TaskScheduler::shutdown() {
  std::unordered_map<long long, std::thread> runners;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (stopping_ && runners_.empty()) {
      return;
    }
    stopping_ = true;

    for (const auto& entry : running_) {
      if (entry.second.paused) {
        continue;
      }
      try {
        Task task = load_task_locked(entry.first);
        if (can_apply(task.status, TransitionKind::Pause)) {
          emit_locked(TaskEventKind::Updated,
                      persist_transition_locked(task, TaskTransition::of(TransitionKind::Pause)));
        }
      } catch (const BatchError& e) {
        std::cerr << "[TaskScheduler] Could not pause task " << entry.first
                  << " during shutdown: " << e.what() << std::endl;
      }
    }
    running_.clear();
    stranded_.clear();
    runners.swap(runners_);
    finished_runners_.clear();
  }
  idle_cv_.notify_all();
  deliver_events();

  if (!runners.empty()) {
    std::cout << "[TaskScheduler] Waiting for " << runners.size() << " runner(s) to exit..."
              << std::endl;
  }
  for (auto& entry : runners) {
    if (entry.second.joinable()) {
      entry.second.join();
    }
  }
}

bool TaskScheduler::enqueue(long long task_id) {
  EventFlush flush(*this);
  std::lock_guard<std::mutex> lock(mtx_);
  Task task = load_task_locked(task_id);
  if (!can_apply(task.status, TransitionKind::Enqueue)) {
    return false;
  }

  Task next = persist_transition_locked(task, TaskTransition::of(TransitionKind::Enqueue));
  wait_list_.push_back(task_id);
  emit_locked(TaskEventKind::Updated, next);
  admit_locked();
  return true;
}

bool TaskScheduler::pause(long long task_id) {
  EventFlush flush(*this);
  std::lock_guard<std::mutex> lock(mtx_);
  return pause_locked(task_id);
}

bool TaskScheduler::resume(long long task_id) {
  EventFlush flush(*this);
  std::lock_guard<std::mutex> lock(mtx_);
  return resume_locked(task_id);
}

bool TaskScheduler::cancel(long long task_id) {
  EventFlush flush(*this);
  std::lock_guard<std::mutex> lock(mtx_);
  const bool cancelled = cancel_locked(task_id);
  if (cancelled) {
    admit_locked();
  }
  return cancelled;
}

bool TaskScheduler::retry(long long task_id) {
  EventFlush flush(*this);
  std::lock_guard<std::mutex> lock(mtx_);
  Task task = load_task_locked(task_id);
  if (!can_apply(task.status, TransitionKind::Retry)) {
    return false;
  }

  Task pending = persist_transition_locked(task, TaskTransition::of(TransitionKind::Retry));
  emit_locked(TaskEventKind::Updated, pending);

  Task queued = persist_transition_locked(pending, TaskTransition::of(TransitionKind::Enqueue));
  wait_list_.push_back(task_id);
  emit_locked(TaskEventKind::Updated, queued);
  admit_locked();
  return true;
}

int TaskScheduler::pause_all() {
  EventFlush flush(*this);
  std::lock_guard<std::mutex> lock(mtx_);
  std::vector<long long> ids;
  for (const auto& entry : running_) {
    if (!entry.second.paused) {
      ids.push_back(entry.first);
    }
  }
  int count = 0;
  for (long long id : ids) {
    if (pause_locked(id)) {
      ++count;
    }
  }
  return count;
}

int TaskScheduler::resume_all() {
  EventFlush flush(*this);
  std::lock_guard<std::mutex> lock(mtx_);
  std::vector<long long> ids;
  for (const auto& entry : running_) {
    if (entry.second.paused) {
      ids.push_back(entry.first);
    }
  }
  int count = 0;
  for (long long id : ids) {
    if (resume_locked(id)) {
      ++count;
    }
  }
  return count;
}

int TaskScheduler::cancel_all() {
  EventFlush flush(*this);
  std::lock_guard<std::mutex> lock(mtx_);
  int count = 0;

  // Drain the wait list first so nothing gets admitted into a freed slot
  const std::deque<long long> waiting = wait_list_;
  for (long long id : waiting) {
    try {
      if (cancel_locked(id)) {
        ++count;
      }
    } catch (const NotFoundError&) {
      wait_list_.erase(std::remove(wait_list_.begin(), wait_list_.end(), id), wait_list_.end());
    }
  }

  std::vector<long long> executing;
  for (const auto& entry : running_) {
    executing.push_back(entry.first);
  }
  for (long long id : executing) {
    if (cancel_locked(id)) {
      ++count;
    }
  }
  idle_cv_.notify_all();
  return count;
}

int TaskScheduler::reconcile_abandoned() {
  std::vector<Task> abandoned;
  FailureObserver observer;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    for (TaskStatus status : {TaskStatus::RUNNING, TaskStatus::PAUSED}) {
      for (const Task& task : task_repo_.get_tasks_by_status(status)) {
        if (running_.count(task.id) > 0) {
          continue;
        }
        Task failed =
            persist_transition_locked(task, TaskTransition::of(TransitionKind::Abandon));
        stranded_.erase(task.id);
        try {
          log_repo_.add_log(task.id, LogLevel::Error, failed.error ? failed.error->message : "");
        } catch (const BatchError& e) {
          std::cerr << "[TaskScheduler] " << e.what() << std::endl;
        }
        emit_locked(TaskEventKind::Failed, failed);
        abandoned.push_back(std::move(failed));
      }
    }

    // get_tasks_by_status returns creation order
    for (const Task& task : task_repo_.get_tasks_by_status(TaskStatus::QUEUED)) {
      if (running_.count(task.id) == 0 &&
          std::find(wait_list_.begin(), wait_list_.end(), task.id) == wait_list_.end()) {
        wait_list_.push_back(task.id);
      }
    }
    observer = failure_observer_;
  }
  deliver_events();

  if (observer) {
    for (const Task& task : abandoned) {
      observer(task);
    }
  }
  return static_cast<int>(abandoned.size());
}

void TaskScheduler::update_config(const TaskCenterConfigPatch& patch) {
  EventFlush flush(*this);
  std::lock_guard<std::mutex> lock(mtx_);
  config_repo_.set_many(patch);
  config_ = apply_patch(config_, patch);
  admit_locked();
}

void TaskScheduler::reload_config() {
  EventFlush flush(*this);
  std::lock_guard<std::mutex> lock(mtx_);
  config_ = config_repo_.get_all();
  admit_locked();
}

TaskCenterConfig TaskScheduler::config() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return config_;
}

QueueStatus TaskScheduler::get_queue_status() const {
  std::lock_guard<std::mutex> lock(mtx_);
  QueueStatus status;
  status.running = static_cast<int>(running_.size());
  status.queued = static_cast<int>(wait_list_.size());
  status.max_concurrent = config_.max_concurrent_tasks;
  status.threads_per_task = config_.threads_per_task;
  status.total_threads = status.running * config_.threads_per_task;
  return status;
}

bool TaskScheduler::is_executing(long long task_id) const {
  std::lock_guard<std::mutex> lock(mtx_);
  return running_.count(task_id) > 0;
}

bool TaskScheduler::is_waiting(long long task_id) const {
  std::lock_guard<std::mutex> lock(mtx_);
  return std::find(wait_list_.begin(), wait_list_.end(), task_id) != wait_list_.end();
}

bool TaskScheduler::wait_until_idle(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mtx_);
  return idle_cv_.wait_for(lock, timeout, [this] {
    return running_.empty() && active_runners_ == 0 && (wait_list_.empty() || stopping_);
  });
}

void TaskScheduler::set_failure_observer(FailureObserver observer) {
  std::lock_guard<std::mutex> lock(mtx_);
  failure_observer_ = std::move(observer);
}

Task TaskScheduler::load_task_locked(long long task_id) {
  auto task = task_repo_.get_task_by_id(task_id, false, false);
  if (!task) {
    throw NotFoundError(task_id);
  }
  return *task;
}

Task TaskScheduler::persist_transition_locked(const Task& task, const TaskTransition& transition) {
  TransitionResult result =
      apply_transition(task, transition, std::chrono::system_clock::now());
  task_repo_.update_task_status(task.id, result.next.status, result.extras);
  if (result.clears_pid) {
    task_repo_.clear_task_pid(task.id);
  }
  if (result.increments_retry) {
    task_repo_.increment_retry_count(task.id);
  }
  return result.next;
}

void TaskScheduler::emit_locked(TaskEventKind kind, const Task& task) {
  TaskEvent event;
  event.kind = kind;
  event.task_id = task.id;
  event.task = task;
  queue_event_locked(std::move(event));
}

void TaskScheduler::queue_event_locked(TaskEvent event) {
  pending_events_.push_back(std::move(event));
}

void TaskScheduler::deliver_events() {
  std::unique_lock<std::mutex> lock(mtx_);
  if (delivering_ && delivering_thread_ == std::this_thread::get_id()) {
    // Re-entered from a sink. The loop below picks up what was just queued.
    return;
  }
  // One deliverer at a time keeps events in the order they were queued
  delivered_cv_.wait(lock, [this] { return !delivering_; });
  delivering_ = true;
  delivering_thread_ = std::this_thread::get_id();

  while (!pending_events_.empty()) {
    std::deque<TaskEvent> batch;
    batch.swap(pending_events_);
    lock.unlock();
    for (const TaskEvent& event : batch) {
      notify_safely(events_, event);
    }
    lock.lock();
  }

  delivering_ = false;
  lock.unlock();
  delivered_cv_.notify_all();
}

void TaskScheduler::admit_locked() {
  reap_finished_runners_locked();
  if (stopping_) {
    return;
  }

  while (static_cast<int>(running_.size()) < config_.max_concurrent_tasks &&
         !wait_list_.empty()) {
    const long long task_id = wait_list_.front();
    wait_list_.pop_front();

    Task running;
    try {
      auto task = task_repo_.get_task_by_id(task_id, true, false);
      if (!task || task->status != TaskStatus::QUEUED) {
        continue;
      }
      running = persist_transition_locked(*task, TaskTransition::of(TransitionKind::Admit));
    } catch (const StoreError& e) {
      std::cerr << "[TaskScheduler] Could not admit task " << task_id << ": " << e.what()
                << std::endl;
      continue;
    }

    const long long run_id = ++next_run_id_;
    ExecutionRecord record;
    record.run_id = run_id;
    record.started = Clock::now();
    running_[task_id] = record;

    emit_locked(TaskEventKind::Started, running);
    launch_runner_locked(running, run_id);
  }
  idle_cv_.notify_all();
}

void TaskScheduler::launch_runner_locked(const Task& task, long long run_id) {
  try {
    runners_.emplace(run_id, std::thread(&TaskScheduler::run_task, this, task, run_id));
    ++active_runners_;
  } catch (const std::system_error& e) {
    std::cerr << "[TaskScheduler] Could not start a runner for task " << task.id << ": "
              << e.what() << std::endl;
    TaskError error;
    error.code = std::string("SPAWN_FAILED");
    error.message = e.what();
    fail_locked(task.id, error);
  }
}

void TaskScheduler::run_task(Task task, long long run_id) {
  ExecutionContext context = make_context(task.id, run_id);

  std::optional<ExecutionResult> result;
  std::optional<TaskError> error;
  try {
    result = adapter_.execute(task, context);
  } catch (const ExecutionError& e) {
    error = TaskError{e.code(), e.what(), e.stack()};
  } catch (const std::exception& e) {
    error = TaskError{std::string("EXECUTION_ERROR"), e.what(), std::nullopt};
  } catch (...) {
    // Anything else would end the runner thread and the process with it
    error = TaskError{std::string("EXECUTION_ERROR"), "Unknown exception", std::nullopt};
  }

  std::optional<Task> failed;
  FailureObserver observer;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (owns_locked(task.id, run_id)) {
      failed = result ? complete_locked(task.id, *result) : fail_locked(task.id, *error);
      admit_locked();
      observer = failure_observer_;
    } else {
      std::cout << "[TaskScheduler] Discarding late result for task " << task.id << std::endl;
    }
  }
  deliver_events();

  if (failed && observer) {
    observer(*failed);
  }

  std::lock_guard<std::mutex> lock(mtx_);
  finished_runners_.push_back(run_id);
  --active_runners_;
  idle_cv_.notify_all();
}

void TaskScheduler::reap_finished_runners_locked() {
  std::vector<long long> still_finishing;
  for (long long run_id : finished_runners_) {
    auto it = runners_.find(run_id);
    if (it == runners_.end()) {
      continue;
    }
    if (it->second.get_id() == std::this_thread::get_id()) {
      still_finishing.push_back(run_id);
      continue;
    }
    // A finished runner has already left the scheduler and is only returning
    if (it->second.joinable()) {
      it->second.join();
    }
    runners_.erase(it);
  }
  finished_runners_.swap(still_finishing);
}

ExecutionContext TaskScheduler::make_context(long long task_id, long long run_id) {
  ExecutionContext::Callbacks callbacks;

  callbacks.log = [this, task_id, run_id](LogLevel level, const std::string& message,
                                          const std::optional<std::string>& raw) {
    EventFlush flush(*this);
    std::lock_guard<std::mutex> lock(mtx_);
    if (!owns_locked(task_id, run_id)) {
      return false;
    }
    try {
      TaskEvent event;
      event.kind = TaskEventKind::Log;
      event.task_id = task_id;
      event.log = log_repo_.add_log(task_id, level, message, raw);
      queue_event_locked(std::move(event));
    } catch (const BatchError& e) {
      std::cerr << "[TaskScheduler] " << e.what() << std::endl;
    }
    return true;
  };

  callbacks.progress = [this, task_id, run_id](int percent,
                                               const std::optional<std::string>& step) {
    EventFlush flush(*this);
    std::lock_guard<std::mutex> lock(mtx_);
    if (!owns_locked(task_id, run_id)) {
      return;
    }
    try {
      const int clamped = std::clamp(percent, 0, 100);
      task_repo_.update_task_progress(task_id, clamped, step);
      TaskEvent event;
      event.kind = TaskEventKind::Progress;
      event.task_id = task_id;
      event.progress = clamped;
      event.current_step = step;
      queue_event_locked(std::move(event));
    } catch (const StoreError& e) {
      std::cerr << "[TaskScheduler] " << e.what() << std::endl;
    }
  };

  callbacks.is_still_owned = [this, task_id, run_id] {
    std::lock_guard<std::mutex> lock(mtx_);
    return owns_locked(task_id, run_id);
  };

  callbacks.is_paused = [this, task_id, run_id] {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = running_.find(task_id);
    return it != running_.end() && it->second.run_id == run_id && it->second.paused;
  };

  callbacks.process_started = [this, task_id, run_id](int pid) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!owns_locked(task_id, run_id)) {
      return;
    }
    try {
      task_repo_.update_task_pid(task_id, pid);
    } catch (const StoreError& e) {
      std::cerr << "[TaskScheduler] " << e.what() << std::endl;
    }
  };

  callbacks.process_exited = [this, task_id, run_id] {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!owns_locked(task_id, run_id)) {
      return;
    }
    try {
      task_repo_.clear_task_pid(task_id);
    } catch (const StoreError& e) {
      std::cerr << "[TaskScheduler] " << e.what() << std::endl;
    }
  };

  int threads_per_task = 1;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    threads_per_task = config_.threads_per_task;
  }
  return ExecutionContext(threads_per_task, std::move(callbacks));
}

bool TaskScheduler::owns_locked(long long task_id, long long run_id) const {
  auto it = running_.find(task_id);
  return it != running_.end() && it->second.run_id == run_id;
}

long long TaskScheduler::busy_millis(const ExecutionRecord& record, Clock::time_point now) const {
  Clock::duration paused = record.paused_total;
  if (record.paused) {
    paused += now - record.paused_at;
  }
  const auto busy = now - record.started - paused;
  return std::max<long long>(
      0, std::chrono::duration_cast<std::chrono::milliseconds>(busy).count());
}

std::optional<Task> TaskScheduler::complete_locked(long long task_id,
                                                   const ExecutionResult& result) {
  auto it = running_.find(task_id);
  const long long execution_ms = busy_millis(it->second, Clock::now());
  running_.erase(it);

  Task completed;
  try {
    Task task = load_task_locked(task_id);
    completed = persist_transition_locked(task, TaskTransition::complete(execution_ms));
  } catch (const NotFoundError&) {
    return std::nullopt;
  } catch (const BatchError& e) {
    std::cerr << "[TaskScheduler] Could not record completion of task " << task_id << ": "
              << e.what() << std::endl;
    return fail_after_store_error_locked(task_id,
                                         std::string("Could not record completion: ") + e.what());
  }

  try {
    for (const auto& output : result.outputs) {
      completed.outputs.push_back(task_repo_.add_task_output(task_id, output));
    }
  } catch (const BatchError& e) {
    std::cerr << "[TaskScheduler] Could not record outputs of task " << task_id << ": "
              << e.what() << std::endl;
  }
  emit_locked(TaskEventKind::Completed, completed);
  return std::nullopt;
}

std::optional<Task> TaskScheduler::fail_locked(long long task_id, const TaskError& error) {
  std::optional<long long> execution_ms;
  auto it = running_.find(task_id);
  if (it != running_.end()) {
    execution_ms = busy_millis(it->second, Clock::now());
    running_.erase(it);
  }

  Task failed;
  try {
    Task task = load_task_locked(task_id);
    failed = persist_transition_locked(task, TaskTransition::fail(error, execution_ms));
  } catch (const NotFoundError&) {
    return std::nullopt;
  } catch (const BatchError& e) {
    std::cerr << "[TaskScheduler] Could not record failure of task " << task_id << ": "
              << e.what() << std::endl;
    return fail_after_store_error_locked(task_id,
                                         std::string("Could not record failure: ") + e.what());
  }

  try {
    TaskEvent event;
    event.kind = TaskEventKind::Log;
    event.task_id = task_id;
    event.log = log_repo_.add_log(task_id, LogLevel::Error, error.message, error.stack);
    queue_event_locked(std::move(event));
  } catch (const BatchError& e) {
    std::cerr << "[TaskScheduler] " << e.what() << std::endl;
  }
  emit_locked(TaskEventKind::Failed, failed);
  return failed;
}

std::optional<Task> TaskScheduler::fail_after_store_error_locked(long long task_id,
                                                                 const std::string& message) {
  try {
    Task task = load_task_locked(task_id);
    stranded_.erase(task_id);
    if (!can_apply(task.status, TransitionKind::Fail)) {
      return std::nullopt;
    }
    TaskError error;
    error.code = std::string(STORE_ERROR_CODE);
    error.message = message;
    Task failed = persist_transition_locked(task, TaskTransition::fail(error));
    emit_locked(TaskEventKind::Failed, failed);
    return failed;
  } catch (const NotFoundError&) {
    stranded_.erase(task_id);
    return std::nullopt;
  } catch (const BatchError& e) {
    std::cerr << "[TaskScheduler] Task " << task_id
              << " is left running without a runner: " << e.what() << std::endl;
    stranded_.insert(task_id);
    return std::nullopt;
  }
}

bool TaskScheduler::pause_locked(long long task_id) {
  auto it = running_.find(task_id);
  if (it == running_.end() || it->second.paused) {
    return false;
  }
  Task task = load_task_locked(task_id);
  if (!can_apply(task.status, TransitionKind::Pause)) {
    return false;
  }
  Task paused = persist_transition_locked(task, TaskTransition::of(TransitionKind::Pause));
  it->second.paused = true;
  it->second.paused_at = Clock::now();
  emit_locked(TaskEventKind::Updated, paused);
  return true;
}

bool TaskScheduler::resume_locked(long long task_id) {
  auto it = running_.find(task_id);
  if (it == running_.end() || !it->second.paused) {
    return false;
  }
  Task task = load_task_locked(task_id);
  if (!can_apply(task.status, TransitionKind::Resume)) {
    return false;
  }
  Task resumed = persist_transition_locked(task, TaskTransition::of(TransitionKind::Resume));
  it->second.paused_total += Clock::now() - it->second.paused_at;
  it->second.paused = false;
  emit_locked(TaskEventKind::Updated, resumed);
  return true;
}

bool TaskScheduler::cancel_locked(long long task_id) {
  Task task = load_task_locked(task_id);

  auto waiting = std::find(wait_list_.begin(), wait_list_.end(), task_id);
  const bool executing = running_.count(task_id) > 0 || stranded_.count(task_id) > 0;
  const bool queued = waiting != wait_list_.end() || task.status == TaskStatus::QUEUED;
  if (!executing && !queued) {
    return false;
  }
  if (!can_apply(task.status, TransitionKind::Cancel)) {
    return false;
  }

  if (waiting != wait_list_.end()) {
    wait_list_.erase(waiting);
  }
  // Dropping the record is what tells the runner it lost ownership
  running_.erase(task_id);
  stranded_.erase(task_id);

  Task cancelled = persist_transition_locked(task, TaskTransition::of(TransitionKind::Cancel));
  emit_locked(TaskEventKind::Cancelled, cancelled);
  idle_cv_.notify_all();
  return true;
}

}  // namespace batch_core::async
