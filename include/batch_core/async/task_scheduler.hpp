#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "batch_core/async/event_sink.hpp"
#include "batch_core/async/execution_adapter.hpp"
#include "batch_core/async/task_transition.hpp"
#include "batch_core/db/models/task_center_config.hpp"

namespace batch_core {
class TaskRepo;
class TaskLogRepo;
class ConfigRepo;
}  // namespace batch_core

namespace batch_core::async {

/**
 * @class TaskScheduler
 * @brief Admits queued tasks up to the concurrency budget and drives each
 *        one through its lifecycle.
 *
 * Waiting tasks form a FIFO list. Each admitted task runs on its own runner
 * thread, which calls the execution adapter and reports back when it
 * finishes. Every public method and every runner callback takes the same
 * mutex, so scheduler state changes never interleave. The mutex is never
 * held while an adapter runs or while an event sink is notified: events are
 * queued under the mutex and delivered in order once it is released, so a
 * sink may call back into the scheduler.
 *
 * Each admission gets a fresh run id. A runner whose run id no longer
 * matches the task's execution record (cancelled, or cancelled and then
 * retried) has lost ownership and its results are discarded.
 */
class TaskScheduler {
 public:
  using Clock = std::chrono::steady_clock;
  // Called with the failed task after the scheduler lock is released
  using FailureObserver = std::function<void(const Task&)>;

  TaskScheduler(TaskRepo& task_repo, TaskLogRepo& log_repo, ConfigRepo& config_repo,
                IExecutionAdapter& adapter, IEventSink& events);

  /**
   * @brief Destructor. Calls shutdown() and joins every runner thread.
   */
  ~TaskScheduler();

  TaskScheduler(const TaskScheduler&) = delete;
  TaskScheduler& operator=(const TaskScheduler&) = delete;
  TaskScheduler(TaskScheduler&&) = delete;
  TaskScheduler& operator=(TaskScheduler&&) = delete;

  /**
   * @brief Recovers from a previous run and starts admitting work.
   *
   * Runs reconcile_abandoned() first, then admission. Until start() is
   * called, enqueued tasks wait without being admitted.
   */
  void start();

  /**
   * @brief Stops admission, persists running tasks as paused, and waits for
   *        every runner thread to return.
   *
   * Adapters see is_still_owned() == false and are expected to stop early.
   * Safe to call more than once.
   */
  void shutdown();

  /**
   * @brief Persists the task as queued and appends it to the wait list.
   * @return false if the task's status does not allow it.
   * @throws NotFoundError for an unknown id.
   */
  bool enqueue(long long task_id);

  bool pause(long long task_id);
  bool resume(long long task_id);

  /**
   * @brief Cancels a queued or executing task.
   *
   * A task whose terminal status could not be written after its run counts
   * as executing here, so it can still be cancelled.
   * @return false when the task is neither queued nor executing.
   * @throws NotFoundError for an unknown id.
   */
  bool cancel(long long task_id);

  /**
   * @brief Moves a failed or cancelled task back to pending, bumps its retry
   *        count and enqueues it. Stored error fields stay until the next
   *        outcome overwrites them.
   */
  bool retry(long long task_id);

  int pause_all();
  int resume_all();
  // Drains the wait list first, then cancels every executing task.
  int cancel_all();

  /**
   * @brief Fails every task persisted as running or paused that has no live
   *        execution record, and rebuilds the wait list from queued rows.
   * @return The number of tasks marked failed.
   */
  int reconcile_abandoned();

  // Validates, persists and applies the patch, then re-runs admission.
  void update_config(const TaskCenterConfigPatch& patch);
  // Re-reads the persisted config and re-runs admission
  void reload_config();
  TaskCenterConfig config() const;

  QueueStatus get_queue_status() const;
  bool is_executing(long long task_id) const;
  bool is_waiting(long long task_id) const;

  /**
   * @brief Blocks until nothing is executing or waiting.
   * @return false if the timeout expired first.
   */
  bool wait_until_idle(std::chrono::milliseconds timeout);

  void set_failure_observer(FailureObserver observer);

 private:
  struct ExecutionRecord {
    long long run_id = 0;
    Clock::time_point started;
    bool paused = false;
    Clock::time_point paused_at;
    Clock::duration paused_total{0};
  };

  // Delivers queued events when the owning scope ends, after its lock_guard
  class EventFlush {
   public:
    explicit EventFlush(TaskScheduler& scheduler) : scheduler_(scheduler) {}
    ~EventFlush() { scheduler_.deliver_events(); }

    EventFlush(const EventFlush&) = delete;
    EventFlush& operator=(const EventFlush&) = delete;

   private:
    TaskScheduler& scheduler_;
  };

  Task load_task_locked(long long task_id);
  Task persist_transition_locked(const Task& task, const TaskTransition& transition);
  void emit_locked(TaskEventKind kind, const Task& task);
  void queue_event_locked(TaskEvent event);
  void deliver_events();

  void admit_locked();
  void launch_runner_locked(const Task& task, long long run_id);
  void run_task(Task task, long long run_id);
  void reap_finished_runners_locked();
  ExecutionContext make_context(long long task_id, long long run_id);

  bool owns_locked(long long task_id, long long run_id) const;
  long long busy_millis(const ExecutionRecord& record, Clock::time_point now) const;

  // Both return the task when it ended up failed, for the failure observer
  std::optional<Task> complete_locked(long long task_id, const ExecutionResult& result);
  std::optional<Task> fail_locked(long long task_id, const TaskError& error);
  std::optional<Task> fail_after_store_error_locked(long long task_id, const std::string& message);

  bool pause_locked(long long task_id);
  bool resume_locked(long long task_id);
  bool cancel_locked(long long task_id);

  TaskRepo& task_repo_;
  TaskLogRepo& log_repo_;
  ConfigRepo& config_repo_;
  IExecutionAdapter& adapter_;
  IEventSink& events_;

  mutable std::mutex mtx_;
  std::condition_variable idle_cv_;
  TaskCenterConfig config_;
  std::deque<long long> wait_list_;
  std::unordered_map<long long, ExecutionRecord> running_;
  std::unordered_map<long long, std::thread> runners_;  // keyed by run id
  std::vector<long long> finished_runners_;
  int active_runners_ = 0;  // launched and not yet finished
  long long next_run_id_ = 0;
  bool stopping_ = true;  // admission starts with start()
  FailureObserver failure_observer_;

  // Runs that ended while the store refused every terminal write. The row
  // still says running; cancel() and reconcile_abandoned() settle it.
  std::unordered_set<long long> stranded_;

  std::deque<TaskEvent> pending_events_;
  std::condition_variable delivered_cv_;
  bool delivering_ = false;
  std::thread::id delivering_thread_;
};

}  // namespace batch_core::async
