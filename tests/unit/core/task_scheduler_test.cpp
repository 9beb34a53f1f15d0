#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

#include "batch_core/async/task_scheduler.hpp"
#include "mocks_test.hpp"
#include "utilities_test.hpp"

namespace batch_tests {

using namespace batch_core;
using namespace batch_core::async;
using ::testing::ElementsAre;

class TaskSchedulerTest : public batch_tests::DatabaseTestBase {
 protected:
  void TearDown() override {
    if (scheduler_) {
      adapter_.release_all();
      scheduler_.reset();
    }
    batch_tests::DatabaseTestBase::TearDown();
  }

  void start_scheduler(int max_concurrent = 2) {
    TaskCenterConfigPatch patch;
    patch.max_concurrent_tasks = max_concurrent;
    config_repo_->set_many(patch);
    scheduler_ = std::make_unique<TaskScheduler>(*task_repo_, *log_repo_, *config_repo_, adapter_,
                                                 events_);
    scheduler_->start();
  }

  long long create(const std::string& name) {
    return task_repo_->create_task(TestUtilities::create_test_new_task(name)).id;
  }

  Task load(long long task_id) {
    auto task = task_repo_->get_task_by_id(task_id);
    EXPECT_TRUE(task.has_value());
    return task.value_or(Task{});
  }

  static bool wait_for(const std::function<bool()>& condition,
                       std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
      if (condition()) {
        return true;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return condition();
  }

  bool idle() { return scheduler_->wait_until_idle(std::chrono::seconds(5)); }

  FakeExecutionAdapter adapter_;
  RecordingEventSink events_;
  std::unique_ptr<TaskScheduler> scheduler_;
};

TEST_F(TaskSchedulerTest, NothingAdmittedBeforeStart) {
  scheduler_ = std::make_unique<TaskScheduler>(*task_repo_, *log_repo_, *config_repo_, adapter_,
                                               events_);
  long long id = create("early");

  EXPECT_TRUE(scheduler_->enqueue(id));
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  EXPECT_TRUE(adapter_.started().empty());
  EXPECT_EQ(load(id).status, TaskStatus::QUEUED);

  scheduler_->start();
  ASSERT_TRUE(adapter_.wait_for_started(1));
  adapter_.release_all();
  ASSERT_TRUE(idle());
  EXPECT_EQ(load(id).status, TaskStatus::COMPLETED);
}

TEST_F(TaskSchedulerTest, RunsQueuedTasksInFifoOrder_ConcurrencyOne) {
  start_scheduler(1);
  long long a = create("a");
  long long b = create("b");
  long long c = create("c");

  ASSERT_TRUE(scheduler_->enqueue(a));
  ASSERT_TRUE(scheduler_->enqueue(b));
  ASSERT_TRUE(scheduler_->enqueue(c));

  ASSERT_TRUE(adapter_.wait_for_started(1));
  EXPECT_EQ(load(a).status, TaskStatus::RUNNING);
  EXPECT_EQ(load(b).status, TaskStatus::QUEUED);
  EXPECT_EQ(load(c).status, TaskStatus::QUEUED);
  EXPECT_TRUE(scheduler_->is_waiting(b));

  adapter_.release(a);
  ASSERT_TRUE(adapter_.wait_for_started(2));
  adapter_.release(b);
  ASSERT_TRUE(adapter_.wait_for_started(3));
  adapter_.release(c);
  ASSERT_TRUE(idle());

  EXPECT_THAT(adapter_.started(), ElementsAre(a, b, c));
  EXPECT_EQ(adapter_.max_active(), 1);
  for (long long id : {a, b, c}) {
    Task task = load(id);
    EXPECT_EQ(task.status, TaskStatus::COMPLETED);
    EXPECT_EQ(task.progress, 100);
    EXPECT_TRUE(task.completed_at.has_value());
    EXPECT_EQ(events_.count(TaskEventKind::Completed, id), 1);
  }
}

TEST_F(TaskSchedulerTest, RespectsConcurrencyLimit) {
  start_scheduler(2);
  for (int i = 0; i < 4; ++i) {
    scheduler_->enqueue(create("t" + std::to_string(i)));
  }

  ASSERT_TRUE(adapter_.wait_for_started(2));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_EQ(adapter_.started().size(), 2u);

  QueueStatus status = scheduler_->get_queue_status();
  EXPECT_EQ(status.running, 2);
  EXPECT_EQ(status.queued, 2);
  EXPECT_EQ(status.max_concurrent, 2);
  EXPECT_EQ(status.threads_per_task, 4);
  EXPECT_EQ(status.total_threads, 8);

  adapter_.release_all();
  ASSERT_TRUE(idle());
  EXPECT_EQ(adapter_.started().size(), 4u);
  EXPECT_EQ(adapter_.max_active(), 2);
}

TEST_F(TaskSchedulerTest, UpdateConfig_AdmitsMoreWork) {
  start_scheduler(1);
  for (int i = 0; i < 3; ++i) {
    scheduler_->enqueue(create("t" + std::to_string(i)));
  }
  ASSERT_TRUE(adapter_.wait_for_started(1));

  TaskCenterConfigPatch patch;
  patch.max_concurrent_tasks = 3;
  scheduler_->update_config(patch);

  EXPECT_TRUE(adapter_.wait_for_started(3));
  EXPECT_EQ(scheduler_->config().max_concurrent_tasks, 3);
  EXPECT_EQ(config_repo_->get_all().max_concurrent_tasks, 3);

  TaskCenterConfigPatch bad;
  bad.max_concurrent_tasks = 0;
  EXPECT_THROW(scheduler_->update_config(bad), ValidationError);
  EXPECT_EQ(scheduler_->config().max_concurrent_tasks, 3);
}

TEST_F(TaskSchedulerTest, Failure_PersistsErrorAndLogLine) {
  start_scheduler(1);
  long long id = create("broken");
  adapter_.fail(id, "PROCESS_EXIT", "exit status 3");

  Task observed;
  scheduler_->set_failure_observer([&](const Task& task) { observed = task; });

  scheduler_->enqueue(id);
  adapter_.release(id);
  ASSERT_TRUE(idle());

  Task task = load(id);
  EXPECT_EQ(task.status, TaskStatus::FAILED);
  ASSERT_TRUE(task.error.has_value());
  EXPECT_EQ(task.error->code, "PROCESS_EXIT");
  EXPECT_EQ(task.error->message, "exit status 3");
  EXPECT_EQ(task.error->stack, "at fake_job");
  EXPECT_TRUE(task.completed_at.has_value());

  auto logs = log_repo_->get_task_logs(id);
  ASSERT_FALSE(logs.empty());
  EXPECT_EQ(logs.back().level, LogLevel::Error);
  EXPECT_EQ(logs.back().message, "exit status 3");

  EXPECT_EQ(events_.count(TaskEventKind::Failed, id), 1);
  ASSERT_TRUE(wait_for([&] { return observed.id == id; }));
  EXPECT_EQ(observed.status, TaskStatus::FAILED);
}

TEST_F(TaskSchedulerTest, PlainExceptionBecomesExecutionError) {
  start_scheduler(1);
  adapter_.set_handler([](const Task&, ExecutionContext&) -> ExecutionResult {
    throw std::runtime_error("unexpected");
  });
  long long id = create("throws");
  scheduler_->enqueue(id);
  ASSERT_TRUE(idle());

  Task task = load(id);
  EXPECT_EQ(task.status, TaskStatus::FAILED);
  EXPECT_EQ(task.error->code, "EXECUTION_ERROR");
  EXPECT_EQ(task.error->message, "unexpected");
}

TEST_F(TaskSchedulerTest, NonStandardThrowFailsOnlyThatTask) {
  start_scheduler(1);
  adapter_.set_handler([](const Task& task, ExecutionContext&) -> ExecutionResult {
    if (task.name == "throws int") {
      throw 42;
    }
    return ExecutionResult{};
  });
  long long bad = create("throws int");
  long long good = create("fine");
  scheduler_->enqueue(bad);
  scheduler_->enqueue(good);
  ASSERT_TRUE(idle());

  Task task = load(bad);
  EXPECT_EQ(task.status, TaskStatus::FAILED);
  ASSERT_TRUE(task.error.has_value());
  EXPECT_EQ(task.error->code, "EXECUTION_ERROR");
  EXPECT_EQ(task.error->message, "Unknown exception");
  EXPECT_EQ(load(good).status, TaskStatus::COMPLETED);
}

TEST_F(TaskSchedulerTest, Retry_AfterFailureRunsAgain) {
  start_scheduler(1);
  std::atomic<int> calls{0};
  adapter_.set_handler([&](const Task&, ExecutionContext&) -> ExecutionResult {
    if (calls.fetch_add(1) == 0) {
      throw ExecutionError("first attempt fails", "PROCESS_EXIT");
    }
    return ExecutionResult{};
  });

  long long id = create("flaky");
  scheduler_->enqueue(id);
  ASSERT_TRUE(idle());
  Task failed = load(id);
  ASSERT_EQ(failed.status, TaskStatus::FAILED);

  EXPECT_TRUE(scheduler_->retry(id));
  ASSERT_TRUE(idle());

  Task task = load(id);
  EXPECT_EQ(task.status, TaskStatus::COMPLETED);
  EXPECT_EQ(task.retry_count, 1);
  EXPECT_FALSE(task.error.has_value());
  // started_at belongs to the first run
  EXPECT_EQ(task.started_at, failed.started_at);
  EXPECT_EQ(calls.load(), 2);

  // Completed tasks are not retryable
  EXPECT_FALSE(scheduler_->retry(id));
}

TEST_F(TaskSchedulerTest, Enqueue_RejectsActiveStatusesAndUnknownIds) {
  start_scheduler(1);
  long long running = create("running");
  long long queued = create("queued");
  scheduler_->enqueue(running);
  scheduler_->enqueue(queued);
  ASSERT_TRUE(adapter_.wait_for_started(1));

  EXPECT_FALSE(scheduler_->enqueue(running));
  EXPECT_FALSE(scheduler_->enqueue(queued));
  EXPECT_THROW(scheduler_->enqueue(987654), NotFoundError);
  EXPECT_THROW(scheduler_->retry(987654), NotFoundError);
  EXPECT_THROW(scheduler_->cancel(987654), NotFoundError);

  adapter_.release_all();
  ASSERT_TRUE(idle());
  // The duplicate enqueue attempts did not produce extra runs
  EXPECT_EQ(adapter_.started().size(), 2u);
}

TEST_F(TaskSchedulerTest, CompletedTask_CanBeResubmitted) {
  start_scheduler(1);
  adapter_.set_handler([](const Task&, ExecutionContext&) { return ExecutionResult{}; });
  long long id = create("again");

  scheduler_->enqueue(id);
  ASSERT_TRUE(idle());
  ASSERT_EQ(load(id).status, TaskStatus::COMPLETED);

  EXPECT_TRUE(scheduler_->enqueue(id));
  ASSERT_TRUE(idle());
  EXPECT_EQ(load(id).status, TaskStatus::COMPLETED);
  EXPECT_EQ(adapter_.started().size(), 2u);
  EXPECT_EQ(load(id).retry_count, 0);
}

TEST_F(TaskSchedulerTest, Cancel_QueuedTaskTwice) {
  start_scheduler(1);
  long long a = create("a");
  long long b = create("b");
  scheduler_->enqueue(a);
  scheduler_->enqueue(b);
  ASSERT_TRUE(adapter_.wait_for_started(1));

  EXPECT_TRUE(scheduler_->cancel(b));
  EXPECT_FALSE(scheduler_->cancel(b));
  EXPECT_EQ(load(b).status, TaskStatus::CANCELLED);
  EXPECT_FALSE(scheduler_->is_waiting(b));
  EXPECT_EQ(events_.count(TaskEventKind::Cancelled, b), 1);

  adapter_.release(a);
  ASSERT_TRUE(idle());
  EXPECT_THAT(adapter_.started(), ElementsAre(a));
}

TEST_F(TaskSchedulerTest, Cancel_RunningTaskDiscardsLateResult) {
  start_scheduler(1);
  long long id = create("long job");
  adapter_.fail(id, "PROCESS_EXIT", "would have failed");
  scheduler_->enqueue(id);
  ASSERT_TRUE(adapter_.wait_for_started(1));

  EXPECT_TRUE(scheduler_->cancel(id));
  EXPECT_FALSE(scheduler_->is_executing(id));
  ASSERT_TRUE(idle());

  EXPECT_THAT(adapter_.lost_ownership(), ElementsAre(id));
  Task task = load(id);
  EXPECT_EQ(task.status, TaskStatus::CANCELLED);
  EXPECT_FALSE(task.error.has_value());
  EXPECT_EQ(events_.count(TaskEventKind::Failed, id), 0);
  EXPECT_EQ(events_.count(TaskEventKind::Cancelled, id), 1);
}

TEST_F(TaskSchedulerTest, CancelAll_DrainsWaitListThenRunning) {
  start_scheduler(1);
  long long a = create("a");
  long long b = create("b");
  long long c = create("c");
  scheduler_->enqueue(a);
  scheduler_->enqueue(b);
  scheduler_->enqueue(c);
  ASSERT_TRUE(adapter_.wait_for_started(1));

  EXPECT_EQ(scheduler_->cancel_all(), 3);
  ASSERT_TRUE(idle());

  EXPECT_THAT(adapter_.started(), ElementsAre(a));
  for (long long id : {a, b, c}) {
    EXPECT_EQ(load(id).status, TaskStatus::CANCELLED);
  }
}

TEST_F(TaskSchedulerTest, PauseAllResumeAll_ExcludesPausedTime) {
  start_scheduler(1);
  long long id = create("pausable");
  const auto begin = std::chrono::steady_clock::now();
  scheduler_->enqueue(id);
  ASSERT_TRUE(adapter_.wait_for_started(1));

  EXPECT_EQ(scheduler_->pause_all(), 1);
  EXPECT_EQ(load(id).status, TaskStatus::PAUSED);
  EXPECT_EQ(scheduler_->pause_all(), 0);
  std::this_thread::sleep_for(std::chrono::milliseconds(300));

  EXPECT_EQ(scheduler_->resume_all(), 1);
  EXPECT_EQ(load(id).status, TaskStatus::RUNNING);
  EXPECT_EQ(scheduler_->resume_all(), 0);

  adapter_.release(id);
  ASSERT_TRUE(idle());
  const auto wall_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                           std::chrono::steady_clock::now() - begin)
                           .count();

  Task task = load(id);
  EXPECT_EQ(task.status, TaskStatus::COMPLETED);
  EXPECT_LE(task.execution_time_ms, wall_ms - 250);
}

TEST_F(TaskSchedulerTest, PauseResume_OnlyForExecutingTasks) {
  start_scheduler(1);
  long long running = create("running");
  long long waiting = create("waiting");
  scheduler_->enqueue(running);
  scheduler_->enqueue(waiting);
  ASSERT_TRUE(adapter_.wait_for_started(1));

  EXPECT_FALSE(scheduler_->pause(waiting));
  EXPECT_FALSE(scheduler_->resume(running));
  EXPECT_TRUE(scheduler_->pause(running));
  EXPECT_FALSE(scheduler_->pause(running));
  EXPECT_TRUE(scheduler_->resume(running));

  adapter_.release_all();
  ASSERT_TRUE(idle());
}

TEST_F(TaskSchedulerTest, ContextCallbacks_ProgressLogsOutputsAndPid) {
  start_scheduler(1);
  std::atomic<int> pid_seen{0};
  adapter_.set_handler([&](const Task& task, ExecutionContext& context) {
    context.process_started(4321);
    auto bound = task_repo_->get_task_by_id(task.id, false, false);
    pid_seen = bound && bound->pid ? *bound->pid : -1;

    context.progress(150, std::string("encoding"));
    context.progress(-5);
    EXPECT_TRUE(context.log(LogLevel::Info, "frame 10", std::string("raw frame 10")));
    EXPECT_TRUE(context.is_still_owned());
    EXPECT_FALSE(context.is_paused());
    EXPECT_EQ(context.threads_per_task(), 4);
    context.process_exited();

    ExecutionResult result;
    TaskOutput output;
    output.path = "/out/final.mp4";
    output.kind = OutputKind::VIDEO;
    output.size = 99;
    result.outputs.push_back(output);
    return result;
  });

  long long id = create("callbacks");
  scheduler_->enqueue(id);
  ASSERT_TRUE(idle());

  EXPECT_EQ(pid_seen.load(), 4321);
  Task task = load(id);
  EXPECT_EQ(task.status, TaskStatus::COMPLETED);
  EXPECT_FALSE(task.pid.has_value());
  EXPECT_EQ(task.current_step, "encoding");
  ASSERT_EQ(task.outputs.size(), 1u);
  EXPECT_EQ(task.outputs[0].path, "/out/final.mp4");

  std::vector<int> progress_values;
  for (const auto& event : events_.events()) {
    if (event.kind == TaskEventKind::Progress && event.task_id == id) {
      progress_values.push_back(event.progress.value_or(-1));
    }
  }
  EXPECT_THAT(progress_values, ElementsAre(100, 0));

  auto logs = log_repo_->get_task_logs(id);
  ASSERT_EQ(logs.size(), 1u);
  EXPECT_EQ(logs[0].message, "frame 10");
  EXPECT_EQ(logs[0].raw, "raw frame 10");
  EXPECT_EQ(events_.count(TaskEventKind::Log, id), 1);
}

TEST_F(TaskSchedulerTest, CallbacksAfterCancelAreDropped) {
  start_scheduler(1);
  std::atomic<bool> cancelled{false};
  std::atomic<bool> late_log_accepted{true};
  adapter_.set_handler([&](const Task&, ExecutionContext& context) {
    while (!cancelled) {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    context.progress(80);
    late_log_accepted = context.log(LogLevel::Info, "too late");
    return ExecutionResult{};
  });

  long long id = create("late");
  scheduler_->enqueue(id);
  ASSERT_TRUE(adapter_.wait_for_started(1));
  ASSERT_TRUE(scheduler_->cancel(id));
  cancelled = true;
  ASSERT_TRUE(idle());

  Task task = load(id);
  EXPECT_EQ(task.status, TaskStatus::CANCELLED);
  EXPECT_EQ(task.progress, 0);
  EXPECT_FALSE(late_log_accepted.load());
  EXPECT_EQ(log_repo_->get_log_count(id), 0);
  EXPECT_EQ(events_.count(TaskEventKind::Completed, id), 0);
}

TEST_F(TaskSchedulerTest, ReconcileAbandoned_FailsInterruptedAndRequeues) {
  long long running = create("was running");
  long long paused = create("was paused");
  long long queued = create("was queued");
  task_repo_->update_task_status(running, TaskStatus::RUNNING);
  task_repo_->update_task_pid(running, 55555);
  task_repo_->update_task_status(paused, TaskStatus::PAUSED);
  task_repo_->update_task_status(queued, TaskStatus::QUEUED);

  start_scheduler(2);

  for (long long id : {running, paused}) {
    Task task = load(id);
    EXPECT_EQ(task.status, TaskStatus::FAILED);
    ASSERT_TRUE(task.error.has_value());
    EXPECT_EQ(task.error->code, ABANDONED_ERROR_CODE);
    EXPECT_FALSE(task.pid.has_value());
    EXPECT_EQ(log_repo_->get_log_count(id), 1);
    EXPECT_EQ(events_.count(TaskEventKind::Failed, id), 1);
  }
  EXPECT_NE(load(paused).error->message.find("paused"), std::string::npos);

  ASSERT_TRUE(adapter_.wait_for_started(1));
  EXPECT_THAT(adapter_.started(), ElementsAre(queued));
  adapter_.release_all();
  ASSERT_TRUE(idle());
  EXPECT_EQ(load(queued).status, TaskStatus::COMPLETED);
}

TEST_F(TaskSchedulerTest, Shutdown_PersistsPausedThenNextStartAbandons) {
  start_scheduler(1);
  long long id = create("interrupted");
  scheduler_->enqueue(id);
  ASSERT_TRUE(adapter_.wait_for_started(1));

  scheduler_->shutdown();
  EXPECT_EQ(load(id).status, TaskStatus::PAUSED);
  EXPECT_THAT(adapter_.lost_ownership(), ElementsAre(id));
  // Safe to call twice
  scheduler_->shutdown();

  scheduler_ = std::make_unique<TaskScheduler>(*task_repo_, *log_repo_, *config_repo_, adapter_,
                                               events_);
  scheduler_->start();

  Task task = load(id);
  EXPECT_EQ(task.status, TaskStatus::FAILED);
  EXPECT_EQ(task.error->code, ABANDONED_ERROR_CODE);
}

TEST_F(TaskSchedulerTest, CompletionWriteFailure_FailsWithStoreError) {
  start_scheduler(1);
  long long id = create("unrecordable");
  {
    PooledConnection conn(*db_manager_);
    *conn << "CREATE TRIGGER reject_completed BEFORE UPDATE ON tasks "
             "WHEN NEW.status = 'completed' BEGIN SELECT RAISE(ABORT, 'disk is full'); END;";
  }

  scheduler_->enqueue(id);
  adapter_.release(id);
  ASSERT_TRUE(idle());

  Task task = load(id);
  EXPECT_EQ(task.status, TaskStatus::FAILED);
  ASSERT_TRUE(task.error.has_value());
  EXPECT_EQ(task.error->code, STORE_ERROR_CODE);
  EXPECT_NE(task.error->message.find("Could not record completion"), std::string::npos);
  EXPECT_EQ(events_.count(TaskEventKind::Failed, id), 1);
  EXPECT_EQ(events_.count(TaskEventKind::Completed, id), 0);
}

TEST_F(TaskSchedulerTest, UnwritableOutcome_TaskStaysCancellable) {
  start_scheduler(1);
  long long id = create("stuck");
  {
    PooledConnection conn(*db_manager_);
    *conn << "CREATE TRIGGER reject_terminal BEFORE UPDATE ON tasks "
             "WHEN NEW.status IN ('completed', 'failed') "
             "BEGIN SELECT RAISE(ABORT, 'disk is full'); END;";
  }

  scheduler_->enqueue(id);
  adapter_.release(id);
  ASSERT_TRUE(idle());
  EXPECT_EQ(load(id).status, TaskStatus::RUNNING);
  EXPECT_FALSE(scheduler_->is_executing(id));

  EXPECT_TRUE(scheduler_->cancel(id));
  EXPECT_EQ(load(id).status, TaskStatus::CANCELLED);
  EXPECT_EQ(events_.count(TaskEventKind::Cancelled, id), 1);
  EXPECT_FALSE(scheduler_->cancel(id));
}

TEST_F(TaskSchedulerTest, UnwritableOutcome_ReconcileMarksAbandoned) {
  start_scheduler(1);
  long long id = create("stuck until reconcile");
  {
    PooledConnection conn(*db_manager_);
    *conn << "CREATE TRIGGER reject_terminal BEFORE UPDATE ON tasks "
             "WHEN NEW.status IN ('completed', 'failed') "
             "BEGIN SELECT RAISE(ABORT, 'disk is full'); END;";
  }
  scheduler_->enqueue(id);
  adapter_.release(id);
  ASSERT_TRUE(idle());
  ASSERT_EQ(load(id).status, TaskStatus::RUNNING);

  {
    PooledConnection conn(*db_manager_);
    *conn << "DROP TRIGGER reject_terminal;";
  }
  EXPECT_EQ(scheduler_->reconcile_abandoned(), 1);
  Task task = load(id);
  EXPECT_EQ(task.status, TaskStatus::FAILED);
  EXPECT_EQ(task.error->code, ABANDONED_ERROR_CODE);
  EXPECT_FALSE(scheduler_->cancel(id));
}

// Calls back into the scheduler from notify(), the way a UI refreshes its
// queue counters when a task finishes
class ReentrantEventSink : public IEventSink {
 public:
  void notify(const TaskEvent& event) override {
    if (scheduler_ == nullptr) {
      return;
    }
    const QueueStatus status = scheduler_->get_queue_status();
    bool retry = false;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      seen_.emplace_back(event.kind, status.running);
      if (event.kind == TaskEventKind::Failed && !retried_) {
        retried_ = true;
        retry = true;
      }
    }
    if (retry) {
      scheduler_->retry(event.task_id);
    }
  }

  void attach(TaskScheduler* scheduler) { scheduler_ = scheduler; }

  std::vector<std::pair<TaskEventKind, int>> seen() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return seen_;
  }

 private:
  std::atomic<TaskScheduler*> scheduler_{nullptr};
  mutable std::mutex mtx_;
  std::vector<std::pair<TaskEventKind, int>> seen_;
  bool retried_ = false;
};

class TaskSchedulerReentryTest : public TaskSchedulerTest {
 protected:
  ReentrantEventSink sink_;
};

TEST_F(TaskSchedulerReentryTest, SinkMayQueryAndRetryFromNotify) {
  TaskCenterConfigPatch patch;
  patch.max_concurrent_tasks = 1;
  config_repo_->set_many(patch);
  scheduler_ = std::make_unique<TaskScheduler>(*task_repo_, *log_repo_, *config_repo_, adapter_,
                                               sink_);
  sink_.attach(scheduler_.get());

  std::atomic<int> calls{0};
  adapter_.set_handler([&](const Task&, ExecutionContext&) -> ExecutionResult {
    if (calls.fetch_add(1) == 0) {
      throw ExecutionError("first attempt fails", "PROCESS_EXIT");
    }
    return ExecutionResult{};
  });
  scheduler_->start();

  long long id = create("reentrant");
  ASSERT_TRUE(scheduler_->enqueue(id));
  ASSERT_TRUE(wait_for([&] { return load(id).status == TaskStatus::COMPLETED; }));
  ASSERT_TRUE(idle());

  EXPECT_EQ(calls.load(), 2);
  EXPECT_EQ(load(id).retry_count, 1);

  auto seen = sink_.seen();
  auto completed = std::find_if(seen.begin(), seen.end(), [](const auto& entry) {
    return entry.first == TaskEventKind::Completed;
  });
  ASSERT_NE(completed, seen.end());
  // The execution record is gone by the time the sink hears about it
  EXPECT_EQ(completed->second, 0);
  auto failed = std::find_if(seen.begin(), seen.end(), [](const auto& entry) {
    return entry.first == TaskEventKind::Failed;
  });
  ASSERT_NE(failed, seen.end());
  EXPECT_LT(failed - seen.begin(), completed - seen.begin());

  sink_.attach(nullptr);
}

}  // namespace batch_tests
