#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "batch_core/db/models/task.hpp"
#include "batch_core/db/models/task_log.hpp"
#include "batch_core/errors.hpp"

namespace batch_core::async {

/**
 * @brief Thrown by an execution adapter when a job fails.
 *
 * The code and stack end up in the task row. Any other exception thrown by an
 * adapter is recorded with the code EXECUTION_ERROR.
 */
class ExecutionError : public BatchError {
 public:
  explicit ExecutionError(const std::string& message, std::string code = "EXECUTION_ERROR",
                          std::optional<std::string> stack = std::nullopt)
      : BatchError(message), code_(std::move(code)), stack_(std::move(stack)) {}

  const std::string& code() const { return code_; }
  const std::optional<std::string>& stack() const { return stack_; }

 private:
  std::string code_;
  std::optional<std::string> stack_;
};

struct ExecutionResult {
  std::vector<TaskOutput> outputs;
};

/**
 * @brief The scheduler's side of a running job, handed to the adapter.
 *
 * Every callback is safe to call from the runner thread. Once the task has
 * been cancelled or the scheduler has shut down, is_still_owned() returns
 * false and log/progress/process calls are dropped.
 */
class ExecutionContext {
 public:
  struct Callbacks {
    std::function<bool(LogLevel, const std::string&, const std::optional<std::string>&)> log;
    std::function<void(int, const std::optional<std::string>&)> progress;
    std::function<bool()> is_still_owned;
    std::function<bool()> is_paused;
    std::function<void(int)> process_started;
    std::function<void()> process_exited;
  };

  ExecutionContext(int threads_per_task, Callbacks callbacks)
      : threads_per_task_(threads_per_task), callbacks_(std::move(callbacks)) {}

  // Returns false when the line was dropped because the task is no longer owned.
  bool log(LogLevel level, const std::string& message,
           const std::optional<std::string>& raw = std::nullopt) {
    return callbacks_.log ? callbacks_.log(level, message, raw) : false;
  }

  void progress(int percent, const std::optional<std::string>& step = std::nullopt) {
    if (callbacks_.progress) callbacks_.progress(percent, step);
  }

  bool is_still_owned() const {
    return callbacks_.is_still_owned ? callbacks_.is_still_owned() : false;
  }

  // Advisory. Adapters may keep working while paused.
  bool is_paused() const {
    return callbacks_.is_paused ? callbacks_.is_paused() : false;
  }

  void process_started(int pid) {
    if (callbacks_.process_started) callbacks_.process_started(pid);
  }

  void process_exited() {
    if (callbacks_.process_exited) callbacks_.process_exited();
  }

  int threads_per_task() const { return threads_per_task_; }

 private:
  int threads_per_task_;
  Callbacks callbacks_;
};

/**
 * @brief Runs one task to completion on the calling thread.
 *
 * Implementations block until the job finishes, return its outputs on
 * success and throw (preferably ExecutionError) on failure. They should stop
 * early once the context reports the task is no longer owned.
 */
class IExecutionAdapter {
 public:
  virtual ~IExecutionAdapter() = default;
  virtual ExecutionResult execute(const Task& task, ExecutionContext& context) = 0;
};

}  // namespace batch_core::async
