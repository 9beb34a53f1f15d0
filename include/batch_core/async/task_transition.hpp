#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "batch_core/db/models/task.hpp"
#include "batch_core/errors.hpp"

namespace batch_core::async {

enum class TransitionKind { Enqueue, Admit, Pause, Resume, Complete, Fail, Cancel, Retry, Abandon };

std::string to_string(TransitionKind kind);

inline constexpr const char* ABANDONED_ERROR_CODE = "ABANDONED";
// The run ended but its outcome could not be written
inline constexpr const char* STORE_ERROR_CODE = "STORE_ERROR";

struct TaskTransition {
  TransitionKind kind;
  std::optional<TaskError> error;               // Fail
  std::optional<long long> execution_time_ms;   // Complete, Fail

  static TaskTransition of(TransitionKind kind) { return TaskTransition{kind, std::nullopt, std::nullopt}; }
  static TaskTransition complete(long long execution_time_ms) {
    return TaskTransition{TransitionKind::Complete, std::nullopt, execution_time_ms};
  }
  static TaskTransition fail(TaskError error, std::optional<long long> execution_time_ms = std::nullopt) {
    return TaskTransition{TransitionKind::Fail, std::move(error), execution_time_ms};
  }
};

struct TransitionResult {
  Task next;            // in-memory view after the change
  StatusExtras extras;  // what TaskRepo::update_task_status should write
  bool clears_pid = false;
  bool increments_retry = false;
};

class IllegalTransitionError : public BatchError {
 public:
  IllegalTransitionError(TaskStatus from, TransitionKind kind)
      : BatchError("Cannot " + to_string(kind) + " a task that is " + batch_core::to_string(from)),
        from_(from),
        kind_(kind) {}

  TaskStatus from() const { return from_; }
  TransitionKind kind() const { return kind_; }

 private:
  TaskStatus from_;
  TransitionKind kind_;
};

bool can_apply(TaskStatus from, TransitionKind kind);

// Pure. Throws IllegalTransitionError when `kind` is not allowed from the
// task's current status.
TransitionResult apply_transition(const Task& task, const TaskTransition& transition,
                                  std::chrono::system_clock::time_point now);

}  // namespace batch_core::async
