#include "batch_core/async/task_transition.hpp"

namespace batch_core::async {

std::string to_string(TransitionKind kind) {
  switch (kind) {
    case TransitionKind::Enqueue: return "enqueue";
    case TransitionKind::Admit: return "admit";
    case TransitionKind::Pause: return "pause";
    case TransitionKind::Resume: return "resume";
    case TransitionKind::Complete: return "complete";
    case TransitionKind::Fail: return "fail";
    case TransitionKind::Cancel: return "cancel";
    case TransitionKind::Retry: return "retry";
    case TransitionKind::Abandon: return "abandon";
  }
  return "unknown";
}

bool can_apply(TaskStatus from, TransitionKind kind) {
  switch (kind) {
    case TransitionKind::Enqueue:
      return from == TaskStatus::PENDING || is_terminal(from);
    case TransitionKind::Admit:
      return from == TaskStatus::QUEUED;
    case TransitionKind::Pause:
      return from == TaskStatus::RUNNING;
    case TransitionKind::Resume:
      return from == TaskStatus::PAUSED;
    case TransitionKind::Complete:
    case TransitionKind::Fail:
    case TransitionKind::Abandon:
      return from == TaskStatus::RUNNING || from == TaskStatus::PAUSED;
    case TransitionKind::Cancel:
      return from == TaskStatus::QUEUED || from == TaskStatus::RUNNING ||
             from == TaskStatus::PAUSED;
    case TransitionKind::Retry:
      return from == TaskStatus::FAILED || from == TaskStatus::CANCELLED;
  }
  return false;
}

TransitionResult apply_transition(const Task& task, const TaskTransition& transition,
                                  std::chrono::system_clock::time_point now) {
  if (!can_apply(task.status, transition.kind)) {
    throw IllegalTransitionError(task.status, transition.kind);
  }

  TransitionResult result;
  result.next = task;
  Task& next = result.next;
  StatusExtras& extras = result.extras;
  next.updated_at = now;

  switch (transition.kind) {
    case TransitionKind::Enqueue:
      next.status = TaskStatus::QUEUED;
      // Resubmitting a finished task starts its progress over
      if (is_terminal(task.status)) {
        extras.progress = 0;
      }
      break;

    case TransitionKind::Admit:
      next.status = TaskStatus::RUNNING;
      if (!next.started_at) {
        next.started_at = now;
      }
      break;

    case TransitionKind::Pause:
      next.status = TaskStatus::PAUSED;
      break;

    case TransitionKind::Resume:
      next.status = TaskStatus::RUNNING;
      break;

    case TransitionKind::Complete:
      next.status = TaskStatus::COMPLETED;
      extras.progress = 100;
      extras.execution_time_ms = transition.execution_time_ms;
      result.clears_pid = true;
      break;

    case TransitionKind::Fail: {
      next.status = TaskStatus::FAILED;
      TaskError error = transition.error.value_or(TaskError{});
      if (!error.code) {
        error.code = "EXECUTION_ERROR";
      }
      extras.error_code = error.code;
      extras.error_message = error.message;
      extras.error_stack = error.stack;
      extras.execution_time_ms = transition.execution_time_ms;
      result.clears_pid = true;
      break;
    }

    case TransitionKind::Abandon: {
      next.status = TaskStatus::FAILED;
      TaskError error;
      error.code = std::string(ABANDONED_ERROR_CODE);
      error.message = "Task was still " + batch_core::to_string(task.status) +
                      " when the scheduler stopped";
      extras.error_code = error.code;
      extras.error_message = error.message;
      result.clears_pid = true;
      break;
    }

    case TransitionKind::Cancel:
      next.status = TaskStatus::CANCELLED;
      result.clears_pid = task.status != TaskStatus::QUEUED;
      break;

    case TransitionKind::Retry:
      next.status = TaskStatus::PENDING;
      next.retry_count = task.retry_count + 1;
      extras.progress = 0;
      result.increments_retry = true;
      break;
  }

  if (extras.progress) {
    next.progress = *extras.progress;
  }
  if (extras.execution_time_ms) {
    next.execution_time_ms = *extras.execution_time_ms;
  }
  if (extras.error_message) {
    next.error = TaskError{extras.error_code, *extras.error_message, extras.error_stack};
  }
  if (is_terminal(next.status)) {
    next.completed_at = now;
  }
  if (result.clears_pid) {
    next.pid.reset();
    next.pid_started_at.reset();
  }
  return result;
}

}  // namespace batch_core::async
