#include "batch_core/async/event_sink.hpp"

namespace batch_core::async {

std::string to_string(TaskEventKind kind) {
  switch (kind) {
    case TaskEventKind::Created: return "created";
    case TaskEventKind::Updated: return "updated";
    case TaskEventKind::Started: return "started";
    case TaskEventKind::Progress: return "progress";
    case TaskEventKind::Log: return "log";
    case TaskEventKind::Completed: return "completed";
    case TaskEventKind::Failed: return "failed";
    case TaskEventKind::Cancelled: return "cancelled";
    case TaskEventKind::Deleted: return "deleted";
  }
  return "unknown";
}

nlohmann::json to_json(const TaskEvent& event) {
  nlohmann::json j = {{"event", to_string(event.kind)}, {"taskId", event.task_id}};
  if (event.task) {
    j["task"] = batch_core::to_json(*event.task);
  }
  if (event.progress) {
    j["progress"] = *event.progress;
  }
  if (event.current_step) {
    j["currentStep"] = *event.current_step;
  }
  if (event.log) {
    j["log"] = batch_core::to_json(*event.log);
  }
  return j;
}

void notify_safely(IEventSink& sink, const TaskEvent& event) {
  try {
    sink.notify(event);
  } catch (const std::exception& e) {
    std::cerr << "[EventSink] " << to_string(event.kind) << " event for task " << event.task_id
              << " was dropped: " << e.what() << std::endl;
  }
}

ConsoleEventSink::ConsoleEventSink(std::ostream& out, bool show_logs)
    : out_(out), show_logs_(show_logs) {}

void ConsoleEventSink::notify(const TaskEvent& event) {
  if (event.kind == TaskEventKind::Log && !show_logs_) {
    return;
  }

  std::lock_guard<std::mutex> lock(out_mtx_);
  out_ << "[Task " << event.task_id << "] " << to_string(event.kind);
  switch (event.kind) {
    case TaskEventKind::Progress:
      if (event.progress) out_ << " " << *event.progress << "%";
      if (event.current_step) out_ << " " << *event.current_step;
      break;
    case TaskEventKind::Log:
      if (event.log) out_ << " [" << batch_core::to_string(event.log->level) << "] " << event.log->message;
      break;
    case TaskEventKind::Failed:
      if (event.task && event.task->error) {
        out_ << ": " << event.task->error->code.value_or("EXECUTION_ERROR") << " "
             << event.task->error->message;
      }
      break;
    case TaskEventKind::Completed:
      if (event.task) out_ << " in " << event.task->execution_time_ms << " ms";
      break;
    default:
      if (event.task) out_ << " (" << batch_core::to_string(event.task->status) << ")";
      break;
  }
  out_ << std::endl;
}

void BroadcastEventSink::add_sink(std::shared_ptr<IEventSink> sink) {
  std::lock_guard<std::mutex> lock(sinks_mtx_);
  sinks_.push_back(std::move(sink));
}

void BroadcastEventSink::notify(const TaskEvent& event) {
  std::vector<std::shared_ptr<IEventSink>> sinks;
  {
    std::lock_guard<std::mutex> lock(sinks_mtx_);
    sinks = sinks_;
  }
  for (const auto& sink : sinks) {
    notify_safely(*sink, event);
  }
}

size_t BroadcastEventSink::size() const {
  std::lock_guard<std::mutex> lock(sinks_mtx_);
  return sinks_.size();
}

}  // namespace batch_core::async
