#pragma once

#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "batch_core/db/models/task.hpp"
#include "batch_core/db/models/task_log.hpp"

namespace batch_core::async {

enum class TaskEventKind { Created, Updated, Started, Progress, Log, Completed, Failed, Cancelled, Deleted };

std::string to_string(TaskEventKind kind);

struct TaskEvent {
  TaskEventKind kind = TaskEventKind::Updated;
  long long task_id = 0;
  std::optional<Task> task;  // snapshot, absent for Progress/Log/Deleted
  std::optional<int> progress;
  std::optional<std::string> current_step;
  std::optional<TaskLog> log;
};

nlohmann::json to_json(const TaskEvent& event);

// Fire-and-forget observer of task lifecycle events.
class IEventSink {
 public:
  virtual ~IEventSink() = default;
  virtual void notify(const TaskEvent& event) = 0;
};

// Delivers an event, logging instead of propagating anything the sink throws.
void notify_safely(IEventSink& sink, const TaskEvent& event);

// Prints one line per event.
class ConsoleEventSink : public IEventSink {
 public:
  explicit ConsoleEventSink(std::ostream& out = std::cout, bool show_logs = true);
  void notify(const TaskEvent& event) override;

 private:
  std::ostream& out_;
  bool show_logs_;
  std::mutex out_mtx_;
};

// Fans every event out to the registered sinks in registration order.
class BroadcastEventSink : public IEventSink {
 public:
  void add_sink(std::shared_ptr<IEventSink> sink);
  void notify(const TaskEvent& event) override;
  size_t size() const;

 private:
  mutable std::mutex sinks_mtx_;
  std::vector<std::shared_ptr<IEventSink>> sinks_;
};

}  // namespace batch_core::async
