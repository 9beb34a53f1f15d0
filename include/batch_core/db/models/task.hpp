#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace batch_core {

enum class TaskStatus { PENDING, QUEUED, RUNNING, PAUSED, COMPLETED, FAILED, CANCELLED };

std::string to_string(TaskStatus status);
TaskStatus task_status_from_string(const std::string &str);

// completed, failed and cancelled
bool is_terminal(TaskStatus status);

enum class TaskType {
  VIDEO_MERGE,
  VIDEO_STITCH,
  VIDEO_RESIZE,
  IMAGE_MATERIAL,
  COVER_FORMAT,
  COVER_COMPRESS,
  LOSSLESS_GRID
};

std::string to_string(TaskType type);
// Throws ValidationError for an unknown type name.
TaskType task_type_from_string(const std::string &str);
const std::vector<TaskType> &all_task_types();

enum class OutputKind { VIDEO, IMAGE, OTHER };

std::string to_string(OutputKind kind);
OutputKind output_kind_from_string(const std::string &str);

struct TaskFile {
  long long id = 0;
  std::string path;
  std::string category;
  std::string category_label;
  int sort_order = 0;
};

struct TaskOutput {
  long long id = 0;
  std::string path;
  OutputKind kind = OutputKind::OTHER;
  std::optional<long long> size;
  std::chrono::system_clock::time_point created_at;
};

struct TaskError {
  std::optional<std::string> code;
  std::string message;
  std::optional<std::string> stack;
};

struct Task {
  long long id = 0;
  TaskType type = TaskType::VIDEO_MERGE;
  std::string name;
  TaskStatus status = TaskStatus::PENDING;
  int priority = 0;

  std::chrono::system_clock::time_point created_at;
  std::chrono::system_clock::time_point updated_at;
  std::optional<std::chrono::system_clock::time_point> started_at;
  std::optional<std::chrono::system_clock::time_point> completed_at;
  long long execution_time_ms = 0;

  std::string output_dir;
  nlohmann::json config = nlohmann::json::object();
  std::vector<TaskFile> files;

  int progress = 0;
  std::optional<std::string> current_step;
  int retry_count = 0;
  int max_retry = 3;

  std::optional<TaskError> error;
  std::vector<TaskOutput> outputs;

  std::optional<int> pid;
  std::optional<std::chrono::system_clock::time_point> pid_started_at;
};

// Input to TaskRepo::create_task.
struct NewTask {
  TaskType type = TaskType::VIDEO_MERGE;
  std::string name;
  std::string output_dir;
  nlohmann::json config = nlohmann::json::object();
  std::vector<TaskFile> files;  // sort_order is assigned from position
  int priority = 0;
  int max_retry = 3;
};

// Optional fields written together with a status change.
struct StatusExtras {
  std::optional<int> progress;
  std::optional<std::string> current_step;
  std::optional<std::string> error_code;
  std::optional<std::string> error_message;
  std::optional<std::string> error_stack;
  std::optional<long long> execution_time_ms;
};

nlohmann::json to_json(const TaskFile &file);
nlohmann::json to_json(const TaskOutput &output);
nlohmann::json to_json(const Task &task);

}  // namespace batch_core
