#include "batch_core/db/models/task.hpp"

#include "batch_core/db/time_utils.hpp"
#include "batch_core/errors.hpp"

namespace batch_core {

std::string to_string(TaskStatus status) {
  switch (status) {
    case TaskStatus::PENDING: return "pending";
    case TaskStatus::QUEUED: return "queued";
    case TaskStatus::RUNNING: return "running";
    case TaskStatus::PAUSED: return "paused";
    case TaskStatus::COMPLETED: return "completed";
    case TaskStatus::FAILED: return "failed";
    case TaskStatus::CANCELLED: return "cancelled";
  }
  return "unknown";
}

TaskStatus task_status_from_string(const std::string &str) {
  if (str == "pending") return TaskStatus::PENDING;
  if (str == "queued") return TaskStatus::QUEUED;
  if (str == "running") return TaskStatus::RUNNING;
  if (str == "paused") return TaskStatus::PAUSED;
  if (str == "completed") return TaskStatus::COMPLETED;
  if (str == "failed") return TaskStatus::FAILED;
  if (str == "cancelled") return TaskStatus::CANCELLED;
  throw ValidationError("Invalid TaskStatus string: " + str);
}

bool is_terminal(TaskStatus status) {
  return status == TaskStatus::COMPLETED || status == TaskStatus::FAILED ||
         status == TaskStatus::CANCELLED;
}

std::string to_string(TaskType type) {
  switch (type) {
    case TaskType::VIDEO_MERGE: return "video_merge";
    case TaskType::VIDEO_STITCH: return "video_stitch";
    case TaskType::VIDEO_RESIZE: return "video_resize";
    case TaskType::IMAGE_MATERIAL: return "image_material";
    case TaskType::COVER_FORMAT: return "cover_format";
    case TaskType::COVER_COMPRESS: return "cover_compress";
    case TaskType::LOSSLESS_GRID: return "lossless_grid";
  }
  return "unknown";
}

TaskType task_type_from_string(const std::string &str) {
  for (TaskType type : all_task_types()) {
    if (to_string(type) == str) {
      return type;
    }
  }
  throw ValidationError("Unknown task type: " + str);
}

const std::vector<TaskType> &all_task_types() {
  static const std::vector<TaskType> types = {
      TaskType::VIDEO_MERGE,    TaskType::VIDEO_STITCH,   TaskType::VIDEO_RESIZE,
      TaskType::IMAGE_MATERIAL, TaskType::COVER_FORMAT,   TaskType::COVER_COMPRESS,
      TaskType::LOSSLESS_GRID};
  return types;
}

std::string to_string(OutputKind kind) {
  switch (kind) {
    case OutputKind::VIDEO: return "video";
    case OutputKind::IMAGE: return "image";
    case OutputKind::OTHER: return "other";
  }
  return "other";
}

OutputKind output_kind_from_string(const std::string &str) {
  if (str == "video") return OutputKind::VIDEO;
  if (str == "image") return OutputKind::IMAGE;
  return OutputKind::OTHER;
}

nlohmann::json to_json(const TaskFile &file) {
  return {{"id", file.id},
          {"path", file.path},
          {"category", file.category},
          {"categoryLabel", file.category_label},
          {"sortOrder", file.sort_order}};
}

nlohmann::json to_json(const TaskOutput &output) {
  nlohmann::json j = {{"id", output.id},
                      {"path", output.path},
                      {"type", to_string(output.kind)},
                      {"createdAt", time_point_to_millis(output.created_at)}};
  j["size"] = output.size ? nlohmann::json(*output.size) : nlohmann::json(nullptr);
  return j;
}

nlohmann::json to_json(const Task &task) {
  auto optional_millis = [](const std::optional<std::chrono::system_clock::time_point> &tp) {
    return tp ? nlohmann::json(time_point_to_millis(*tp)) : nlohmann::json(nullptr);
  };

  nlohmann::json j;
  j["id"] = task.id;
  j["type"] = to_string(task.type);
  j["name"] = task.name;
  j["status"] = to_string(task.status);
  j["priority"] = task.priority;
  j["createdAt"] = time_point_to_millis(task.created_at);
  j["updatedAt"] = time_point_to_millis(task.updated_at);
  j["startedAt"] = optional_millis(task.started_at);
  j["completedAt"] = optional_millis(task.completed_at);
  j["executionTime"] = task.execution_time_ms;
  j["outputDir"] = task.output_dir;
  j["config"] = task.config;
  j["progress"] = task.progress;
  j["currentStep"] = task.current_step ? nlohmann::json(*task.current_step) : nlohmann::json(nullptr);
  j["retryCount"] = task.retry_count;
  j["maxRetry"] = task.max_retry;
  j["pid"] = task.pid ? nlohmann::json(*task.pid) : nlohmann::json(nullptr);
  j["pidStartedAt"] = optional_millis(task.pid_started_at);

  if (task.error) {
    j["error"] = {{"code", task.error->code ? nlohmann::json(*task.error->code) : nlohmann::json(nullptr)},
                  {"message", task.error->message},
                  {"stack", task.error->stack ? nlohmann::json(*task.error->stack) : nlohmann::json(nullptr)}};
  } else {
    j["error"] = nullptr;
  }

  j["files"] = nlohmann::json::array();
  for (const auto &file : task.files) {
    j["files"].push_back(to_json(file));
  }
  j["outputs"] = nlohmann::json::array();
  for (const auto &output : task.outputs) {
    j["outputs"].push_back(to_json(output));
  }
  return j;
}

}  // namespace batch_core
