#include "batch_core/db/models/task_query.hpp"

#include "batch_core/db/time_utils.hpp"
#include "batch_core/errors.hpp"

namespace batch_core {

TaskSortField task_sort_field_from_string(const std::string &str) {
  if (str == "createdAt" || str == "created_at") return TaskSortField::CREATED_AT;
  if (str == "updatedAt" || str == "updated_at") return TaskSortField::UPDATED_AT;
  if (str == "priority") return TaskSortField::PRIORITY;
  if (str == "progress") return TaskSortField::PROGRESS;
  throw ValidationError("Unsupported sort field: " + str);
}

nlohmann::json to_json(const TaskStats &stats) {
  return {{"pending", stats.pending},
          {"running", stats.running},
          {"completed", stats.completed},
          {"failed", stats.failed},
          {"cancelled", stats.cancelled},
          {"totalExecutionTime", stats.total_execution_time_ms}};
}

nlohmann::json to_json(const TaskListResult &result) {
  nlohmann::json tasks = nlohmann::json::array();
  for (const auto &task : result.tasks) {
    tasks.push_back(to_json(task));
  }
  return {{"tasks", tasks},
          {"total", result.total},
          {"page", result.page},
          {"pageSize", result.page_size},
          {"stats", to_json(result.stats)}};
}

nlohmann::json to_json(const DatabaseStats &stats) {
  auto optional_millis = [](const std::optional<std::chrono::system_clock::time_point> &tp) {
    return tp ? nlohmann::json(time_point_to_millis(*tp)) : nlohmann::json(nullptr);
  };
  return {{"taskCount", stats.task_count},
          {"logCount", stats.log_count},
          {"outputCount", stats.output_count},
          {"oldestTask", optional_millis(stats.oldest_task)},
          {"newestTask", optional_millis(stats.newest_task)}};
}

}  // namespace batch_core
