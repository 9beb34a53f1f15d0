#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "batch_core/db/models/task.hpp"

namespace batch_core {

struct TaskFilter {
  std::vector<TaskStatus> statuses;
  std::vector<TaskType> types;
  std::optional<std::string> search;  // substring of name
  std::optional<std::chrono::system_clock::time_point> created_from;
  std::optional<std::chrono::system_clock::time_point> created_to;
};

enum class TaskSortField { CREATED_AT, UPDATED_AT, PRIORITY, PROGRESS };
enum class SortOrder { ASC, DESC };

TaskSortField task_sort_field_from_string(const std::string &str);

struct TaskSort {
  TaskSortField field = TaskSortField::CREATED_AT;
  SortOrder order = SortOrder::DESC;
};

struct TaskListOptions {
  TaskFilter filter;
  TaskSort sort;
  int page = 1;
  int page_size = 50;
  bool with_files = false;
  bool with_outputs = false;
};

// queued and paused tasks are counted as pending
struct TaskStats {
  int pending = 0;
  int running = 0;
  int completed = 0;
  int failed = 0;
  int cancelled = 0;
  long long total_execution_time_ms = 0;
};

struct TaskListResult {
  std::vector<Task> tasks;
  int total = 0;
  int page = 1;
  int page_size = 50;
  TaskStats stats;
};

struct DatabaseStats {
  int task_count = 0;
  int log_count = 0;
  int output_count = 0;
  std::optional<std::chrono::system_clock::time_point> oldest_task;
  std::optional<std::chrono::system_clock::time_point> newest_task;
};

nlohmann::json to_json(const TaskStats &stats);
nlohmann::json to_json(const TaskListResult &result);
nlohmann::json to_json(const DatabaseStats &stats);

}  // namespace batch_core
