#pragma once

#include <chrono>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace batch_core {

enum class LogLevel { Info, Warning, Error, Success, Debug };

std::string to_string(LogLevel level);
LogLevel log_level_from_string(const std::string &str);

struct TaskLog {
  long long id = 0;
  long long task_id = 0;
  std::chrono::system_clock::time_point timestamp;
  LogLevel level = LogLevel::Info;
  std::string message;
  std::optional<std::string> raw;
  // Only filled by TaskLogRepo::get_recent_logs
  std::optional<std::string> task_type;
};

nlohmann::json to_json(const TaskLog &log);

}  // namespace batch_core
