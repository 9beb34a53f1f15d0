#include "batch_core/db/models/task_log.hpp"

#include "batch_core/db/time_utils.hpp"
#include "batch_core/errors.hpp"

namespace batch_core {

std::string to_string(LogLevel level) {
  switch (level) {
    case LogLevel::Info: return "info";
    case LogLevel::Warning: return "warning";
    case LogLevel::Error: return "error";
    case LogLevel::Success: return "success";
    case LogLevel::Debug: return "debug";
  }
  return "info";
}

LogLevel log_level_from_string(const std::string &str) {
  if (str == "info") return LogLevel::Info;
  if (str == "warning") return LogLevel::Warning;
  if (str == "error") return LogLevel::Error;
  if (str == "success") return LogLevel::Success;
  if (str == "debug") return LogLevel::Debug;
  throw ValidationError("Invalid LogLevel string: " + str);
}

nlohmann::json to_json(const TaskLog &log) {
  nlohmann::json j = {{"id", log.id},
                      {"taskId", log.task_id},
                      {"timestamp", time_point_to_millis(log.timestamp)},
                      {"level", to_string(log.level)},
                      {"message", log.message}};
  j["raw"] = log.raw ? nlohmann::json(*log.raw) : nlohmann::json(nullptr);
  if (log.task_type) {
    j["taskType"] = *log.task_type;
  }
  return j;
}

}  // namespace batch_core
