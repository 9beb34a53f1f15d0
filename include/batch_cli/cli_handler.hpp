#pragma once

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "batch_cli/app_config.hpp"
#include "batch_core/db/models/task_query.hpp"
#include "batch_core/services/task_center.hpp"

namespace batch_cli {

enum class Command {
  Submit,
  List,
  Get,
  Start,
  Cancel,
  Retry,
  Delete,
  Logs,
  Recent,
  ClearCompleted,
  ClearFailed,
  ClearCancelled,
  ConfigGet,
  ConfigSet,
  ConfigReset,
  Status,
  Cpu,
  Run,
  Help
};

struct CliOptions {
  Command command = Command::Help;
  std::string config_path;  // --config, empty when not given

  long long task_id = 0;

  // submit
  batch_core::NewTask new_task;

  // list
  batch_core::TaskListOptions list_options;

  // logs / recent
  int limit = 0;
  int offset = 0;

  // clear-completed
  int days = 0;

  // config set
  std::string config_key;
  nlohmann::json config_value;
};

class CliError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Parses `[--config FILE] <command> [args]`. Throws CliError on bad usage.
CliOptions parse_arguments(int argc, char *argv[]);

void print_help(std::ostream &out);

class CliHandler {
 public:
  CliHandler(batch_core::TaskCenter &center, const AppConfig &config, std::ostream &out = std::cout);

  // Disable copy constructor and assignment
  CliHandler(const CliHandler &) = delete;
  CliHandler &operator=(const CliHandler &) = delete;

  void execute_command(const CliOptions &options);

 private:
  batch_core::TaskCenter &center_;
  const AppConfig &config_;
  std::ostream &out_;

  // Command handlers
  void handle_submit_command(const CliOptions &options);
  void handle_list_command(const CliOptions &options);
  void handle_get_command(const CliOptions &options);
  void handle_lifecycle_command(const CliOptions &options);
  void handle_delete_command(const CliOptions &options);
  void handle_logs_command(const CliOptions &options);
  void handle_recent_command(const CliOptions &options);
  void handle_clear_command(const CliOptions &options);
  void handle_config_command(const CliOptions &options);
  void handle_status_command();
  void handle_cpu_command();
  void handle_run_command();

  void print_json(const nlohmann::json &value);
};

}  // namespace batch_cli
