#include "batch_cli/cli_handler.hpp"

#include <chrono>
#include <sstream>

#include "batch_core/errors.hpp"

namespace batch_cli {

namespace {

int parse_int(const std::string &value, const std::string &flag) {
  try {
    size_t consumed = 0;
    const int parsed = std::stoi(value, &consumed);
    if (consumed != value.size()) {
      throw CliError(flag + " expects an integer, got '" + value + "'");
    }
    return parsed;
  } catch (const std::logic_error &) {
    throw CliError(flag + " expects an integer, got '" + value + "'");
  }
}

long long parse_task_id(const std::vector<std::string> &args, const std::string &usage) {
  if (args.size() < 2) {
    throw CliError("Missing task id. Usage: " + usage);
  }
  const int id = parse_int(args[1], "task id");
  if (id <= 0) {
    throw CliError("Task id must be positive. Usage: " + usage);
  }
  return id;
}

std::vector<std::string> split_csv(const std::string &value) {
  std::vector<std::string> parts;
  std::stringstream stream(value);
  std::string part;
  while (std::getline(stream, part, ',')) {
    if (!part.empty()) {
      parts.push_back(part);
    }
  }
  return parts;
}

// Returns the value following args[i], advancing i past it
const std::string &flag_value(const std::vector<std::string> &args, size_t &i) {
  if (i + 1 >= args.size()) {
    throw CliError(args[i] + " requires a value");
  }
  return args[++i];
}

void parse_submit(const std::vector<std::string> &args, CliOptions &options) {
  const std::string usage =
      "submit <type> <output_dir> <file>... [--name N] [--priority P] [--max-retry R] "
      "[--config-json J]";
  std::vector<std::string> positional;
  for (size_t i = 1; i < args.size(); ++i) {
    const std::string &arg = args[i];
    if (arg == "--name" || arg == "-n") {
      options.new_task.name = flag_value(args, i);
    } else if (arg == "--priority" || arg == "-p") {
      options.new_task.priority = parse_int(flag_value(args, i), arg);
    } else if (arg == "--max-retry") {
      options.new_task.max_retry = parse_int(flag_value(args, i), arg);
    } else if (arg == "--config-json") {
      const std::string &raw = flag_value(args, i);
      try {
        options.new_task.config = nlohmann::json::parse(raw);
      } catch (const nlohmann::json::parse_error &e) {
        throw CliError(std::string("--config-json is not valid JSON: ") + e.what());
      }
    } else {
      positional.push_back(arg);
    }
  }

  if (positional.size() < 2) {
    throw CliError("Submit requires a type and an output directory. Usage: " + usage);
  }
  options.new_task.type = batch_core::task_type_from_string(positional[0]);
  options.new_task.output_dir = positional[1];
  for (size_t i = 2; i < positional.size(); ++i) {
    batch_core::TaskFile file;
    file.path = positional[i];
    file.category = "input";
    file.category_label = "Input";
    options.new_task.files.push_back(file);
  }
}

void parse_list(const std::vector<std::string> &args, CliOptions &options) {
  batch_core::TaskListOptions &list = options.list_options;
  for (size_t i = 1; i < args.size(); ++i) {
    const std::string &arg = args[i];
    if (arg == "--status" || arg == "-s") {
      for (const auto &status : split_csv(flag_value(args, i))) {
        list.filter.statuses.push_back(batch_core::task_status_from_string(status));
      }
    } else if (arg == "--type" || arg == "-t") {
      for (const auto &type : split_csv(flag_value(args, i))) {
        list.filter.types.push_back(batch_core::task_type_from_string(type));
      }
    } else if (arg == "--search" || arg == "-q") {
      list.filter.search = flag_value(args, i);
    } else if (arg == "--page") {
      list.page = parse_int(flag_value(args, i), arg);
    } else if (arg == "--page-size") {
      list.page_size = parse_int(flag_value(args, i), arg);
    } else if (arg == "--sort") {
      list.sort.field = batch_core::task_sort_field_from_string(flag_value(args, i));
    } else if (arg == "--asc") {
      list.sort.order = batch_core::SortOrder::ASC;
    } else {
      throw CliError("Unknown list option: " + arg);
    }
  }
  if (list.page < 1 || list.page_size < 1) {
    throw CliError("--page and --page-size must be at least 1");
  }
}

void parse_paging(const std::vector<std::string> &args, size_t first, CliOptions &options) {
  for (size_t i = first; i < args.size(); ++i) {
    const std::string &arg = args[i];
    if (arg == "--limit" || arg == "-l") {
      options.limit = parse_int(flag_value(args, i), arg);
    } else if (arg == "--offset" || arg == "-o") {
      options.offset = parse_int(flag_value(args, i), arg);
    } else {
      throw CliError("Unknown option: " + arg);
    }
  }
  if (options.limit < 1 || options.offset < 0) {
    throw CliError("--limit must be at least 1 and --offset cannot be negative");
  }
}

}  // namespace

CliOptions parse_arguments(int argc, char *argv[]) {
  CliOptions options;

  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" || arg == "-c") {
      if (i + 1 >= argc) {
        throw CliError("--config requires a file path");
      }
      options.config_path = argv[++i];
    } else {
      args.push_back(arg);
    }
  }

  if (args.empty()) {
    options.command = Command::Help;
    return options;
  }

  const std::string &command = args[0];
  if (command == "submit") {
    options.command = Command::Submit;
    parse_submit(args, options);
  } else if (command == "list" || command == "ls") {
    options.command = Command::List;
    parse_list(args, options);
  } else if (command == "get") {
    options.command = Command::Get;
    options.task_id = parse_task_id(args, "get <id>");
  } else if (command == "start") {
    options.command = Command::Start;
    options.task_id = parse_task_id(args, "start <id>");
  } else if (command == "cancel") {
    options.command = Command::Cancel;
    options.task_id = parse_task_id(args, "cancel <id>");
  } else if (command == "retry") {
    options.command = Command::Retry;
    options.task_id = parse_task_id(args, "retry <id>");
  } else if (command == "delete" || command == "rm") {
    options.command = Command::Delete;
    options.task_id = parse_task_id(args, "delete <id>");
  } else if (command == "logs") {
    options.command = Command::Logs;
    options.task_id = parse_task_id(args, "logs <id> [--limit n] [--offset n]");
    options.limit = 1000;
    parse_paging(args, 2, options);
  } else if (command == "recent") {
    options.command = Command::Recent;
    options.limit = 100;
    parse_paging(args, 1, options);
  } else if (command == "clear-completed") {
    options.command = Command::ClearCompleted;
    if (args.size() > 1) {
      options.days = parse_int(args[1], "days");
      if (options.days < 0) {
        throw CliError("days cannot be negative");
      }
    }
  } else if (command == "clear-failed") {
    options.command = Command::ClearFailed;
  } else if (command == "clear-cancelled") {
    options.command = Command::ClearCancelled;
  } else if (command == "config") {
    const std::string sub = args.size() > 1 ? args[1] : "get";
    if (sub == "get") {
      options.command = Command::ConfigGet;
    } else if (sub == "set") {
      if (args.size() < 4) {
        throw CliError("Usage: config set <key> <json value>");
      }
      options.command = Command::ConfigSet;
      options.config_key = args[2];
      try {
        options.config_value = nlohmann::json::parse(args[3]);
      } catch (const nlohmann::json::parse_error &) {
        // Bare words are taken as strings
        options.config_value = args[3];
      }
    } else if (sub == "reset") {
      options.command = Command::ConfigReset;
    } else {
      throw CliError("Unknown config subcommand: " + sub);
    }
  } else if (command == "status") {
    options.command = Command::Status;
  } else if (command == "cpu") {
    options.command = Command::Cpu;
  } else if (command == "run") {
    options.command = Command::Run;
  } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
    options.command = Command::Help;
  } else {
    throw CliError("Unknown command: " + command);
  }

  return options;
}

void print_help(std::ostream &out) {
  out << "Usage: batchctl [--config FILE] <command> [args]\n"
      << "\n"
      << "Task commands:\n"
      << "  submit <type> <output_dir> <file>... [--name N] [--priority P]\n"
      << "         [--max-retry R] [--config-json J]   Create a task\n"
      << "  list [--status s,..] [--type t,..] [--search q] [--page n]\n"
      << "       [--page-size n] [--sort field] [--asc]  List tasks\n"
      << "  get <id>                                   Show one task\n"
      << "  start <id>                                 Queue a task\n"
      << "  cancel <id>                                Cancel a queued task\n"
      << "  retry <id>                                 Retry a failed or cancelled task\n"
      << "  delete <id>                                Delete a task and its logs\n"
      << "  logs <id> [--limit n] [--offset n]         Show a task's log\n"
      << "  recent [--limit n]                         Show recent log lines\n"
      << "  clear-completed [days]                     Delete completed tasks\n"
      << "  clear-failed                               Delete failed tasks\n"
      << "  clear-cancelled                            Delete cancelled tasks\n"
      << "\n"
      << "Engine commands:\n"
      << "  run                                        Run queued work until idle\n"
      << "  status                                     Queue and database summary\n"
      << "  config get | set <key> <json> | reset      Task center settings\n"
      << "  cpu                                        CPU info and recommendations\n"
      << "  help                                       Show this message\n"
      << "\n"
      << "Task types:";
  for (batch_core::TaskType type : batch_core::all_task_types()) {
    out << " " << batch_core::to_string(type);
  }
  out << "\n\nTasks only execute inside `batchctl run`. Other commands record the\n"
      << "change and return.\n";
}

CliHandler::CliHandler(batch_core::TaskCenter &center, const AppConfig &config, std::ostream &out)
    : center_(center), config_(config), out_(out) {}

void CliHandler::execute_command(const CliOptions &options) {
  switch (options.command) {
    case Command::Submit:
      handle_submit_command(options);
      break;
    case Command::List:
      handle_list_command(options);
      break;
    case Command::Get:
      handle_get_command(options);
      break;
    case Command::Start:
    case Command::Cancel:
    case Command::Retry:
      handle_lifecycle_command(options);
      break;
    case Command::Delete:
      handle_delete_command(options);
      break;
    case Command::Logs:
      handle_logs_command(options);
      break;
    case Command::Recent:
      handle_recent_command(options);
      break;
    case Command::ClearCompleted:
    case Command::ClearFailed:
    case Command::ClearCancelled:
      handle_clear_command(options);
      break;
    case Command::ConfigGet:
    case Command::ConfigSet:
    case Command::ConfigReset:
      handle_config_command(options);
      break;
    case Command::Status:
      handle_status_command();
      break;
    case Command::Cpu:
      handle_cpu_command();
      break;
    case Command::Run:
      handle_run_command();
      break;
    case Command::Help:
      print_help(out_);
      break;
  }
}

void CliHandler::handle_submit_command(const CliOptions &options) {
  const batch_core::Task task = center_.submit(options.new_task);
  print_json(batch_core::to_json(task));
}

void CliHandler::handle_list_command(const CliOptions &options) {
  print_json(batch_core::to_json(center_.list(options.list_options)));
}

void CliHandler::handle_get_command(const CliOptions &options) {
  auto task = center_.get(options.task_id);
  if (!task) {
    throw batch_core::NotFoundError(options.task_id);
  }
  nlohmann::json result = batch_core::to_json(*task);
  result["logCount"] = center_.get_logs(options.task_id).size();
  print_json(result);
}

void CliHandler::handle_lifecycle_command(const CliOptions &options) {
  bool accepted = false;
  std::string action;
  switch (options.command) {
    case Command::Start:
      accepted = center_.start(options.task_id);
      action = "start";
      break;
    case Command::Cancel:
      accepted = center_.cancel(options.task_id);
      action = "cancel";
      break;
    default:
      accepted = center_.retry(options.task_id);
      action = "retry";
      break;
  }

  auto task = center_.get(options.task_id);
  nlohmann::json result = {{"taskId", options.task_id}, {"action", action}, {"success", accepted}};
  if (task) {
    result["status"] = batch_core::to_string(task->status);
  }
  print_json(result);
}

void CliHandler::handle_delete_command(const CliOptions &options) {
  print_json({{"taskId", options.task_id}, {"deleted", center_.remove(options.task_id)}});
}

void CliHandler::handle_logs_command(const CliOptions &options) {
  nlohmann::json logs = nlohmann::json::array();
  for (const auto &log : center_.get_logs(options.task_id, options.limit, options.offset)) {
    logs.push_back(batch_core::to_json(log));
  }
  print_json(logs);
}

void CliHandler::handle_recent_command(const CliOptions &options) {
  nlohmann::json logs = nlohmann::json::array();
  for (const auto &log : center_.get_recent_logs(options.limit)) {
    logs.push_back(batch_core::to_json(log));
  }
  print_json(logs);
}

void CliHandler::handle_clear_command(const CliOptions &options) {
  int deleted = 0;
  if (options.command == Command::ClearCompleted) {
    deleted = center_.clear_completed(options.days);
  } else if (options.command == Command::ClearFailed) {
    deleted = center_.clear_failed();
  } else {
    deleted = center_.clear_cancelled();
  }
  print_json({{"deleted", deleted}});
}

void CliHandler::handle_config_command(const CliOptions &options) {
  batch_core::TaskCenterConfig config;
  if (options.command == Command::ConfigSet) {
    config = center_.set_config(nlohmann::json{{options.config_key, options.config_value}});
  } else if (options.command == Command::ConfigReset) {
    config = center_.reset_config();
  } else {
    config = center_.get_config();
  }
  print_json(batch_core::to_json(config));
}

void CliHandler::handle_status_command() {
  batch_core::TaskListOptions summary;
  summary.page_size = 1;
  const batch_core::TaskListResult tasks = center_.list(summary);
  print_json({{"queue", batch_core::to_json(center_.get_queue_status())},
              {"tasks", batch_core::to_json(tasks.stats)},
              {"database", batch_core::to_json(center_.get_database_stats())}});
}

void CliHandler::handle_cpu_command() {
  print_json(batch_core::to_json(center_.get_cpu_info()));
}

void CliHandler::handle_run_command() {
  center_.initialize();

  int enqueued = 0;
  if (config_.enqueue_pending_on_run) {
    batch_core::TaskListOptions pending;
    pending.filter.statuses.push_back(batch_core::TaskStatus::PENDING);
    pending.sort.order = batch_core::SortOrder::ASC;
    pending.page_size = 1000;
    for (const auto &task : center_.list(pending).tasks) {
      if (center_.start(task.id)) {
        ++enqueued;
      }
    }
  }
  std::cerr << "[batchctl] Running queued work (" << enqueued << " pending task(s) enqueued)"
            << std::endl;

  while (!center_.wait_until_idle(std::chrono::seconds(5))) {
    const batch_core::QueueStatus status = center_.get_queue_status();
    std::cerr << "[batchctl] " << status.running << " running, " << status.queued << " queued"
              << std::endl;
  }

  const int expired = center_.cleanup_expired();
  batch_core::TaskListOptions summary;
  summary.page_size = 1;
  print_json({{"enqueued", enqueued},
              {"expiredRemoved", expired},
              {"tasks", batch_core::to_json(center_.list(summary).stats)}});
}

void CliHandler::print_json(const nlohmann::json &value) {
  out_ << value.dump(2) << std::endl;
}

}  // namespace batch_cli
