#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "batch_core/async/execution_adapter.hpp"

namespace batch_core::async {

struct ProcessAdapterOptions {
  // How often ownership is checked while the child is quiet
  std::chrono::milliseconds poll_interval{100};
  // Time between SIGTERM and SIGKILL when a task is taken away
  std::chrono::milliseconds kill_grace{2000};
  // Output lines kept for the error stack of a failed run
  size_t tail_lines = 20;
};

/**
 * @class ProcessExecutionAdapter
 * @brief Runs a task as a child process with fork/execvp.
 *
 * The command line is the string array task.config["command"]. In each
 * argument "{threads}" and "{output_dir}" are substituted, and an argument
 * that is exactly "{inputs}" expands to every input file path in order.
 *
 * stdout and stderr are merged and every line is logged. Two line forms are
 * also interpreted:
 *   progress=<0-100>          progress update
 *   output=<kind>:<path>      declares an output (kind is video, image or other)
 */
class ProcessExecutionAdapter : public IExecutionAdapter {
 public:
  explicit ProcessExecutionAdapter(ProcessAdapterOptions options = ProcessAdapterOptions{});

  ExecutionResult execute(const Task& task, ExecutionContext& context) override;

  // Throws ExecutionError with code NO_COMMAND when the task has no usable command.
  static std::vector<std::string> build_command(const Task& task, int threads_per_task);

  // "progress=<n>" clamped to [0, 100]. Non-numeric or non-finite values give nullopt.
  static std::optional<int> parse_progress_line(const std::string& line);
  static std::optional<TaskOutput> parse_output_line(const std::string& line);

  // kill(pid, 0) liveness check
  static bool is_process_alive(int pid);

 private:
  ProcessAdapterOptions options_;
};

}  // namespace batch_core::async
