#include "batch_core/async/process_execution_adapter.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <deque>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace batch_core::async {

namespace {

constexpr const char* kProgressPrefix = "progress=";
constexpr const char* kOutputPrefix = "output=";

void replace_all(std::string& text, const std::string& from, const std::string& to) {
  size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
}

bool starts_with(const std::string& text, const char* prefix) {
  return text.rfind(prefix, 0) == 0;
}

// Closes both ends of a pipe on scope exit
struct PipeFds {
  int fds[2] = {-1, -1};

  ~PipeFds() {
    close_read();
    close_write();
  }
  void close_read() {
    if (fds[0] != -1) {
      ::close(fds[0]);
      fds[0] = -1;
    }
  }
  void close_write() {
    if (fds[1] != -1) {
      ::close(fds[1]);
      fds[1] = -1;
    }
  }
};

int wait_for_child(pid_t pid) {
  int status = 0;
  while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
  }
  return status;
}

std::string join_tail(const std::deque<std::string>& lines) {
  std::string out;
  for (const auto& line : lines) {
    if (!out.empty()) out += '\n';
    out += line;
  }
  return out;
}

}  // namespace

ProcessExecutionAdapter::ProcessExecutionAdapter(ProcessAdapterOptions options)
    : options_(options) {}

std::vector<std::string> ProcessExecutionAdapter::build_command(const Task& task,
                                                                int threads_per_task) {
  auto it = task.config.find("command");
  if (it == task.config.end() || !it->is_array() || it->empty()) {
    throw ExecutionError("Task " + std::to_string(task.id) + " has no command configured",
                         "NO_COMMAND");
  }

  std::vector<std::string> argv;
  for (const auto& arg : *it) {
    if (!arg.is_string()) {
      throw ExecutionError("Command arguments must be strings, got " + arg.dump(), "NO_COMMAND");
    }
    std::string value = arg.get<std::string>();
    if (value == "{inputs}") {
      for (const auto& file : task.files) {
        argv.push_back(file.path);
      }
      continue;
    }
    replace_all(value, "{threads}", std::to_string(threads_per_task));
    replace_all(value, "{output_dir}", task.output_dir);
    argv.push_back(std::move(value));
  }
  if (argv.empty() || argv.front().empty()) {
    throw ExecutionError("Task " + std::to_string(task.id) + " has an empty command",
                         "NO_COMMAND");
  }
  return argv;
}

std::optional<int> ProcessExecutionAdapter::parse_progress_line(const std::string& line) {
  if (!starts_with(line, kProgressPrefix)) {
    return std::nullopt;
  }
  try {
    size_t consumed = 0;
    const std::string number = line.substr(std::strlen(kProgressPrefix));
    const double value = std::stod(number, &consumed);
    if (consumed == 0 || !std::isfinite(value)) {
      return std::nullopt;
    }
    // Clamp before the cast, out of range doubles have no int value
    return static_cast<int>(std::clamp(value, 0.0, 100.0));
  } catch (const std::invalid_argument&) {
    return std::nullopt;
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

std::optional<TaskOutput> ProcessExecutionAdapter::parse_output_line(const std::string& line) {
  if (!starts_with(line, kOutputPrefix)) {
    return std::nullopt;
  }
  const std::string rest = line.substr(std::strlen(kOutputPrefix));
  const auto colon = rest.find(':');
  if (colon == std::string::npos || colon + 1 >= rest.size()) {
    return std::nullopt;
  }

  TaskOutput output;
  output.kind = output_kind_from_string(rest.substr(0, colon));
  output.path = rest.substr(colon + 1);
  std::error_code ec;
  const auto size = std::filesystem::file_size(output.path, ec);
  if (!ec) {
    output.size = static_cast<long long>(size);
  }
  return output;
}

bool ProcessExecutionAdapter::is_process_alive(int pid) {
  if (pid <= 0) {
    return false;
  }
  return ::kill(pid, 0) == 0 || errno == EPERM;
}

ExecutionResult ProcessExecutionAdapter::execute(const Task& task, ExecutionContext& context) {
  const std::vector<std::string> argv = build_command(task, context.threads_per_task());

  PipeFds output_pipe;
  PipeFds exec_error_pipe;
  if (::pipe(output_pipe.fds) != 0 || ::pipe(exec_error_pipe.fds) != 0) {
    throw ExecutionError(std::string("pipe failed: ") + std::strerror(errno), "SPAWN_FAILED");
  }
  ::fcntl(exec_error_pipe.fds[1], F_SETFD, FD_CLOEXEC);

  std::vector<char*> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    cargv.push_back(const_cast<char*>(arg.c_str()));
  }
  cargv.push_back(nullptr);

  const pid_t pid = ::fork();
  if (pid < 0) {
    throw ExecutionError(std::string("fork failed: ") + std::strerror(errno), "SPAWN_FAILED");
  }
  if (pid == 0) {
    ::setpgid(0, 0);
    ::dup2(output_pipe.fds[1], STDOUT_FILENO);
    ::dup2(output_pipe.fds[1], STDERR_FILENO);
    ::close(output_pipe.fds[0]);
    ::close(output_pipe.fds[1]);
    ::close(exec_error_pipe.fds[0]);
    ::execvp(cargv[0], cargv.data());
    const int err = errno;
    ssize_t ignored = ::write(exec_error_pipe.fds[1], &err, sizeof(err));
    (void)ignored;
    ::_exit(127);
  }

  ::setpgid(pid, pid);
  output_pipe.close_write();
  exec_error_pipe.close_write();

  // Closed by exec on success, carries errno otherwise
  int exec_errno = 0;
  ssize_t n = 0;
  while ((n = ::read(exec_error_pipe.fds[0], &exec_errno, sizeof(exec_errno))) < 0 &&
         errno == EINTR) {
  }
  if (n > 0) {
    wait_for_child(pid);
    throw ExecutionError("Cannot execute '" + argv.front() + "': " + std::strerror(exec_errno),
                         "SPAWN_FAILED");
  }

  context.process_started(static_cast<int>(pid));

  ExecutionResult result;
  std::deque<std::string> tail;
  std::string pending;
  bool owned = true;

  auto handle_line = [&](const std::string& line) {
    tail.push_back(line);
    if (tail.size() > options_.tail_lines) {
      tail.pop_front();
    }
    if (auto progress = parse_progress_line(line)) {
      context.progress(*progress);
      return;
    }
    if (auto output = parse_output_line(line)) {
      result.outputs.push_back(*output);
    }
    if (!context.log(LogLevel::Info, line, line)) {
      owned = false;
    }
  };

  const int poll_ms = static_cast<int>(options_.poll_interval.count());
  char buffer[4096];
  while (owned) {
    pollfd pfd{output_pipe.fds[0], POLLIN, 0};
    const int ready = ::poll(&pfd, 1, poll_ms);
    if (ready < 0) {
      if (errno == EINTR) continue;
      break;
    }
    if (ready == 0) {
      owned = context.is_still_owned();
      continue;
    }

    const ssize_t got = ::read(output_pipe.fds[0], buffer, sizeof(buffer));
    if (got < 0) {
      if (errno == EINTR) continue;
      break;
    }
    if (got == 0) {
      break;
    }
    pending.append(buffer, static_cast<size_t>(got));
    size_t newline;
    while ((newline = pending.find('\n')) != std::string::npos) {
      std::string line = pending.substr(0, newline);
      pending.erase(0, newline + 1);
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      if (!context.is_still_owned()) {
        owned = false;
        break;
      }
      handle_line(line);
    }
  }

  if (!owned) {
    std::cout << "[ProcessAdapter] Task " << task.id << " no longer owned, stopping pid " << pid
              << std::endl;
    ::kill(-pid, SIGTERM);
    const auto deadline = std::chrono::steady_clock::now() + options_.kill_grace;
    int status = 0;
    pid_t reaped = 0;
    while ((reaped = ::waitpid(pid, &status, WNOHANG)) == 0 &&
           std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    if (reaped == 0) {
      std::cerr << "[ProcessAdapter] pid " << pid << " ignored SIGTERM, sending SIGKILL"
                << std::endl;
      ::kill(-pid, SIGKILL);
      wait_for_child(pid);
    }
    context.process_exited();
    throw ExecutionError("Task " + std::to_string(task.id) + " was stopped", "CANCELLED");
  }

  if (!pending.empty()) {
    handle_line(pending);
  }

  const int status = wait_for_child(pid);
  context.process_exited();

  if (WIFSIGNALED(status)) {
    throw ExecutionError("Process terminated by signal " + std::to_string(WTERMSIG(status)),
                         "PROCESS_SIGNAL", join_tail(tail));
  }
  if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
    throw ExecutionError("Process exited with code " + std::to_string(WEXITSTATUS(status)),
                         "PROCESS_EXIT", join_tail(tail));
  }
  return result;
}

}  // namespace batch_core::async
