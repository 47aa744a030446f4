#include "tools/model/command_model.hpp"

#include "core/fs_utils.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <system_error>
#include <thread>
#include <utility>

#if !defined(_WIN32)
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace norma::tools::model {

namespace {

using Clock = std::chrono::steady_clock;

struct CommandCapture {
  std::string output;
  int exit_code = -1;
  bool timed_out = false;
};

#if defined(_WIN32)

// No process-group kill on this platform; the deadline is checked after the
// command returns.
bool RunCommandCapture(const std::string& command, std::chrono::milliseconds timeout,
                       CommandCapture& capture, std::string& error) {
  capture = CommandCapture{};
  const auto started = Clock::now();
  FILE* pipe = _popen(command.c_str(), "r");
  if (pipe == nullptr) {
    error = "failed to execute model command: " + command;
    return false;
  }
  char buffer[4096];
  while (std::fgets(buffer, static_cast<int>(sizeof(buffer)), pipe) != nullptr) {
    capture.output.append(buffer);
  }
  capture.exit_code = _pclose(pipe);
  capture.timed_out = timeout.count() > 0 && Clock::now() - started > timeout;
  return true;
}

#else

std::string ErrnoText(const char* what) {
  return std::string(what) + ": " + std::strerror(errno);
}

// Runs `command` under /bin/sh in its own process group and collects stdout.
// With a positive `timeout` the whole group is killed once the deadline
// passes, whether the command is blocked writing, reading or sleeping.
bool RunCommandCapture(const std::string& command, std::chrono::milliseconds timeout,
                       CommandCapture& capture, std::string& error) {
  capture = CommandCapture{};

  int fds[2];
  if (::pipe(fds) != 0) {
    error = ErrnoText("failed to create model command pipe");
    return false;
  }
  const pid_t pid = ::fork();
  if (pid < 0) {
    error = ErrnoText("failed to start model command");
    ::close(fds[0]);
    ::close(fds[1]);
    return false;
  }
  if (pid == 0) {
    ::setpgid(0, 0);
    ::dup2(fds[1], STDOUT_FILENO);
    ::close(fds[0]);
    ::close(fds[1]);
    ::execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
    ::_exit(127);
  }
  ::setpgid(pid, pid);
  ::close(fds[1]);

  const bool bounded = timeout.count() > 0;
  const auto deadline = Clock::now() + timeout;
  const auto remaining_ms = [&deadline]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
  };

  bool read_failed = false;
  char buffer[4096];
  for (;;) {
    int wait_ms = -1;
    if (bounded) {
      const auto left = remaining_ms();
      if (left <= 0) {
        capture.timed_out = true;
        break;
      }
      wait_ms = static_cast<int>(std::min<long long>(left, 1000));
    }
    pollfd pfd{};
    pfd.fd = fds[0];
    pfd.events = POLLIN;
    const int ready = ::poll(&pfd, 1, wait_ms);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      error = ErrnoText("failed to wait for model command output");
      read_failed = true;
      break;
    }
    if (ready == 0) {
      continue;
    }
    const ssize_t n = ::read(fds[0], buffer, sizeof(buffer));
    if (n > 0) {
      capture.output.append(buffer, static_cast<std::size_t>(n));
    } else if (n == 0) {
      break;
    } else if (errno != EINTR) {
      error = ErrnoText("failed to read model command output");
      read_failed = true;
      break;
    }
  }
  ::close(fds[0]);

  if (capture.timed_out || read_failed) {
    ::kill(-pid, SIGKILL);
  }

  // stdout may close before the command exits; the deadline still applies.
  int status = 0;
  for (;;) {
    const bool block = capture.timed_out || read_failed || !bounded;
    const pid_t done = ::waitpid(pid, &status, block ? 0 : WNOHANG);
    if (done == pid) {
      break;
    }
    if (done < 0) {
      if (errno == EINTR) {
        continue;
      }
      error = ErrnoText("failed to collect model command status");
      return false;
    }
    if (remaining_ms() <= 0) {
      capture.timed_out = true;
      ::kill(-pid, SIGKILL);
      continue;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  if (read_failed) {
    return false;
  }

  if (WIFEXITED(status)) {
    capture.exit_code = WEXITSTATUS(status);
  } else {
    capture.exit_code = status;
  }
  return true;
}

#endif

std::string QuoteForShell(const std::string& raw) {
  std::string quoted = "'";
  for (const char c : raw) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted.push_back(c);
    }
  }
  quoted += "'";
  return quoted;
}

fs::path PromptFilePath(const fs::path& dir) {
  static std::atomic<unsigned long long> counter{0};
  const auto tick = std::chrono::steady_clock::now().time_since_epoch().count();
  return dir / ("prompt." + std::to_string(tick) + "." +
                std::to_string(counter.fetch_add(1U, std::memory_order_relaxed)) + ".txt");
}

} // namespace

CommandModel::CommandModel(std::string command, fs::path scratch_dir)
    : command_(std::move(command)), scratch_dir_(std::move(scratch_dir)) {}

bool CommandModel::Complete(const ModelRequest& request, std::string& response,
                            std::string& error) {
  response.clear();
  if (command_.empty()) {
    error = "model command is empty";
    return false;
  }

  fs::path dir = scratch_dir_;
  if (dir.empty()) {
    std::error_code ec;
    dir = fs::temp_directory_path(ec);
    if (ec) {
      error = "failed to resolve temp directory for model prompt: " + ec.message();
      return false;
    }
  }

  const fs::path prompt_path = PromptFilePath(dir);
  if (!core::WriteTextFileAtomic(prompt_path,
                                 request.system_prompt + "\n\n" + request.user_prompt, error)) {
    return false;
  }

  const std::string command = std::string("NORMA_MODEL_STAGE=") + ToString(request.stage) + " " +
                              command_ + " < " + QuoteForShell(prompt_path.string());

  CommandCapture capture;
  const bool ran = RunCommandCapture(command, request.timeout, capture, error);

  std::error_code cleanup_ec;
  (void)fs::remove(prompt_path, cleanup_ec);

  if (!ran) {
    return false;
  }
  if (capture.timed_out) {
    error = "model command exceeded timeout of " + std::to_string(request.timeout.count()) + "ms";
    return false;
  }
  if (capture.exit_code != 0) {
    error = "model command exited with status " + std::to_string(capture.exit_code);
    return false;
  }
  if (capture.output.find_first_not_of(" \t\r\n") == std::string::npos) {
    error = "model command produced no output";
    return false;
  }

  response = std::move(capture.output);
  return true;
}

} // namespace norma::tools::model
