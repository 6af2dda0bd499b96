/**
 * @file process_runner.cpp
 * @brief fork/exec with timeout and stdout capture
 */

#include "vod_ingest/process_runner.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

#include "vod_ingest/logging.hpp"
#include "vod_ingest/system.hpp"

namespace vod_ingest {

std::vector<std::string> with_cpu_affinity(const std::vector<std::string> &argv,
                                           const std::vector<int> &cpu_set) {
  if (cpu_set.empty())
    return argv;
  std::vector<std::string> out{"taskset", "-c", format_cpu_list(cpu_set)};
  out.insert(out.end(), argv.begin(), argv.end());
  return out;
}

std::string describe_command(const std::vector<std::string> &argv) {
  std::string out;
  for (size_t i = 0; i < argv.size(); ++i) {
    if (i > 0)
      out += ' ';
    out += argv[i];
  }
  return out;
}

namespace {

/// Exit code used by the child when execvp fails
constexpr int EXEC_FAILED = 127;

int decode_status(int status) {
  if (WIFEXITED(status))
    return WEXITSTATUS(status);
  if (WIFSIGNALED(status))
    return 128 + WTERMSIG(status);
  return -1;
}

} // anonymous namespace

ProcessResult SubprocessRunner::run(const std::vector<std::string> &argv_in,
                                    double timeout_sec, bool capture_stdout,
                                    const std::vector<int> &cpu_set) {
  ProcessResult result;
  if (argv_in.empty())
    return result;

  std::vector<std::string> argv = with_cpu_affinity(argv_in, cpu_set);
  std::vector<char *> cargv;
  cargv.reserve(argv.size() + 1);
  for (auto &arg : argv)
    cargv.push_back(const_cast<char *>(arg.c_str()));
  cargv.push_back(nullptr);

  int pipe_fds[2] = {-1, -1};
  if (capture_stdout && pipe2(pipe_fds, O_CLOEXEC) != 0) {
    LOG_ERROR("pipe() failed: {}", std::strerror(errno));
    return result;
  }

  pid_t pid = fork();
  if (pid < 0) {
    LOG_ERROR("fork() failed: {}", std::strerror(errno));
    if (capture_stdout) {
      close(pipe_fds[0]);
      close(pipe_fds[1]);
    }
    return result;
  }

  if (pid == 0) {
    /// Child: only async-signal-safe calls from here on
    int devnull = open("/dev/null", O_RDWR);
    if (devnull >= 0) {
      dup2(devnull, STDIN_FILENO);
      dup2(devnull, STDERR_FILENO);
      if (!capture_stdout)
        dup2(devnull, STDOUT_FILENO);
    }
    if (capture_stdout)
      dup2(pipe_fds[1], STDOUT_FILENO);
    execvp(cargv[0], cargv.data());
    _exit(EXEC_FAILED);
  }

  // **---- Parent: drain stdout and enforce the timeout ----**

  if (capture_stdout)
    close(pipe_fds[1]);

  const auto start = std::chrono::steady_clock::now();
  auto expired = [&]() {
    if (timeout_sec <= 0)
      return false;
    std::chrono::duration<double> elapsed =
        std::chrono::steady_clock::now() - start;
    return elapsed.count() >= timeout_sec;
  };

  int status = 0;
  bool reaped = false;
  bool pipe_open = capture_stdout;
  char buf[8192];

  while (!reaped) {
    if (pipe_open) {
      struct pollfd pfd = {pipe_fds[0], POLLIN, 0};
      int ready = poll(&pfd, 1, 100);
      if (ready > 0) {
        ssize_t n = read(pipe_fds[0], buf, sizeof(buf));
        if (n > 0) {
          result.output.append(buf, static_cast<size_t>(n));
        } else if (n == 0 || errno != EINTR) {
          pipe_open = false;
        }
      }
    } else {
      usleep(20 * 1000);
    }

    pid_t w = waitpid(pid, &status, WNOHANG);
    if (w == pid) {
      reaped = true;
    } else if (w < 0 && errno != EINTR) {
      LOG_ERROR("waitpid() failed: {}", std::strerror(errno));
      break;
    } else if (expired()) {
      kill(pid, SIGKILL);
      waitpid(pid, &status, 0);
      result.timed_out = true;
      reaped = true;
    }
  }

  /// Drain whatever the child wrote before exiting
  while (pipe_open) {
    ssize_t n = read(pipe_fds[0], buf, sizeof(buf));
    if (n > 0)
      result.output.append(buf, static_cast<size_t>(n));
    else if (n == 0 || errno != EINTR)
      pipe_open = false;
  }
  if (capture_stdout)
    close(pipe_fds[0]);

  if (!reaped)
    return result;

  result.exit_code = decode_status(status);
  result.launched = !(WIFEXITED(status) && result.exit_code == EXEC_FAILED &&
                      !result.timed_out && result.output.empty());
  if (!result.launched) {
    LOG_ERROR("Failed to launch '{}'", argv[0]);
  } else if (result.timed_out) {
    LOG_WARN("'{}' killed after {:.0f}s timeout", argv_in[0], timeout_sec);
  }
  return result;
}

} // namespace vod_ingest
