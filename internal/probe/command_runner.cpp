#include "command_runner.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/select.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <fstream>
#include <sstream>

namespace cic::probe {

namespace {

void Drain(int fd, std::string& sink) {
  std::array<char, 4096> buffer;
  ssize_t                bytes;
  while ((bytes = read(fd, buffer.data(), buffer.size())) > 0) sink.append(buffer.data(), static_cast<size_t>(bytes));
}

} // namespace

CommandResult RunCommand(const std::vector<std::string>& args, std::chrono::milliseconds timeout) {
  CommandResult result;
  if (args.empty()) return result;

  int pipe_out[2];
  int pipe_err[2];

  // close-on-exec so children forked by sibling probes do not inherit our ends
  if (pipe2(pipe_out, O_CLOEXEC) == -1) return result;
  if (pipe2(pipe_err, O_CLOEXEC) == -1) {
    close(pipe_out[0]);
    close(pipe_out[1]);
    return result;
  }

  pid_t pid = fork();

  if (pid == -1) {
    close(pipe_out[0]);
    close(pipe_out[1]);
    close(pipe_err[0]);
    close(pipe_err[1]);
    return result;
  }

  if (pid == 0) {
    setpgid(0, 0);

    dup2(pipe_out[1], STDOUT_FILENO);
    dup2(pipe_err[1], STDERR_FILENO);
    close(pipe_out[0]);
    close(pipe_out[1]);
    close(pipe_err[0]);
    close(pipe_err[1]);

    int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      dup2(devnull, STDIN_FILENO);
      close(devnull);
    }

    std::vector<std::vector<char>> storage;
    std::vector<char*>             argv;
    storage.reserve(args.size());
    for (const auto& arg : args) {
      storage.emplace_back(arg.begin(), arg.end());
      storage.back().push_back('\0');
      argv.push_back(storage.back().data());
    }
    argv.push_back(nullptr);

    execvp(argv[0], argv.data());
    _exit(127);
  }

  close(pipe_out[1]);
  close(pipe_err[1]);

  fcntl(pipe_out[0], F_SETFL, O_NONBLOCK);
  fcntl(pipe_err[0], F_SETFL, O_NONBLOCK);

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  bool       finished = false;

  while (!finished) {
    fd_set read_fds;
    FD_ZERO(&read_fds);
    FD_SET(pipe_out[0], &read_fds);
    FD_SET(pipe_err[0], &read_fds);

    timeval tv;
    tv.tv_sec  = 0;
    tv.tv_usec = 100 * 1000;

    if (select(std::max(pipe_out[0], pipe_err[0]) + 1, &read_fds, nullptr, nullptr, &tv) > 0) {
      if (FD_ISSET(pipe_out[0], &read_fds)) Drain(pipe_out[0], result.out);
      if (FD_ISSET(pipe_err[0], &read_fds)) Drain(pipe_err[0], result.err);
    }

    int   status      = 0;
    pid_t wait_result = waitpid(pid, &status, WNOHANG);
    if (wait_result == pid) {
      if (WIFEXITED(status)) result.exit_code = WEXITSTATUS(status);
      finished = true;
    } else if (wait_result == -1) {
      finished = true;
    } else if (std::chrono::steady_clock::now() >= deadline) {
      kill(-pid, SIGKILL);
      kill(pid, SIGKILL);
      waitpid(pid, &status, 0);
      result.exit_code = -1;
      result.timed_out = true;
      finished         = true;
    }

    if (finished) {
      Drain(pipe_out[0], result.out);
      Drain(pipe_err[0], result.err);
    }
  }

  close(pipe_out[0]);
  close(pipe_err[0]);

  return result;
}

CommandResult RunShell(const std::string& script, std::chrono::milliseconds timeout) {
  return RunCommand({"/bin/sh", "-c", script}, timeout);
}

ProbeResult CommandFailure(const CommandResult& result, std::string_view what) {
  std::string message(what);

  if (result.timed_out) return ProbeResult::Err(ProbeErrorCode::kTimeout, message + ": timed out");
  if (result.exit_code == 127) return ProbeResult::Err(ProbeErrorCode::kUnavailable, message + ": not installed");

  message += ": exit " + std::to_string(result.exit_code);
  if (!result.err.empty()) message += ": " + result.err.substr(0, 200);
  return ProbeResult::Err(ProbeErrorCode::kCommandFailed, message);
}

std::optional<std::string> ReadTextFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return std::nullopt;

  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

} // namespace cic::probe
