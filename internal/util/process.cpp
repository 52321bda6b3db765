#include "process.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace hostreg::util {

namespace {

using SteadyClock = std::chrono::steady_clock;

std::string ErrnoText(const char* what) {
  return std::string(what) + ": " + std::strerror(errno);
}

void CloseFd(int& fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

int DecodeStatus(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

void KillAndReap(pid_t pid) {
  ::kill(pid, SIGKILL);
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
  }
}

// False when the deadline passes before the child exits.
bool WaitForExit(pid_t pid, SteadyClock::time_point deadline, int* exit_code) {
  while (true) {
    int         status = 0;
    const pid_t result = ::waitpid(pid, &status, WNOHANG);
    if (result == pid) {
      *exit_code = DecodeStatus(status);
      return true;
    }
    if (result < 0 && errno != EINTR) {
      throw ExternalToolError(ErrnoText("waitpid"));
    }
    if (SteadyClock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
}

[[noreturn]] void ExecChild(const std::vector<std::string>& argv, int stdout_fd) {
  ::dup2(stdout_fd, STDOUT_FILENO);

  const int devnull = ::open("/dev/null", O_RDWR);
  if (devnull >= 0) {
    ::dup2(devnull, STDIN_FILENO);
    ::dup2(devnull, STDERR_FILENO);
  }

  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    args.push_back(const_cast<char*>(arg.c_str()));
  }
  args.push_back(nullptr);

  ::execvp(args[0], args.data());
  _exit(127);
}

} // namespace

std::string JoinArgv(const std::vector<std::string>& argv) {
  std::ostringstream out;
  for (std::size_t i = 0; i < argv.size(); ++i) {
    if (i) out << ' ';
    out << argv[i];
  }
  return out.str();
}

ProcessCommandRunner::ProcessCommandRunner(std::chrono::milliseconds timeout) : timeout_(timeout) {
}

CommandResult ProcessCommandRunner::Run(const std::vector<std::string>& argv) {
  if (argv.empty()) {
    throw ExternalToolError("empty command line");
  }

  int pipe_fds[2];
  if (::pipe2(pipe_fds, O_CLOEXEC) < 0) {
    throw ExternalToolError(ErrnoText("pipe2"));
  }
  int read_fd  = pipe_fds[0];
  int write_fd = pipe_fds[1];

  const pid_t pid = ::fork();
  if (pid < 0) {
    const auto message = ErrnoText("fork");
    CloseFd(read_fd);
    CloseFd(write_fd);
    throw ExternalToolError(message);
  }
  if (pid == 0) {
    ExecChild(argv, write_fd);
  }

  CloseFd(write_fd);

  const auto    deadline = SteadyClock::now() + timeout_;
  CommandResult result;

  std::array<char, 4096> buffer{};
  bool                   eof = false;
  while (!eof) {
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - SteadyClock::now());
    if (remaining.count() <= 0) {
      break;
    }

    pollfd pfd{read_fd, POLLIN, 0};
    const int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
    if (ready < 0) {
      if (errno == EINTR) continue;
      const auto message = ErrnoText("poll");
      CloseFd(read_fd);
      KillAndReap(pid);
      throw ExternalToolError(message);
    }
    if (ready == 0) {
      continue;
    }

    const ssize_t n = ::read(read_fd, buffer.data(), buffer.size());
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
      const auto message = ErrnoText("read");
      CloseFd(read_fd);
      KillAndReap(pid);
      throw ExternalToolError(message);
    }
    if (n == 0) {
      eof = true;
      break;
    }

    // Keep draining past the cap so the child never blocks on a full pipe.
    const auto room = kMaxOutputBytes - std::min(kMaxOutputBytes, result.stdout_text.size());
    result.stdout_text.append(buffer.data(), std::min(room, static_cast<std::size_t>(n)));
  }

  CloseFd(read_fd);

  if (!eof || !WaitForExit(pid, deadline, &result.exit_code)) {
    KillAndReap(pid);
    HOSTREG_LOG_WARN("External command timed out",
                     {hostreg::observability::StringField("command", JoinArgv(argv)),
                      hostreg::observability::IntField("timeout_ms", timeout_.count())});
    throw ExternalToolError(JoinArgv(argv) + " timed out after " + std::to_string(timeout_.count()) + "ms");
  }

  return result;
}

} // namespace hostreg::util
