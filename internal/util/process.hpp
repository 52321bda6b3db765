#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace hostreg::util {

struct CommandResult {
  int         exit_code = 0;
  std::string stdout_text;
};

/*
  Runs an external program and captures its stdout.

  Implementations throw ExternalToolError when the program cannot be
  started or does not finish in time. A non-zero exit code is returned,
  not thrown; the caller decides what it means.
*/
class CommandRunner {
 public:
  virtual ~CommandRunner() = default;

  virtual CommandResult Run(const std::vector<std::string>& argv) = 0;
};

/*
  fork/execvp runner.

  - argv[0] is resolved through PATH
  - stderr is discarded
  - the child is SIGKILLed and reaped when the timeout expires
  - exec failure is reported as exit code 127
*/
class ProcessCommandRunner final : public CommandRunner {
 public:
  static constexpr std::size_t kMaxOutputBytes = 8 * 1024 * 1024;

  explicit ProcessCommandRunner(std::chrono::milliseconds timeout = std::chrono::seconds(10));

  CommandResult Run(const std::vector<std::string>& argv) override;

 private:
  std::chrono::milliseconds timeout_;
};

// "systemctl show x" style rendering for log lines and error messages.
std::string JoinArgv(const std::vector<std::string>& argv);

} // namespace hostreg::util
