#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace cmdgate::exec {

struct ExecutionResult {
  bool succeeded = false;
  std::string stdout_text;
  std::string stderr_text;
  int exit_code = -1;
  std::string error_message;
  bool timed_out = false;
  std::chrono::milliseconds duration{0};
};

struct RunnerOptions {
  std::chrono::milliseconds timeout{std::chrono::seconds{30}};
  std::size_t max_output_bytes = 1024 * 1024;
};

/// Runs `/bin/sh -c <command>` in its own process group with a wall-clock bound.
/// Any exit code counts as success; only timeouts and launch failures do not.
class CommandRunner {
public:
  explicit CommandRunner(RunnerOptions options = {});

  [[nodiscard]] ExecutionResult run(const std::string &command) const;
  [[nodiscard]] const RunnerOptions &options() const { return options_; }

private:
  RunnerOptions options_;
};

[[nodiscard]] std::string describe_timeout(std::chrono::milliseconds timeout);

/// Chat-sized rendering: stdout, stderr and a non-zero exit code, cut to `budget` chars.
[[nodiscard]] std::string render_execution_result(const ExecutionResult &result,
                                                  std::size_t budget = 1800);

} // namespace cmdgate::exec
