#pragma once

#include "sos/common/result.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <sys/types.h>
#include <vector>

namespace sos::sandbox {

struct ProcessOptions {
  bool allow_failure = false;
  std::chrono::milliseconds timeout{30'000};
  std::filesystem::path working_dir;
};

struct ProcessResult {
  int exit_code = 0;
  std::string stdout_text;
  std::string stderr_text;
  bool timed_out = false;
};

/// Runs argv to completion, capturing stdout and stderr separately. The child
/// is killed when it outlives `options.timeout`. Unless allow_failure is set,
/// a non-zero exit or a timeout is reported as a Runtime failure.
[[nodiscard]] common::Result<ProcessResult> run_process(const std::vector<std::string> &argv,
                                                        const ProcessOptions &options = {});

/// Long-lived child with all three standard streams piped to the parent.
class ChildProcess {
public:
  [[nodiscard]] static common::Result<std::unique_ptr<ChildProcess>>
  spawn(const std::vector<std::string> &argv, const std::filesystem::path &working_dir = {});

  ~ChildProcess();
  ChildProcess(const ChildProcess &) = delete;
  ChildProcess &operator=(const ChildProcess &) = delete;

  [[nodiscard]] pid_t pid() const { return pid_; }
  [[nodiscard]] int stdin_fd() const { return stdin_fd_; }
  [[nodiscard]] int stdout_fd() const { return stdout_fd_; }
  [[nodiscard]] int stderr_fd() const { return stderr_fd_; }
  [[nodiscard]] bool is_running() const;

  /// SIGKILL without reaping; safe while another thread polls the pipes.
  void kill_now();
  /// SIGTERM, short grace period, SIGKILL, then reap.
  void terminate();

private:
  ChildProcess(pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd);

  pid_t pid_;
  int stdin_fd_;
  int stdout_fd_;
  int stderr_fd_;
};

} // namespace sos::sandbox
