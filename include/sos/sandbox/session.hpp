#pragma once

#include "sos/common/cancellation.hpp"
#include "sos/common/fifo_semaphore.hpp"
#include "sos/common/result.hpp"
#include "sos/sandbox/stream.hpp"
#include "sos/sandbox/types.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace sos::sandbox {

struct SessionOptions {
  std::chrono::milliseconds init_timeout{10'000};
  std::chrono::milliseconds probe_timeout{2'000};
  std::chrono::milliseconds write_timeout{5'000};
};

enum class SessionHealth {
  Healthy,
  // A command was abandoned mid-flight; the next exec probes first.
  Unknown,
  // No sentinel arrived in time; the shell state cannot be trusted.
  Corrupted,
  Closed,
};

[[nodiscard]] const char *to_string(SessionHealth health);

/// A sentinel line `\n<marker> <exit_code>\n` located in a capture buffer.
struct SentinelMatch {
  std::size_t begin = 0;
  std::size_t end = 0;
  int exit_code = 0;
};

[[nodiscard]] std::optional<SentinelMatch> find_sentinel(const std::string &buffer,
                                                         const std::string &marker);
[[nodiscard]] std::string new_marker();
[[nodiscard]] std::string shell_quote(const std::string &value);
/// Shadows `exit` and `logout` with functions that return their status, so a
/// command cannot end the persistent shell. As a consequence `exit` only
/// leaves the current function or eval: `exit 4; echo after` prints `after`,
/// and a sourced script keeps running past its `exit`.
[[nodiscard]] std::string build_init_script(const std::string &workdir, const std::string &marker);
[[nodiscard]] std::string build_exec_script(const std::string &command, const std::string &marker);
[[nodiscard]] std::string build_probe_script(const std::string &marker);

struct ExecTiming {
  std::chrono::system_clock::time_point started_at;
  std::chrono::system_clock::time_point finished_at;
};

/// Persistent shell attached to one sandbox. Each exec writes the command
/// followed by a fresh sentinel on stdout and stderr, then reads both streams
/// until the sentinels arrive. Execs are served one at a time in arrival
/// order.
class Session {
public:
  /// Runs while the execution lock is still held, so callers can record
  /// outcomes in the order the shell ran them.
  using CompletionHook =
      std::function<void(const common::Result<CommandResult> &, const ExecTiming &)>;

  Session(std::string sandbox_id, std::unique_ptr<IShellStream> stream,
          SessionOptions options = {});

  Session(const Session &) = delete;
  Session &operator=(const Session &) = delete;

  /// Disables prompts, makes `exit` return instead of killing the shell (see
  /// build_init_script), moves to `workdir` (or $HOME) and waits for the
  /// shell to answer.
  [[nodiscard]] common::Status initialize(const std::string &workdir);

  /// Non-zero exit codes are results. Errors: SessionTimeout (session is
  /// then corrupted), SessionClosed, Cancelled (health becomes unknown),
  /// InvalidArgument for a blank command.
  [[nodiscard]] common::Result<CommandResult>
  exec(const std::string &command, std::chrono::milliseconds timeout,
       const common::CancellationToken *cancel = nullptr, const CompletionHook &on_complete = {});

  /// Kills the shell. Safe from any thread; a blocked exec returns SessionClosed.
  void terminate();

  [[nodiscard]] SessionHealth health() const { return health_.load(); }
  [[nodiscard]] const std::string &sandbox_id() const { return sandbox_id_; }
  [[nodiscard]] std::size_t queued() const { return exec_lock_.waiting(); }

private:
  struct Capture {
    std::string out;
    std::string err;
    std::optional<SentinelMatch> out_match;
    std::optional<SentinelMatch> err_match;
  };

  [[nodiscard]] common::Result<CommandResult>
  run_locked(const std::string &command, std::chrono::milliseconds timeout,
             const common::CancellationToken *cancel);
  [[nodiscard]] common::Status await_sentinel(const std::string &marker,
                                              std::chrono::steady_clock::time_point deadline,
                                              const common::CancellationToken *cancel,
                                              Capture &capture);
  [[nodiscard]] common::Status send(const std::string &script);
  [[nodiscard]] common::Status probe_locked(const common::CancellationToken *cancel);
  void discard_pending();

  std::string sandbox_id_;
  std::unique_ptr<IShellStream> stream_;
  SessionOptions options_;
  common::FifoSemaphore exec_lock_{1};
  std::atomic<SessionHealth> health_{SessionHealth::Unknown};
};

} // namespace sos::sandbox
