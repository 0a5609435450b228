#include "sos/sandbox/session.hpp"

#include "sos/common/fs.hpp"
#include "sos/common/random.hpp"

#include <algorithm>
#include <charconv>

namespace sos::sandbox {

namespace {

constexpr auto kReadSlice = std::chrono::milliseconds(50);
constexpr int kMaxDiscardRounds = 64;

std::string sentinel_lines(const std::string &marker, const std::string &status) {
  const std::string line = "printf '\\n%s %d\\n' " + shell_quote(marker) + " " + status;
  return line + "\n" + line + " >&2\n";
}

// Releases the FIFO execution lock on every exit path.
class LockRelease {
public:
  explicit LockRelease(common::FifoSemaphore &lock) : lock_(lock) {}
  ~LockRelease() { lock_.release(); }
  LockRelease(const LockRelease &) = delete;
  LockRelease &operator=(const LockRelease &) = delete;

private:
  common::FifoSemaphore &lock_;
};

} // namespace

const char *to_string(const SessionHealth health) {
  switch (health) {
  case SessionHealth::Healthy:
    return "healthy";
  case SessionHealth::Unknown:
    return "unknown";
  case SessionHealth::Corrupted:
    return "corrupted";
  case SessionHealth::Closed:
    return "closed";
  }
  return "closed";
}

std::optional<SentinelMatch> find_sentinel(const std::string &buffer, const std::string &marker) {
  const std::string needle = "\n" + marker + " ";
  std::size_t from = 0;
  while (true) {
    const auto begin = buffer.find(needle, from);
    if (begin == std::string::npos) {
      return std::nullopt;
    }
    std::size_t pos = begin + needle.size();
    const std::size_t digits_start = pos;
    if (pos < buffer.size() && buffer[pos] == '-') {
      ++pos;
    }
    while (pos < buffer.size() && buffer[pos] >= '0' && buffer[pos] <= '9') {
      ++pos;
    }
    std::size_t line_end = pos;
    if (line_end < buffer.size() && buffer[line_end] == '\r') {
      ++line_end;
    }
    int exit_code = 0;
    const auto parsed =
        std::from_chars(buffer.data() + digits_start, buffer.data() + pos, exit_code);
    if (pos > digits_start && parsed.ec == std::errc() && parsed.ptr == buffer.data() + pos &&
        line_end < buffer.size() && buffer[line_end] == '\n') {
      return SentinelMatch{.begin = begin, .end = line_end + 1, .exit_code = exit_code};
    }
    from = begin + 1;
  }
}

std::string new_marker() { return "__SOS_" + common::random_hex(12); }

std::string shell_quote(const std::string &value) {
  std::string quoted = "'";
  for (const char ch : value) {
    if (ch == '\'') {
      quoted += "'\\''";
    } else {
      quoted.push_back(ch);
    }
  }
  quoted.push_back('\'');
  return quoted;
}

std::string build_init_script(const std::string &workdir, const std::string &marker) {
  std::string script = "exit() { return \"${1:-0}\"; }\n"
                       "logout() { return \"${1:-0}\"; }\n"
                       "unset PROMPT_COMMAND\n"
                       "PS1=''; PS2=''\n";
  if (workdir.empty()) {
    script += "cd \"$HOME\" 2>/dev/null || cd /\n";
  } else {
    script += "cd " + shell_quote(workdir) + " 2>/dev/null || cd \"$HOME\" 2>/dev/null || cd /\n";
  }
  return script + sentinel_lines(marker, "0");
}

std::string build_exec_script(const std::string &command, const std::string &marker) {
  // eval keeps syntax errors from terminating the shell; stdin is detached so
  // a command cannot consume the lines that follow it.
  return "__sos_cmd=" + shell_quote(command) + "\n" + "eval \"$__sos_cmd\" </dev/null\n" +
         "__sos_rc=$?\n" + sentinel_lines(marker, "\"$__sos_rc\"");
}

std::string build_probe_script(const std::string &marker) { return sentinel_lines(marker, "0"); }

Session::Session(std::string sandbox_id, std::unique_ptr<IShellStream> stream,
                 SessionOptions options)
    : sandbox_id_(std::move(sandbox_id)), stream_(std::move(stream)), options_(options) {}

common::Status Session::initialize(const std::string &workdir) {
  if (exec_lock_.acquire(std::chrono::steady_clock::now() + options_.init_timeout) !=
      common::WaitOutcome::Acquired) {
    return common::Status::error(common::ErrorCode::SessionTimeout,
                                 "session is busy during initialization");
  }
  LockRelease release(exec_lock_);

  const std::string marker = new_marker();
  if (auto sent = send(build_init_script(workdir, marker)); !sent.ok()) {
    return sent;
  }
  Capture capture;
  auto status = await_sentinel(marker, std::chrono::steady_clock::now() + options_.init_timeout,
                               nullptr, capture);
  if (!status.ok()) {
    return common::Status::error(status.code(),
                                 "shell did not complete initialization: " + status.error());
  }
  health_.store(SessionHealth::Healthy);
  return common::Status::success();
}

common::Result<CommandResult> Session::exec(const std::string &command,
                                            const std::chrono::milliseconds timeout,
                                            const common::CancellationToken *cancel,
                                            const CompletionHook &on_complete) {
  if (common::trim(command).empty()) {
    return common::Result<CommandResult>::failure(common::ErrorCode::InvalidArgument,
                                                  "command must not be empty");
  }

  const auto gave_up = [this, cancel] {
    const auto health = health_.load();
    return common::is_cancelled(cancel) || health == SessionHealth::Closed ||
           health == SessionHealth::Corrupted;
  };
  const auto waited = exec_lock_.acquire(std::chrono::steady_clock::time_point::max(), gave_up);
  if (waited != common::WaitOutcome::Acquired) {
    if (common::is_cancelled(cancel)) {
      return common::Result<CommandResult>::failure(common::ErrorCode::Cancelled,
                                                    "cancelled while queued");
    }
    return common::Result<CommandResult>::failure(common::ErrorCode::SessionClosed,
                                                  "session closed while queued");
  }
  LockRelease release(exec_lock_);

  ExecTiming timing{.started_at = std::chrono::system_clock::now(), .finished_at = {}};
  auto result = run_locked(command, timeout, cancel);
  timing.finished_at = std::chrono::system_clock::now();
  if (on_complete) {
    on_complete(result, timing);
  }
  return result;
}

common::Result<CommandResult> Session::run_locked(const std::string &command,
                                                  const std::chrono::milliseconds timeout,
                                                  const common::CancellationToken *cancel) {
  using ExecResult = common::Result<CommandResult>;
  switch (health_.load()) {
  case SessionHealth::Closed:
    return ExecResult::failure(common::ErrorCode::SessionClosed, "session is closed");
  case SessionHealth::Corrupted:
    return ExecResult::failure(common::ErrorCode::SessionTimeout,
                               "session was abandoned after an earlier timeout");
  case SessionHealth::Unknown:
    if (auto probed = probe_locked(cancel); !probed.ok()) {
      return ExecResult::failure(probed);
    }
    break;
  case SessionHealth::Healthy:
    break;
  }

  discard_pending();
  const std::string marker = new_marker();
  if (auto sent = send(build_exec_script(command, marker)); !sent.ok()) {
    return ExecResult::failure(sent);
  }

  Capture capture;
  if (auto done = await_sentinel(marker, std::chrono::steady_clock::now() + timeout, cancel,
                                 capture);
      !done.ok()) {
    return ExecResult::failure(done);
  }

  health_.store(SessionHealth::Healthy);
  return ExecResult::success(CommandResult{
      .stdout_text = common::trim_trailing_newlines(capture.out.substr(0, capture.out_match->begin)),
      .stderr_text = common::trim_trailing_newlines(capture.err.substr(0, capture.err_match->begin)),
      .exit_code = capture.out_match->exit_code,
  });
}

common::Status Session::await_sentinel(const std::string &marker,
                                       const std::chrono::steady_clock::time_point deadline,
                                       const common::CancellationToken *cancel, Capture &capture) {
  while (!capture.out_match.has_value() || !capture.err_match.has_value()) {
    if (common::is_cancelled(cancel)) {
      health_.store(SessionHealth::Unknown);
      return common::Status::error(common::ErrorCode::Cancelled,
                                   "cancelled before the command finished");
    }
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      health_.store(SessionHealth::Corrupted);
      return common::Status::error(common::ErrorCode::SessionTimeout,
                                   "no completion sentinel before the deadline");
    }

    auto chunks = stream_->read(std::min(deadline, now + kReadSlice));
    if (!chunks.ok()) {
      health_.store(SessionHealth::Closed);
      return chunks.status();
    }
    for (const auto &chunk : chunks.value()) {
      (chunk.channel == StreamChannel::Stdout ? capture.out : capture.err) += chunk.data;
    }
    if (!capture.out_match.has_value()) {
      capture.out_match = find_sentinel(capture.out, marker);
    }
    if (!capture.err_match.has_value()) {
      capture.err_match = find_sentinel(capture.err, marker);
    }
  }
  return common::Status::success();
}

common::Status Session::send(const std::string &script) {
  auto written = stream_->write(script, std::chrono::steady_clock::now() + options_.write_timeout);
  if (!written.ok()) {
    health_.store(written.code() == common::ErrorCode::SessionTimeout ? SessionHealth::Corrupted
                                                                      : SessionHealth::Closed);
  }
  return written;
}

common::Status Session::probe_locked(const common::CancellationToken *cancel) {
  discard_pending();
  const std::string marker = new_marker();
  if (auto sent = send(build_probe_script(marker)); !sent.ok()) {
    return sent;
  }
  Capture capture;
  auto status = await_sentinel(marker, std::chrono::steady_clock::now() + options_.probe_timeout,
                               cancel, capture);
  if (!status.ok()) {
    if (status.code() == common::ErrorCode::SessionTimeout) {
      return common::Status::error(common::ErrorCode::SessionTimeout,
                                   "liveness probe unanswered; previous command still running");
    }
    return status;
  }
  health_.store(SessionHealth::Healthy);
  return common::Status::success();
}

void Session::discard_pending() {
  for (int round = 0; round < kMaxDiscardRounds; ++round) {
    auto chunks = stream_->read(std::chrono::steady_clock::now());
    if (!chunks.ok() || chunks.value().empty()) {
      return;
    }
  }
}

void Session::terminate() {
  health_.store(SessionHealth::Closed);
  stream_->shutdown();
}

} // namespace sos::sandbox
