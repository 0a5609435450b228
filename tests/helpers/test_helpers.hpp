#pragma once

#include "sos/config/schema.hpp"
#include "sos/observability/observer.hpp"
#include "sos/sandbox/docker.hpp"
#include "sos/sandbox/runtime.hpp"
#include "sos/sandbox/stream.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sos::testing {

config::Config mock_config();

/// What the scripted shell answers to one command. A hung command produces
/// nothing until ScriptedShell::finish_hung().
struct ShellReply {
  std::string stdout_text;
  std::string stderr_text;
  int exit_code = 0;
  bool hang = false;
};

using ShellHandler = std::function<ShellReply(const std::string &command)>;

/// In-memory shell that understands the session scripts: it answers init and
/// probe scripts with their sentinel and exec scripts with the handler's reply.
class ScriptedShell {
public:
  explicit ScriptedShell(ShellHandler handler = {});

  [[nodiscard]] common::Status write(const std::string &data);
  [[nodiscard]] common::Result<std::vector<sandbox::StreamChunk>>
  read(std::chrono::steady_clock::time_point deadline);
  void shutdown();

  void set_answer_init(bool answer);
  /// Completes the hung command and everything queued behind it.
  void finish_hung();
  /// Simulates the shell process dying.
  void close_remote();

  [[nodiscard]] std::vector<std::string> commands() const;
  [[nodiscard]] std::size_t scripts_received() const;
  [[nodiscard]] bool is_shut_down() const;

private:
  void handle_script_locked(const std::string &script);
  void emit_locked(const std::string &marker, const ShellReply &reply);

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  ShellHandler handler_;
  std::deque<sandbox::StreamChunk> pending_;
  std::deque<std::string> backlog_;
  std::optional<std::pair<std::string, ShellReply>> hung_;
  std::vector<std::string> commands_;
  std::size_t scripts_ = 0;
  bool answer_init_ = true;
  bool closed_ = false;
  bool shut_down_ = false;
};

class ScriptedShellStream final : public sandbox::IShellStream {
public:
  explicit ScriptedShellStream(std::shared_ptr<ScriptedShell> shell) : shell_(std::move(shell)) {}

  [[nodiscard]] common::Status write(const std::string &data,
                                     std::chrono::steady_clock::time_point deadline) override;
  [[nodiscard]] common::Result<std::vector<sandbox::StreamChunk>>
  read(std::chrono::steady_clock::time_point deadline) override;
  void shutdown() override;

private:
  std::shared_ptr<ScriptedShell> shell_;
};

/// Marker embedded in a session script, or empty.
[[nodiscard]] std::string script_marker(const std::string &script);
/// Command carried by an exec script, or nullopt for init and probe scripts.
[[nodiscard]] std::optional<std::string> script_command(const std::string &script);

/// Records docker argv and answers from canned results keyed by subcommand.
class FakeDockerRunner final : public sandbox::IDockerRunner {
public:
  [[nodiscard]] common::Result<sandbox::ProcessResult>
  run(const std::vector<std::string> &args,
      const sandbox::DockerCommandOptions &options = {}) override;
  [[nodiscard]] std::vector<std::string> command_prefix() const override { return {"docker"}; }

  /// Queue a result for the next call whose first argument is `subcommand`.
  void push_result(const std::string &subcommand, sandbox::ProcessResult result);
  void push_failure(const std::string &subcommand, const std::string &message);

  [[nodiscard]] std::vector<std::vector<std::string>> calls() const;
  [[nodiscard]] std::size_t count(const std::string &subcommand) const;

private:
  mutable std::mutex mutex_;
  std::vector<std::vector<std::string>> calls_;
  std::map<std::string, std::deque<common::Result<sandbox::ProcessResult>>> queued_;
};

/// Container runtime double with failure injection. Shells are ScriptedShells
/// driven by `shell_handler`.
class FakeRuntime final : public sandbox::IContainerRuntime {
public:
  using StandaloneHandler =
      std::function<common::Result<sandbox::CommandResult>(const std::string &command)>;

  explicit FakeRuntime(ShellHandler shell_handler = {});

  [[nodiscard]] common::Result<sandbox::ContainerHandle>
  create_container(const sandbox::ContainerSpec &spec) override;
  [[nodiscard]] common::Status start_container(const sandbox::ContainerHandle &handle) override;
  [[nodiscard]] common::Result<std::unique_ptr<sandbox::IShellStream>>
  attach(const sandbox::ContainerHandle &handle) override;
  [[nodiscard]] common::Result<sandbox::CommandResult>
  exec_standalone(const sandbox::ContainerHandle &handle, const std::string &command,
                  std::chrono::milliseconds timeout) override;
  [[nodiscard]] common::Status stop_container(const sandbox::ContainerHandle &handle) override;
  [[nodiscard]] common::Status remove_container(const sandbox::ContainerHandle &handle) override;
  [[nodiscard]] std::string_view name() const override { return "fake"; }

  void set_standalone_handler(StandaloneHandler handler);
  void set_answer_init(bool answer) { answer_init_ = answer; }
  void set_start_delay(std::chrono::milliseconds delay) { start_delay_ = delay; }

  // Remaining injected failures per operation.
  std::atomic<int> fail_create{0};
  std::atomic<int> fail_start{0};
  std::atomic<int> fail_attach{0};
  std::atomic<int> fail_stop{0};
  std::atomic<int> fail_remove{0};

  std::atomic<int> create_calls{0};
  std::atomic<int> start_calls{0};
  std::atomic<int> attach_calls{0};
  std::atomic<int> standalone_calls{0};
  std::atomic<int> stop_calls{0};
  std::atomic<int> remove_calls{0};

  [[nodiscard]] std::size_t live_containers() const;
  [[nodiscard]] std::shared_ptr<ScriptedShell> shell_for(const std::string &sandbox_id) const;
  [[nodiscard]] std::vector<std::string> standalone_commands() const;

private:
  [[nodiscard]] static bool consume(std::atomic<int> &counter);

  ShellHandler shell_handler_;
  StandaloneHandler standalone_handler_;
  std::atomic<bool> answer_init_{true};
  std::chrono::milliseconds start_delay_{0};

  mutable std::mutex mutex_;
  std::map<std::string, std::string> containers_;
  std::map<std::string, std::shared_ptr<ScriptedShell>> shells_;
  std::vector<std::string> standalone_commands_;
  std::uint64_t next_container_ = 1;
};

/// Keeps every event and metric for assertions.
class RecordingObserver final : public observability::IObserver {
public:
  void record_event(const observability::ObserverEvent &event) override;
  void record_metric(const observability::ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "recording"; }

  [[nodiscard]] std::vector<observability::ObserverEvent> events() const;
  [[nodiscard]] std::vector<observability::ObserverMetric> metrics() const;
  /// `from->to` pairs of state events for one sandbox, in order.
  [[nodiscard]] std::vector<std::string> transitions(const std::string &sandbox_id) const;

private:
  mutable std::mutex mutex_;
  std::vector<observability::ObserverEvent> events_;
  std::vector<observability::ObserverMetric> metrics_;
};

/// Installs a RecordingObserver as the global observer for one scope.
class ScopedRecordingObserver {
public:
  ScopedRecordingObserver();
  ~ScopedRecordingObserver();

  ScopedRecordingObserver(const ScopedRecordingObserver &) = delete;
  ScopedRecordingObserver &operator=(const ScopedRecordingObserver &) = delete;

  [[nodiscard]] RecordingObserver &observer() { return *observer_; }

private:
  std::shared_ptr<RecordingObserver> observer_;
};

class TempDir {
public:
  TempDir();
  ~TempDir();

  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  void create_file(const std::string &name, const std::string &content) const;

private:
  std::filesystem::path path_;
};

/// Polls `condition` until it holds or `timeout` passes.
bool eventually(const std::function<bool()> &condition,
                std::chrono::milliseconds timeout = std::chrono::milliseconds(2'000));

} // namespace sos::testing
