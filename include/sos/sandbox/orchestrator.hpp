#pragma once

#include "sos/common/cancellation.hpp"
#include "sos/common/result.hpp"
#include "sos/sandbox/admission.hpp"
#include "sos/sandbox/registry.hpp"
#include "sos/sandbox/runtime.hpp"
#include "sos/sandbox/session.hpp"
#include "sos/sandbox/trajectory.hpp"
#include "sos/sandbox/types.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace sos::sandbox {

struct OrchestratorOptions {
  std::size_t max_sandboxes = 10;
  std::string default_image = "ubuntu:latest";
  // Zero rejects immediately when every slot is taken.
  std::chrono::milliseconds admission_wait{0};
  std::chrono::milliseconds exec_timeout{30'000};
  std::chrono::milliseconds standalone_timeout{60'000};
  // Zero disables the lifetime reaper.
  std::chrono::seconds max_lifetime{600};
  std::chrono::seconds reap_interval{60};
  // Upper bound for stop() waiting on an interrupted start.
  std::chrono::milliseconds stop_wait{120'000};
  std::size_t trajectory_max_records = 0;
  SessionOptions session;
};

struct ExecRequest {
  std::string command;
  ExecMode mode = ExecMode::Session;
  std::optional<std::chrono::milliseconds> timeout;
};

/// Entry point for every sandbox operation. Ties admission, the registry,
/// the container runtime, sessions and trajectories together; callers only
/// ever pass sandbox ids.
class Orchestrator {
public:
  explicit Orchestrator(std::shared_ptr<IContainerRuntime> runtime,
                        OrchestratorOptions options = {});
  ~Orchestrator();

  Orchestrator(const Orchestrator &) = delete;
  Orchestrator &operator=(const Orchestrator &) = delete;

  /// Registers a sandbox in Created. An empty image selects the default.
  [[nodiscard]] common::Result<std::string> create(SandboxSpec spec);

  /// Created -> Starting -> Running. On failure after admission the sandbox
  /// ends in Failed and its capacity is returned. AdmissionExhausted and
  /// Cancelled-while-queued leave it in Created.
  [[nodiscard]] common::Status start(const std::string &id,
                                     const common::CancellationToken *cancel = nullptr);

  /// Runs a command in the persistent session or as a standalone process.
  /// A non-zero exit is a normal result. SessionTimeout and SessionClosed
  /// demote the sandbox to Failed.
  [[nodiscard]] common::Result<CommandResult>
  exec(const std::string &id, const ExecRequest &request,
       const common::CancellationToken *cancel = nullptr);

  /// Running or Starting -> Stopping -> Stopped. Cleanup failures end in
  /// Failed with a Runtime error; the admission ticket is released either
  /// way. With `remove` the record and its trajectory are dropped too.
  [[nodiscard]] common::Result<SandboxSummary> stop(const std::string &id, bool remove = false);

  /// Stops the sandbox if it is live, then forgets it.
  [[nodiscard]] common::Status discard(const std::string &id);

  [[nodiscard]] std::vector<SandboxSummary> list() const;
  [[nodiscard]] common::Result<SandboxSummary> describe(const std::string &id) const;
  [[nodiscard]] common::Result<TrajectorySnapshot> trajectory(const std::string &id) const;
  [[nodiscard]] common::Result<std::string> formatted_trajectory(const std::string &id) const;

  /// Stops and removes sandboxes running longer than max_lifetime. Returns
  /// how many were reaped.
  std::size_t reap_expired();
  void start_reaper();
  void stop_reaper();

  /// Best-effort sweep of every live sandbox. Pending admission waiters
  /// return Cancelled and no new sandbox can be created afterwards.
  void shutdown();

  [[nodiscard]] const OrchestratorOptions &options() const { return options_; }
  [[nodiscard]] const AdmissionController &admission() const { return admission_; }
  [[nodiscard]] std::string_view runtime_name() const { return runtime_->name(); }

private:
  [[nodiscard]] common::Result<std::shared_ptr<Session>>
  provision(SandboxRecord &record, const common::CancellationToken &cancel);
  void abort_start(SandboxRecord &record, AdmissionTicket &ticket,
                   const std::shared_ptr<common::CancellationToken> &token,
                   const common::Status &cause);
  [[nodiscard]] common::Status release_resources(SandboxRecord &record);
  void demote(SandboxRecord &record, const std::string &reason);
  [[nodiscard]] common::Result<CommandResult> exec_standalone(SandboxRecord &record,
                                                              const ExecRequest &request);
  void record_outcome(SandboxRecord &record, const std::string &command, ExecMode mode,
                      const common::Result<CommandResult> &result, const ExecTiming &timing);
  void reaper_loop();

  std::shared_ptr<IContainerRuntime> runtime_;
  OrchestratorOptions options_;
  AdmissionController admission_;
  SandboxRegistry registry_;
  TrajectoryRecorder trajectory_;
  std::thread reaper_;
  std::atomic<bool> reaper_running_{false};
  std::atomic<bool> shutting_down_{false};
};

} // namespace sos::sandbox
