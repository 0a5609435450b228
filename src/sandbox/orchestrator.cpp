#include "sos/sandbox/orchestrator.hpp"

#include "sos/common/fs.hpp"
#include "sos/observability/global.hpp"

#include <algorithm>
#include <cctype>

namespace sos::sandbox {

namespace {

std::chrono::milliseconds elapsed_ms(const ExecTiming &timing) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(timing.finished_at -
                                                               timing.started_at);
}

common::Status not_in_state(const SandboxRecord &record, const std::string &action,
                            const std::string &required) {
  return common::Status::error(common::ErrorCode::InvalidTransition,
                               "sandbox " + record.id + " is " + to_string(record.current()) +
                                   "; " + action + " requires " + required);
}

bool valid_image_reference(const std::string &image) {
  if (image.empty() || image.front() == '-') {
    return false;
  }
  return std::none_of(image.begin(), image.end(), [](const unsigned char ch) {
    return std::isspace(ch) != 0 || std::iscntrl(ch) != 0;
  });
}

} // namespace

Orchestrator::Orchestrator(std::shared_ptr<IContainerRuntime> runtime,
                           OrchestratorOptions options)
    : runtime_(std::move(runtime)), options_(std::move(options)),
      admission_(options_.max_sandboxes), trajectory_(options_.trajectory_max_records) {}

Orchestrator::~Orchestrator() { shutdown(); }

common::Result<std::string> Orchestrator::create(SandboxSpec spec) {
  using IdResult = common::Result<std::string>;
  if (shutting_down_.load()) {
    return IdResult::failure(common::ErrorCode::Cancelled, "orchestrator is shutting down");
  }

  spec.image = common::trim(spec.image);
  if (spec.image.empty()) {
    spec.image = options_.default_image;
  }
  if (!valid_image_reference(spec.image)) {
    return IdResult::failure(common::ErrorCode::InvalidArgument,
                             "invalid image reference: " + spec.image);
  }
  std::vector<std::string> setup;
  for (const auto &command : spec.setup_commands) {
    if (!common::trim(command).empty()) {
      setup.push_back(command);
    }
  }
  spec.setup_commands = std::move(setup);

  const std::string id = registry_.create(std::move(spec));
  trajectory_.open(id);
  return IdResult::success(id);
}

common::Status Orchestrator::start(const std::string &id,
                                   const common::CancellationToken *cancel) {
  auto found = registry_.get(id);
  if (!found.ok()) {
    return found.status();
  }
  auto record = found.value();
  if (shutting_down_.load()) {
    return common::Status::error(common::ErrorCode::Cancelled, "orchestrator is shutting down");
  }

  // The claim keeps the sandbox Created while it waits for admission, so
  // only admitted sandboxes ever count as Starting.
  auto token = std::make_shared<common::CancellationToken>(cancel);
  if (auto claimed = record->claim_start(token); !claimed.ok()) {
    return claimed;
  }
  auto admitted = admission_.acquire(options_.admission_wait, token.get());
  if (!admitted.ok()) {
    record->release_start_claim(token);
    return admitted.status();
  }
  AdmissionTicket ticket = std::move(admitted.value());

  if (auto moved = record->compare_and_set(SandboxState::Created, SandboxState::Starting);
      !moved.ok()) {
    // discard() retired the sandbox while this call waited for admission.
    record->release_start_claim(token);
    return moved;
  }

  auto provisioned = provision(*record, *token);
  if (!provisioned.ok()) {
    abort_start(*record, ticket, token, provisioned.status());
    return provisioned.status();
  }

  {
    std::lock_guard<std::mutex> lock(record->mutex);
    record->session = provisioned.value();
    record->ticket = std::move(ticket);
    record->started_at = std::chrono::system_clock::now();
    record->running_since = std::chrono::steady_clock::now();
    if (record->start_cancel == token) {
      record->start_cancel.reset();
    }
  }

  if (auto running = record->compare_and_set(SandboxState::Starting, SandboxState::Running);
      !running.ok()) {
    // stop() claimed the sandbox while it was starting.
    const auto cleanup = release_resources(*record);
    (void)record->compare_and_set(SandboxState::Stopping,
                                  cleanup.ok() ? SandboxState::Stopped : SandboxState::Failed,
                                  cleanup.ok() ? "stopped while starting" : cleanup.error());
    return common::Status::error(common::ErrorCode::Cancelled,
                                 "sandbox " + id + " was stopped while starting");
  }
  return common::Status::success();
}

common::Result<std::shared_ptr<Session>>
Orchestrator::provision(SandboxRecord &record, const common::CancellationToken &cancel) {
  using SessionResult = common::Result<std::shared_ptr<Session>>;
  const auto interrupted = [&record] {
    return SessionResult::failure(common::ErrorCode::Cancelled,
                                  "start of sandbox " + record.id + " was cancelled");
  };

  auto created = runtime_->create_container(ContainerSpec{
      .sandbox_id = record.id,
      .image = record.spec.image,
      .setup_commands = record.spec.setup_commands,
  });
  if (!created.ok()) {
    return SessionResult::failure(created.status());
  }
  const ContainerHandle handle = created.value();
  {
    std::lock_guard<std::mutex> lock(record.mutex);
    record.container = handle;
  }
  if (cancel.is_cancelled()) {
    return interrupted();
  }

  if (auto started = runtime_->start_container(handle); !started.ok()) {
    return SessionResult::failure(started);
  }

  if (!record.spec.setup_commands.empty()) {
    if (cancel.is_cancelled()) {
      return interrupted();
    }
    auto setup = runtime_->exec_standalone(handle, common::join(record.spec.setup_commands, " && "),
                                           options_.standalone_timeout);
    if (!setup.ok()) {
      return SessionResult::failure(setup.status());
    }
    if (setup.value().exit_code != 0) {
      std::string detail = common::trim(setup.value().stderr_text);
      if (detail.empty()) {
        detail = common::trim(setup.value().stdout_text);
      }
      return SessionResult::failure(common::ErrorCode::SetupFailed,
                                    "setup commands exited with " +
                                        std::to_string(setup.value().exit_code) +
                                        (detail.empty() ? "" : ": " + detail));
    }
  }
  if (cancel.is_cancelled()) {
    return interrupted();
  }

  auto attached = runtime_->attach(handle);
  if (!attached.ok()) {
    return SessionResult::failure(attached.status());
  }
  auto session =
      std::make_shared<Session>(record.id, std::move(attached.value()), options_.session);
  if (auto ready = session->initialize(handle.workdir); !ready.ok()) {
    session->terminate();
    return SessionResult::failure(ready.code() == common::ErrorCode::SessionClosed
                                      ? common::ErrorCode::Runtime
                                      : ready.code(),
                                  runtime_error_context("attach", record.id, ready.error()));
  }
  return SessionResult::success(std::move(session));
}

void Orchestrator::abort_start(SandboxRecord &record, AdmissionTicket &ticket,
                               const std::shared_ptr<common::CancellationToken> &token,
                               const common::Status &cause) {
  const auto cleanup = release_resources(record);
  std::string reason = cause.error();
  if (!cleanup.ok()) {
    reason += "; cleanup: " + cleanup.error();
  }
  record.release_start_claim(token);
  if (record.compare_and_set(SandboxState::Starting, SandboxState::Failed, reason).ok()) {
    ticket.release();
    return;
  }
  // A concurrent stop() moved the sandbox to Stopping and is waiting on us.
  ticket.release();
  (void)record.compare_and_set(SandboxState::Stopping,
                               cleanup.ok() ? SandboxState::Stopped : SandboxState::Failed,
                               cleanup.ok() ? "stopped while starting" : reason);
}

common::Status Orchestrator::release_resources(SandboxRecord &record) {
  std::shared_ptr<Session> session;
  std::optional<ContainerHandle> handle;
  std::optional<AdmissionTicket> ticket;
  {
    std::lock_guard<std::mutex> lock(record.mutex);
    session = std::move(record.session);
    record.session.reset();
    handle = std::move(record.container);
    record.container.reset();
    ticket = std::move(record.ticket);
    record.ticket.reset();
    record.running_since.reset();
  }

  if (session != nullptr) {
    session->terminate();
  }

  auto outcome = common::Status::success();
  if (handle.has_value()) {
    if (auto stopped = runtime_->stop_container(*handle); !stopped.ok()) {
      observability::record_error("sandbox", stopped.error());
      outcome = stopped;
    }
    if (auto removed = runtime_->remove_container(*handle); !removed.ok()) {
      observability::record_error("sandbox", removed.error());
      if (outcome.ok()) {
        outcome = removed;
      }
    }
  }

  if (ticket.has_value()) {
    ticket->release();
  }
  return outcome;
}

void Orchestrator::demote(SandboxRecord &record, const std::string &reason) {
  if (!record.compare_and_set(SandboxState::Running, SandboxState::Stopping, reason).ok()) {
    return;
  }
  const auto cleanup = release_resources(record);
  (void)record.compare_and_set(SandboxState::Stopping, SandboxState::Failed,
                               cleanup.ok() ? reason : reason + "; cleanup: " + cleanup.error());
}

common::Result<CommandResult> Orchestrator::exec(const std::string &id,
                                                 const ExecRequest &request,
                                                 const common::CancellationToken *cancel) {
  using ExecResult = common::Result<CommandResult>;
  auto found = registry_.get(id);
  if (!found.ok()) {
    return ExecResult::failure(found.status());
  }
  auto record = found.value();
  if (common::trim(request.command).empty()) {
    return ExecResult::failure(common::ErrorCode::InvalidArgument, "command must not be empty");
  }
  if (record->current() != SandboxState::Running) {
    return ExecResult::failure(not_in_state(*record, "exec", "running"));
  }
  if (request.mode == ExecMode::Standalone) {
    return exec_standalone(*record, request);
  }

  std::shared_ptr<Session> session;
  {
    std::lock_guard<std::mutex> lock(record->mutex);
    session = record->session;
  }
  if (session == nullptr) {
    return ExecResult::failure(not_in_state(*record, "exec", "running"));
  }

  auto result = session->exec(
      request.command, request.timeout.value_or(options_.exec_timeout), cancel,
      [this, &record, &request](const ExecResult &outcome, const ExecTiming &timing) {
        record_outcome(*record, request.command, ExecMode::Session, outcome, timing);
      });
  if (!result.ok() && (result.code() == common::ErrorCode::SessionTimeout ||
                       result.code() == common::ErrorCode::SessionClosed)) {
    demote(*record, std::string(error_code_name(result.code())) + ": " + result.error());
  }
  return result;
}

common::Result<CommandResult> Orchestrator::exec_standalone(SandboxRecord &record,
                                                            const ExecRequest &request) {
  std::optional<ContainerHandle> handle;
  {
    std::lock_guard<std::mutex> lock(record.mutex);
    handle = record.container;
  }
  if (!handle.has_value()) {
    return common::Result<CommandResult>::failure(not_in_state(record, "exec", "running"));
  }

  ExecTiming timing{.started_at = std::chrono::system_clock::now(), .finished_at = {}};
  auto result = runtime_->exec_standalone(*handle, request.command,
                                          request.timeout.value_or(options_.standalone_timeout));
  timing.finished_at = std::chrono::system_clock::now();
  if (result.ok()) {
    // Same output shape as session commands.
    auto &output = result.value();
    output.stdout_text = common::trim_trailing_newlines(std::move(output.stdout_text));
    output.stderr_text = common::trim_trailing_newlines(std::move(output.stderr_text));
  }
  record_outcome(record, request.command, ExecMode::Standalone, result, timing);
  return result;
}

void Orchestrator::record_outcome(SandboxRecord &record, const std::string &command,
                                  const ExecMode mode,
                                  const common::Result<CommandResult> &result,
                                  const ExecTiming &timing) {
  CommandRecord entry;
  entry.command = command;
  entry.mode = mode;
  entry.started_at = timing.started_at;
  entry.finished_at = timing.finished_at;
  if (result.ok()) {
    entry.stdout_text = result.value().stdout_text;
    entry.stderr_text = result.value().stderr_text;
    entry.exit_code = result.value().exit_code;
  } else {
    entry.exit_code = -1;
    entry.error = std::string(error_code_name(result.code())) + ": " + result.error();
  }
  const int exit_code = entry.exit_code;

  if (auto appended = trajectory_.append(record.id, std::move(entry)); !appended.ok()) {
    observability::record_error("trajectory", appended.error());
  }
  {
    std::lock_guard<std::mutex> lock(record.mutex);
    if (mode == ExecMode::Session) {
      ++record.session_commands;
    } else {
      ++record.standalone_commands;
      if (result.ok()) {
        record.last_standalone_exit_code = exit_code;
      }
    }
  }
  observability::record_command(record.id, to_string(mode), exit_code, elapsed_ms(timing));
}

common::Result<SandboxSummary> Orchestrator::stop(const std::string &id, const bool remove) {
  using SummaryResult = common::Result<SandboxSummary>;
  auto found = registry_.get(id);
  if (!found.ok()) {
    return SummaryResult::failure(found.status());
  }
  auto record = found.value();

  auto outcome = common::Status::success();
  if (record->compare_and_set(SandboxState::Starting, SandboxState::Stopping, "stop requested")
          .ok()) {
    std::shared_ptr<common::CancellationToken> token;
    {
      std::lock_guard<std::mutex> lock(record->mutex);
      token = record->start_cancel;
    }
    if (token != nullptr) {
      token->cancel();
    }
    if (!record->wait_terminal(std::chrono::steady_clock::now() + options_.stop_wait)) {
      return SummaryResult::failure(common::ErrorCode::Runtime,
                                    "sandbox " + id + " did not finish starting in time");
    }
    if (record->current() == SandboxState::Failed) {
      outcome = common::Status::error(common::ErrorCode::Runtime, record->summary().failure_reason);
    }
  } else {
    if (auto moved =
            record->compare_and_set(SandboxState::Running, SandboxState::Stopping, "stop requested");
        !moved.ok()) {
      return SummaryResult::failure(not_in_state(*record, "stop", "running or starting"));
    }
    const auto cleanup = release_resources(*record);
    if (cleanup.ok()) {
      (void)record->compare_and_set(SandboxState::Stopping, SandboxState::Stopped);
    } else {
      (void)record->compare_and_set(SandboxState::Stopping, SandboxState::Failed,
                                    "cleanup failed: " + cleanup.error());
      outcome = common::Status::error(common::ErrorCode::Runtime, cleanup.error());
    }
  }

  auto summary = record->summary();
  if (remove) {
    if (auto removed = registry_.remove(id); removed.ok()) {
      trajectory_.erase(id);
    } else {
      observability::record_error("sandbox", removed.error());
    }
  }
  if (!outcome.ok()) {
    return SummaryResult::failure(outcome);
  }
  return SummaryResult::success(std::move(summary));
}

common::Status Orchestrator::discard(const std::string &id) {
  auto found = registry_.get(id);
  if (!found.ok()) {
    return found.status();
  }
  auto record = found.value();

  const SandboxState state = record->current();
  if (state == SandboxState::Created &&
      record->compare_and_set(SandboxState::Created, SandboxState::Failed, "discarded").ok()) {
    std::shared_ptr<common::CancellationToken> pending;
    {
      std::lock_guard<std::mutex> lock(record->mutex);
      pending = record->start_cancel;
    }
    if (pending != nullptr) {
      pending->cancel();
    }
  }
  if (!is_terminal(record->current())) {
    auto stopped = stop(id);
    if (!stopped.ok() && stopped.code() != common::ErrorCode::Runtime &&
        stopped.code() != common::ErrorCode::InvalidTransition) {
      return stopped.status();
    }
  }
  if (!record->wait_terminal(std::chrono::steady_clock::now() + options_.stop_wait)) {
    return not_in_state(*record, "removal", "stopped or failed");
  }
  if (auto removed = registry_.remove(id); !removed.ok()) {
    return removed;
  }
  trajectory_.erase(id);
  return common::Status::success();
}

std::vector<SandboxSummary> Orchestrator::list() const {
  std::vector<SandboxSummary> out;
  for (const auto &record : registry_.list()) {
    out.push_back(record->summary());
  }
  return out;
}

common::Result<SandboxSummary> Orchestrator::describe(const std::string &id) const {
  auto found = registry_.get(id);
  if (!found.ok()) {
    return common::Result<SandboxSummary>::failure(found.status());
  }
  return common::Result<SandboxSummary>::success(found.value()->summary());
}

common::Result<TrajectorySnapshot> Orchestrator::trajectory(const std::string &id) const {
  if (auto found = registry_.get(id); !found.ok()) {
    return common::Result<TrajectorySnapshot>::failure(found.status());
  }
  return trajectory_.get(id);
}

common::Result<std::string> Orchestrator::formatted_trajectory(const std::string &id) const {
  auto snapshot = trajectory(id);
  if (!snapshot.ok()) {
    return common::Result<std::string>::failure(snapshot.status());
  }
  return common::Result<std::string>::success(format_trajectory(snapshot.value()));
}

std::size_t Orchestrator::reap_expired() {
  if (options_.max_lifetime.count() <= 0) {
    return 0;
  }
  const auto now = std::chrono::steady_clock::now();
  std::vector<std::string> expired;
  for (const auto &record : registry_.list()) {
    if (record->current() != SandboxState::Running) {
      continue;
    }
    std::lock_guard<std::mutex> lock(record->mutex);
    if (record->running_since.has_value() &&
        now - *record->running_since >= options_.max_lifetime) {
      expired.push_back(record->id);
    }
  }

  std::size_t reaped = 0;
  for (const auto &id : expired) {
    auto stopped = stop(id, true);
    if (stopped.ok() || stopped.code() == common::ErrorCode::Runtime) {
      ++reaped;
      observability::record_server("reaped", "id=" + id);
    }
  }
  return reaped;
}

void Orchestrator::start_reaper() {
  if (options_.max_lifetime.count() <= 0 || reaper_running_) {
    return;
  }
  reaper_running_ = true;
  reaper_ = std::thread([this]() { reaper_loop(); });
}

void Orchestrator::stop_reaper() {
  reaper_running_ = false;
  if (reaper_.joinable()) {
    reaper_.join();
  }
}

void Orchestrator::reaper_loop() {
  while (reaper_running_) {
    const auto interval = std::chrono::duration_cast<std::chrono::milliseconds>(
        options_.reap_interval);
    const auto wait_steps = std::max<long long>(1, interval.count() / 100);
    for (long long i = 0; i < wait_steps && reaper_running_; ++i) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    if (reaper_running_) {
      (void)reap_expired();
    }
  }
}

void Orchestrator::shutdown() {
  if (shutting_down_.exchange(true)) {
    return;
  }
  stop_reaper();
  admission_.close();

  std::size_t swept = 0;
  for (const auto &record : registry_.list()) {
    const SandboxState state = record->current();
    if (state != SandboxState::Running && state != SandboxState::Starting) {
      continue;
    }
    auto stopped = stop(record->id);
    if (!stopped.ok() && stopped.code() != common::ErrorCode::InvalidTransition) {
      observability::record_error("shutdown", "sandbox " + record->id + ": " + stopped.error());
    }
    ++swept;
  }
  if (swept > 0) {
    observability::record_server("sweep", std::to_string(swept) + " sandbox(es) stopped");
  }
}

} // namespace sos::sandbox
