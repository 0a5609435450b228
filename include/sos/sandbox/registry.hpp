#pragma once

#include "sos/common/cancellation.hpp"
#include "sos/common/result.hpp"
#include "sos/sandbox/admission.hpp"
#include "sos/sandbox/runtime.hpp"
#include "sos/sandbox/session.hpp"
#include "sos/sandbox/types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace sos::sandbox {

/// One sandbox. `state` changes only through compare_and_set; the remaining
/// mutable fields are guarded by `mutex`.
struct SandboxRecord {
  SandboxRecord(std::string id, SandboxSpec spec, std::uint64_t sequence);

  SandboxRecord(const SandboxRecord &) = delete;
  SandboxRecord &operator=(const SandboxRecord &) = delete;

  /// Atomically moves `expected -> next`. Fails with InvalidTransition when
  /// the current state differs or the edge is not part of the lifecycle.
  [[nodiscard]] common::Status compare_and_set(SandboxState expected, SandboxState next,
                                               const std::string &detail = "");
  [[nodiscard]] SandboxState current() const { return state.load(); }

  /// Reserves a Created sandbox for one start() call and publishes `cancel`
  /// for stop() and discard(). A second claim fails with InvalidTransition
  /// while the first is held, even though the state is still Created.
  [[nodiscard]] common::Status claim_start(std::shared_ptr<common::CancellationToken> cancel);
  /// Drops the claim only if `cancel` still holds it.
  void release_start_claim(const std::shared_ptr<common::CancellationToken> &cancel);

  /// Blocks until the sandbox reaches Stopped or Failed, or `deadline`.
  bool wait_terminal(std::chrono::steady_clock::time_point deadline) const;

  [[nodiscard]] SandboxSummary summary() const;

  const std::string id;
  const SandboxSpec spec;
  const std::uint64_t sequence;
  const std::chrono::system_clock::time_point created_at;

  std::atomic<SandboxState> state{SandboxState::Created};
  mutable std::mutex mutex;
  mutable std::condition_variable state_changed;
  std::optional<ContainerHandle> container;
  std::shared_ptr<Session> session;
  std::optional<AdmissionTicket> ticket;
  std::string failure_reason;
  std::optional<std::chrono::system_clock::time_point> started_at;
  std::optional<std::chrono::steady_clock::time_point> running_since;
  std::uint64_t session_commands = 0;
  std::uint64_t standalone_commands = 0;
  std::optional<int> last_standalone_exit_code;
  // Held by the one start() in flight; stop() and discard() cancel it.
  std::shared_ptr<common::CancellationToken> start_cancel;
};

using SandboxRecordPtr = std::shared_ptr<SandboxRecord>;

/// Owns every sandbox record. Lookups share a reader lock on the id map;
/// per-sandbox changes synchronize on the record itself.
class SandboxRegistry {
public:
  /// Allocates a record in Created. Does not contact the runtime.
  [[nodiscard]] std::string create(SandboxSpec spec);

  [[nodiscard]] common::Result<SandboxRecordPtr> get(const std::string &id) const;
  /// Records in creation order.
  [[nodiscard]] std::vector<SandboxRecordPtr> list() const;

  [[nodiscard]] common::Status transition(const std::string &id, SandboxState expected,
                                          SandboxState next, const std::string &detail = "");

  /// Legal only from Stopped or Failed.
  [[nodiscard]] common::Status remove(const std::string &id);

  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::size_t count_live() const;

private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, SandboxRecordPtr> records_;
  std::uint64_t next_sequence_ = 0;
};

} // namespace sos::sandbox
