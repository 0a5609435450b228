#include "sos/sandbox/registry.hpp"

#include "sos/common/random.hpp"
#include "sos/observability/global.hpp"

#include <algorithm>

namespace sos::sandbox {

SandboxRecord::SandboxRecord(std::string id, SandboxSpec spec, const std::uint64_t sequence)
    : id(std::move(id)), spec(std::move(spec)), sequence(sequence),
      created_at(std::chrono::system_clock::now()) {}

common::Status SandboxRecord::compare_and_set(const SandboxState expected,
                                              const SandboxState next,
                                              const std::string &detail) {
  {
    std::lock_guard<std::mutex> lock(mutex);
    SandboxState observed = expected;
    if (!is_legal_transition(expected, next) || !state.compare_exchange_strong(observed, next)) {
      return common::Status::error(common::ErrorCode::InvalidTransition,
                                   "sandbox " + id + " is " + to_string(state.load()) +
                                       "; cannot move " + to_string(expected) + " -> " +
                                       to_string(next));
    }
    if (next == SandboxState::Failed && !detail.empty()) {
      failure_reason = detail;
    }
  }
  state_changed.notify_all();
  observability::record_state_change(id, to_string(expected), to_string(next), detail);
  return common::Status::success();
}

common::Status SandboxRecord::claim_start(std::shared_ptr<common::CancellationToken> cancel) {
  std::lock_guard<std::mutex> lock(mutex);
  const SandboxState observed = state.load();
  if (observed != SandboxState::Created) {
    return common::Status::error(common::ErrorCode::InvalidTransition,
                                 "sandbox " + id + " is " + to_string(observed) +
                                     "; cannot move created -> starting");
  }
  if (start_cancel != nullptr) {
    return common::Status::error(common::ErrorCode::InvalidTransition,
                                 "sandbox " + id + " is already being started");
  }
  start_cancel = std::move(cancel);
  return common::Status::success();
}

void SandboxRecord::release_start_claim(const std::shared_ptr<common::CancellationToken> &cancel) {
  std::lock_guard<std::mutex> lock(mutex);
  if (start_cancel == cancel) {
    start_cancel.reset();
  }
}

bool SandboxRecord::wait_terminal(const std::chrono::steady_clock::time_point deadline) const {
  std::unique_lock<std::mutex> lock(mutex);
  return state_changed.wait_until(lock, deadline, [this] { return is_terminal(state.load()); });
}

SandboxSummary SandboxRecord::summary() const {
  std::lock_guard<std::mutex> lock(mutex);
  return SandboxSummary{
      .id = id,
      .image = spec.image,
      .setup_commands = spec.setup_commands,
      .state = state.load(),
      .failure_reason = failure_reason,
      .created_at = created_at,
      .started_at = started_at,
      .session_command_count = session_commands,
      .standalone_command_count = standalone_commands,
      .last_standalone_exit_code = last_standalone_exit_code,
  };
}

std::string SandboxRegistry::create(SandboxSpec spec) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  std::string id = common::uuid_v4();
  while (records_.count(id) != 0) {
    id = common::uuid_v4();
  }
  records_.emplace(id, std::make_shared<SandboxRecord>(id, std::move(spec), next_sequence_++));
  lock.unlock();
  observability::record_state_change(id, "new", to_string(SandboxState::Created));
  return id;
}

common::Result<SandboxRecordPtr> SandboxRegistry::get(const std::string &id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const auto it = records_.find(id);
  if (it == records_.end()) {
    return common::Result<SandboxRecordPtr>::failure(common::ErrorCode::NotFound,
                                                     "sandbox not found: " + id);
  }
  return common::Result<SandboxRecordPtr>::success(it->second);
}

std::vector<SandboxRecordPtr> SandboxRegistry::list() const {
  std::vector<SandboxRecordPtr> out;
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    out.reserve(records_.size());
    for (const auto &[id, record] : records_) {
      out.push_back(record);
    }
  }
  std::sort(out.begin(), out.end(), [](const SandboxRecordPtr &lhs, const SandboxRecordPtr &rhs) {
    return lhs->sequence < rhs->sequence;
  });
  return out;
}

common::Status SandboxRegistry::transition(const std::string &id, const SandboxState expected,
                                           const SandboxState next, const std::string &detail) {
  auto record = get(id);
  if (!record.ok()) {
    return record.status();
  }
  return record.value()->compare_and_set(expected, next, detail);
}

common::Status SandboxRegistry::remove(const std::string &id) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  const auto it = records_.find(id);
  if (it == records_.end()) {
    return common::Status::error(common::ErrorCode::NotFound, "sandbox not found: " + id);
  }
  const SandboxState state = it->second->current();
  if (!is_terminal(state)) {
    return common::Status::error(common::ErrorCode::InvalidTransition,
                                 "sandbox " + id + " is " + to_string(state) +
                                     "; only stopped or failed sandboxes can be removed");
  }
  records_.erase(it);
  return common::Status::success();
}

std::size_t SandboxRegistry::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return records_.size();
}

std::size_t SandboxRegistry::count_live() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return static_cast<std::size_t>(
      std::count_if(records_.begin(), records_.end(), [](const auto &entry) {
        const auto state = entry.second->current();
        return state == SandboxState::Starting || state == SandboxState::Running;
      }));
}

} // namespace sos::sandbox
