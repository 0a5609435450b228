#include "sos/sandbox/trajectory.hpp"

namespace sos::sandbox {

TrajectoryRecorder::TrajectoryRecorder(const std::size_t max_records)
    : max_records_(max_records) {}

void TrajectoryRecorder::open(const std::string &sandbox_id) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (logs_.count(sandbox_id) == 0) {
    logs_.emplace(sandbox_id, std::make_shared<Log>());
  }
}

std::shared_ptr<TrajectoryRecorder::Log>
TrajectoryRecorder::find(const std::string &sandbox_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const auto it = logs_.find(sandbox_id);
  return it == logs_.end() ? nullptr : it->second;
}

common::Result<std::uint64_t> TrajectoryRecorder::append(const std::string &sandbox_id,
                                                         CommandRecord record) {
  auto log = find(sandbox_id);
  if (log == nullptr) {
    return common::Result<std::uint64_t>::failure(common::ErrorCode::NotFound,
                                                  "no trajectory for sandbox " + sandbox_id);
  }

  std::lock_guard<std::mutex> lock(log->mutex);
  record.index = log->next_index++;
  const std::uint64_t index = record.index;
  log->records.push_back(std::move(record));
  while (max_records_ > 0 && log->records.size() > max_records_) {
    log->records.pop_front();
    ++log->dropped;
  }
  return common::Result<std::uint64_t>::success(index);
}

common::Result<TrajectorySnapshot>
TrajectoryRecorder::get(const std::string &sandbox_id) const {
  auto log = find(sandbox_id);
  if (log == nullptr) {
    return common::Result<TrajectorySnapshot>::failure(common::ErrorCode::NotFound,
                                                       "no trajectory for sandbox " + sandbox_id);
  }

  std::lock_guard<std::mutex> lock(log->mutex);
  TrajectorySnapshot snapshot;
  snapshot.records.assign(log->records.begin(), log->records.end());
  snapshot.dropped = log->dropped;
  snapshot.truncated = log->dropped > 0;
  return common::Result<TrajectorySnapshot>::success(std::move(snapshot));
}

void TrajectoryRecorder::erase(const std::string &sandbox_id) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  logs_.erase(sandbox_id);
}

std::string format_trajectory(const TrajectorySnapshot &snapshot) {
  std::string out;
  if (snapshot.truncated) {
    out += "... " + std::to_string(snapshot.dropped) + " earlier command(s) truncated ...\n";
  }
  for (const auto &record : snapshot.records) {
    out += "$ " + record.command;
    if (record.mode == ExecMode::Standalone) {
      out += "  [standalone]";
    }
    out += "\n";
    if (!record.stdout_text.empty()) {
      out += record.stdout_text + "\n";
    }
    if (!record.stderr_text.empty()) {
      out += record.stderr_text + "\n";
    }
    if (!record.error.empty()) {
      out += "[error] " + record.error + "\n";
    } else if (record.exit_code != 0) {
      out += "[exit " + std::to_string(record.exit_code) + "]\n";
    }
  }
  return out;
}

} // namespace sos::sandbox
