#pragma once

#include "sos/common/result.hpp"
#include "sos/sandbox/types.hpp"

#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace sos::sandbox {

/// Copy of a trajectory at one point in time. `truncated` is set once any
/// record has been evicted; `dropped` counts the evicted records.
struct TrajectorySnapshot {
  std::vector<CommandRecord> records;
  bool truncated = false;
  std::uint64_t dropped = 0;
};

/// Append-only command log per sandbox, optionally bounded (oldest records
/// evicted first).
class TrajectoryRecorder {
public:
  /// `max_records` of 0 keeps everything.
  explicit TrajectoryRecorder(std::size_t max_records = 0);

  void open(const std::string &sandbox_id);
  /// Assigns the next index to `record` and returns it.
  [[nodiscard]] common::Result<std::uint64_t> append(const std::string &sandbox_id,
                                                     CommandRecord record);
  [[nodiscard]] common::Result<TrajectorySnapshot> get(const std::string &sandbox_id) const;
  void erase(const std::string &sandbox_id);

  [[nodiscard]] std::size_t max_records() const { return max_records_; }

private:
  struct Log {
    mutable std::mutex mutex;
    std::deque<CommandRecord> records;
    std::uint64_t dropped = 0;
    std::uint64_t next_index = 0;
  };

  [[nodiscard]] std::shared_ptr<Log> find(const std::string &sandbox_id) const;

  std::size_t max_records_;
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<Log>> logs_;
};

/// `$ command` followed by its output, one block per record.
[[nodiscard]] std::string format_trajectory(const TrajectorySnapshot &snapshot);

} // namespace sos::sandbox
