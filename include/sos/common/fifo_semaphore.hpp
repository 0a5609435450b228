#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>

namespace sos::common {

enum class WaitOutcome { Acquired, TimedOut, Cancelled };

/// Counting semaphore that hands permits to waiters strictly in arrival
/// order. A waiter that times out or is cancelled leaves the queue without
/// consuming a permit.
class FifoSemaphore {
public:
  explicit FifoSemaphore(std::size_t permits);

  FifoSemaphore(const FifoSemaphore &) = delete;
  FifoSemaphore &operator=(const FifoSemaphore &) = delete;

  /// `should_abort` is polled while waiting; a null function never aborts.
  [[nodiscard]] WaitOutcome acquire(std::chrono::steady_clock::time_point deadline,
                                    const std::function<bool()> &should_abort = {});

  /// Succeeds only when a permit is free and nobody is queued ahead.
  [[nodiscard]] bool try_acquire();

  void release();

  [[nodiscard]] std::size_t available() const;
  [[nodiscard]] std::size_t waiting() const;

private:
  static constexpr auto kPollInterval = std::chrono::milliseconds(25);

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::size_t permits_;
  std::deque<std::uint64_t> queue_;
  std::uint64_t next_waiter_ = 0;
};

} // namespace sos::common
