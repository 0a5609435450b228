#include "sos/common/fifo_semaphore.hpp"

#include <algorithm>

namespace sos::common {

FifoSemaphore::FifoSemaphore(const std::size_t permits) : permits_(permits) {}

WaitOutcome FifoSemaphore::acquire(const std::chrono::steady_clock::time_point deadline,
                                   const std::function<bool()> &should_abort) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (queue_.empty() && permits_ > 0) {
    --permits_;
    return WaitOutcome::Acquired;
  }

  const std::uint64_t self = next_waiter_++;
  queue_.push_back(self);

  const auto leave = [&](const WaitOutcome outcome) {
    queue_.erase(std::find(queue_.begin(), queue_.end(), self));
    // The next waiter may now be at the front with a free permit.
    cv_.notify_all();
    return outcome;
  };

  while (true) {
    if (queue_.front() == self && permits_ > 0) {
      --permits_;
      queue_.pop_front();
      cv_.notify_all();
      return WaitOutcome::Acquired;
    }
    if (should_abort && should_abort()) {
      return leave(WaitOutcome::Cancelled);
    }
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return leave(WaitOutcome::TimedOut);
    }
    cv_.wait_until(lock, std::min(deadline, now + kPollInterval));
  }
}

bool FifoSemaphore::try_acquire() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!queue_.empty() || permits_ == 0) {
    return false;
  }
  --permits_;
  return true;
}

void FifoSemaphore::release() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++permits_;
  }
  cv_.notify_all();
}

std::size_t FifoSemaphore::available() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return permits_;
}

std::size_t FifoSemaphore::waiting() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

} // namespace sos::common
