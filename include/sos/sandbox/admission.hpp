#pragma once

#include "sos/common/cancellation.hpp"
#include "sos/common/fifo_semaphore.hpp"
#include "sos/common/result.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_set>

namespace sos::sandbox {

namespace detail {

struct AdmissionPool {
  explicit AdmissionPool(std::size_t capacity) : capacity(capacity), permits(capacity) {}

  const std::size_t capacity;
  common::FifoSemaphore permits;
  std::mutex mutex;
  std::unordered_set<std::uint64_t> outstanding;
  std::uint64_t next_id = 1;
  std::atomic<bool> closed{false};
};

} // namespace detail

/// One unit of admission capacity. Returned to the pool exactly once, either
/// by release() or on destruction.
class AdmissionTicket {
public:
  AdmissionTicket() = default;
  ~AdmissionTicket();

  AdmissionTicket(AdmissionTicket &&other) noexcept;
  AdmissionTicket &operator=(AdmissionTicket &&other) noexcept;
  AdmissionTicket(const AdmissionTicket &) = delete;
  AdmissionTicket &operator=(const AdmissionTicket &) = delete;

  /// Idempotent. Never throws; a failing observer is reported on stderr.
  void release() noexcept;

  [[nodiscard]] bool held() const { return pool_ != nullptr; }
  [[nodiscard]] std::uint64_t id() const { return id_; }

private:
  friend class AdmissionController;
  AdmissionTicket(std::shared_ptr<detail::AdmissionPool> pool, std::uint64_t id)
      : pool_(std::move(pool)), id_(id) {}

  std::shared_ptr<detail::AdmissionPool> pool_;
  std::uint64_t id_ = 0;
};

/// Bounds the number of sandboxes holding runtime resources. Waiters are
/// served in arrival order.
class AdmissionController {
public:
  explicit AdmissionController(std::size_t capacity);

  /// `wait` of zero fails immediately with AdmissionExhausted when the pool
  /// is full. A cancelled token or a closed controller yields Cancelled.
  [[nodiscard]] common::Result<AdmissionTicket>
  acquire(std::chrono::milliseconds wait, const common::CancellationToken *cancel = nullptr);

  [[nodiscard]] common::Result<AdmissionTicket> try_acquire();

  /// Rejects new requests and wakes every waiter with Cancelled. Tickets
  /// already issued stay valid until released.
  void close();

  [[nodiscard]] std::size_t capacity() const { return pool_->capacity; }
  [[nodiscard]] std::size_t in_use() const;
  [[nodiscard]] std::size_t waiting() const { return pool_->permits.waiting(); }
  [[nodiscard]] bool closed() const { return pool_->closed.load(); }

private:
  [[nodiscard]] AdmissionTicket issue();

  std::shared_ptr<detail::AdmissionPool> pool_;
};

} // namespace sos::sandbox
