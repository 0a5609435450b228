#include "sos/sandbox/admission.hpp"

#include "sos/observability/global.hpp"

#include <exception>
#include <iostream>
#include <string>

namespace sos::sandbox {

namespace {

std::size_t outstanding_count(detail::AdmissionPool &pool) {
  std::lock_guard<std::mutex> lock(pool.mutex);
  return pool.outstanding.size();
}

} // namespace

AdmissionTicket::~AdmissionTicket() { release(); }

AdmissionTicket::AdmissionTicket(AdmissionTicket &&other) noexcept
    : pool_(std::move(other.pool_)), id_(other.id_) {
  other.pool_.reset();
  other.id_ = 0;
}

AdmissionTicket &AdmissionTicket::operator=(AdmissionTicket &&other) noexcept {
  if (this != &other) {
    release();
    pool_ = std::move(other.pool_);
    id_ = other.id_;
    other.pool_.reset();
    other.id_ = 0;
  }
  return *this;
}

void AdmissionTicket::release() noexcept {
  if (pool_ == nullptr) {
    return;
  }
  auto pool = std::move(pool_);
  pool_.reset();

  std::size_t remaining = 0;
  {
    std::lock_guard<std::mutex> lock(pool->mutex);
    if (pool->outstanding.erase(id_) == 0) {
      return;
    }
    remaining = pool->outstanding.size();
  }
  pool->permits.release();
  // Runs from destructors and move assignment; an observer failure must not
  // escape and terminate the process.
  try {
    observability::record_admission("released", remaining, pool->capacity);
  } catch (const std::exception &ex) {
    std::cerr << "[WARN] admission: release not recorded: " << ex.what() << "\n";
  }
}

AdmissionController::AdmissionController(const std::size_t capacity)
    : pool_(std::make_shared<detail::AdmissionPool>(capacity)) {}

common::Result<AdmissionTicket>
AdmissionController::acquire(const std::chrono::milliseconds wait,
                             const common::CancellationToken *cancel) {
  using TicketResult = common::Result<AdmissionTicket>;
  if (pool_->closed.load() || common::is_cancelled(cancel)) {
    observability::record_admission("cancelled", in_use(), pool_->capacity);
    return TicketResult::failure(common::ErrorCode::Cancelled, "admission is closed");
  }
  if (wait.count() <= 0) {
    return try_acquire();
  }

  auto pool = pool_;
  observability::record_metric(
      observability::AdmissionWaitersMetric{.depth = pool->permits.waiting() + 1});
  const auto outcome =
      pool->permits.acquire(std::chrono::steady_clock::now() + wait, [pool, cancel] {
        return pool->closed.load() || common::is_cancelled(cancel);
      });
  switch (outcome) {
  case common::WaitOutcome::Acquired:
    if (pool->closed.load()) {
      pool->permits.release();
      break;
    }
    return TicketResult::success(issue());
  case common::WaitOutcome::TimedOut:
    observability::record_admission("rejected", in_use(), pool->capacity);
    return TicketResult::failure(common::ErrorCode::AdmissionExhausted,
                                 "no sandbox capacity available after waiting " +
                                     std::to_string(wait.count()) + "ms");
  case common::WaitOutcome::Cancelled:
    break;
  }
  observability::record_admission("cancelled", in_use(), pool->capacity);
  return TicketResult::failure(common::ErrorCode::Cancelled, "admission wait cancelled");
}

common::Result<AdmissionTicket> AdmissionController::try_acquire() {
  using TicketResult = common::Result<AdmissionTicket>;
  if (pool_->closed.load()) {
    return TicketResult::failure(common::ErrorCode::Cancelled, "admission is closed");
  }
  if (!pool_->permits.try_acquire()) {
    observability::record_admission("rejected", in_use(), pool_->capacity);
    return TicketResult::failure(common::ErrorCode::AdmissionExhausted,
                                 "all " + std::to_string(pool_->capacity) +
                                     " sandbox slots are in use");
  }
  return TicketResult::success(issue());
}

void AdmissionController::close() { pool_->closed.store(true); }

std::size_t AdmissionController::in_use() const { return outstanding_count(*pool_); }

AdmissionTicket AdmissionController::issue() {
  std::uint64_t id = 0;
  std::size_t count = 0;
  {
    std::lock_guard<std::mutex> lock(pool_->mutex);
    id = pool_->next_id++;
    pool_->outstanding.insert(id);
    count = pool_->outstanding.size();
  }
  observability::record_admission("acquired", count, pool_->capacity);
  return AdmissionTicket(pool_, id);
}

} // namespace sos::sandbox
