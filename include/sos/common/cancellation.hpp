#pragma once

#include <atomic>

namespace sos::common {

/// Cooperative cancel flag handed into blocking waits. Waiters poll it; it
/// never interrupts a thread on its own.
class CancellationToken {
public:
  CancellationToken() = default;
  explicit CancellationToken(const CancellationToken *parent) : parent_(parent) {}

  CancellationToken(const CancellationToken &) = delete;
  CancellationToken &operator=(const CancellationToken &) = delete;

  void cancel() { cancelled_.store(true); }

  [[nodiscard]] bool is_cancelled() const {
    return cancelled_.load() || (parent_ != nullptr && parent_->is_cancelled());
  }

private:
  const CancellationToken *parent_ = nullptr;
  std::atomic<bool> cancelled_{false};
};

[[nodiscard]] inline bool is_cancelled(const CancellationToken *token) {
  return token != nullptr && token->is_cancelled();
}

} // namespace sos::common
