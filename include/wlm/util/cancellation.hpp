#pragma once

#include <atomic>

namespace wlm::util {

/**
 * @brief Cooperative cancellation flag shared by every worker
 *
 * A token may be chained to a parent (e.g. a run-level token chained to the
 * caller's abort token); it reports cancelled when either is set. cancel()
 * is a lock-free store and may be called from a signal handler.
 */
class CancellationToken {
public:
  CancellationToken() = default;
  explicit CancellationToken(const CancellationToken* parent) : parent_(parent) {}

  CancellationToken(const CancellationToken&) = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

  void cancel() noexcept { cancelled_.store(true, std::memory_order_relaxed); }

  bool isCancelled() const noexcept {
    return cancelled_.load(std::memory_order_relaxed) ||
           (parent_ != nullptr && parent_->isCancelled());
  }

  // Set on this token only, ignoring the parent
  bool isCancelledLocally() const noexcept {
    return cancelled_.load(std::memory_order_relaxed);
  }

private:
  std::atomic<bool> cancelled_{false};
  const CancellationToken* parent_ = nullptr;
};

} // namespace wlm::util
