#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <vector>

namespace wlm::stream {

/**
 * @brief Shared line budget for the global output cap
 *
 * tryConsume() reserves one line; once the limit is reached every caller
 * gets false. Without a limit the budget only counts.
 */
class OutputBudget {
public:
  explicit OutputBudget(std::optional<uint64_t> limit = std::nullopt) : limit_(limit) {}

  OutputBudget(const OutputBudget&) = delete;
  OutputBudget& operator=(const OutputBudget&) = delete;

  bool tryConsume() noexcept;

  bool exhausted() const noexcept {
    return limit_.has_value() && consumed_.load(std::memory_order_acquire) >= *limit_;
  }

  uint64_t consumed() const noexcept { return consumed_.load(std::memory_order_acquire); }
  std::optional<uint64_t> limit() const { return limit_; }

  // Static per-worker quotas: total / workers, remainder to the first workers
  static std::vector<uint64_t> splitQuota(uint64_t total, size_t workers);

private:
  std::optional<uint64_t> limit_;
  std::atomic<uint64_t> consumed_{0};
};

}  // namespace wlm::stream
