#include "wlm/stream/output_budget.hpp"

namespace wlm::stream {

bool OutputBudget::tryConsume() noexcept {
  if (!limit_) {
    consumed_.fetch_add(1, std::memory_order_acq_rel);
    return true;
  }

  uint64_t current = consumed_.load(std::memory_order_acquire);
  while (current < *limit_) {
    if (consumed_.compare_exchange_weak(current, current + 1,
                                        std::memory_order_acq_rel,
                                        std::memory_order_acquire)) {
      return true;
    }
  }
  return false;
}

std::vector<uint64_t> OutputBudget::splitQuota(uint64_t total, size_t workers) {
  std::vector<uint64_t> quotas;
  if (workers == 0) {
    return quotas;
  }
  quotas.assign(workers, total / workers);
  uint64_t remainder = total % workers;
  for (size_t i = 0; i < remainder; ++i) {
    ++quotas[i];
  }
  return quotas;
}

}  // namespace wlm::stream
