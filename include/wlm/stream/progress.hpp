#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <mutex>

namespace wlm::stream {

// Receives emitted line counts; must tolerate calls from several threads
class ProgressReporter {
public:
  virtual ~ProgressReporter() = default;

  virtual void advance(uint64_t lines) = 0;
  virtual void finish() {}
};

/**
 * @brief Line counter redrawn in place on stderr
 *
 * Redraws at most every refresh interval; finish() prints the final count
 * and a newline.
 */
class ConsoleProgress : public ProgressReporter {
public:
  ConsoleProgress();
  explicit ConsoleProgress(std::ostream& out,
                           std::chrono::milliseconds refresh = std::chrono::milliseconds(200));

  void advance(uint64_t lines) override;
  void finish() override;

  uint64_t total() const { return total_.load(std::memory_order_relaxed); }

private:
  void draw(uint64_t total, bool final_line);

  std::ostream& out_;
  std::chrono::milliseconds refresh_;
  std::chrono::steady_clock::time_point start_;
  std::chrono::steady_clock::time_point last_draw_;
  std::atomic<uint64_t> total_{0};
  std::mutex draw_mutex_;
  bool finished_ = false;
};

}  // namespace wlm::stream
