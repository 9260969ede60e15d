#include "wlm/stream/progress.hpp"

#include <iostream>

#include <fmt/format.h>

namespace wlm::stream {

ConsoleProgress::ConsoleProgress() : ConsoleProgress(std::cerr) {}

ConsoleProgress::ConsoleProgress(std::ostream& out, std::chrono::milliseconds refresh)
    : out_(out),
      refresh_(refresh),
      start_(std::chrono::steady_clock::now()),
      last_draw_(start_) {}

void ConsoleProgress::advance(uint64_t lines) {
  uint64_t total = total_.fetch_add(lines, std::memory_order_relaxed) + lines;

  std::unique_lock<std::mutex> lock(draw_mutex_, std::try_to_lock);
  if (!lock.owns_lock() || finished_) {
    return;
  }
  auto now = std::chrono::steady_clock::now();
  if (now - last_draw_ < refresh_) {
    return;
  }
  last_draw_ = now;
  draw(total, false);
}

void ConsoleProgress::finish() {
  std::lock_guard<std::mutex> lock(draw_mutex_);
  if (finished_) {
    return;
  }
  finished_ = true;
  draw(total_.load(std::memory_order_relaxed), true);
}

void ConsoleProgress::draw(uint64_t total, bool final_line) {
  double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
  double rate = seconds > 0.0 ? static_cast<double>(total) / seconds : 0.0;
  out_ << fmt::format("\r{} lines ({:.0f}/s)", total, rate);
  if (final_line) {
    out_ << '\n';
  }
  out_.flush();
}

}  // namespace wlm::stream
