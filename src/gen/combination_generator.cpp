#include "wlm/gen/combination_generator.hpp"

#include <algorithm>

namespace wlm::gen {

CombinationGenerator::CombinationGenerator(const std::vector<std::string>& words,
                                           const std::vector<std::string>& joiners,
                                           size_t max_length)
    : words_(words),
      joiners_(joiners),
      max_length_(std::min(max_length, words.size())) {
  reset();
}

void CombinationGenerator::reset() {
  exhausted_ = !startLength(1);
}

std::optional<std::string> CombinationGenerator::next() {
  if (exhausted_) {
    return std::nullopt;
  }

  // A single word has nothing to join
  size_t joiner_count = length_ == 1 ? 1 : joiners_.size();
  std::string value = join(joiners_[joiner_index_]);

  if (++joiner_index_ >= joiner_count) {
    joiner_index_ = 0;
    if (!advancePermutation() && !startLength(length_ + 1)) {
      exhausted_ = true;
    }
  }

  return value;
}

bool CombinationGenerator::startLength(size_t length) {
  if (length == 0 || length > max_length_ || joiners_.empty()) {
    return false;
  }

  length_ = length;
  joiner_index_ = 0;
  positions_.resize(length);
  used_.assign(words_.size(), false);
  for (size_t i = 0; i < length; ++i) {
    positions_[i] = i;
    used_[i] = true;
  }
  return true;
}

bool CombinationGenerator::advancePermutation() {
  const size_t n = words_.size();

  // Walk back from the last slot; release each slot and try to bump it
  // to the next larger free position, then refill the tail ascending.
  for (size_t slot = length_; slot-- > 0;) {
    used_[positions_[slot]] = false;

    size_t candidate = positions_[slot] + 1;
    while (candidate < n && used_[candidate]) {
      ++candidate;
    }
    if (candidate >= n) {
      continue;
    }

    positions_[slot] = candidate;
    used_[candidate] = true;

    size_t fill = 0;
    for (size_t tail = slot + 1; tail < length_; ++tail) {
      while (used_[fill]) {
        ++fill;
      }
      positions_[tail] = fill;
      used_[fill] = true;
    }
    return true;
  }

  return false;
}

std::string CombinationGenerator::join(const std::string& joiner) const {
  std::string result;
  for (size_t i = 0; i < length_; ++i) {
    if (i > 0) {
      result += joiner;
    }
    result += words_[positions_[i]];
  }
  return result;
}

}  // namespace wlm::gen
