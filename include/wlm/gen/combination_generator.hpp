#pragma once

#include <optional>
#include <string>
#include <vector>

#include "wlm/gen/sequence.hpp"

namespace wlm::gen {

/**
 * @brief Lazy sequence of joined word permutations (base strings)
 *
 * For every length l in 1..max_length, every ordered selection of l
 * distinct word positions (lexicographic over positions) and every joiner,
 * yields words[p1] + joiner + ... + words[pl]. Equal words at different
 * positions count as distinct. Length-1 permutations are emitted once, since
 * the joiner has nothing to join.
 */
class CombinationGenerator : public StringSequence {
public:
  CombinationGenerator(const std::vector<std::string>& words,
                       const std::vector<std::string>& joiners,
                       size_t max_length);

  std::optional<std::string> next() override;
  void reset() override;

private:
  // Advance positions_ to the next l-permutation; false when exhausted
  bool advancePermutation();

  // Start permutations of the given length; false if the length is out of range
  bool startLength(size_t length);

  std::string join(const std::string& joiner) const;

  const std::vector<std::string>& words_;
  const std::vector<std::string>& joiners_;
  size_t max_length_;

  size_t length_ = 0;
  std::vector<size_t> positions_;
  std::vector<bool> used_;
  size_t joiner_index_ = 0;
  bool exhausted_ = false;
};

}  // namespace wlm::gen
