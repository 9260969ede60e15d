#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "wlm/common.hpp"
#include "wlm/util/unicode.hpp"

namespace wlm::config {

// Case transforms applied to the {base} placeholder
enum class CaseMode {
  kOriginal,
  kLower,
  kUpper,
  kTitle,
  kInvert
};

// How workers share the output budget and the sink
enum class ExecutionMode {
  kThreads,    // Shared memory: atomic budget, mutex-guarded sink
  kProcesses   // Isolated memory: static per-worker quota, pipes to the parent
};

// Single code point -> ordered replacement strings
using LeetMap = std::map<UChar32, std::vector<std::string>>;

/**
 * @brief Immutable generation settings
 *
 * Built once before generation starts and shared read-only by every
 * worker. Token sets are taken literally: an empty vector disables every
 * mask using that placeholder, while an empty string entry omits the slot.
 */
struct GenerationConfig {
  std::vector<std::string> words;
  std::vector<std::string> joiners{""};
  size_t max_permutation_length = 0;       // 0 = word count
  std::vector<std::string> masks;           // empty = defaultMasks()

  std::vector<std::string> numbers;
  std::vector<std::string> symbols;
  std::vector<std::string> years;

  std::vector<CaseMode> cases{CaseMode::kOriginal};
  LeetMap leet;
  size_t leet_max_expansions = 4;

  size_t min_length = 4;
  size_t max_length = 64;
  double min_entropy = 0.0;
  std::unordered_set<std::string> blacklist;
  std::optional<uint64_t> max_count;

  size_t workers = 1;
  ExecutionMode mode = ExecutionMode::kThreads;

  // Permutation length clamped to 1..words.size()
  size_t effectivePermutationLength() const;

  // Configured masks, or the built-in set when none were given
  const std::vector<std::string>& effectiveMasks() const;

  // Check cross-field constraints; fails with kConfigError
  Result<void> validate() const;

  static const std::vector<std::string>& defaultMasks();
};

std::string caseModeToString(CaseMode mode);
std::string executionModeToString(ExecutionMode mode);

}  // namespace wlm::config
