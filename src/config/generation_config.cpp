#include "wlm/config/generation_config.hpp"

#include <algorithm>

namespace wlm::config {

size_t GenerationConfig::effectivePermutationLength() const {
  if (words.empty()) {
    return 0;
  }
  if (max_permutation_length == 0) {
    return words.size();
  }
  return std::clamp<size_t>(max_permutation_length, 1, words.size());
}

const std::vector<std::string>& GenerationConfig::effectiveMasks() const {
  return masks.empty() ? defaultMasks() : masks;
}

Result<void> GenerationConfig::validate() const {
  if (words.empty()) {
    return makeErrorResult<void>(ErrorCode::kConfigError, "No words provided");
  }
  for (const auto& word : words) {
    if (word.empty()) {
      return makeErrorResult<void>(ErrorCode::kConfigError, "Word list contains an empty word");
    }
  }
  if (joiners.empty()) {
    return makeErrorResult<void>(ErrorCode::kConfigError, "At least one joiner is required");
  }
  if (cases.empty()) {
    return makeErrorResult<void>(ErrorCode::kConfigError, "At least one case mode is required");
  }
  if (min_length > max_length) {
    return makeErrorResult<void>(ErrorCode::kConfigError,
        "min_length (" + std::to_string(min_length) + ") exceeds max_length (" +
        std::to_string(max_length) + ")");
  }
  if (min_entropy < 0.0) {
    return makeErrorResult<void>(ErrorCode::kConfigError, "min_entropy must not be negative");
  }
  if (max_count.has_value() && *max_count == 0) {
    return makeErrorResult<void>(ErrorCode::kConfigError, "max_count must be positive");
  }
  if (workers == 0) {
    return makeErrorResult<void>(ErrorCode::kConfigError, "Worker count must be at least 1");
  }
  for (const auto& [key, replacements] : leet) {
    if (replacements.empty()) {
      std::string key_text;
      util::Unicode::append(key_text, key);
      return makeErrorResult<void>(ErrorCode::kConfigError,
          "Leet entry '" + key_text + "' has no replacements");
    }
  }
  return {};
}

const std::vector<std::string>& GenerationConfig::defaultMasks() {
  static const std::vector<std::string> masks = {
    "{base}{num}{sym}",
    "{base}{year}{sym}",
    "{sym}{base}{num}",
    "{camel}{num}",
    "{Base}{year}",
    "{BASE}{sym}{num}",
  };
  return masks;
}

std::string caseModeToString(CaseMode mode) {
  switch (mode) {
    case CaseMode::kOriginal: return "original";
    case CaseMode::kLower: return "lower";
    case CaseMode::kUpper: return "upper";
    case CaseMode::kTitle: return "title";
    case CaseMode::kInvert: return "invert";
  }
  return "original";
}

std::string executionModeToString(ExecutionMode mode) {
  switch (mode) {
    case ExecutionMode::kThreads: return "threads";
    case ExecutionMode::kProcesses: return "processes";
  }
  return "threads";
}

}  // namespace wlm::config
