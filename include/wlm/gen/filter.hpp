#pragma once

#include <string>
#include <string_view>
#include <unordered_set>

#include "wlm/config/generation_config.hpp"

namespace wlm::gen {

// Shannon entropy in bits over the code-point distribution; 0 for length < 2
double shannonEntropy(std::string_view text);

/**
 * @brief Length, entropy and blacklist predicate
 */
class CandidateFilter {
public:
  CandidateFilter(size_t min_length, size_t max_length, double min_entropy,
                  const std::unordered_set<std::string>& blacklist);

  explicit CandidateFilter(const config::GenerationConfig& config);

  bool accepts(const std::string& candidate) const;

private:
  size_t min_length_;
  size_t max_length_;
  double min_entropy_;
  const std::unordered_set<std::string>& blacklist_;
};

}  // namespace wlm::gen
