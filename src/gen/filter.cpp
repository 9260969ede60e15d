#include "wlm/gen/filter.hpp"

#include <cmath>
#include <unordered_map>

#include "wlm/util/unicode.hpp"

namespace wlm::gen {

double shannonEntropy(std::string_view text) {
  auto points = util::Unicode::decode(text);
  if (points.size() < 2) {
    return 0.0;
  }

  std::unordered_map<UChar32, size_t> counts;
  for (UChar32 codepoint : points) {
    ++counts[codepoint];
  }

  const double length = static_cast<double>(points.size());
  double entropy = 0.0;
  for (const auto& [codepoint, count] : counts) {
    double p = static_cast<double>(count) / length;
    entropy -= p * std::log2(p);
  }
  return entropy;
}

CandidateFilter::CandidateFilter(size_t min_length, size_t max_length, double min_entropy,
                                 const std::unordered_set<std::string>& blacklist)
    : min_length_(min_length),
      max_length_(max_length),
      min_entropy_(min_entropy),
      blacklist_(blacklist) {}

CandidateFilter::CandidateFilter(const config::GenerationConfig& config)
    : CandidateFilter(config.min_length, config.max_length, config.min_entropy, config.blacklist) {}

bool CandidateFilter::accepts(const std::string& candidate) const {
  size_t length = util::Unicode::length(candidate);
  if (length < min_length_ || length > max_length_) {
    return false;
  }
  if (min_entropy_ > 0.0 && shannonEntropy(candidate) < min_entropy_) {
    return false;
  }
  return blacklist_.find(candidate) == blacklist_.end();
}

}  // namespace wlm::gen
