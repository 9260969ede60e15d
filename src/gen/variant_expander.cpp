#include "wlm/gen/variant_expander.hpp"

#include <algorithm>

namespace wlm::gen {

using util::CodePoints;
using util::Unicode;

namespace {

template <typename Fn>
std::string mapCodePoints(const std::string& text, Fn fn) {
  CodePoints points = Unicode::decode(text);
  for (auto& codepoint : points) {
    codepoint = fn(codepoint);
  }
  return Unicode::encode(points);
}

CodePoints applyCasePoints(const CodePoints& source, config::CaseMode mode) {
  CodePoints result = source;
  switch (mode) {
    case config::CaseMode::kOriginal:
      break;
    case config::CaseMode::kLower:
      for (auto& cp : result) cp = Unicode::toLower(cp);
      break;
    case config::CaseMode::kUpper:
      for (auto& cp : result) cp = Unicode::toUpper(cp);
      break;
    case config::CaseMode::kTitle: {
      bool word_start = true;
      for (auto& cp : result) {
        if (Unicode::isWhitespace(cp)) {
          word_start = true;
          continue;
        }
        cp = word_start ? Unicode::toTitle(cp) : Unicode::toLower(cp);
        word_start = false;
      }
      break;
    }
    case config::CaseMode::kInvert:
      for (auto& cp : result) {
        if (Unicode::isUpper(cp)) {
          cp = Unicode::toLower(cp);
        } else if (Unicode::isLower(cp)) {
          cp = Unicode::toUpper(cp);
        }
      }
      break;
  }
  return result;
}

}  // namespace

std::string capitalizeFirst(const std::string& text) {
  CodePoints points = Unicode::decode(text);
  if (!points.empty()) {
    points.front() = Unicode::toUpper(points.front());
  }
  return Unicode::encode(points);
}

std::string toUpperCase(const std::string& text) {
  return mapCodePoints(text, Unicode::toUpper);
}

std::string toLowerCase(const std::string& text) {
  return mapCodePoints(text, Unicode::toLower);
}

std::string toTitleCase(const std::string& text) {
  return Unicode::encode(applyCasePoints(Unicode::decode(text), config::CaseMode::kTitle));
}

std::string invertCase(const std::string& text) {
  return Unicode::encode(applyCasePoints(Unicode::decode(text), config::CaseMode::kInvert));
}

std::string toCamelCase(const std::string& text) {
  CodePoints points = Unicode::decode(text);
  bool run_start = true;
  for (auto& cp : points) {
    if (!Unicode::isAlnum(cp)) {
      run_start = true;
      continue;
    }
    cp = run_start ? Unicode::toUpper(cp) : Unicode::toLower(cp);
    run_start = false;
  }
  return Unicode::encode(points);
}

std::string applyCase(const std::string& text, config::CaseMode mode) {
  return Unicode::encode(applyCasePoints(Unicode::decode(text), mode));
}

// LeetExpander

LeetExpander::LeetExpander(const config::LeetMap& leet, size_t max_substitutions)
    : leet_(leet), max_substitutions_(max_substitutions) {}

void LeetExpander::assign(const CodePoints& text, const CodePoints& source) {
  text_ = text;
  eligible_.clear();
  options_.clear();

  size_t limit = std::min(text.size(), source.size());
  for (size_t i = 0; i < limit; ++i) {
    auto it = leet_.find(source[i]);
    if (it != leet_.end() && !it->second.empty()) {
      eligible_.push_back(i);
      options_.push_back(&it->second);
    }
  }

  track_duplicates_ = false;
  for (size_t e = 0; e < eligible_.size() && !track_duplicates_; ++e) {
    track_duplicates_ = canCollide(text_[eligible_[e]], *options_[e]);
  }

  reset();
}

bool LeetExpander::canCollide(UChar32 original, const std::vector<std::string>& options) {
  std::unordered_set<UChar32> replacements;
  for (const auto& option : options) {
    CodePoints points = Unicode::decode(option);
    if (points.size() != 1 || points.front() == original ||
        !replacements.insert(points.front()).second) {
      return true;
    }
  }
  return false;
}

void LeetExpander::reset() {
  seen_.clear();
  exhausted_ = !startSubsetSize(0);
}

std::optional<std::string> LeetExpander::next() {
  while (!exhausted_) {
    std::string value = render();
    advance();
    if (!track_duplicates_ || seen_.insert(value).second) {
      return value;
    }
  }
  return std::nullopt;
}

std::string LeetExpander::render() const {
  std::string result;
  result.reserve(text_.size() + subset_size_ * 2);

  size_t member = 0;
  for (size_t i = 0; i < text_.size(); ++i) {
    if (member < subset_size_ && eligible_[subset_[member]] == i) {
      result += (*options_[subset_[member]])[choices_[member]];
      ++member;
    } else {
      Unicode::append(result, text_[i]);
    }
  }
  return result;
}

void LeetExpander::advance() {
  if (advanceChoices() || advanceSubset()) {
    return;
  }
  if (!startSubsetSize(subset_size_ + 1)) {
    exhausted_ = true;
  }
}

bool LeetExpander::advanceChoices() {
  for (size_t member = subset_size_; member-- > 0;) {
    if (++choices_[member] < options_[subset_[member]]->size()) {
      return true;
    }
    choices_[member] = 0;
  }
  return false;
}

bool LeetExpander::advanceSubset() {
  const size_t n = eligible_.size();
  const size_t k = subset_size_;

  // Lexicographic next k-combination of 0..n-1
  for (size_t member = k; member-- > 0;) {
    if (subset_[member] < n - k + member) {
      ++subset_[member];
      for (size_t tail = member + 1; tail < k; ++tail) {
        subset_[tail] = subset_[tail - 1] + 1;
      }
      std::fill(choices_.begin(), choices_.end(), 0);
      return true;
    }
  }
  return false;
}

bool LeetExpander::startSubsetSize(size_t size) {
  if (size > std::min(eligible_.size(), max_substitutions_)) {
    return false;
  }
  subset_size_ = size;
  subset_.resize(size);
  choices_.assign(size, 0);
  for (size_t i = 0; i < size; ++i) {
    subset_[i] = i;
  }
  return true;
}

// BaseVariantSequence

BaseVariantSequence::BaseVariantSequence(const std::vector<config::CaseMode>& cases,
                                         const config::LeetMap& leet,
                                         size_t max_substitutions)
    : cases_(cases), expander_(leet, max_substitutions) {}

void BaseVariantSequence::assign(const std::string& base) {
  base_ = base;
  source_ = Unicode::decode(base);
  reset();
}

void BaseVariantSequence::reset() {
  seen_.clear();
  exhausted_ = !startCase(0);
}

std::optional<std::string> BaseVariantSequence::next() {
  while (!exhausted_) {
    if (auto value = expander_.next()) {
      if (cases_.size() == 1 || seen_.insert(*value).second) {
        return value;
      }
      continue;
    }
    if (!startCase(case_index_ + 1)) {
      exhausted_ = true;
    }
  }
  return std::nullopt;
}

bool BaseVariantSequence::startCase(size_t index) {
  if (index >= cases_.size()) {
    return false;
  }
  case_index_ = index;
  expander_.assign(applyCasePoints(source_, cases_[index]), source_);
  return true;
}

}  // namespace wlm::gen
