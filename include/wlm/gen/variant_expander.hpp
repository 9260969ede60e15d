#pragma once

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "wlm/config/generation_config.hpp"
#include "wlm/gen/sequence.hpp"
#include "wlm/util/unicode.hpp"

namespace wlm::gen {

// Single deterministic transforms of a base string
std::string capitalizeFirst(const std::string& text);   // {Base}
std::string toUpperCase(const std::string& text);       // {BASE}
std::string toLowerCase(const std::string& text);
std::string toTitleCase(const std::string& text);       // each whitespace-delimited word
std::string invertCase(const std::string& text);
std::string toCamelCase(const std::string& text);       // {camel}: "foo_bar" -> "Foo_Bar"

std::string applyCase(const std::string& text, config::CaseMode mode);

/**
 * @brief Bounded leet substitution enumerator
 *
 * Eligible positions are those whose character in the *source* string is a
 * key of the leet map. Yields every variant with 0..min(eligible, max)
 * positions replaced: subset size ascending, subsets in lexicographic
 * position order, then every replacement choice (last position fastest).
 * Subsets larger than the bound are never generated. Duplicate results are
 * skipped; they are only tracked when some replacement is not a single code
 * point distinct from the original and from its siblings, since otherwise
 * every variant is unique.
 */
class LeetExpander : public StringSequence {
public:
  LeetExpander(const config::LeetMap& leet, size_t max_substitutions);

  // Expand `text`, taking eligibility from `source` (same length in code points)
  void assign(const util::CodePoints& text, const util::CodePoints& source);

  std::optional<std::string> next() override;
  void reset() override;

  bool tracksDuplicates() const { return track_duplicates_; }

private:
  static bool canCollide(UChar32 original, const std::vector<std::string>& options);

  std::string render() const;
  bool advanceChoices();
  bool advanceSubset();
  bool startSubsetSize(size_t size);
  void advance();

  const config::LeetMap& leet_;
  size_t max_substitutions_;

  util::CodePoints text_;
  std::vector<size_t> eligible_;                          // positions in text_
  std::vector<const std::vector<std::string>*> options_;  // per eligible position

  size_t subset_size_ = 0;
  std::vector<size_t> subset_;    // indices into eligible_
  std::vector<size_t> choices_;   // replacement index per subset member
  bool exhausted_ = true;

  bool track_duplicates_ = false;
  std::unordered_set<std::string> seen_;
};

/**
 * @brief Value set of the {base} placeholder for one base string
 *
 * Case modes in configured order, each leet-expanded; identical strings
 * produced by different case modes are yielded once. With a single case
 * mode nothing is remembered across variants.
 */
class BaseVariantSequence : public StringSequence {
public:
  BaseVariantSequence(const std::vector<config::CaseMode>& cases,
                      const config::LeetMap& leet,
                      size_t max_substitutions);

  void assign(const std::string& base);

  std::optional<std::string> next() override;
  void reset() override;

private:
  bool startCase(size_t index);

  const std::vector<config::CaseMode>& cases_;
  LeetExpander expander_;

  std::string base_;
  util::CodePoints source_;
  size_t case_index_ = 0;
  bool exhausted_ = true;
  std::unordered_set<std::string> seen_;
};

}  // namespace wlm::gen
