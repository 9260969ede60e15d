#pragma once

#include <array>
#include <optional>
#include <string>
#include <vector>

#include "wlm/common.hpp"
#include "wlm/config/generation_config.hpp"
#include "wlm/gen/sequence.hpp"
#include "wlm/gen/variant_expander.hpp"

namespace wlm::gen {

// Placeholders in canonical order; earlier ones vary slowest
enum class Placeholder {
  kBase,         // {base}  case x leet variants
  kCapitalized,  // {Base}
  kUpper,        // {BASE}
  kCamel,        // {camel}
  kNum,          // {num}
  kSym,          // {sym}
  kYear          // {year}
};

constexpr size_t kPlaceholderCount = 7;

std::string_view placeholderName(Placeholder placeholder);

/**
 * @brief Parsed mask template
 *
 * Text outside braces is literal. A '{' without a closing '}' is literal
 * as well; a complete {name} token must name a known placeholder.
 */
class MaskTemplate {
public:
  static Result<MaskTemplate> parse(const std::string& text);

  const std::string& text() const { return text_; }

  // Distinct placeholders present, in canonical order
  const std::vector<Placeholder>& placeholders() const { return placeholders_; }

  // Substitute one value per placeholder (indexed by Placeholder)
  std::string render(const std::array<std::string, kPlaceholderCount>& values) const;

private:
  struct Segment {
    bool is_placeholder = false;
    Placeholder placeholder = Placeholder::kBase;
    std::string literal;
  };

  std::string text_;
  std::vector<Segment> segments_;
  std::vector<Placeholder> placeholders_;
};

// Parse every mask; the first unknown placeholder fails with kInvalidMask
Result<std::vector<MaskTemplate>> compileMasks(const std::vector<std::string>& masks);

/**
 * @brief Cross product of placeholder value sets for one base string
 *
 * For each mask in order, iterates the cross product of the value sets of
 * the placeholders it contains (last placeholder fastest). Every occurrence
 * of a placeholder receives the same value within one candidate. A mask
 * whose placeholder has an empty value set yields nothing.
 */
class MaskComposer : public StringSequence {
public:
  MaskComposer(const std::vector<MaskTemplate>& masks, const config::GenerationConfig& config);

  void assign(const std::string& base);

  std::optional<std::string> next() override;
  void reset() override;

private:
  bool startMask(size_t index);
  bool advanceSlots();
  StringSequence& sourceFor(Placeholder placeholder);

  const std::vector<MaskTemplate>& masks_;

  BaseVariantSequence base_variants_;
  SingleValueSequence capitalized_{""};
  SingleValueSequence upper_{""};
  SingleValueSequence camel_{""};
  VectorSequence numbers_;
  VectorSequence symbols_;
  VectorSequence years_;

  size_t mask_index_ = 0;
  bool mask_ready_ = false;
  std::array<std::string, kPlaceholderCount> current_;
};

}  // namespace wlm::gen
