#include "wlm/gen/mask_composer.hpp"

#include <algorithm>

namespace wlm::gen {

namespace {

struct PlaceholderEntry {
  std::string_view name;
  Placeholder placeholder;
};

constexpr std::array<PlaceholderEntry, kPlaceholderCount> kPlaceholders = {{
  {"base", Placeholder::kBase},
  {"Base", Placeholder::kCapitalized},
  {"BASE", Placeholder::kUpper},
  {"camel", Placeholder::kCamel},
  {"num", Placeholder::kNum},
  {"sym", Placeholder::kSym},
  {"year", Placeholder::kYear},
}};

std::optional<Placeholder> lookupPlaceholder(std::string_view name) {
  for (const auto& entry : kPlaceholders) {
    if (entry.name == name) {
      return entry.placeholder;
    }
  }
  return std::nullopt;
}

}  // namespace

std::string_view placeholderName(Placeholder placeholder) {
  return kPlaceholders[static_cast<size_t>(placeholder)].name;
}

Result<MaskTemplate> MaskTemplate::parse(const std::string& text) {
  MaskTemplate mask;
  mask.text_ = text;

  std::string literal;
  size_t pos = 0;
  while (pos < text.size()) {
    if (text[pos] != '{') {
      literal += text[pos++];
      continue;
    }

    auto close = text.find('}', pos + 1);
    if (close == std::string::npos) {
      literal.append(text, pos, std::string::npos);
      break;
    }

    std::string name = text.substr(pos + 1, close - pos - 1);
    auto placeholder = lookupPlaceholder(name);
    if (!placeholder) {
      return makeErrorResult<MaskTemplate>(ErrorCode::kInvalidMask,
          "Unknown placeholder {" + name + "} in mask '" + text + "'");
    }

    if (!literal.empty()) {
      mask.segments_.push_back(Segment{false, Placeholder::kBase, std::move(literal)});
      literal.clear();
    }
    mask.segments_.push_back(Segment{true, *placeholder, {}});
    if (std::find(mask.placeholders_.begin(), mask.placeholders_.end(), *placeholder) ==
        mask.placeholders_.end()) {
      mask.placeholders_.push_back(*placeholder);
    }
    pos = close + 1;
  }

  if (!literal.empty()) {
    mask.segments_.push_back(Segment{false, Placeholder::kBase, std::move(literal)});
  }

  std::sort(mask.placeholders_.begin(), mask.placeholders_.end());
  return mask;
}

std::string MaskTemplate::render(const std::array<std::string, kPlaceholderCount>& values) const {
  std::string result;
  for (const auto& segment : segments_) {
    if (segment.is_placeholder) {
      result += values[static_cast<size_t>(segment.placeholder)];
    } else {
      result += segment.literal;
    }
  }
  return result;
}

Result<std::vector<MaskTemplate>> compileMasks(const std::vector<std::string>& masks) {
  std::vector<MaskTemplate> compiled;
  compiled.reserve(masks.size());
  for (const auto& text : masks) {
    auto mask = MaskTemplate::parse(text);
    if (!mask) {
      return std::unexpected(mask.error());
    }
    compiled.push_back(std::move(*mask));
  }
  return compiled;
}

MaskComposer::MaskComposer(const std::vector<MaskTemplate>& masks,
                           const config::GenerationConfig& config)
    : masks_(masks),
      base_variants_(config.cases, config.leet, config.leet_max_expansions),
      numbers_(config.numbers),
      symbols_(config.symbols),
      years_(config.years) {
  mask_index_ = masks_.size();
}

void MaskComposer::assign(const std::string& base) {
  base_variants_.assign(base);
  capitalized_ = SingleValueSequence(capitalizeFirst(base));
  upper_ = SingleValueSequence(toUpperCase(base));
  camel_ = SingleValueSequence(toCamelCase(base));
  reset();
}

void MaskComposer::reset() {
  mask_index_ = 0;
  mask_ready_ = false;
}

std::optional<std::string> MaskComposer::next() {
  while (mask_index_ < masks_.size()) {
    if (!mask_ready_) {
      mask_ready_ = startMask(mask_index_);
      if (!mask_ready_) {
        ++mask_index_;
        continue;
      }
    }

    std::string candidate = masks_[mask_index_].render(current_);
    if (!advanceSlots()) {
      mask_ready_ = false;
      ++mask_index_;
    }
    return candidate;
  }
  return std::nullopt;
}

bool MaskComposer::startMask(size_t index) {
  for (Placeholder placeholder : masks_[index].placeholders()) {
    auto& source = sourceFor(placeholder);
    source.reset();
    auto value = source.next();
    if (!value) {
      return false;
    }
    current_[static_cast<size_t>(placeholder)] = std::move(*value);
  }
  return true;
}

bool MaskComposer::advanceSlots() {
  const auto& active = masks_[mask_index_].placeholders();
  for (size_t slot = active.size(); slot-- > 0;) {
    auto& source = sourceFor(active[slot]);
    if (auto value = source.next()) {
      current_[static_cast<size_t>(active[slot])] = std::move(*value);
      return true;
    }
    // Wrap this slot and carry into the previous one
    source.reset();
    current_[static_cast<size_t>(active[slot])] = source.next().value_or("");
  }
  return false;
}

StringSequence& MaskComposer::sourceFor(Placeholder placeholder) {
  switch (placeholder) {
    case Placeholder::kBase: return base_variants_;
    case Placeholder::kCapitalized: return capitalized_;
    case Placeholder::kUpper: return upper_;
    case Placeholder::kCamel: return camel_;
    case Placeholder::kNum: return numbers_;
    case Placeholder::kSym: return symbols_;
    case Placeholder::kYear: return years_;
  }
  return base_variants_;
}

}  // namespace wlm::gen
