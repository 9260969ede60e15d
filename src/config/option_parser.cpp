#include "wlm/config/option_parser.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <unordered_set>

namespace wlm::config {

namespace {

// Years, range bounds and last:N counts all fall in 0..kMaxYear
constexpr int kMaxYear = 9999;

bool containsLineBreak(const std::string& token) {
  return token.find_first_of("\r\n") != std::string::npos;
}

void appendUnique(std::vector<std::string>& out, std::unordered_set<std::string>& seen,
                  std::string value) {
  if (seen.insert(value).second) {
    out.push_back(std::move(value));
  }
}

}  // namespace

Result<std::vector<std::string>> OptionParser::parseTokenList(const std::string& csv,
                                                              const std::string& option_name) {
  std::vector<std::string> tokens;
  std::unordered_set<std::string> seen;

  for (const auto& part : split(csv, ',')) {
    std::string token = trim(part);
    if (containsLineBreak(token)) {
      return makeErrorResult<std::vector<std::string>>(ErrorCode::kConfigError,
          "Invalid " + option_name + " entry: line breaks are not allowed");
    }
    appendUnique(tokens, seen, std::move(token));
  }

  if (tokens.empty()) {
    tokens.emplace_back();
  }
  return tokens;
}

Result<std::vector<std::string>> OptionParser::parseYears(const std::string& text) {
  auto now = std::chrono::system_clock::now();
  std::chrono::year_month_day today{std::chrono::floor<std::chrono::days>(now)};
  return parseYears(text, static_cast<int>(today.year()));
}

Result<std::vector<std::string>> OptionParser::parseYears(const std::string& text, int current_year) {
  std::vector<std::string> years;
  std::unordered_set<std::string> seen;

  for (const auto& part : split(text, ',')) {
    std::string element = trim(part);
    if (element.empty()) {
      continue;
    }

    if (element.starts_with("last:")) {
      auto count = parseYearNumber(element.substr(5), element);
      if (!count) {
        return std::unexpected(count.error());
      }
      if (*count == 0) {
        return makeErrorResult<std::vector<std::string>>(ErrorCode::kConfigError,
            "Invalid years element '" + element + "': count must be at least 1");
      }
      for (int year = current_year; year > current_year - *count && year >= 0; --year) {
        appendUnique(years, seen, std::to_string(year));
      }
      continue;
    }

    auto dash = element.find('-', 1);
    if (dash != std::string::npos) {
      auto first = parseYearNumber(trim(element.substr(0, dash)), element);
      if (!first) {
        return std::unexpected(first.error());
      }
      auto last = parseYearNumber(trim(element.substr(dash + 1)), element);
      if (!last) {
        return std::unexpected(last.error());
      }
      int low = std::min(*first, *last);
      int high = std::max(*first, *last);
      for (int year = low; year <= high; ++year) {
        appendUnique(years, seen, std::to_string(year));
      }
      continue;
    }

    auto year = parseYearNumber(element, element);
    if (!year) {
      return std::unexpected(year.error());
    }
    appendUnique(years, seen, std::to_string(*year));
  }

  if (years.empty()) {
    years.emplace_back();
  }
  return years;
}

Result<std::vector<CaseMode>> OptionParser::parseCases(const std::string& csv) {
  std::vector<CaseMode> modes;

  for (const auto& part : split(csv, ',')) {
    std::string token = trim(part);
    std::transform(token.begin(), token.end(), token.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (token.empty()) {
      continue;
    }

    CaseMode mode;
    if (token == "original") {
      mode = CaseMode::kOriginal;
    } else if (token == "lower") {
      mode = CaseMode::kLower;
    } else if (token == "upper") {
      mode = CaseMode::kUpper;
    } else if (token == "title") {
      mode = CaseMode::kTitle;
    } else if (token == "invert") {
      mode = CaseMode::kInvert;
    } else {
      return makeErrorResult<std::vector<CaseMode>>(ErrorCode::kConfigError,
          "Unknown case mode '" + token + "' (expected original, lower, upper, title or invert)");
    }

    if (std::find(modes.begin(), modes.end(), mode) == modes.end()) {
      modes.push_back(mode);
    }
  }

  if (modes.empty()) {
    modes.push_back(CaseMode::kOriginal);
  }
  return modes;
}

Result<LeetMap> OptionParser::parseLeet(const std::string& text) {
  LeetMap mapping;

  for (const auto& chunk : split(text, ';')) {
    std::string entry = trim(chunk);
    if (entry.empty()) {
      continue;
    }

    auto eq = entry.find('=');
    if (eq == std::string::npos) {
      return makeErrorResult<LeetMap>(ErrorCode::kConfigError,
          "Invalid leet entry '" + entry + "': expected key=replacement[,replacement...]");
    }

    auto key_points = util::Unicode::decode(trim(entry.substr(0, eq)));
    if (key_points.size() != 1) {
      return makeErrorResult<LeetMap>(ErrorCode::kConfigError,
          "Invalid leet entry '" + entry + "': key must be a single character");
    }

    std::vector<std::string> values;
    for (const auto& part : split(entry.substr(eq + 1), ',')) {
      std::string value = trim(part);
      if (containsLineBreak(value)) {
        return makeErrorResult<LeetMap>(ErrorCode::kConfigError,
            "Invalid leet entry '" + entry + "': line breaks are not allowed");
      }
      if (!value.empty()) {
        values.push_back(std::move(value));
      }
    }
    if (values.empty()) {
      return makeErrorResult<LeetMap>(ErrorCode::kConfigError,
          "Invalid leet entry '" + entry + "': no replacements given");
    }

    auto& target = mapping[key_points.front()];
    for (auto& value : values) {
      if (std::find(target.begin(), target.end(), value) == target.end()) {
        target.push_back(std::move(value));
      }
    }
  }

  return mapping;
}

Result<ExecutionMode> OptionParser::parseExecutionMode(const std::string& mode) {
  if (mode == "threads") {
    return ExecutionMode::kThreads;
  }
  if (mode == "processes") {
    return ExecutionMode::kProcesses;
  }
  return makeErrorResult<ExecutionMode>(ErrorCode::kConfigError,
      "Unknown execution mode '" + mode + "' (expected threads or processes)");
}

std::vector<std::string> OptionParser::split(const std::string& text, char delimiter) {
  std::vector<std::string> parts;
  if (text.empty()) {
    return parts;
  }

  size_t start = 0;
  while (true) {
    auto pos = text.find(delimiter, start);
    if (pos == std::string::npos) {
      parts.push_back(text.substr(start));
      break;
    }
    parts.push_back(text.substr(start, pos - start));
    start = pos + 1;
  }
  return parts;
}

std::string OptionParser::trim(const std::string& text) {
  const char* whitespace = " \t\r\n";
  auto first = text.find_first_not_of(whitespace);
  if (first == std::string::npos) {
    return "";
  }
  auto last = text.find_last_not_of(whitespace);
  return text.substr(first, last - first + 1);
}

Result<int> OptionParser::parseYearNumber(const std::string& text, const std::string& element) {
  int value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (text.empty() || ec != std::errc() || ptr != text.data() + text.size()) {
    return makeErrorResult<int>(ErrorCode::kConfigError,
        "Invalid years element '" + element + "'");
  }
  if (value < 0 || value > kMaxYear) {
    return makeErrorResult<int>(ErrorCode::kConfigError,
        "Invalid years element '" + element + "': values must be between 0 and " +
        std::to_string(kMaxYear));
  }
  return value;
}

}  // namespace wlm::config
