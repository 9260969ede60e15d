#pragma once

#include <string>
#include <vector>

#include "wlm/common.hpp"
#include "wlm/config/generation_config.hpp"

namespace wlm::config {

/**
 * @brief Parsers turning command-line/TOML option strings into typed settings
 *
 * Supported formats:
 * - CSV token lists: "1,12,123" ; an empty element ("" or ",x") is kept
 *   and means "omit this slot"
 * - years: "1990-1995,2020,last:5"
 * - cases: "original,lower,upper,title,invert"
 * - leet: "a=@,4;s=$,5;e=3"
 *
 * Every parser fails with kConfigError on malformed input instead of
 * silently skipping it.
 */
class OptionParser {
public:
  /**
   * @brief Split a CSV list keeping empty elements, trimming whitespace
   * @return Ordered, de-duplicated tokens; "" yields {""}
   */
  static Result<std::vector<std::string>> parseTokenList(const std::string& csv,
                                                         const std::string& option_name);

  /**
   * @brief Expand a years list relative to the current calendar year
   */
  static Result<std::vector<std::string>> parseYears(const std::string& text);

  /**
   * @brief Expand a years list relative to an explicit current year
   *
   * Elements are expanded in the order written: single years as is,
   * ranges ascending (reversed bounds are swapped), "last:N" as the N
   * years ending at current_year, descending and never below 0. Years,
   * range bounds and N must lie in 0..9999. Duplicates keep their first
   * position. An empty list yields {""}.
   */
  static Result<std::vector<std::string>> parseYears(const std::string& text, int current_year);

  static Result<std::vector<CaseMode>> parseCases(const std::string& csv);

  static Result<LeetMap> parseLeet(const std::string& text);

  static Result<ExecutionMode> parseExecutionMode(const std::string& mode);

private:
  static std::vector<std::string> split(const std::string& text, char delimiter);
  static std::string trim(const std::string& text);
  static Result<int> parseYearNumber(const std::string& text, const std::string& element);
};

}  // namespace wlm::config
