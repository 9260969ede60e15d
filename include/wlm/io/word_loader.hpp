#pragma once

#include <filesystem>
#include <iosfwd>
#include <string>
#include <unordered_set>
#include <vector>

#include "wlm/common.hpp"

namespace wlm::io {

/**
 * @brief Collects the input word list
 *
 * Sources, in order: the --word argument (comma-separated, or "-" for one
 * word per line on stdin) and then the --word-file. Every word is NFKC
 * normalized and trimmed; blanks are dropped and duplicates keep their
 * first position.
 */
class WordLoader {
public:
  explicit WordLoader(std::istream& stdin_stream);

  Result<std::vector<std::string>> load(const std::string& word_argument,
                                        const std::filesystem::path& word_file) const;

  // Normalize, trim, drop blanks and duplicates
  static Result<std::vector<std::string>> clean(const std::vector<std::string>& raw);

  static std::vector<std::string> readLines(std::istream& in);

private:
  std::istream& stdin_;
};

/**
 * @brief Read a blacklist file: one entry per line, trimmed, NFKC
 * normalized, blank lines dropped
 *
 * An unreadable file is an error.
 */
Result<std::unordered_set<std::string>> loadBlacklist(const std::filesystem::path& path);

}  // namespace wlm::io
