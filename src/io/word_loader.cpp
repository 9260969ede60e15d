#include "wlm/io/word_loader.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <istream>
#include <sstream>
#include <unordered_set>

#include <spdlog/spdlog.h>

#include "wlm/util/unicode.hpp"

namespace wlm::io {

namespace {

std::string trimAscii(const std::string& text) {
  const char* whitespace = " \t\r\n\f\v";
  auto start = text.find_first_not_of(whitespace);
  if (start == std::string::npos) {
    return "";
  }
  auto end = text.find_last_not_of(whitespace);
  return text.substr(start, end - start + 1);
}

Result<std::vector<std::string>> readFileLines(const std::filesystem::path& path,
                                               const std::string& what) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return makeErrorResult<std::vector<std::string>>(ErrorCode::kFileNotFound,
        what + " not found: " + path.string());
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return makeErrorResult<std::vector<std::string>>(ErrorCode::kFileReadError,
        "Cannot read " + what + " " + path.string() + ": " + std::strerror(errno));
  }
  auto lines = WordLoader::readLines(in);
  if (in.bad()) {
    return makeErrorResult<std::vector<std::string>>(ErrorCode::kFileReadError,
        "Error while reading " + what + " " + path.string());
  }
  return lines;
}

}  // namespace

WordLoader::WordLoader(std::istream& stdin_stream) : stdin_(stdin_stream) {}

Result<std::vector<std::string>> WordLoader::load(const std::string& word_argument,
                                                  const std::filesystem::path& word_file) const {
  std::vector<std::string> raw;

  if (word_argument == "-") {
    spdlog::info("Reading words from stdin");
    auto lines = readLines(stdin_);
    raw.insert(raw.end(), lines.begin(), lines.end());
  } else if (!word_argument.empty()) {
    std::stringstream ss(word_argument);
    std::string item;
    while (std::getline(ss, item, ',')) {
      raw.push_back(item);
    }
  }

  if (!word_file.empty()) {
    auto lines = readFileLines(word_file, "Word file");
    if (!lines) {
      return std::unexpected(lines.error());
    }
    spdlog::debug("Read {} line(s) from {}", lines->size(), word_file.string());
    raw.insert(raw.end(), lines->begin(), lines->end());
  }

  return clean(raw);
}

Result<std::vector<std::string>> WordLoader::clean(const std::vector<std::string>& raw) {
  std::vector<std::string> words;
  std::unordered_set<std::string> seen;

  for (const auto& entry : raw) {
    auto normalized = util::Unicode::normalizeNfkc(entry);
    if (!normalized) {
      return std::unexpected(normalized.error());
    }
    auto word = trimAscii(*normalized);
    if (word.empty()) {
      continue;
    }
    if (seen.insert(word).second) {
      words.push_back(std::move(word));
    }
  }

  return words;
}

std::vector<std::string> WordLoader::readLines(std::istream& in) {
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(in, line)) {
    lines.push_back(line);
  }
  return lines;
}

Result<std::unordered_set<std::string>> loadBlacklist(const std::filesystem::path& path) {
  auto lines = readFileLines(path, "Blacklist");
  if (!lines) {
    return std::unexpected(lines.error());
  }

  std::unordered_set<std::string> entries;
  for (const auto& line : *lines) {
    auto normalized = util::Unicode::normalizeNfkc(line);
    if (!normalized) {
      return std::unexpected(normalized.error());
    }
    auto entry = trimAscii(*normalized);
    if (!entry.empty()) {
      entries.insert(std::move(entry));
    }
  }

  spdlog::info("Loaded {} blacklist entr{} from {}", entries.size(),
               entries.size() == 1 ? "y" : "ies", path.string());
  return entries;
}

}  // namespace wlm::io
