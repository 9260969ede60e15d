#include "test_helpers.hpp"

#include <fstream>
#include <random>

#include <zlib.h>

namespace wlm::test {

void TempDirTest::SetUp() {
  temp_dir_ = std::filesystem::temp_directory_path() / "wlm_test";
  temp_dir_ /= randomString(8);
  std::filesystem::create_directories(temp_dir_);
}

void TempDirTest::TearDown() {
  std::error_code ec;
  if (std::filesystem::exists(temp_dir_, ec)) {
    std::filesystem::remove_all(temp_dir_, ec);
  }
}

Result<void> CollectingSink::writeLine(std::string_view line) {
  std::lock_guard<std::mutex> lock(mutex_);
  lines_.emplace_back(line);
  return {};
}

std::vector<std::string> CollectingSink::lines() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return lines_;
}

Result<void> FailingSink::writeLine(std::string_view line) {
  (void)line;
  if (written_ >= capacity_) {
    return makeErrorResult<void>(ErrorCode::kFileWriteError, "No space left on device");
  }
  ++written_;
  return {};
}

std::vector<std::string> collect(gen::StringSequence& sequence) {
  std::vector<std::string> values;
  while (auto value = sequence.next()) {
    values.push_back(*value);
  }
  return values;
}

config::GenerationConfig plainConfig(std::vector<std::string> words) {
  config::GenerationConfig config;
  config.words = std::move(words);
  config.joiners = {""};
  config.cases = {config::CaseMode::kOriginal};
  config.min_length = 0;
  config.max_length = 1024;
  config.masks = {"{base}"};
  return config;
}

std::vector<std::string> readLines(const std::filesystem::path& path) {
  std::vector<std::string> lines;
  std::ifstream in(path);
  std::string line;
  while (std::getline(in, line)) {
    lines.push_back(line);
  }
  return lines;
}

std::vector<std::string> readGzipLines(const std::filesystem::path& path) {
  std::vector<std::string> lines;
  gzFile file = gzopen(path.c_str(), "rb");
  if (file == nullptr) {
    return lines;
  }

  std::string content;
  char buffer[4096];
  int n;
  while ((n = gzread(file, buffer, sizeof(buffer))) > 0) {
    content.append(buffer, static_cast<size_t>(n));
  }
  gzclose(file);

  size_t start = 0;
  size_t newline;
  while ((newline = content.find('\n', start)) != std::string::npos) {
    lines.push_back(content.substr(start, newline - start));
    start = newline + 1;
  }
  return lines;
}

std::string randomString(size_t length) {
  static const char charset[] = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<> dis(0, sizeof(charset) - 2);

  std::string result;
  result.reserve(length);
  for (size_t i = 0; i < length; ++i) {
    result += charset[dis(gen)];
  }
  return result;
}

}  // namespace wlm::test
