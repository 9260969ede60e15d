#pragma once

#include <filesystem>
#include <fstream>
#include <string>

namespace wlm::test {

// RAII temporary directory for testing
class TempDirectory {
 public:
  TempDirectory();
  ~TempDirectory();

  // Non-copyable, movable
  TempDirectory(const TempDirectory&) = delete;
  TempDirectory& operator=(const TempDirectory&) = delete;
  TempDirectory(TempDirectory&&) = default;
  TempDirectory& operator=(TempDirectory&&) = default;

  const std::filesystem::path& path() const { return path_; }

  // Create file with content
  std::filesystem::path createFile(const std::string& name, const std::string& content = "");

  // Manual cleanup (called automatically in destructor)
  void cleanup();

 private:
  std::filesystem::path path_;

  void createTempDir();
};

}  // namespace wlm::test
