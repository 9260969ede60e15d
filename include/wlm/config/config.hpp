#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "wlm/common.hpp"
#include "wlm/config/generation_config.hpp"

namespace wlm::config {

/**
 * @brief Defaults for every generation option, read from config.toml
 *
 * List options are stored in the same string syntax the command line
 * accepts ("1,12,123", "a=@,4;s=$,5", "last:5") and go through
 * OptionParser when applied, so the file and the flags share one set of
 * rules. Masks are a TOML array because masks may contain commas.
 */
class Config {
 public:
  // Built-in defaults
  Config() = default;

  std::string joiners = ",-,_,.";
  std::string cases = "original,lower,upper,title,invert";
  std::string numbers = "1,12,123,2025,007";
  std::string symbols = "!,@,#,$";
  std::string years;
  std::vector<std::string> masks;                 // empty = built-in masks
  std::string leet = "a=@,4;s=$,5;e=3;i=1;o=0";
  int64_t leet_max_expansions = 4;

  int64_t min_length = 4;
  int64_t max_length = 64;
  double min_entropy = 0.0;
  std::optional<int64_t> max_count;
  int64_t max_permutation_length = 0;             // 0 = word count

  int64_t workers = 4;
  std::string mode = "threads";                   // threads, processes

  std::string log_level = "warning";
  std::string log_file;                           // empty = stderr only
  bool progress = false;

  // Load configuration from file; keys not present keep their defaults
  Result<void> load(const std::filesystem::path& config_path);

  // Save configuration to file
  Result<void> save(const std::filesystem::path& config_path = {}) const;

  // Validate scalar ranges and enumerations
  Result<void> validate() const;

  // Parse the string options into the typed generation settings
  Result<void> applyTo(GenerationConfig& generation) const;

  // Serialized form, as written by save()
  std::string toToml() const;

  const std::filesystem::path& path() const { return config_path_; }

  // Get default configuration file path
  static std::filesystem::path defaultConfigPath();

  /**
   * @brief Load the given file, or the default file when path is empty
   *
   * A missing default file yields the built-in defaults; a missing
   * explicit file is an error.
   */
  static Result<Config> loadOrDefault(const std::filesystem::path& explicit_path = {});

 private:
  std::filesystem::path config_path_;
};

}  // namespace wlm::config
