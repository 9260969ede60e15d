#pragma once

#include <filesystem>
#include <string>

namespace wlm::util {

// XDG base directory lookup
class Xdg {
 public:
  // Get XDG config home directory (~/.config/wlm)
  static std::filesystem::path configHome();

  // Get config file path
  static std::filesystem::path configFile();

 private:
  // Get environment variable with default
  static std::string getEnvVar(const std::string& name, const std::string& default_value);
};

}  // namespace wlm::util
