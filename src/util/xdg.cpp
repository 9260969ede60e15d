#include "wlm/util/xdg.hpp"

#include <cstdlib>

namespace wlm::util {

std::filesystem::path Xdg::configHome() {
  std::string xdg_config_home = getEnvVar("XDG_CONFIG_HOME", "");
  if (!xdg_config_home.empty()) {
    return std::filesystem::path(xdg_config_home) / "wlm";
  }

  std::string home = getEnvVar("HOME", "");
  if (home.empty()) {
    return std::filesystem::current_path() / ".wlm_config";
  }

  return std::filesystem::path(home) / ".config" / "wlm";
}

std::filesystem::path Xdg::configFile() {
  return configHome() / "config.toml";
}

std::string Xdg::getEnvVar(const std::string& name, const std::string& default_value) {
  const char* value = std::getenv(name.c_str());
  return value ? std::string(value) : default_value;
}

}  // namespace wlm::util
