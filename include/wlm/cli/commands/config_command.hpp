#pragma once

#include "wlm/cli/application.hpp"
#include "wlm/common.hpp"

namespace wlm::cli {

/**
 * Command for managing the configuration file
 *
 * Subcommands:
 * - path: Show configuration file path
 * - show: Print the effective configuration
 * - init: Write a config file holding the built-in defaults
 */
class ConfigCommand : public Command {
public:
  explicit ConfigCommand(Application& app);

  void setupCommand(CLI::App* cmd) override;
  Result<int> execute(const GlobalOptions& options) override;

  std::string name() const override { return name_; }
  std::string description() const override { return description_; }

private:
  Application& app_;
  std::string name_ = "config";
  std::string description_ = "Show or create the configuration file";

  // Subcommand flags
  bool path_mode_ = false;
  bool show_mode_ = false;
  bool init_mode_ = false;

  bool force_ = false;

  Result<int> executePath(const GlobalOptions& options);
  Result<int> executeShow(const GlobalOptions& options);
  Result<int> executeInit(const GlobalOptions& options);

  std::filesystem::path targetPath(const GlobalOptions& options) const;
};

}  // namespace wlm::cli
