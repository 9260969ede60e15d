#include "wlm/cli/commands/config_command.hpp"

#include <filesystem>
#include <iostream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace wlm::cli {

ConfigCommand::ConfigCommand(Application& app) : app_(app) {}

void ConfigCommand::setupCommand(CLI::App* cmd) {
  auto path_cmd = cmd->add_subcommand("path", "Show configuration file path");
  path_cmd->callback([this]() { path_mode_ = true; });

  auto show_cmd = cmd->add_subcommand("show", "Print the effective configuration");
  show_cmd->callback([this]() { show_mode_ = true; });

  auto init_cmd = cmd->add_subcommand("init", "Write a default configuration file");
  init_cmd->add_flag("--force", force_, "Overwrite an existing configuration file");
  init_cmd->callback([this]() { init_mode_ = true; });

  // Require exactly one subcommand
  cmd->require_subcommand(1);
}

Result<int> ConfigCommand::execute(const GlobalOptions& options) {
  if (path_mode_) {
    return executePath(options);
  } else if (show_mode_) {
    return executeShow(options);
  } else if (init_mode_) {
    return executeInit(options);
  }

  return std::unexpected(makeError(ErrorCode::kInvalidArgument, "No subcommand specified"));
}

std::filesystem::path ConfigCommand::targetPath(const GlobalOptions& options) const {
  if (!options.config_file.empty()) {
    return options.config_file;
  }
  return config::Config::defaultConfigPath();
}

Result<int> ConfigCommand::executePath(const GlobalOptions& options) {
  auto path = targetPath(options);
  bool exists = std::filesystem::exists(path);

  if (options.json) {
    nlohmann::json output;
    output["path"] = path.string();
    output["exists"] = exists;
    std::cout << output.dump(2) << "\n";
  } else {
    std::cout << path.string() << "\n";
  }
  return 0;
}

Result<int> ConfigCommand::executeShow(const GlobalOptions& options) {
  const auto& config = app_.config();

  if (options.json) {
    nlohmann::json output;
    output["path"] = config.path().string();
    output["joiners"] = config.joiners;
    output["cases"] = config.cases;
    output["numbers"] = config.numbers;
    output["symbols"] = config.symbols;
    output["years"] = config.years;
    output["masks"] = config.masks.empty() ? config::GenerationConfig::defaultMasks() : config.masks;
    output["leet"] = config.leet;
    output["leet_max_expansions"] = config.leet_max_expansions;
    output["min_length"] = config.min_length;
    output["max_length"] = config.max_length;
    output["min_entropy"] = config.min_entropy;
    output["max_count"] = config.max_count ? nlohmann::json(*config.max_count) : nlohmann::json(nullptr);
    output["max_permutation_length"] = config.max_permutation_length;
    output["workers"] = config.workers;
    output["mode"] = config.mode;
    output["log_level"] = config.log_level;
    output["log_file"] = config.log_file;
    output["progress"] = config.progress;
    std::cout << output.dump(2) << "\n";
  } else {
    std::cout << "# " << config.path().string() << "\n";
    std::cout << config.toToml();
  }
  return 0;
}

Result<int> ConfigCommand::executeInit(const GlobalOptions& options) {
  auto path = targetPath(options);

  if (std::filesystem::exists(path) && !force_) {
    return std::unexpected(makeError(ErrorCode::kFileExists,
        "Config file already exists: " + path.string() + " (use --force to overwrite)"));
  }

  config::Config defaults;
  auto saved = defaults.save(path);
  if (!saved) {
    return std::unexpected(saved.error());
  }
  spdlog::info("Wrote default configuration to {}", path.string());

  if (options.json) {
    nlohmann::json output;
    output["success"] = true;
    output["path"] = path.string();
    std::cout << output.dump(2) << "\n";
  } else if (!options.quiet) {
    std::cout << "Created " << path.string() << "\n";
  }
  return 0;
}

}  // namespace wlm::cli
