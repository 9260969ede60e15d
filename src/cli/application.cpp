#include "wlm/cli/application.hpp"

#include <unistd.h>

#include <iostream>

#include <spdlog/spdlog.h>

#include "wlm/cli/commands/config_command.hpp"
#include "wlm/cli/commands/generate_command.hpp"
#include "wlm/util/error_handler.hpp"

namespace wlm::cli {

Application::Application()
    : app_("wlm", "Word list maker: password candidates from words, masks and rules") {

  app_.set_version_flag("--version", wlm::getVersion().toString());
  app_.set_help_all_flag("--help-all", "Expand all help");
  app_.require_subcommand(1);

  setupGlobalOptions();
  setupCommands();
  setupHelp();
}

int Application::run(int argc, char* argv[]) {
  try {
    app_.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app_.exit(e);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return exitCodeFor(makeError(ErrorCode::kUnknownError, e.what()));
  }

  // The command has already been executed by CLI11's callback system
  return 0;
}

void Application::setupGlobalOptions() {
  app_.add_flag("--json", global_options_.json, "Output in JSON format");
  app_.add_flag("-v,--verbose", global_options_.verbose, "Verbose output (-v info, -vv debug)");
  app_.add_flag("-q,--quiet", global_options_.quiet, "Only log errors");
  app_.add_option("--config", global_options_.config_file, "Path to config file");
  app_.add_flag("--no-color", global_options_.no_color, "Disable colored output");
  app_.add_option("--log-level", global_options_.log_level, "Logging verbosity")
      ->check(CLI::IsMember({"debug", "info", "warning", "error"}));
}

void Application::setupCommands() {
  registerCommand(std::make_unique<GenerateCommand>(*this));
  registerCommand(std::make_unique<ConfigCommand>(*this));
}

void Application::setupHelp() {
  app_.get_formatter()->column_width(40);

  app_.footer(R"(Examples:
  wlm generate -w john,doe --joiners "-,_,." --numbers "1,12,123,2025" --symbols "!,$" -s
  wlm generate -w red,fox --mask "{base}{year}{sym}" --mask "{sym}{camel}{num}" -s
  wlm generate -w brand,name --years "2010-2015,last:3" -o out/list.txt.gz
  wlm generate -w hello,world --min-length 8 --max-length 16 --min-entropy 2.5 -s
  cat words.txt | wlm generate -w - --max-count 1000 --progress -s
  wlm generate -w company,2025 --processes -t 8 -o list.txt
  wlm config init

Placeholders: {base} {Base} {BASE} {camel} {num} {sym} {year}

For more information on a specific command, run:
  wlm <command> --help)");
}

void Application::registerCommand(std::unique_ptr<Command> command) {
  auto* cmd_ptr = command.get();

  auto* sub = app_.add_subcommand(cmd_ptr->name(), cmd_ptr->description());
  cmd_ptr->setupCommand(sub);

  sub->callback([this, cmd_ptr]() {
    auto init_result = initialize();
    if (!init_result.has_value()) {
      throw CLI::RuntimeError(reportError(init_result.error()));
    }

    auto result = cmd_ptr->execute(global_options_);
    if (!result.has_value()) {
      throw CLI::RuntimeError(reportError(result.error()));
    }
    if (*result != 0) {
      throw CLI::RuntimeError(*result);
    }
  });

  commands_.push_back(std::move(command));
}

Result<void> Application::initialize() {
  if (initialized_) {
    return {};
  }

  auto loaded = config::Config::loadOrDefault(global_options_.config_file);
  if (!loaded) {
    // Log to stderr at the requested level even though the file failed
    util::LoggingOptions fallback;
    fallback.level = global_options_.log_level.empty() ? "warning" : global_options_.log_level;
    fallback.color = !global_options_.no_color;
    auto logging = util::setupLogging(fallback);
    if (!logging) {
      return logging;
    }
    return std::unexpected(loaded.error());
  }
  config_ = std::move(*loaded);

  util::LoggingOptions logging_options;
  logging_options.level = effectiveLogLevel();
  logging_options.color = !global_options_.no_color;
  logging_options.log_file = config_.log_file;
  auto logging = util::setupLogging(logging_options);
  if (!logging) {
    return logging;
  }

  spdlog::debug("Using config {}", config_.path().string());
  initialized_ = true;
  return {};
}

std::string Application::effectiveLogLevel() const {
  if (!global_options_.log_level.empty()) {
    return global_options_.log_level;
  }
  if (global_options_.quiet) {
    return "error";
  }
  if (global_options_.verbose >= 2) {
    return "debug";
  }
  if (global_options_.verbose == 1) {
    return "info";
  }
  return config_.log_level;
}

int Application::reportError(const Error& error) const {
  util::ContextualError contextual(error, util::ErrorContext{});
  auto& handler = util::ErrorHandler::instance();
  handler.report(contextual);

  bool color = !global_options_.no_color && ::isatty(STDERR_FILENO) == 1;
  std::cerr << handler.formatUserError(contextual, global_options_.json, color) << std::endl;
  return exitCodeFor(error);
}

const GlobalOptions& Application::globalOptions() const {
  return global_options_;
}

config::Config& Application::config() {
  return config_;
}

}  // namespace wlm::cli
