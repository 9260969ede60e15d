#pragma once

#include <memory>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "wlm/common.hpp"
#include "wlm/config/config.hpp"

namespace wlm::cli {

/**
 * @brief Global CLI options that are available to all commands
 */
struct GlobalOptions {
  bool json = false;           // --json: Output in JSON format
  int verbose = 0;             // --verbose: Verbose output level (can be repeated: -v, -vv)
  bool quiet = false;          // --quiet: Suppress normal output
  std::string config_file;     // --config: Path to config file
  bool no_color = false;       // --no-color: Disable colored output
  std::string log_level;       // --log-level: Overrides -v/-q and the config file
};

/**
 * @brief Base class for all CLI commands
 */
class Command {
public:
  virtual ~Command() = default;

  /**
   * @brief Execute the command with the given arguments
   * @param options Global CLI options
   * @return Result with exit code (0 = success)
   */
  virtual Result<int> execute(const GlobalOptions& options) = 0;

  virtual std::string name() const = 0;
  virtual std::string description() const = 0;

  // Setup command-specific CLI options (optional override)
  virtual void setupCommand(CLI::App* cmd) { (void)cmd; }
};

/**
 * @brief Main CLI application
 *
 * Before a command runs, the config file is loaded and logging is set up.
 * A command error is printed to stderr (text or JSON) and mapped to the
 * process exit code.
 */
class Application {
public:
  Application();
  ~Application() = default;

  /**
   * @brief Run the application with command line arguments
   * @return Exit code (0 = success)
   */
  int run(int argc, char* argv[]);

  const GlobalOptions& globalOptions() const;

  // Loaded configuration; valid once a command is running
  config::Config& config();

private:
  void setupGlobalOptions();
  void setupCommands();
  void setupHelp();

  void registerCommand(std::unique_ptr<Command> command);

  // Load config and set up logging
  Result<void> initialize();

  // Print the error, log it and return the exit code
  int reportError(const Error& error) const;

  std::string effectiveLogLevel() const;

  CLI::App app_;
  GlobalOptions global_options_;
  config::Config config_;
  bool initialized_ = false;

  std::vector<std::unique_ptr<Command>> commands_;
};

}  // namespace wlm::cli
