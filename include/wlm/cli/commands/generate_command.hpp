#pragma once

#include <string>
#include <vector>

#include "wlm/cli/application.hpp"
#include "wlm/common.hpp"
#include "wlm/config/generation_config.hpp"
#include "wlm/stream/stream_coordinator.hpp"

namespace wlm::cli {

/**
 * @brief Command that generates the word list
 *
 * Settings come from the config file and are overridden by any flag given
 * on the command line. Lines go to stdout with -s, to a file with -o
 * (gzip when the path ends in .gz), or both. Without -o, -s is implied.
 */
class GenerateCommand : public Command {
public:
  explicit GenerateCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "generate"; }
  std::string description() const override { return "Generate password candidates from words"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Result<config::GenerationConfig> buildConfig() const;
  void printSummary(const stream::RunSummary& summary, const GlobalOptions& options) const;

  Application& app_;

  // Inputs
  std::string word_;
  std::string word_file_;

  // Output
  std::string output_;
  bool show_ = false;
  bool force_ = false;
  bool progress_ = false;

  // Generation overrides; applied only when given
  std::string joiners_;
  std::string cases_;
  std::string numbers_;
  std::string symbols_;
  std::string years_;
  std::vector<std::string> masks_;
  size_t max_permutation_length_ = 0;
  std::string leet_;
  size_t leet_max_expansions_ = 0;
  size_t min_length_ = 0;
  size_t max_length_ = 0;
  double min_entropy_ = 0.0;
  std::string blacklist_;
  uint64_t max_count_ = 0;
  size_t threads_ = 0;
  bool processes_ = false;

  CLI::Option* joiners_opt_ = nullptr;
  CLI::Option* cases_opt_ = nullptr;
  CLI::Option* numbers_opt_ = nullptr;
  CLI::Option* symbols_opt_ = nullptr;
  CLI::Option* years_opt_ = nullptr;
  CLI::Option* max_permutation_length_opt_ = nullptr;
  CLI::Option* leet_opt_ = nullptr;
  CLI::Option* leet_max_expansions_opt_ = nullptr;
  CLI::Option* min_length_opt_ = nullptr;
  CLI::Option* max_length_opt_ = nullptr;
  CLI::Option* min_entropy_opt_ = nullptr;
  CLI::Option* max_count_opt_ = nullptr;
  CLI::Option* threads_opt_ = nullptr;
};

}  // namespace wlm::cli
