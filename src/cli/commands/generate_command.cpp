#include "wlm/cli/commands/generate_command.hpp"

#include <signal.h>

#include <atomic>
#include <iostream>
#include <memory>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "wlm/config/option_parser.hpp"
#include "wlm/io/word_loader.hpp"
#include "wlm/stream/progress.hpp"
#include "wlm/stream/sink.hpp"
#include "wlm/util/cancellation.hpp"

namespace wlm::cli {

namespace {

std::atomic<util::CancellationToken*> g_abort_token{nullptr};

extern "C" void handleTerminationSignal(int) {
  if (auto* token = g_abort_token.load()) {
    token->cancel();
  }
}

// Routes SIGINT/SIGTERM to the token while a run is active
class SignalGuard {
public:
  explicit SignalGuard(util::CancellationToken& token) {
    g_abort_token.store(&token);

    struct sigaction action {};
    action.sa_handler = handleTerminationSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;
    sigaction(SIGINT, &action, &previous_int_);
    sigaction(SIGTERM, &action, &previous_term_);
  }

  ~SignalGuard() {
    sigaction(SIGINT, &previous_int_, nullptr);
    sigaction(SIGTERM, &previous_term_, nullptr);
    g_abort_token.store(nullptr);
  }

  SignalGuard(const SignalGuard&) = delete;
  SignalGuard& operator=(const SignalGuard&) = delete;

private:
  struct sigaction previous_int_ {};
  struct sigaction previous_term_ {};
};

}  // namespace

GenerateCommand::GenerateCommand(Application& app) : app_(app) {}

void GenerateCommand::setupCommand(CLI::App* cmd) {
  // Inputs
  cmd->add_option("-w,--word", word_,
                  "Base word(s), comma-separated; '-' reads one word per line from stdin");
  cmd->add_option("--word-file", word_file_, "File with base words, one per line");

  // Output & display
  cmd->add_option("-o,--output", output_, "Output file path; a .gz suffix writes gzip");
  cmd->add_flag("-s,--show", show_, "Print candidates to stdout");
  cmd->add_flag("--force", force_, "Overwrite the output file if it exists");
  cmd->add_flag("--progress", progress_, "Show a line counter on stderr");

  // Generation controls
  joiners_opt_ = cmd->add_option("--joiners", joiners_,
                                 "Joiners between words as CSV; an empty element joins directly (default: \",-,_,.\")");
  cases_opt_ = cmd->add_option("--cases", cases_,
                               "Case variants as CSV of original,lower,upper,title,invert");
  numbers_opt_ = cmd->add_option("--numbers", numbers_,
                                 "Numbers as CSV; an empty element omits the slot");
  symbols_opt_ = cmd->add_option("--symbols", symbols_,
                                 "Symbols as CSV; an empty element omits the slot");
  years_opt_ = cmd->add_option("--years", years_,
                               "Years as CSV of 1990-1995, 2020 or last:5");
  cmd->add_option("--mask", masks_,
                  "Mask using {base} {Base} {BASE} {camel} {num} {sym} {year}; repeatable");
  max_permutation_length_opt_ = cmd->add_option("--max-permutation-length", max_permutation_length_,
                                                "Max words combined per base string (default: all)")
      ->check(CLI::PositiveNumber);

  // Leet options
  leet_opt_ = cmd->add_option("--leet", leet_,
                              "Leet map like \"a=@,4;s=$,5;e=3\"; empty disables");
  leet_max_expansions_opt_ = cmd->add_option("--leet-max-expansions", leet_max_expansions_,
                                             "Max simultaneous substitutions per variant");

  // Filters & limits
  min_length_opt_ = cmd->add_option("--min-length", min_length_, "Minimum candidate length");
  max_length_opt_ = cmd->add_option("--max-length", max_length_, "Maximum candidate length");
  min_entropy_opt_ = cmd->add_option("--min-entropy", min_entropy_,
                                     "Minimum Shannon entropy in bits (0 disables)")
      ->check(CLI::NonNegativeNumber);
  cmd->add_option("--blacklist", blacklist_, "File of candidates to exclude, one per line");
  max_count_opt_ = cmd->add_option("--max-count", max_count_, "Stop after this many lines")
      ->check(CLI::PositiveNumber);

  // Parallelism
  threads_opt_ = cmd->add_option("-t,--threads", threads_, "Number of workers")
      ->check(CLI::PositiveNumber);
  cmd->add_flag("--processes", processes_, "Use processes instead of threads");
}

Result<config::GenerationConfig> GenerateCommand::buildConfig() const {
  using config::OptionParser;

  config::GenerationConfig generation;
  auto applied = app_.config().applyTo(generation);
  if (!applied) {
    return std::unexpected(applied.error());
  }

  if (joiners_opt_->count() > 0) {
    auto parsed = OptionParser::parseTokenList(joiners_, "joiners");
    if (!parsed) return std::unexpected(parsed.error());
    generation.joiners = std::move(*parsed);
  }
  if (cases_opt_->count() > 0) {
    auto parsed = OptionParser::parseCases(cases_);
    if (!parsed) return std::unexpected(parsed.error());
    generation.cases = std::move(*parsed);
  }
  if (numbers_opt_->count() > 0) {
    auto parsed = OptionParser::parseTokenList(numbers_, "numbers");
    if (!parsed) return std::unexpected(parsed.error());
    generation.numbers = std::move(*parsed);
  }
  if (symbols_opt_->count() > 0) {
    auto parsed = OptionParser::parseTokenList(symbols_, "symbols");
    if (!parsed) return std::unexpected(parsed.error());
    generation.symbols = std::move(*parsed);
  }
  if (years_opt_->count() > 0) {
    auto parsed = OptionParser::parseYears(years_);
    if (!parsed) return std::unexpected(parsed.error());
    generation.years = std::move(*parsed);
  }
  if (leet_opt_->count() > 0) {
    auto parsed = OptionParser::parseLeet(leet_);
    if (!parsed) return std::unexpected(parsed.error());
    generation.leet = std::move(*parsed);
  }
  if (!masks_.empty()) {
    generation.masks = masks_;
  }

  if (max_permutation_length_opt_->count() > 0) generation.max_permutation_length = max_permutation_length_;
  if (leet_max_expansions_opt_->count() > 0) generation.leet_max_expansions = leet_max_expansions_;
  if (min_length_opt_->count() > 0) generation.min_length = min_length_;
  if (max_length_opt_->count() > 0) generation.max_length = max_length_;
  if (min_entropy_opt_->count() > 0) generation.min_entropy = min_entropy_;
  if (max_count_opt_->count() > 0) generation.max_count = max_count_;
  if (threads_opt_->count() > 0) generation.workers = threads_;
  if (processes_) generation.mode = config::ExecutionMode::kProcesses;

  if (!blacklist_.empty()) {
    auto blacklist = io::loadBlacklist(blacklist_);
    if (!blacklist) return std::unexpected(blacklist.error());
    generation.blacklist = std::move(*blacklist);
  }

  io::WordLoader loader(std::cin);
  auto words = loader.load(word_, word_file_);
  if (!words) {
    return std::unexpected(words.error());
  }
  if (words->empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "No words provided. Use -w/--word or --word-file."));
  }
  generation.words = std::move(*words);

  auto valid = generation.validate();
  if (!valid) {
    return std::unexpected(valid.error());
  }
  return generation;
}

Result<int> GenerateCommand::execute(const GlobalOptions& options) {
  auto generation = buildConfig();
  if (!generation) {
    return std::unexpected(generation.error());
  }

  spdlog::info("Starting words: {}", fmt::join(generation->words, ","));
  spdlog::debug("Joiners: {} | Numbers: {} | Symbols: {} | Years: {}",
                generation->joiners.size(), generation->numbers.size(),
                generation->symbols.size(), generation->years.size());
  spdlog::debug("Masks: {}", fmt::join(generation->effectiveMasks(), " "));

  // Without a file, lines go to stdout
  bool to_stdout = show_ || output_.empty();

  stream::TeeSink sink;
  if (!output_.empty()) {
    auto file_sink = stream::openOutputFile(output_, force_);
    if (!file_sink) {
      return std::unexpected(file_sink.error());
    }
    sink.add(std::move(*file_sink));
  }
  if (to_stdout) {
    sink.add(std::make_unique<stream::ConsoleSink>());
  }

  std::unique_ptr<stream::ConsoleProgress> progress;
  if (progress_ || app_.config().progress) {
    progress = std::make_unique<stream::ConsoleProgress>();
  }

  util::CancellationToken abort_token;
  Result<stream::RunSummary> summary;
  {
    SignalGuard guard(abort_token);
    stream::StreamCoordinator coordinator(*generation, sink, progress.get(), &abort_token);
    summary = coordinator.run();
  }

  auto closed = sink.close();
  if (!summary) {
    return std::unexpected(summary.error());
  }
  if (!closed) {
    return std::unexpected(closed.error());
  }

  if (summary->cap_reached) {
    spdlog::info("Reached max-count={}; stopped.", *generation->max_count);
  }
  printSummary(*summary, options);

  if (summary->cancelled) {
    spdlog::warn("Generation cancelled after {} line(s)", summary->lines);
    return exitCodeFor(makeError(ErrorCode::kCancelled, "Cancelled"));
  }
  return 0;
}

void GenerateCommand::printSummary(const stream::RunSummary& summary,
                                   const GlobalOptions& options) const {
  // Keep stdout clean when it carries the candidates
  bool lines_on_stdout = show_ || output_.empty();
  std::ostream& out = lines_on_stdout ? std::cerr : std::cout;

  if (options.json) {
    nlohmann::json output;
    output["lines"] = summary.lines;
    output["workers"] = summary.workers;
    output["mode"] = config::executionModeToString(summary.mode);
    output["cap_reached"] = summary.cap_reached;
    output["cancelled"] = summary.cancelled;
    output["elapsed_ms"] = summary.elapsed.count();
    if (!output_.empty()) {
      output["output"] = output_;
    }
    out << output.dump(2) << "\n";
    return;
  }

  if (options.quiet) {
    return;
  }

  out << fmt::format("Done. Generated {} line(s) with {} worker(s) ({}) in {:.2f}s{}",
                     summary.lines, summary.workers,
                     config::executionModeToString(summary.mode),
                     static_cast<double>(summary.elapsed.count()) / 1000.0,
                     summary.cap_reached ? ", max-count reached" : "")
      << "\n";
}

}  // namespace wlm::cli
