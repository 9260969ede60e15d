#include "wlm/config/config.hpp"

#include <fstream>
#include <sstream>

#include <spdlog/spdlog.h>
#include <toml++/toml.hpp>

#include "wlm/config/option_parser.hpp"
#include "wlm/util/error_handler.hpp"
#include "wlm/util/xdg.hpp"

namespace wlm::config {

namespace {

Result<void> typeError(const std::string& key, const std::string& expected) {
  return makeErrorResult<void>(ErrorCode::kConfigError,
      "Config key '" + key + "' must be " + expected);
}

// Reads an optional key into target; a present value of the wrong type fails
template <typename T>
Result<void> readValue(const toml::table& table, const std::string& key, T& target,
                       const std::string& expected) {
  auto node = table[key];
  if (!node) {
    return {};
  }
  if (auto value = node.template value<T>()) {
    target = *value;
    return {};
  }
  return typeError(key, expected);
}

}  // namespace

Result<void> Config::load(const std::filesystem::path& config_path) {
  config_path_ = config_path;

  if (!std::filesystem::exists(config_path)) {
    return std::unexpected(makeError(ErrorCode::kFileNotFound,
                                     "Config file not found: " + config_path.string()));
  }

  try {
    auto config_data = toml::parse_file(config_path.string());

    std::vector<Result<void>> reads;
    reads.push_back(readValue(config_data, "joiners", joiners, "a string"));
    reads.push_back(readValue(config_data, "cases", cases, "a string"));
    reads.push_back(readValue(config_data, "numbers", numbers, "a string"));
    reads.push_back(readValue(config_data, "symbols", symbols, "a string"));
    reads.push_back(readValue(config_data, "years", years, "a string"));
    reads.push_back(readValue(config_data, "leet", leet, "a string"));
    reads.push_back(readValue(config_data, "leet_max_expansions", leet_max_expansions, "an integer"));
    reads.push_back(readValue(config_data, "min_length", min_length, "an integer"));
    reads.push_back(readValue(config_data, "max_length", max_length, "an integer"));
    reads.push_back(readValue(config_data, "max_permutation_length", max_permutation_length, "an integer"));
    reads.push_back(readValue(config_data, "workers", workers, "an integer"));
    reads.push_back(readValue(config_data, "mode", mode, "a string"));
    reads.push_back(readValue(config_data, "log_level", log_level, "a string"));
    reads.push_back(readValue(config_data, "log_file", log_file, "a string"));
    reads.push_back(readValue(config_data, "progress", progress, "a boolean"));
    for (const auto& read : reads) {
      if (!read) {
        return read;
      }
    }

    // Integers are accepted where a float is expected
    if (auto node = config_data["min_entropy"]) {
      if (auto value = node.value<double>()) {
        min_entropy = *value;
      } else {
        return typeError("min_entropy", "a number");
      }
    }

    if (auto node = config_data["max_count"]) {
      if (auto value = node.value<int64_t>()) {
        max_count = *value;
      } else {
        return typeError("max_count", "an integer");
      }
    }

    if (auto node = config_data["masks"]) {
      auto* array = node.as_array();
      if (array == nullptr) {
        return typeError("masks", "an array of strings");
      }
      masks.clear();
      for (const auto& element : *array) {
        auto value = element.value<std::string>();
        if (!value) {
          return typeError("masks", "an array of strings");
        }
        masks.push_back(*value);
      }
    }

    spdlog::debug("Loaded config from {}", config_path.string());
    return validate();

  } catch (const toml::parse_error& e) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "TOML parse error in " + config_path.string() + ": " +
                                     std::string(e.description())));
  }
}

Result<void> Config::save(const std::filesystem::path& config_path) const {
  std::filesystem::path save_path = config_path.empty() ? config_path_ : config_path;

  if (save_path.empty()) {
    save_path = defaultConfigPath();
  }

  std::error_code ec;
  auto parent = save_path.parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      return std::unexpected(makeError(ErrorCode::kDirectoryCreateError,
                                       "Cannot create " + parent.string() + ": " + ec.message()));
    }
  }

  // Write to a temporary file, then rename over the target
  auto temp_path = save_path;
  temp_path += ".tmp";
  {
    std::ofstream out(temp_path, std::ios::trunc);
    if (!out) {
      return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                       "Cannot write config file: " + temp_path.string()));
    }
    out << toToml();
    out.flush();
    if (!out) {
      return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                       "Cannot write config file: " + temp_path.string()));
    }
  }

  std::filesystem::rename(temp_path, save_path, ec);
  if (ec) {
    std::filesystem::remove(temp_path, ec);
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Cannot replace config file " + save_path.string()));
  }

  return {};
}

Result<void> Config::validate() const {
  if (min_length < 0 || max_length < 0) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "min_length and max_length must not be negative"));
  }
  if (min_length > max_length) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "min_length exceeds max_length"));
  }
  if (leet_max_expansions < 0) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "leet_max_expansions must not be negative"));
  }
  if (min_entropy < 0.0) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "min_entropy must not be negative"));
  }
  if (max_count && *max_count <= 0) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "max_count must be positive"));
  }
  if (max_permutation_length < 0) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "max_permutation_length must not be negative"));
  }
  if (workers < 1) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "workers must be at least 1"));
  }

  auto parsed_mode = OptionParser::parseExecutionMode(mode);
  if (!parsed_mode) {
    return std::unexpected(parsed_mode.error());
  }
  auto level = util::normalizeLogLevel(log_level);
  if (!level) {
    return std::unexpected(level.error());
  }

  return {};
}

Result<void> Config::applyTo(GenerationConfig& generation) const {
  auto valid = validate();
  if (!valid) {
    return valid;
  }

  auto parsed_joiners = OptionParser::parseTokenList(joiners, "joiners");
  if (!parsed_joiners) return std::unexpected(parsed_joiners.error());
  auto parsed_cases = OptionParser::parseCases(cases);
  if (!parsed_cases) return std::unexpected(parsed_cases.error());
  auto parsed_numbers = OptionParser::parseTokenList(numbers, "numbers");
  if (!parsed_numbers) return std::unexpected(parsed_numbers.error());
  auto parsed_symbols = OptionParser::parseTokenList(symbols, "symbols");
  if (!parsed_symbols) return std::unexpected(parsed_symbols.error());
  auto parsed_years = OptionParser::parseYears(years);
  if (!parsed_years) return std::unexpected(parsed_years.error());
  auto parsed_leet = OptionParser::parseLeet(leet);
  if (!parsed_leet) return std::unexpected(parsed_leet.error());
  auto parsed_mode = OptionParser::parseExecutionMode(mode);
  if (!parsed_mode) return std::unexpected(parsed_mode.error());

  generation.joiners = std::move(*parsed_joiners);
  generation.cases = std::move(*parsed_cases);
  generation.numbers = std::move(*parsed_numbers);
  generation.symbols = std::move(*parsed_symbols);
  generation.years = std::move(*parsed_years);
  generation.leet = std::move(*parsed_leet);
  generation.masks = masks;
  generation.leet_max_expansions = static_cast<size_t>(leet_max_expansions);
  generation.min_length = static_cast<size_t>(min_length);
  generation.max_length = static_cast<size_t>(max_length);
  generation.min_entropy = min_entropy;
  generation.max_permutation_length = static_cast<size_t>(max_permutation_length);
  if (max_count) {
    generation.max_count = static_cast<uint64_t>(*max_count);
  } else {
    generation.max_count.reset();
  }
  generation.workers = static_cast<size_t>(workers);
  generation.mode = *parsed_mode;
  return {};
}

std::string Config::toToml() const {
  toml::table config_data;

  config_data.insert_or_assign("joiners", joiners);
  config_data.insert_or_assign("cases", cases);
  config_data.insert_or_assign("numbers", numbers);
  config_data.insert_or_assign("symbols", symbols);
  config_data.insert_or_assign("years", years);

  toml::array mask_array;
  for (const auto& mask : masks) {
    mask_array.push_back(mask);
  }
  config_data.insert_or_assign("masks", mask_array);

  config_data.insert_or_assign("leet", leet);
  config_data.insert_or_assign("leet_max_expansions", leet_max_expansions);
  config_data.insert_or_assign("min_length", min_length);
  config_data.insert_or_assign("max_length", max_length);
  config_data.insert_or_assign("min_entropy", min_entropy);
  if (max_count) {
    config_data.insert_or_assign("max_count", *max_count);
  }
  config_data.insert_or_assign("max_permutation_length", max_permutation_length);
  config_data.insert_or_assign("workers", workers);
  config_data.insert_or_assign("mode", mode);
  config_data.insert_or_assign("log_level", log_level);
  if (!log_file.empty()) {
    config_data.insert_or_assign("log_file", log_file);
  }
  config_data.insert_or_assign("progress", progress);

  std::stringstream ss;
  ss << config_data << "\n";
  return ss.str();
}

std::filesystem::path Config::defaultConfigPath() {
  return util::Xdg::configFile();
}

Result<Config> Config::loadOrDefault(const std::filesystem::path& explicit_path) {
  Config config;
  if (explicit_path.empty()) {
    auto default_path = defaultConfigPath();
    if (!std::filesystem::exists(default_path)) {
      config.config_path_ = default_path;
      return config;
    }
    auto loaded = config.load(default_path);
    if (!loaded) {
      return std::unexpected(loaded.error());
    }
    return config;
  }

  auto loaded = config.load(explicit_path);
  if (!loaded) {
    return std::unexpected(loaded.error());
  }
  return config;
}

}  // namespace wlm::config
