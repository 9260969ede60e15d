#include "wlm/util/error_handler.hpp"

#include <filesystem>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace wlm::util {

namespace {

constexpr size_t kLogFileSize = 1024 * 1024 * 5;  // 5MB files
constexpr size_t kLogFileBackups = 3;

// User-facing output already shows the message; the log keeps the full record
void logContextualError(const ContextualError& error) {
  std::string message = ErrorHandler::instance().formatLogError(error);

  switch (error.severity()) {
    case ErrorSeverity::kInfo:
    case ErrorSeverity::kWarning:
    case ErrorSeverity::kError:
      spdlog::debug("{}", message);
      break;
    case ErrorSeverity::kCritical:
      spdlog::critical("{}", message);
      break;
  }

  if (error.context()) {
    const auto& ctx = *error.context();
    if (!ctx.file_path.empty()) {
      spdlog::debug("  File: {}", ctx.file_path);
    }
    if (!ctx.operation.empty()) {
      spdlog::debug("  Operation: {}", ctx.operation);
    }
  }
}

}  // namespace

Result<std::string> normalizeLogLevel(const std::string& level) {
  if (level == "debug" || level == "info" || level == "error") {
    return level;
  }
  if (level == "warning" || level == "warn") {
    return std::string("warn");
  }
  return makeErrorResult<std::string>(ErrorCode::kConfigError,
      "Unknown log level '" + level + "' (expected debug, info, warning or error)");
}

Result<void> setupLogging(const LoggingOptions& options) {
  auto level_name = normalizeLogLevel(options.level);
  if (!level_name) {
    return std::unexpected(level_name.error());
  }
  auto level = spdlog::level::from_str(*level_name);

  std::vector<spdlog::sink_ptr> sinks;
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>(
      options.color ? spdlog::color_mode::automatic : spdlog::color_mode::never);
  console_sink->set_level(level);
  sinks.push_back(console_sink);

  if (!options.log_file.empty()) {
    std::filesystem::path log_path(options.log_file);
    std::error_code ec;
    if (log_path.has_parent_path()) {
      std::filesystem::create_directories(log_path.parent_path(), ec);
    }
    try {
      auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          log_path.string(), kLogFileSize, kLogFileBackups);
      file_sink->set_level(spdlog::level::debug);
      file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
      sinks.push_back(file_sink);
    } catch (const spdlog::spdlog_ex& e) {
      return makeErrorResult<void>(ErrorCode::kFileWriteError,
          "Failed to open log file " + log_path.string() + ": " + e.what());
    }
  }

  auto logger = std::make_shared<spdlog::logger>("wlm", sinks.begin(), sinks.end());
  console_sink->set_pattern("[%H:%M:%S.%e] [%l] %v");
  logger->set_level(options.log_file.empty() ? level : spdlog::level::debug);
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(logger);

  ErrorHandler::instance().setErrorLogger(logContextualError);
  return {};
}

}  // namespace wlm::util
