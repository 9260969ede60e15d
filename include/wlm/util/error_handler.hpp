#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>

#include "wlm/common.hpp"

namespace wlm::util {

// Error severity levels
enum class ErrorSeverity {
  kInfo,     // Informational messages
  kWarning,  // Recoverable issues
  kError,    // Run failed
  kCritical  // Run failed with partial output left behind
};

// Where the error happened
struct ErrorContext {
  std::string file_path;   // File being operated on
  std::string operation;   // Operation being performed
  std::chrono::system_clock::time_point timestamp;

  ErrorContext() : timestamp(std::chrono::system_clock::now()) {}

  ErrorContext& withFile(const std::string& path) {
    file_path = path;
    return *this;
  }

  ErrorContext& withOperation(const std::string& op) {
    operation = op;
    return *this;
  }
};

// Error with context and severity, as reported at the command line
class ContextualError {
public:
  ContextualError(ErrorCode code, std::string message, ErrorSeverity severity = ErrorSeverity::kError)
    : code_(code), message_(std::move(message)), severity_(severity) {}

  ContextualError(ErrorCode code, std::string message, ErrorContext context,
                  ErrorSeverity severity = ErrorSeverity::kError)
    : code_(code), message_(std::move(message)), context_(std::move(context)), severity_(severity) {}

  ContextualError(const Error& error, ErrorContext context)
    : ContextualError(error.code(), error.message(), std::move(context)) {}

  ErrorCode code() const { return code_; }
  const std::string& message() const { return message_; }
  const std::optional<ErrorContext>& context() const { return context_; }
  ErrorSeverity severity() const { return severity_; }

  // Get full error description with context
  std::string fullDescription() const;

private:
  ErrorCode code_;
  std::string message_;
  std::optional<ErrorContext> context_;
  ErrorSeverity severity_;
};

// Formats errors for the user and forwards them to the error logger
class ErrorHandler {
public:
  static ErrorHandler& instance();

  // Log the error through the registered logger, if any
  void report(const ContextualError& error) const;

  // Set error logging callback
  void setErrorLogger(std::function<void(const ContextualError&)> logger);

  // Format error for user display
  std::string formatUserError(const ContextualError& error, bool json_format = false,
                              bool color = true) const;

  // Format error for internal logging
  std::string formatLogError(const ContextualError& error) const;

private:
  ErrorHandler() = default;
  std::function<void(const ContextualError&)> error_logger_;
};

std::string severityToString(ErrorSeverity severity);

// Logging setup (error_logger.cpp)
struct LoggingOptions {
  std::string level = "warning";   // debug, info, warning, error
  bool color = true;
  std::string log_file;            // empty = no file sink
};

// Install the default spdlog logger and hook it into ErrorHandler
Result<void> setupLogging(const LoggingOptions& options);

// Map a --log-level name to an spdlog level name; kConfigError when unknown
Result<std::string> normalizeLogLevel(const std::string& level);

}  // namespace wlm::util
