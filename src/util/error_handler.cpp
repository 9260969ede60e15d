#include "wlm/util/error_handler.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

#include <nlohmann/json.hpp>

namespace wlm::util {

std::string ContextualError::fullDescription() const {
  std::ostringstream oss;
  oss << errorCodeToString(code_) << ": " << message_;

  if (context_) {
    if (!context_->operation.empty()) {
      oss << " (during " << context_->operation << ")";
    }
    if (!context_->file_path.empty()) {
      oss << " [file: " << context_->file_path << "]";
    }
  }

  return oss.str();
}

std::string severityToString(ErrorSeverity severity) {
  switch (severity) {
    case ErrorSeverity::kInfo: return "info";
    case ErrorSeverity::kWarning: return "warning";
    case ErrorSeverity::kError: return "error";
    case ErrorSeverity::kCritical: return "critical";
  }
  return "error";
}

ErrorHandler& ErrorHandler::instance() {
  static ErrorHandler instance_;
  return instance_;
}

void ErrorHandler::report(const ContextualError& error) const {
  if (error_logger_) {
    error_logger_(error);
  }
}

void ErrorHandler::setErrorLogger(std::function<void(const ContextualError&)> logger) {
  error_logger_ = std::move(logger);
}

std::string ErrorHandler::formatUserError(const ContextualError& error, bool json_format,
                                          bool color) const {
  if (json_format) {
    nlohmann::json error_json;
    error_json["error"] = true;
    error_json["code"] = std::string(errorCodeToString(error.code()));
    error_json["message"] = error.message();
    error_json["severity"] = severityToString(error.severity());
    error_json["exit_code"] = exitCodeFor(Error(error.code(), error.message()));

    if (error.context()) {
      const auto& ctx = *error.context();
      if (!ctx.file_path.empty()) {
        error_json["file"] = ctx.file_path;
      }
      if (!ctx.operation.empty()) {
        error_json["operation"] = ctx.operation;
      }
    }

    return error_json.dump();
  }

  std::ostringstream oss;

  const char* color_code = "";
  const char* severity_text = "";
  const char* reset_code = color ? "\033[0m" : "";

  switch (error.severity()) {
    case ErrorSeverity::kInfo:
      color_code = "\033[36m"; // Cyan
      severity_text = "Info";
      break;
    case ErrorSeverity::kWarning:
      color_code = "\033[33m"; // Yellow
      severity_text = "Warning";
      break;
    case ErrorSeverity::kError:
      color_code = "\033[31m"; // Red
      severity_text = "Error";
      break;
    case ErrorSeverity::kCritical:
      color_code = "\033[35m"; // Magenta
      severity_text = "Critical";
      break;
  }
  if (!color) {
    color_code = "";
  }

  oss << color_code << severity_text << reset_code << ": " << error.message();

  if (error.context()) {
    const auto& ctx = *error.context();
    if (!ctx.file_path.empty()) {
      oss << "\n  File: " << ctx.file_path;
    }
    if (!ctx.operation.empty()) {
      oss << "\n  Operation: " << ctx.operation;
    }
  }

  switch (error.code()) {
    case ErrorCode::kFileExists:
      oss << "\n  Suggestion: Pass --force to overwrite the existing file";
      break;
    case ErrorCode::kFileNotFound:
      oss << "\n  Suggestion: Check if the file path is correct and the file exists";
      break;
    case ErrorCode::kFilePermissionDenied:
      oss << "\n  Suggestion: Check file permissions or run with appropriate privileges";
      break;
    case ErrorCode::kInvalidMask:
      oss << "\n  Suggestion: Known placeholders are {base} {Base} {BASE} {camel} {num} {sym} {year}";
      break;
    default:
      break;
  }

  return oss.str();
}

std::string ErrorHandler::formatLogError(const ContextualError& error) const {
  std::ostringstream oss;

  auto time_t = std::chrono::system_clock::to_time_t(
    error.context() ? error.context()->timestamp : std::chrono::system_clock::now());
  std::tm tm_buf{};
  localtime_r(&time_t, &tm_buf);
  oss << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << "] ";

  switch (error.severity()) {
    case ErrorSeverity::kInfo: oss << "INFO"; break;
    case ErrorSeverity::kWarning: oss << "WARN"; break;
    case ErrorSeverity::kError: oss << "ERROR"; break;
    case ErrorSeverity::kCritical: oss << "CRITICAL"; break;
  }

  oss << " [" << static_cast<int>(error.code()) << "] " << error.fullDescription();

  return oss.str();
}

}  // namespace wlm::util
