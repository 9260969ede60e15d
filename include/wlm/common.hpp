#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace wlm {

// Error handling - using std::expected pattern
enum class ErrorCode {
  kSuccess = 0,
  kInvalidArgument,
  kFileNotFound,
  kFileReadError,
  kFileWriteError,
  kFileExists,
  kFilePermissionDenied,
  kDirectoryCreateError,
  kParseError,
  kValidationError,
  kConfigError,
  kInvalidMask,
  kWorkerError,
  kProcessError,
  kSystemError,
  kCancelled,
  kInvalidState,
  kUnknownError
};

// Convert error code to string
std::string_view errorCodeToString(ErrorCode code);

// Error class for detailed error information
class Error {
 public:
  Error(ErrorCode code, std::string message)
      : code_(code), message_(std::move(message)) {}

  ErrorCode code() const { return code_; }
  const std::string& message() const { return message_; }

  // Configuration problems detected before generation starts
  bool isConfigError() const;

  // Sink, output file and input file failures
  bool isIoError() const;

 private:
  ErrorCode code_;
  std::string message_;
};

// Result type alias
template <typename T>
using Result = std::expected<T, Error>;

// Convenience function for creating errors
inline Error makeError(ErrorCode code, const std::string& message) {
  return Error(code, message);
}

// Convenience function for creating error results
template<typename T>
inline Result<T> makeErrorResult(ErrorCode code, const std::string& message) {
  return std::unexpected(makeError(code, message));
}

// Process exit code for an error reaching the command line
int exitCodeFor(const Error& error);

// Version information
struct Version {
  int major;
  int minor;
  int patch;
  std::string build;

  std::string toString() const;
};

// Get version information
Version getVersion();

}  // namespace wlm
