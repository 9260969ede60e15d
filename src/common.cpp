#include "wlm/common.hpp"

#include <sstream>

#ifndef WLM_VERSION_MAJOR
#define WLM_VERSION_MAJOR 0
#define WLM_VERSION_MINOR 1
#define WLM_VERSION_PATCH 0
#endif

namespace wlm {

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kFileNotFound:
      return "File not found";
    case ErrorCode::kFileReadError:
      return "File read error";
    case ErrorCode::kFileWriteError:
      return "File write error";
    case ErrorCode::kFileExists:
      return "File exists";
    case ErrorCode::kFilePermissionDenied:
      return "File permission denied";
    case ErrorCode::kDirectoryCreateError:
      return "Directory create error";
    case ErrorCode::kParseError:
      return "Parse error";
    case ErrorCode::kValidationError:
      return "Validation error";
    case ErrorCode::kConfigError:
      return "Configuration error";
    case ErrorCode::kInvalidMask:
      return "Invalid mask";
    case ErrorCode::kWorkerError:
      return "Worker error";
    case ErrorCode::kProcessError:
      return "Process error";
    case ErrorCode::kSystemError:
      return "System error";
    case ErrorCode::kCancelled:
      return "Cancelled";
    case ErrorCode::kInvalidState:
      return "Invalid state";
    case ErrorCode::kUnknownError:
      return "Unknown error";
  }
  return "Unknown error";
}

bool Error::isConfigError() const {
  switch (code_) {
    case ErrorCode::kInvalidArgument:
    case ErrorCode::kParseError:
    case ErrorCode::kValidationError:
    case ErrorCode::kConfigError:
    case ErrorCode::kInvalidMask:
      return true;
    default:
      return false;
  }
}

bool Error::isIoError() const {
  switch (code_) {
    case ErrorCode::kFileNotFound:
    case ErrorCode::kFileReadError:
    case ErrorCode::kFileWriteError:
    case ErrorCode::kFileExists:
    case ErrorCode::kFilePermissionDenied:
    case ErrorCode::kDirectoryCreateError:
      return true;
    default:
      return false;
  }
}

int exitCodeFor(const Error& error) {
  if (error.code() == ErrorCode::kCancelled) {
    return 130;
  }
  if (error.isConfigError()) {
    return 1;
  }
  if (error.isIoError()) {
    return 2;
  }
  return 3;
}

std::string Version::toString() const {
  std::ostringstream oss;
  oss << major << "." << minor << "." << patch;
  if (!build.empty()) {
    oss << "+" << build;
  }
  return oss.str();
}

Version getVersion() {
  return Version{WLM_VERSION_MAJOR, WLM_VERSION_MINOR, WLM_VERSION_PATCH, ""};
}

}  // namespace wlm
