#include "wlm/stream/sink.hpp"

#include <cerrno>
#include <cstring>
#include <iostream>

#include <spdlog/spdlog.h>

namespace wlm::stream {

// ConsoleSink

ConsoleSink::ConsoleSink() : out_(std::cout) {}

ConsoleSink::ConsoleSink(std::ostream& out) : out_(out) {}

Result<void> ConsoleSink::writeLine(std::string_view line) {
  out_.write(line.data(), static_cast<std::streamsize>(line.size()));
  out_.put('\n');
  if (!out_) {
    return makeErrorResult<void>(ErrorCode::kFileWriteError, "Failed to write to standard output");
  }
  return {};
}

Result<void> ConsoleSink::flush() {
  out_.flush();
  if (!out_) {
    return makeErrorResult<void>(ErrorCode::kFileWriteError, "Failed to flush standard output");
  }
  return {};
}

// FileSink

FileSink::FileSink(const std::filesystem::path& path) : path_(path) {}

FileSink::~FileSink() {
  if (out_.is_open()) {
    out_.close();
  }
}

Result<void> FileSink::open() {
  out_.open(path_, std::ios::binary | std::ios::trunc);
  if (!out_) {
    return makeErrorResult<void>(ErrorCode::kFileWriteError,
        "Cannot open output file " + path_.string() + ": " + std::strerror(errno));
  }
  return {};
}

Result<void> FileSink::writeLine(std::string_view line) {
  if (!out_.is_open()) {
    return makeErrorResult<void>(ErrorCode::kInvalidState, "Output file is closed: " + path_.string());
  }
  out_.write(line.data(), static_cast<std::streamsize>(line.size()));
  out_.put('\n');
  if (!out_) {
    return makeErrorResult<void>(ErrorCode::kFileWriteError,
        "Failed to write to " + path_.string() + ": " + std::strerror(errno));
  }
  return {};
}

Result<void> FileSink::flush() {
  if (!out_.is_open()) {
    return {};
  }
  out_.flush();
  if (!out_) {
    return makeErrorResult<void>(ErrorCode::kFileWriteError,
        "Failed to flush " + path_.string() + ": " + std::strerror(errno));
  }
  return {};
}

Result<void> FileSink::close() {
  if (!out_.is_open()) {
    return {};
  }
  auto flushed = flush();
  out_.close();
  if (!flushed) {
    return flushed;
  }
  if (out_.fail()) {
    return makeErrorResult<void>(ErrorCode::kFileWriteError, "Failed to close " + path_.string());
  }
  return {};
}

// GzipFileSink

GzipFileSink::GzipFileSink(const std::filesystem::path& path) : path_(path) {}

GzipFileSink::~GzipFileSink() {
  if (file_ != nullptr) {
    gzclose(file_);
  }
}

Result<void> GzipFileSink::open() {
  file_ = gzopen(path_.c_str(), "wb");
  if (file_ == nullptr) {
    return makeErrorResult<void>(ErrorCode::kFileWriteError,
        "Cannot open gzip output " + path_.string() + ": " + std::strerror(errno));
  }
  return {};
}

Result<void> GzipFileSink::writeLine(std::string_view line) {
  if (file_ == nullptr) {
    return makeErrorResult<void>(ErrorCode::kInvalidState, "Output file is closed: " + path_.string());
  }
  if (!line.empty() &&
      gzwrite(file_, line.data(), static_cast<unsigned>(line.size())) != static_cast<int>(line.size())) {
    return fail("write");
  }
  if (gzputc(file_, '\n') != '\n') {
    return fail("write");
  }
  return {};
}

Result<void> GzipFileSink::flush() {
  if (file_ == nullptr) {
    return {};
  }
  if (gzflush(file_, Z_SYNC_FLUSH) != Z_OK) {
    return fail("flush");
  }
  return {};
}

Result<void> GzipFileSink::close() {
  if (file_ == nullptr) {
    return {};
  }
  int status = gzclose(file_);
  file_ = nullptr;
  if (status != Z_OK) {
    return makeErrorResult<void>(ErrorCode::kFileWriteError,
        "Failed to close gzip output " + path_.string() + " (zlib status " + std::to_string(status) + ")");
  }
  return {};
}

Result<void> GzipFileSink::fail(const std::string& operation) {
  int zlib_error = Z_OK;
  const char* message = gzerror(file_, &zlib_error);
  std::string detail = zlib_error == Z_ERRNO ? std::strerror(errno) : (message ? message : "unknown error");
  return makeErrorResult<void>(ErrorCode::kFileWriteError,
      "Failed to " + operation + " gzip output " + path_.string() + ": " + detail);
}

// TeeSink

void TeeSink::add(std::unique_ptr<Sink> sink) {
  sinks_.push_back(std::move(sink));
}

Result<void> TeeSink::writeLine(std::string_view line) {
  for (auto& sink : sinks_) {
    auto result = sink->writeLine(line);
    if (!result) {
      return result;
    }
  }
  return {};
}

Result<void> TeeSink::flush() {
  for (auto& sink : sinks_) {
    auto result = sink->flush();
    if (!result) {
      return result;
    }
  }
  return {};
}

Result<void> TeeSink::close() {
  Result<void> first_error;
  for (auto& sink : sinks_) {
    auto result = sink->close();
    if (!result && first_error) {
      first_error = std::unexpected(result.error());
    }
  }
  return first_error;
}

// SynchronizedSink

Result<void> SynchronizedSink::writeLine(std::string_view line) {
  std::lock_guard<std::mutex> lock(mutex_);
  return inner_.writeLine(line);
}

Result<void> SynchronizedSink::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  return inner_.flush();
}

Result<void> SynchronizedSink::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  return inner_.close();
}

Result<std::unique_ptr<Sink>> openOutputFile(const std::filesystem::path& path, bool force) {
  std::error_code ec;
  if (std::filesystem::exists(path, ec) && !force) {
    return makeErrorResult<std::unique_ptr<Sink>>(ErrorCode::kFileExists,
        "Output file exists: " + path.string() + " (use --force to overwrite)");
  }

  auto parent = path.parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      return makeErrorResult<std::unique_ptr<Sink>>(ErrorCode::kDirectoryCreateError,
          "Cannot create directory " + parent.string() + ": " + ec.message());
    }
  }

  if (path.extension() == ".gz") {
    spdlog::info("Writing gzip: {}", path.string());
    auto sink = std::make_unique<GzipFileSink>(path);
    auto opened = sink->open();
    if (!opened) {
      return std::unexpected(opened.error());
    }
    return std::unique_ptr<Sink>(std::move(sink));
  }

  spdlog::info("Writing: {}", path.string());
  auto sink = std::make_unique<FileSink>(path);
  auto opened = sink->open();
  if (!opened) {
    return std::unexpected(opened.error());
  }
  return std::unique_ptr<Sink>(std::move(sink));
}

}  // namespace wlm::stream
