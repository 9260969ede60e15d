#pragma once

#include <filesystem>
#include <fstream>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <string_view>
#include <vector>

#include <zlib.h>

#include "wlm/common.hpp"

namespace wlm::stream {

/**
 * @brief Line-oriented output destination
 *
 * writeLine appends the text and a newline. A failed write is fatal for the
 * run; callers never retry.
 */
class Sink {
public:
  virtual ~Sink() = default;

  virtual Result<void> writeLine(std::string_view line) = 0;
  virtual Result<void> flush() = 0;

  // Flush and release the destination; further writes fail
  virtual Result<void> close() { return flush(); }
};

// Standard output (or any ostream)
class ConsoleSink : public Sink {
public:
  ConsoleSink();
  explicit ConsoleSink(std::ostream& out);

  Result<void> writeLine(std::string_view line) override;
  Result<void> flush() override;

private:
  std::ostream& out_;
};

// Plain text file
class FileSink : public Sink {
public:
  explicit FileSink(const std::filesystem::path& path);
  ~FileSink() override;

  FileSink(const FileSink&) = delete;
  FileSink& operator=(const FileSink&) = delete;

  Result<void> open();
  Result<void> writeLine(std::string_view line) override;
  Result<void> flush() override;
  Result<void> close() override;

private:
  std::filesystem::path path_;
  std::ofstream out_;
};

// gzip-compressed file (zlib)
class GzipFileSink : public Sink {
public:
  explicit GzipFileSink(const std::filesystem::path& path);
  ~GzipFileSink() override;

  GzipFileSink(const GzipFileSink&) = delete;
  GzipFileSink& operator=(const GzipFileSink&) = delete;

  Result<void> open();
  Result<void> writeLine(std::string_view line) override;
  Result<void> flush() override;
  Result<void> close() override;

private:
  Result<void> fail(const std::string& operation);

  std::filesystem::path path_;
  gzFile file_ = nullptr;
};

// Writes every line to each child sink in order
class TeeSink : public Sink {
public:
  void add(std::unique_ptr<Sink> sink);
  bool empty() const { return sinks_.empty(); }

  Result<void> writeLine(std::string_view line) override;
  Result<void> flush() override;
  Result<void> close() override;

private:
  std::vector<std::unique_ptr<Sink>> sinks_;
};

// Serializes writes from concurrent workers so lines never interleave
class SynchronizedSink : public Sink {
public:
  explicit SynchronizedSink(Sink& inner) : inner_(inner) {}

  Result<void> writeLine(std::string_view line) override;
  Result<void> flush() override;
  Result<void> close() override;

private:
  Sink& inner_;
  std::mutex mutex_;
};

/**
 * @brief Open an output file sink; ".gz" paths are gzip-compressed
 *
 * Fails with kFileExists when the path exists and force is false.
 * Missing parent directories are created.
 */
Result<std::unique_ptr<Sink>> openOutputFile(const std::filesystem::path& path, bool force);

}  // namespace wlm::stream
