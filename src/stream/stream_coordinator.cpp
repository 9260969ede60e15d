#include "wlm/stream/stream_coordinator.hpp"

#include <unistd.h>
#include <sys/wait.h>
#include <poll.h>
#include <signal.h>

#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <exception>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>

#include <spdlog/spdlog.h>

#include "wlm/gen/pipeline.hpp"

namespace wlm::stream {

namespace {

constexpr uint64_t kProgressBatch = 1024;
constexpr size_t kPipeChunk = 64 * 1024;
constexpr int kPollTimeoutMs = 100;

// Child exit statuses
constexpr int kChildOk = 0;
constexpr int kChildWriteFailed = 2;
constexpr int kChildFailed = 3;

/**
 * @brief Write the whole buffer, retrying on EINTR and short writes
 * @return false when the pipe is gone or the write failed
 */
bool writeAll(int fd, const std::string& data) {
  const char* ptr = data.data();
  size_t remaining = data.size();
  while (remaining > 0) {
    ssize_t written = ::write(fd, ptr, remaining);
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    ptr += written;
    remaining -= static_cast<size_t>(written);
  }
  return true;
}

void safeClose(int fd) {
  if (fd >= 0) {
    ::close(fd);
  }
}

/**
 * @brief Body of a forked worker; never returns
 *
 * Writes at most quota lines of its shard into the pipe in bounded
 * batches. A closed pipe means the parent stopped reading and is not a
 * failure of this worker.
 */
[[noreturn]] void runChild(const config::GenerationConfig& config,
                           const std::vector<gen::MaskTemplate>& masks,
                           size_t index,
                           size_t count,
                           std::optional<uint64_t> quota,
                           int fd,
                           const StreamCoordinator::WorkerHook& hook) {
  // SIGTERM from the parent must end the child, not the inherited abort handler
  ::signal(SIGTERM, SIG_DFL);
  ::signal(SIGPIPE, SIG_IGN);
  ::signal(SIGINT, SIG_IGN);

  int status = kChildOk;
  try {
    if (hook) {
      hook(index);
    }
    gen::CandidatePipeline pipeline(config, masks, index, count);
    std::string buffer;
    buffer.reserve(kPipeChunk + 256);
    uint64_t emitted = 0;

    while (!quota || emitted < *quota) {
      auto candidate = pipeline.next();
      if (!candidate) {
        break;
      }
      buffer.append(*candidate);
      buffer.push_back('\n');
      ++emitted;

      if (buffer.size() >= kPipeChunk) {
        if (!writeAll(fd, buffer)) {
          status = errno == EPIPE ? kChildOk : kChildWriteFailed;
          buffer.clear();
          break;
        }
        buffer.clear();
      }
    }

    if (!buffer.empty() && !writeAll(fd, buffer)) {
      status = errno == EPIPE ? kChildOk : kChildWriteFailed;
    }
  } catch (const std::exception& e) {
    std::fprintf(stderr, "wlm: worker %zu failed: %s\n", index, e.what());
    status = kChildFailed;
  }

  safeClose(fd);
  ::_exit(status);
}

struct ChildWorker {
  size_t index = 0;
  pid_t pid = -1;
  int fd = -1;
  std::string pending;
  bool reaped = false;
};

void terminateChildren(std::vector<ChildWorker>& children) {
  for (auto& child : children) {
    if (!child.reaped && child.pid > 0) {
      ::kill(child.pid, SIGTERM);
    }
  }
  for (auto& child : children) {
    safeClose(child.fd);
    child.fd = -1;
    if (!child.reaped && child.pid > 0) {
      int status = 0;
      while (::waitpid(child.pid, &status, 0) < 0 && errno == EINTR) {
      }
      child.reaped = true;
    }
  }
}

std::string describeExit(int status) {
  if (WIFEXITED(status)) {
    return "exited with status " + std::to_string(WEXITSTATUS(status));
  }
  if (WIFSIGNALED(status)) {
    return std::string("killed by signal ") + std::to_string(WTERMSIG(status));
  }
  return "terminated abnormally";
}

}  // namespace

StreamCoordinator::StreamCoordinator(const config::GenerationConfig& config,
                                     Sink& sink,
                                     ProgressReporter* progress,
                                     const util::CancellationToken* abort)
    : config_(config), sink_(sink), progress_(progress), abort_(abort) {}

Result<RunSummary> StreamCoordinator::run() {
  auto valid = config_.validate();
  if (!valid) {
    return std::unexpected(valid.error());
  }

  auto masks = gen::compileMasks(config_.effectiveMasks());
  if (!masks) {
    return std::unexpected(masks.error());
  }

  spdlog::debug("Starting {} worker(s) in {} mode, {} mask(s), {} word(s)",
                config_.workers, config::executionModeToString(config_.mode),
                masks->size(), config_.words.size());

  auto start = std::chrono::steady_clock::now();
  auto summary = config_.mode == config::ExecutionMode::kProcesses
                     ? runProcesses(*masks)
                     : runThreads(*masks);

  if (progress_ != nullptr) {
    progress_->finish();
  }
  if (!summary) {
    return summary;
  }

  summary->elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
  spdlog::debug("Run finished: {} line(s) in {} ms", summary->lines, summary->elapsed.count());
  return summary;
}

Result<RunSummary> StreamCoordinator::runThreads(const std::vector<gen::MaskTemplate>& masks) {
  const size_t worker_count = config_.workers;

  OutputBudget budget(config_.max_count);
  util::CancellationToken stop(abort_);
  SynchronizedSink sink(sink_);

  std::mutex error_mutex;
  std::optional<Error> first_error;
  auto recordError = [&](Error error) {
    std::lock_guard<std::mutex> lock(error_mutex);
    if (!first_error) {
      first_error = std::move(error);
    }
  };

  std::atomic<uint64_t> written{0};

  auto worker = [&](size_t index) {
    uint64_t pending_progress = 0;
    try {
      if (worker_hook_) {
        worker_hook_(index);
      }
      gen::CandidatePipeline pipeline(config_, masks, index, worker_count, &stop);
      while (auto candidate = pipeline.next()) {
        if (!budget.tryConsume()) {
          stop.cancel();
          break;
        }
        auto result = sink.writeLine(*candidate);
        if (!result) {
          recordError(result.error());
          stop.cancel();
          break;
        }
        written.fetch_add(1, std::memory_order_relaxed);
        if (progress_ != nullptr && ++pending_progress >= kProgressBatch) {
          progress_->advance(pending_progress);
          pending_progress = 0;
        }
      }
    } catch (const std::exception& e) {
      recordError(makeError(ErrorCode::kWorkerError,
                            "Worker " + std::to_string(index) + " failed: " + e.what()));
      stop.cancel();
    }
    if (progress_ != nullptr && pending_progress > 0) {
      progress_->advance(pending_progress);
    }
  };

  if (worker_count == 1) {
    worker(0);
  } else {
    std::vector<std::thread> threads;
    threads.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
      threads.emplace_back(worker, i);
    }
    for (auto& thread : threads) {
      thread.join();
    }
  }

  auto flushed = sink.flush();
  if (first_error) {
    return std::unexpected(*first_error);
  }
  if (!flushed) {
    return std::unexpected(flushed.error());
  }

  RunSummary summary;
  summary.lines = written.load();
  summary.workers = worker_count;
  summary.mode = config::ExecutionMode::kThreads;
  summary.cap_reached = config_.max_count.has_value() && summary.lines >= *config_.max_count;
  summary.cancelled = aborted();
  return summary;
}

Result<RunSummary> StreamCoordinator::runProcesses(const std::vector<gen::MaskTemplate>& masks) {
  const size_t worker_count = config_.workers;

  std::vector<std::optional<uint64_t>> quotas(worker_count);
  if (config_.max_count) {
    auto split = OutputBudget::splitQuota(*config_.max_count, worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
      quotas[i] = split[i];
    }
  }

  // Buffered output would otherwise be written again by every child
  std::cout.flush();
  std::fflush(nullptr);
  auto pre_flush = sink_.flush();
  if (!pre_flush) {
    return std::unexpected(pre_flush.error());
  }

  std::vector<ChildWorker> children;
  children.reserve(worker_count);

  for (size_t i = 0; i < worker_count; ++i) {
    if (quotas[i] && *quotas[i] == 0) {
      continue;
    }

    int fds[2];
    if (::pipe(fds) != 0) {
      int err = errno;
      terminateChildren(children);
      return makeErrorResult<RunSummary>(ErrorCode::kProcessError,
          std::string("Failed to create worker pipe: ") + std::strerror(err));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
      int err = errno;
      safeClose(fds[0]);
      safeClose(fds[1]);
      terminateChildren(children);
      return makeErrorResult<RunSummary>(ErrorCode::kProcessError,
          std::string("Failed to fork worker: ") + std::strerror(err));
    }

    if (pid == 0) {
      safeClose(fds[0]);
      for (auto& sibling : children) {
        safeClose(sibling.fd);
      }
      runChild(config_, masks, i, worker_count, quotas[i], fds[1], worker_hook_);
    }

    safeClose(fds[1]);
    ChildWorker child;
    child.index = i;
    child.pid = pid;
    child.fd = fds[0];
    children.push_back(std::move(child));
  }

  spdlog::debug("Forked {} worker process(es)", children.size());

  uint64_t lines = 0;
  bool cancelled = false;
  std::vector<char> buffer(kPipeChunk);

  while (true) {
    std::vector<pollfd> polls;
    std::vector<size_t> owners;
    for (size_t c = 0; c < children.size(); ++c) {
      if (children[c].fd >= 0) {
        polls.push_back(pollfd{children[c].fd, POLLIN, 0});
        owners.push_back(c);
      }
    }
    if (polls.empty()) {
      break;
    }

    if (aborted()) {
      cancelled = true;
      terminateChildren(children);
      break;
    }

    int ready = ::poll(polls.data(), polls.size(), kPollTimeoutMs);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      int err = errno;
      terminateChildren(children);
      return makeErrorResult<RunSummary>(ErrorCode::kProcessError,
          std::string("poll failed: ") + std::strerror(err));
    }

    for (size_t p = 0; p < polls.size(); ++p) {
      if (polls[p].revents == 0) {
        continue;
      }
      ChildWorker& child = children[owners[p]];

      ssize_t n = ::read(child.fd, buffer.data(), buffer.size());
      if (n < 0) {
        if (errno == EINTR || errno == EAGAIN) {
          continue;
        }
        int err = errno;
        terminateChildren(children);
        return makeErrorResult<RunSummary>(ErrorCode::kProcessError,
            "Failed to read from worker " + std::to_string(child.index) + ": " + std::strerror(err));
      }

      if (n == 0) {
        safeClose(child.fd);
        child.fd = -1;
        child.pending.clear();

        int status = 0;
        while (::waitpid(child.pid, &status, 0) < 0 && errno == EINTR) {
        }
        child.reaped = true;
        if (!WIFEXITED(status) || WEXITSTATUS(status) != kChildOk) {
          std::string detail = describeExit(status);
          terminateChildren(children);
          return makeErrorResult<RunSummary>(ErrorCode::kWorkerError,
              "Worker " + std::to_string(child.index) + " " + detail);
        }
        continue;
      }

      child.pending.append(buffer.data(), static_cast<size_t>(n));
      uint64_t forwarded = 0;
      size_t line_start = 0;
      size_t newline;
      while ((newline = child.pending.find('\n', line_start)) != std::string::npos) {
        auto result = sink_.writeLine(
            std::string_view(child.pending).substr(line_start, newline - line_start));
        if (!result) {
          terminateChildren(children);
          return std::unexpected(result.error());
        }
        ++forwarded;
        line_start = newline + 1;
      }
      child.pending.erase(0, line_start);

      lines += forwarded;
      if (progress_ != nullptr && forwarded > 0) {
        progress_->advance(forwarded);
      }
    }
  }

  auto flushed = sink_.flush();
  if (!flushed) {
    return std::unexpected(flushed.error());
  }

  RunSummary summary;
  summary.lines = lines;
  summary.workers = worker_count;
  summary.mode = config::ExecutionMode::kProcesses;
  summary.cap_reached = config_.max_count.has_value() && lines >= *config_.max_count;
  summary.cancelled = cancelled;
  return summary;
}

}  // namespace wlm::stream
