#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

#include "wlm/common.hpp"
#include "wlm/config/generation_config.hpp"
#include "wlm/gen/mask_composer.hpp"
#include "wlm/stream/output_budget.hpp"
#include "wlm/stream/progress.hpp"
#include "wlm/stream/sink.hpp"
#include "wlm/util/cancellation.hpp"

namespace wlm::stream {

// Outcome of one generation run
struct RunSummary {
  uint64_t lines = 0;
  size_t workers = 1;
  config::ExecutionMode mode = config::ExecutionMode::kThreads;
  bool cap_reached = false;
  bool cancelled = false;
  std::chrono::milliseconds elapsed{0};
};

/**
 * @brief Drives the candidate pipeline across workers into one sink
 *
 * Worker i processes every base string whose index is congruent to i
 * modulo the worker count. In thread mode the workers share an atomic
 * budget and a mutex-guarded sink; in process mode each forked child gets
 * a fixed quota and writes into its own pipe, and the parent forwards
 * complete lines to the sink.
 *
 * The configuration is validated and the masks compiled before any
 * worker starts, so configuration errors emit nothing. A sink failure or
 * worker failure stops every worker and is returned as the error. An
 * abort through the caller's token ends the run early with
 * RunSummary::cancelled set.
 */
class StreamCoordinator {
public:
  // Runs first in every worker thread or forked child; a throw fails that worker
  using WorkerHook = std::function<void(size_t worker_index)>;

  StreamCoordinator(const config::GenerationConfig& config,
                    Sink& sink,
                    ProgressReporter* progress = nullptr,
                    const util::CancellationToken* abort = nullptr);

  Result<RunSummary> run();

  void setWorkerHook(WorkerHook hook) { worker_hook_ = std::move(hook); }

private:
  Result<RunSummary> runThreads(const std::vector<gen::MaskTemplate>& masks);
  Result<RunSummary> runProcesses(const std::vector<gen::MaskTemplate>& masks);

  bool aborted() const { return abort_ != nullptr && abort_->isCancelled(); }

  const config::GenerationConfig& config_;
  Sink& sink_;
  ProgressReporter* progress_;
  const util::CancellationToken* abort_;
  WorkerHook worker_hook_;
};

}  // namespace wlm::stream
