#include "wlm/gen/pipeline.hpp"

namespace wlm::gen {

CandidatePipeline::CandidatePipeline(const config::GenerationConfig& config,
                                     const std::vector<MaskTemplate>& masks,
                                     size_t shard_index,
                                     size_t shard_count,
                                     const util::CancellationToken* cancel)
    : combinations_(config.words, config.joiners, config.effectivePermutationLength()),
      shard_(combinations_, shard_index, shard_count),
      composer_(masks, config),
      filter_(config),
      cancel_(cancel) {}

std::optional<std::string> CandidatePipeline::next() {
  while (true) {
    if (cancel_ != nullptr && cancel_->isCancelled()) {
      return std::nullopt;
    }

    if (has_base_) {
      if (auto candidate = composer_.next()) {
        if (filter_.accepts(*candidate)) {
          return candidate;
        }
        continue;
      }
    }

    auto base = shard_.next();
    if (!base) {
      return std::nullopt;
    }
    ++bases_consumed_;
    has_base_ = true;
    composer_.assign(*base);
  }
}

void CandidatePipeline::reset() {
  shard_.reset();
  has_base_ = false;
  bases_consumed_ = 0;
}

}  // namespace wlm::gen
