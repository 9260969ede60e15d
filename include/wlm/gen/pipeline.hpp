#pragma once

#include <optional>
#include <string>
#include <vector>

#include "wlm/config/generation_config.hpp"
#include "wlm/gen/combination_generator.hpp"
#include "wlm/gen/filter.hpp"
#include "wlm/gen/mask_composer.hpp"
#include "wlm/gen/sequence.hpp"
#include "wlm/util/cancellation.hpp"

namespace wlm::gen {

/**
 * @brief Full generation pipeline for one shard of the base-string stream
 *
 * base strings (shard of CombinationGenerator) -> MaskComposer (variants
 * and tokens) -> CandidateFilter. Pulls one candidate at a time; holds no
 * state beyond the current base string. When a cancellation token is
 * given it is polled before every raw candidate, rejected ones included.
 */
class CandidatePipeline : public StringSequence {
public:
  CandidatePipeline(const config::GenerationConfig& config,
                    const std::vector<MaskTemplate>& masks,
                    size_t shard_index = 0,
                    size_t shard_count = 1,
                    const util::CancellationToken* cancel = nullptr);

  std::optional<std::string> next() override;
  void reset() override;

  // Base strings consumed so far by this shard
  size_t baseStringsConsumed() const { return bases_consumed_; }

private:
  CombinationGenerator combinations_;
  ShardSequence shard_;
  MaskComposer composer_;
  CandidateFilter filter_;
  const util::CancellationToken* cancel_;
  bool has_base_ = false;
  size_t bases_consumed_ = 0;
};

}  // namespace wlm::gen
