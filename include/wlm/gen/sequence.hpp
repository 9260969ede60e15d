#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace wlm::gen {

/**
 * @brief Finite, forward-only, restartable sequence of strings
 *
 * Every pipeline stage is a StringSequence pulling from the stage before
 * it. Stages never collect their input into a container, so memory stays
 * bounded by one base string's worth of state.
 */
class StringSequence {
public:
  virtual ~StringSequence() = default;

  /**
   * @brief Pull the next value
   * @return The value, or std::nullopt once the sequence is exhausted
   */
  virtual std::optional<std::string> next() = 0;

  /**
   * @brief Rewind to the first value
   */
  virtual void reset() = 0;
};

/**
 * @brief Sequence over a borrowed vector (token sets held by the config)
 */
class VectorSequence : public StringSequence {
public:
  explicit VectorSequence(const std::vector<std::string>& values) : values_(values) {}

  std::optional<std::string> next() override {
    if (index_ >= values_.size()) {
      return std::nullopt;
    }
    return values_[index_++];
  }

  void reset() override { index_ = 0; }

private:
  const std::vector<std::string>& values_;
  size_t index_ = 0;
};

/**
 * @brief Sequence yielding exactly one value
 */
class SingleValueSequence : public StringSequence {
public:
  explicit SingleValueSequence(std::string value) : value_(std::move(value)) {}

  std::optional<std::string> next() override {
    if (done_) {
      return std::nullopt;
    }
    done_ = true;
    return value_;
  }

  void reset() override { done_ = false; }

private:
  std::string value_;
  bool done_ = false;
};

/**
 * @brief Keeps every N-th value of an inner sequence (round-robin shard)
 */
class ShardSequence : public StringSequence {
public:
  ShardSequence(StringSequence& inner, size_t shard_index, size_t shard_count)
      : inner_(inner), shard_index_(shard_index), shard_count_(shard_count == 0 ? 1 : shard_count) {}

  std::optional<std::string> next() override {
    while (auto value = inner_.next()) {
      size_t position = position_++;
      if (position % shard_count_ == shard_index_) {
        return value;
      }
    }
    return std::nullopt;
  }

  void reset() override {
    inner_.reset();
    position_ = 0;
  }

private:
  StringSequence& inner_;
  size_t shard_index_;
  size_t shard_count_;
  size_t position_ = 0;
};

}  // namespace wlm::gen
