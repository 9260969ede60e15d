#pragma once

#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace wlm::test {

// Synthetic base-word lists for performance testing
class CorpusGenerator {
 public:
  struct Config {
    size_t word_count = 4;
    size_t min_word_length = 3;
    size_t max_word_length = 8;
    double digit_word_probability = 0.25;  // Words like "1984" or "2025"
    double unicode_probability = 0.1;      // Words with non-ASCII letters
    uint32_t seed = 42;
  };

  CorpusGenerator();
  explicit CorpusGenerator(Config config);

  std::vector<std::string> generateWords();

  std::string generateWord();

 private:
  Config config_;
  std::mt19937 rng_;

  std::vector<std::string> syllables_;
  std::vector<std::string> accented_;
};

}  // namespace wlm::test
