#include <gtest/gtest.h>

#include <algorithm>
#include <set>

#include "wlm/gen/combination_generator.hpp"
#include "test_helpers.hpp"

using namespace wlm::gen;
using namespace wlm::test;

class CombinationGeneratorTest : public ::testing::Test {};

TEST_F(CombinationGeneratorTest, TwoWordsNoJoiner) {
  std::vector<std::string> words = {"a", "b"};
  std::vector<std::string> joiners = {""};
  CombinationGenerator generator(words, joiners, 2);

  auto values = collect(generator);
  EXPECT_EQ(values, (std::vector<std::string>{"a", "b", "ab", "ba"}));
}

TEST_F(CombinationGeneratorTest, JoinerOrderWithinPermutation) {
  std::vector<std::string> words = {"red", "fox"};
  std::vector<std::string> joiners = {"", "-"};
  CombinationGenerator generator(words, joiners, 2);

  auto values = collect(generator);
  EXPECT_EQ(values, (std::vector<std::string>{"red", "fox", "redfox", "red-fox", "foxred", "fox-red"}));
}

TEST_F(CombinationGeneratorTest, SingleWordsIgnoreJoiners) {
  std::vector<std::string> words = {"a", "b", "c"};
  std::vector<std::string> joiners = {"", "-", "_", "."};
  CombinationGenerator generator(words, joiners, 1);

  auto values = collect(generator);
  EXPECT_EQ(values, (std::vector<std::string>{"a", "b", "c"}));
}

TEST_F(CombinationGeneratorTest, CountMatchesPermutationFormula) {
  std::vector<std::string> words = {"a", "b", "c", "d"};
  std::vector<std::string> joiners = {"", "-"};
  CombinationGenerator generator(words, joiners, 3);

  // P(4,1) + 2*P(4,2) + 2*P(4,3)
  auto values = collect(generator);
  EXPECT_EQ(values.size(), 4u + 2u * 12u + 2u * 24u);

  std::set<std::string> unique(values.begin(), values.end());
  EXPECT_EQ(unique.size(), values.size());
}

TEST_F(CombinationGeneratorTest, LexicographicPermutationOrder) {
  std::vector<std::string> words = {"1", "2", "3"};
  std::vector<std::string> joiners = {""};
  CombinationGenerator generator(words, joiners, 3);

  auto values = collect(generator);
  std::vector<std::string> length_three(values.end() - 6, values.end());
  EXPECT_EQ(length_three, (std::vector<std::string>{"123", "132", "213", "231", "312", "321"}));
}

TEST_F(CombinationGeneratorTest, DuplicateWordsArePositions) {
  std::vector<std::string> words = {"x", "x"};
  std::vector<std::string> joiners = {""};
  CombinationGenerator generator(words, joiners, 2);

  auto values = collect(generator);
  EXPECT_EQ(values, (std::vector<std::string>{"x", "x", "xx", "xx"}));
}

TEST_F(CombinationGeneratorTest, LengthClampedToWordCount) {
  std::vector<std::string> words = {"a", "b"};
  std::vector<std::string> joiners = {""};
  CombinationGenerator generator(words, joiners, 10);

  EXPECT_EQ(collect(generator).size(), 4u);
}

TEST_F(CombinationGeneratorTest, ResetRestartsSequence) {
  std::vector<std::string> words = {"a", "b"};
  std::vector<std::string> joiners = {"", "."};
  CombinationGenerator generator(words, joiners, 2);

  auto first = collect(generator);
  EXPECT_FALSE(generator.next().has_value());

  generator.reset();
  EXPECT_EQ(collect(generator), first);
}

TEST_F(CombinationGeneratorTest, EmptyInputsYieldNothing) {
  std::vector<std::string> no_words;
  std::vector<std::string> joiners = {""};
  CombinationGenerator empty_words(no_words, joiners, 2);
  EXPECT_FALSE(empty_words.next().has_value());

  std::vector<std::string> words = {"a"};
  std::vector<std::string> no_joiners;
  CombinationGenerator empty_joiners(words, no_joiners, 1);
  EXPECT_FALSE(empty_joiners.next().has_value());
}

TEST_F(CombinationGeneratorTest, ShardsPartitionTheStream) {
  std::vector<std::string> words = {"a", "b", "c"};
  std::vector<std::string> joiners = {"", "-"};
  CombinationGenerator full(words, joiners, 3);
  auto all = collect(full);

  std::vector<std::string> merged;
  for (size_t shard = 0; shard < 3; ++shard) {
    CombinationGenerator generator(words, joiners, 3);
    ShardSequence sequence(generator, shard, 3);
    auto part = collect(sequence);
    for (size_t i = 0; i < part.size(); ++i) {
      EXPECT_EQ(part[i], all[shard + 3 * i]);
    }
    merged.insert(merged.end(), part.begin(), part.end());
  }

  std::sort(merged.begin(), merged.end());
  std::sort(all.begin(), all.end());
  EXPECT_EQ(merged, all);
}
