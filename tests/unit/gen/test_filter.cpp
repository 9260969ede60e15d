#include <gtest/gtest.h>

#include <cmath>

#include "wlm/gen/filter.hpp"

using namespace wlm::gen;

class FilterTest : public ::testing::Test {
 protected:
  std::unordered_set<std::string> blacklist_;
};

TEST_F(FilterTest, ShannonEntropy) {
  EXPECT_DOUBLE_EQ(shannonEntropy("aaaa"), 0.0);
  EXPECT_DOUBLE_EQ(shannonEntropy("ab"), 1.0);
  EXPECT_DOUBLE_EQ(shannonEntropy(""), 0.0);
  EXPECT_DOUBLE_EQ(shannonEntropy("a"), 0.0);
  EXPECT_DOUBLE_EQ(shannonEntropy("abcd"), 2.0);
  EXPECT_NEAR(shannonEntropy("aab"), -(2.0 / 3.0) * std::log2(2.0 / 3.0) - (1.0 / 3.0) * std::log2(1.0 / 3.0), 1e-12);
}

TEST_F(FilterTest, EntropyCountsCodePoints) {
  // Two distinct code points, each two bytes in UTF-8
  EXPECT_DOUBLE_EQ(shannonEntropy("éü"), 1.0);
  EXPECT_DOUBLE_EQ(shannonEntropy("éé"), 0.0);
}

TEST_F(FilterTest, LengthBoundsAreInclusive) {
  CandidateFilter filter(4, 6, 0.0, blacklist_);

  EXPECT_FALSE(filter.accepts("abc"));
  EXPECT_TRUE(filter.accepts("abcd"));
  EXPECT_TRUE(filter.accepts("abcdef"));
  EXPECT_FALSE(filter.accepts("abcdefg"));
}

TEST_F(FilterTest, LengthCountsCodePoints) {
  CandidateFilter filter(4, 4, 0.0, blacklist_);
  EXPECT_TRUE(filter.accepts("ñaña"));
}

TEST_F(FilterTest, EntropyThreshold) {
  CandidateFilter filter(0, 64, 1.5, blacklist_);

  EXPECT_FALSE(filter.accepts("aaaaaaaa"));
  EXPECT_FALSE(filter.accepts("abab"));
  EXPECT_TRUE(filter.accepts("abcd"));
}

TEST_F(FilterTest, Blacklist) {
  blacklist_ = {"password1", "letmein"};
  CandidateFilter filter(0, 64, 0.0, blacklist_);

  EXPECT_FALSE(filter.accepts("password1"));
  EXPECT_FALSE(filter.accepts("letmein"));
  EXPECT_TRUE(filter.accepts("password2"));
}

TEST_F(FilterTest, FromConfig) {
  wlm::config::GenerationConfig config;
  config.min_length = 2;
  config.max_length = 3;
  config.blacklist = {"abc"};
  CandidateFilter filter(config);

  EXPECT_FALSE(filter.accepts("a"));
  EXPECT_TRUE(filter.accepts("ab"));
  EXPECT_FALSE(filter.accepts("abc"));
}
