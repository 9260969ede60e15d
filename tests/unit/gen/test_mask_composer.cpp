#include <gtest/gtest.h>

#include "wlm/gen/mask_composer.hpp"
#include "test_helpers.hpp"

using namespace wlm::gen;
using namespace wlm::test;
using wlm::ErrorCode;
using wlm::config::CaseMode;

class MaskComposerTest : public ::testing::Test {
 protected:
  std::vector<std::string> compose(const std::vector<std::string>& mask_texts,
                                   const wlm::config::GenerationConfig& config,
                                   const std::string& base) {
    auto masks = compileMasks(mask_texts);
    EXPECT_TRUE(masks.has_value());
    if (!masks) {
      return {};
    }
    compiled_ = std::move(*masks);
    MaskComposer composer(compiled_, config);
    composer.assign(base);
    return collect(composer);
  }

  std::vector<MaskTemplate> compiled_;
};

TEST_F(MaskComposerTest, BaseWithNumbers) {
  auto config = plainConfig({"pass"});
  config.numbers = {"1", "2"};

  EXPECT_EQ(compose({"{base}{num}"}, config, "pass"), (std::vector<std::string>{"pass1", "pass2"}));
}

TEST_F(MaskComposerTest, LastPlaceholderVariesFastest) {
  auto config = plainConfig({"x"});
  config.numbers = {"1", "2"};
  config.symbols = {"!", "@"};

  EXPECT_EQ(compose({"{sym}{base}{num}"}, config, "x"),
            (std::vector<std::string>{"!x1", "!x2", "@x1", "@x2"}));
}

TEST_F(MaskComposerTest, RepeatedPlaceholderSharesValue) {
  auto config = plainConfig({"x"});
  config.numbers = {"1", "2"};

  EXPECT_EQ(compose({"{num}{base}{num}"}, config, "x"), (std::vector<std::string>{"1x1", "2x2"}));
}

TEST_F(MaskComposerTest, EmptyTokenOmitsSlot) {
  auto config = plainConfig({"x"});
  config.numbers = {"", "7"};

  EXPECT_EQ(compose({"{base}{num}"}, config, "x"), (std::vector<std::string>{"x", "x7"}));
}

TEST_F(MaskComposerTest, EmptyValueSetSkipsMask) {
  auto config = plainConfig({"x"});
  config.numbers = {"1"};
  config.years = {};

  EXPECT_EQ(compose({"{base}{year}", "{base}{num}"}, config, "x"), (std::vector<std::string>{"x1"}));
}

TEST_F(MaskComposerTest, DerivedPlaceholders) {
  auto config = plainConfig({"red_fox"});
  config.years = {"2024"};

  EXPECT_EQ(compose({"{Base}{year}", "{BASE}", "{camel}"}, config, "red_fox"),
            (std::vector<std::string>{"Red_fox2024", "RED_FOX", "Red_Fox"}));
}

TEST_F(MaskComposerTest, DerivedPlaceholdersAreNotLeetExpanded) {
  auto config = plainConfig({"sea"});
  config.leet = {{U'e', {"3"}}};

  EXPECT_EQ(compose({"{Base}", "{base}"}, config, "sea"),
            (std::vector<std::string>{"Sea", "sea", "s3a"}));
}

TEST_F(MaskComposerTest, LiteralTextKept) {
  auto config = plainConfig({"x"});
  config.numbers = {"1"};

  EXPECT_EQ(compose({"<{base}>-{num}", "static"}, config, "x"),
            (std::vector<std::string>{"<x>-1", "static"}));
}

TEST_F(MaskComposerTest, UnknownPlaceholderIsInvalidMask) {
  EXPECT_ERROR(MaskTemplate::parse("{base}{foo}"), ErrorCode::kInvalidMask);
  EXPECT_ERROR(compileMasks({"{base}", "{Num}"}), ErrorCode::kInvalidMask);

  auto result = MaskTemplate::parse("{bogus}");
  ASSERT_FALSE(result.has_value());
  EXPECT_TRUE(result.error().isConfigError());
  EXPECT_NE(result.error().message().find("{bogus}"), std::string::npos);
}

TEST_F(MaskComposerTest, UnclosedBraceIsLiteral) {
  auto mask = MaskTemplate::parse("{base}{num");
  ASSERT_OK(mask);
  EXPECT_EQ(mask->placeholders(), (std::vector<Placeholder>{Placeholder::kBase}));

  auto config = plainConfig({"x"});
  EXPECT_EQ(compose({"{base}{num"}, config, "x"), (std::vector<std::string>{"x{num"}));
}

TEST_F(MaskComposerTest, PlaceholdersInCanonicalOrder) {
  auto mask = MaskTemplate::parse("{year}{sym}{base}{year}");
  ASSERT_OK(mask);
  EXPECT_EQ(mask->placeholders(),
            (std::vector<Placeholder>{Placeholder::kBase, Placeholder::kSym, Placeholder::kYear}));
}

TEST_F(MaskComposerTest, DefaultMasksCompile) {
  auto masks = compileMasks(wlm::config::GenerationConfig::defaultMasks());
  ASSERT_OK(masks);
  EXPECT_EQ(masks->size(), 6u);
}

TEST_F(MaskComposerTest, CaseVariantsCrossTokens) {
  auto config = plainConfig({"ab"});
  config.cases = {CaseMode::kOriginal, CaseMode::kUpper};
  config.symbols = {"!"};

  EXPECT_EQ(compose({"{base}{sym}"}, config, "ab"), (std::vector<std::string>{"ab!", "AB!"}));
}
