#include <gtest/gtest.h>

#include <fstream>

#include "wlm/config/config.hpp"
#include "test_helpers.hpp"

using namespace wlm::config;
using namespace wlm::test;
using wlm::ErrorCode;

class ConfigTest : public TempDirTest {
 protected:
  std::filesystem::path writeConfig(const std::string& content) {
    auto path = temp_dir_ / "config.toml";
    std::ofstream out(path);
    out << content;
    return path;
  }
};

TEST_F(ConfigTest, DefaultsMatchDocumentedValues) {
  Config config;
  EXPECT_EQ(config.joiners, ",-,_,.");
  EXPECT_EQ(config.cases, "original,lower,upper,title,invert");
  EXPECT_EQ(config.numbers, "1,12,123,2025,007");
  EXPECT_EQ(config.symbols, "!,@,#,$");
  EXPECT_EQ(config.leet, "a=@,4;s=$,5;e=3;i=1;o=0");
  EXPECT_EQ(config.leet_max_expansions, 4);
  EXPECT_EQ(config.min_length, 4);
  EXPECT_EQ(config.max_length, 64);
  EXPECT_EQ(config.workers, 4);
  EXPECT_EQ(config.mode, "threads");
  EXPECT_FALSE(config.max_count.has_value());
  EXPECT_OK(config.validate());
}

TEST_F(ConfigTest, LoadOverridesPresentKeysOnly) {
  auto path = writeConfig(R"(
numbers = "7,77"
masks = ["{base}{num}", "{camel},{year}"]
min_entropy = 2
max_count = 500
mode = "processes"
progress = true
)");

  Config config;
  ASSERT_OK(config.load(path));
  EXPECT_EQ(config.numbers, "7,77");
  EXPECT_EQ(config.masks, (std::vector<std::string>{"{base}{num}", "{camel},{year}"}));
  EXPECT_DOUBLE_EQ(config.min_entropy, 2.0);
  ASSERT_TRUE(config.max_count.has_value());
  EXPECT_EQ(*config.max_count, 500);
  EXPECT_EQ(config.mode, "processes");
  EXPECT_TRUE(config.progress);
  EXPECT_EQ(config.symbols, "!,@,#,$");
  EXPECT_EQ(config.path(), path);
}

TEST_F(ConfigTest, WrongTypeIsConfigError) {
  auto path = writeConfig("workers = \"four\"\n");
  Config config;
  EXPECT_ERROR(config.load(path), ErrorCode::kConfigError);
}

TEST_F(ConfigTest, MalformedTomlIsParseError) {
  auto path = writeConfig("numbers = [unclosed\n");
  Config config;
  EXPECT_ERROR(config.load(path), ErrorCode::kParseError);
}

TEST_F(ConfigTest, OutOfRangeValuesFailValidation) {
  Config config;
  EXPECT_ERROR(config.load(writeConfig("min_length = 10\nmax_length = 5\n")),
               ErrorCode::kConfigError);

  Config other;
  EXPECT_ERROR(other.load(writeConfig("mode = \"fibers\"\n")), ErrorCode::kConfigError);

  Config level;
  EXPECT_ERROR(level.load(writeConfig("log_level = \"chatty\"\n")), ErrorCode::kConfigError);
}

TEST_F(ConfigTest, MissingExplicitFileIsError) {
  EXPECT_ERROR(Config::loadOrDefault(temp_dir_ / "absent.toml"), ErrorCode::kFileNotFound);
}

TEST_F(ConfigTest, SaveThenLoadPreservesValues) {
  Config config;
  config.years = "last:3";
  config.masks = {"{sym}{Base}"};
  config.max_count = 42;
  config.workers = 2;

  auto path = temp_dir_ / "nested" / "config.toml";
  ASSERT_OK(config.save(path));
  EXPECT_FALSE(std::filesystem::exists(path.string() + ".tmp"));

  Config loaded;
  ASSERT_OK(loaded.load(path));
  EXPECT_EQ(loaded.years, "last:3");
  EXPECT_EQ(loaded.masks, (std::vector<std::string>{"{sym}{Base}"}));
  ASSERT_TRUE(loaded.max_count.has_value());
  EXPECT_EQ(*loaded.max_count, 42);
  EXPECT_EQ(loaded.workers, 2);
}

TEST_F(ConfigTest, ApplyToParsesListOptions) {
  Config config;
  config.joiners = "-";
  config.numbers = "1,2";
  config.years = "2000-2001";
  config.leet = "";
  config.max_count = 10;
  config.mode = "processes";

  GenerationConfig generation;
  ASSERT_OK(config.applyTo(generation));
  EXPECT_EQ(generation.joiners, (std::vector<std::string>{"-"}));
  EXPECT_EQ(generation.numbers, (std::vector<std::string>{"1", "2"}));
  EXPECT_EQ(generation.years, (std::vector<std::string>{"2000", "2001"}));
  EXPECT_TRUE(generation.leet.empty());
  ASSERT_TRUE(generation.max_count.has_value());
  EXPECT_EQ(*generation.max_count, 10u);
  EXPECT_EQ(generation.mode, ExecutionMode::kProcesses);
  EXPECT_EQ(generation.cases.size(), 5u);
}

TEST_F(ConfigTest, ApplyToRejectsMalformedLists) {
  Config config;
  config.leet = "a";
  GenerationConfig generation;
  EXPECT_ERROR(config.applyTo(generation), ErrorCode::kConfigError);
}
