#include <gtest/gtest.h>
#include <fcntl.h>
#include <unistd.h>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <nlohmann/json.hpp>

#include "wlm/cli/application.hpp"
#include "temp_directory.hpp"
#include "test_helpers.hpp"

namespace wlm::cli {

struct CommandOutput {
  int code = 0;
  std::string out;
  std::string err;
};

class GenerateCLITest : public ::testing::Test {
protected:
  void SetUp() override {
    temp_dir_ = std::make_unique<wlm::test::TempDirectory>();
    config_home_ = temp_dir_->path() / "config";
    setenv("XDG_CONFIG_HOME", config_home_.string().c_str(), 1);
  }

  void TearDown() override {
    unsetenv("XDG_CONFIG_HOME");
    temp_dir_.reset();
  }

  // Run one CLI invocation with stdout and stderr captured
  CommandOutput runCommand(const std::vector<std::string>& args) {
    Application app;

    std::vector<char*> argv;
    argv.push_back(const_cast<char*>("wlm"));
    for (const auto& arg : args) {
      argv.push_back(const_cast<char*>(arg.c_str()));
    }

    std::ostringstream cout_output, cerr_output;
    std::streambuf* orig_cout = std::cout.rdbuf();
    std::streambuf* orig_cerr = std::cerr.rdbuf();
    std::cout.rdbuf(cout_output.rdbuf());
    std::cerr.rdbuf(cerr_output.rdbuf());

    CommandOutput output;
    try {
      output.code = app.run(static_cast<int>(argv.size()), argv.data());
    } catch (const std::exception& e) {
      std::cout.rdbuf(orig_cout);
      std::cerr.rdbuf(orig_cerr);
      throw;
    }

    std::cout.rdbuf(orig_cout);
    std::cerr.rdbuf(orig_cerr);

    output.out = cout_output.str();
    output.err = cerr_output.str();
    return output;
  }

  static std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
      lines.push_back(line);
    }
    return lines;
  }

  std::unique_ptr<wlm::test::TempDirectory> temp_dir_;
  std::filesystem::path config_home_;
};

TEST_F(GenerateCLITest, WritesCandidatesToStdoutWithoutOutputFile) {
  auto result = runCommand({"-q", "generate", "-w", "ab,cd", "--joiners", "-",
                            "--cases", "original", "--leet-max-expansions", "0", "--mask", "{base}",
                            "--min-length", "1"});
  EXPECT_EQ(result.code, 0) << result.err;
  EXPECT_EQ(splitLines(result.out), (std::vector<std::string>{"ab", "cd", "ab-cd", "cd-ab"}));
}

TEST_F(GenerateCLITest, MasksAndTokens) {
  auto result = runCommand({"-q", "generate", "-w", "pass", "--cases", "original",
                            "--leet-max-expansions", "0", "--numbers", "1,2", "--symbols", "!",
                            "--mask", "{base}{num}{sym}", "--mask", "{BASE}"});
  EXPECT_EQ(result.code, 0) << result.err;
  EXPECT_EQ(splitLines(result.out), (std::vector<std::string>{"pass1!", "pass2!", "PASS"}));
}

TEST_F(GenerateCLITest, OutputFileAndSummary) {
  auto path = temp_dir_->path() / "out" / "list.txt";
  auto result = runCommand({"generate", "-w", "john,doe", "-o", path.string()});
  EXPECT_EQ(result.code, 0) << result.err;
  EXPECT_TRUE(std::filesystem::exists(path));
  EXPECT_NE(result.out.find("Done. Generated"), std::string::npos);

  auto lines = wlm::test::readLines(path);
  EXPECT_FALSE(lines.empty());
  EXPECT_NE(result.out.find(std::to_string(lines.size()) + " line(s)"), std::string::npos);
}

TEST_F(GenerateCLITest, GzipOutput) {
  auto path = temp_dir_->path() / "list.txt.gz";
  auto result = runCommand({"-q", "generate", "-w", "john", "--max-count", "20",
                            "-o", path.string()});
  EXPECT_EQ(result.code, 0) << result.err;
  EXPECT_EQ(wlm::test::readGzipLines(path).size(), 20u);
}

TEST_F(GenerateCLITest, ExistingOutputNeedsForce) {
  auto path = temp_dir_->createFile("taken.txt", "old\n");

  auto refused = runCommand({"generate", "-w", "john", "-o", path.string()});
  EXPECT_EQ(refused.code, 2);
  EXPECT_NE(refused.err.find("--force"), std::string::npos);
  EXPECT_EQ(wlm::test::readLines(path), (std::vector<std::string>{"old"}));

  auto forced = runCommand({"-q", "generate", "-w", "john", "-o", path.string(), "--force"});
  EXPECT_EQ(forced.code, 0) << forced.err;
  EXPECT_NE(wlm::test::readLines(path), (std::vector<std::string>{"old"}));
}

TEST_F(GenerateCLITest, UnknownPlaceholderIsConfigError) {
  auto result = runCommand({"generate", "-w", "john", "--mask", "{base}{bogus}"});
  EXPECT_EQ(result.code, 1);
  EXPECT_TRUE(result.out.empty());
  EXPECT_NE(result.err.find("{bogus}"), std::string::npos);
}

TEST_F(GenerateCLITest, ErrorsAreUncoloredWhenStderrIsNotATerminal) {
  auto log_path = temp_dir_->path() / "stderr.log";
  int log_fd = ::open(log_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
  ASSERT_GE(log_fd, 0);
  int saved_fd = ::dup(STDERR_FILENO);
  ASSERT_GE(saved_fd, 0);
  ASSERT_GE(::dup2(log_fd, STDERR_FILENO), 0);
  ::close(log_fd);

  auto result = runCommand({"generate", "-w", "john", "--mask", "{base}{bogus}"});

  ::dup2(saved_fd, STDERR_FILENO);
  ::close(saved_fd);

  EXPECT_EQ(result.code, 1);
  EXPECT_NE(result.err.find("{bogus}"), std::string::npos);
  EXPECT_EQ(result.err.find('\033'), std::string::npos) << result.err;
}

TEST_F(GenerateCLITest, MissingWordsIsConfigError) {
  auto result = runCommand({"generate", "--numbers", "1"});
  EXPECT_EQ(result.code, 1);
  EXPECT_NE(result.err.find("No words provided"), std::string::npos);
}

TEST_F(GenerateCLITest, JsonSummaryAndErrors) {
  auto path = temp_dir_->path() / "list.txt";
  auto result = runCommand({"--json", "generate", "-w", "john,doe", "--max-count", "5",
                            "-t", "2", "-o", path.string()});
  ASSERT_EQ(result.code, 0) << result.err;

  auto summary = nlohmann::json::parse(result.out);
  EXPECT_EQ(summary["lines"], 5);
  EXPECT_EQ(summary["workers"], 2);
  EXPECT_EQ(summary["mode"], "threads");
  EXPECT_TRUE(summary["cap_reached"].get<bool>());
  EXPECT_EQ(summary["output"], path.string());

  auto failed = runCommand({"--json", "generate", "-w", "john", "--years", "soon"});
  EXPECT_EQ(failed.code, 1);
  auto error = nlohmann::json::parse(failed.err);
  EXPECT_EQ(error["code"], "Configuration error");
  EXPECT_EQ(error["exit_code"], 1);
}

TEST_F(GenerateCLITest, ProcessModeHonorsMaxCount) {
  auto path = temp_dir_->path() / "procs.txt";
  auto result = runCommand({"-q", "generate", "-w", "john,doe,acme", "--processes", "-t", "3",
                            "--max-count", "100", "-o", path.string()});
  EXPECT_EQ(result.code, 0) << result.err;
  EXPECT_EQ(wlm::test::readLines(path).size(), 100u);
}

TEST_F(GenerateCLITest, ConfigFileProvidesDefaults) {
  auto config_file = temp_dir_->createFile("custom.toml",
      "numbers = \"9\"\nsymbols = \"\"\ncases = \"upper\"\nleet = \"\"\n"
      "masks = [\"{base}{num}\"]\nmin_length = 1\n");

  auto result = runCommand({"-q", "--config", config_file.string(), "generate", "-w", "ab"});
  EXPECT_EQ(result.code, 0) << result.err;
  EXPECT_EQ(splitLines(result.out), (std::vector<std::string>{"AB9"}));

  auto overridden = runCommand({"-q", "--config", config_file.string(), "generate",
                                "-w", "ab", "--numbers", "7"});
  EXPECT_EQ(splitLines(overridden.out), (std::vector<std::string>{"AB7"}));
}

TEST_F(GenerateCLITest, MissingExplicitConfigFails) {
  auto result = runCommand({"--config", (temp_dir_->path() / "none.toml").string(),
                            "generate", "-w", "ab"});
  EXPECT_EQ(result.code, 2);
}

TEST_F(GenerateCLITest, ConfigInitPathShow) {
  auto expected = config_home_ / "wlm" / "config.toml";

  auto path = runCommand({"config", "path"});
  EXPECT_EQ(path.code, 0);
  EXPECT_NE(path.out.find(expected.string()), std::string::npos);

  auto init = runCommand({"config", "init"});
  EXPECT_EQ(init.code, 0) << init.err;
  EXPECT_TRUE(std::filesystem::exists(expected));

  auto again = runCommand({"config", "init"});
  EXPECT_EQ(again.code, 2);

  auto forced = runCommand({"config", "init", "--force"});
  EXPECT_EQ(forced.code, 0) << forced.err;

  auto show = runCommand({"--json", "config", "show"});
  EXPECT_EQ(show.code, 0) << show.err;
  auto json = nlohmann::json::parse(show.out);
  EXPECT_EQ(json["workers"], 4);
  EXPECT_EQ(json["mode"], "threads");
}

}  // namespace wlm::cli
