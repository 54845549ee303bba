#pragma once

#include <filesystem>
#include <gtest/gtest.h>
#include <optional>
#include <string>
#include <vector>

namespace intcode::test {

// Result of running a CLI command
struct CliResult {
  int exit_code;
  std::string stdout_output;
  std::string combined_output;  // stdout + stderr interleaved

  [[nodiscard]] auto Success() const -> bool {
    return exit_code == 0;
  }

  [[nodiscard]] auto Contains(const std::string& text) const -> bool {
    return combined_output.find(text) != std::string::npos;
  }
};

// Test fixture for CLI integration tests
//
// Provides utilities for:
// - Running the intcode binary with arguments
// - Managing temporary directories for test isolation
// - Creating program images and intcode.toml files
//
// Usage:
//   TEST_F(RunTest, Echo) {
//     WriteFile("echo.txt", "3,0,4,0,99");
//     auto result = Run({"run", "echo.txt", "--input", "5"});
//     EXPECT_EQ(result.stdout_output, "5\n");
//   }
//
class CliTestFixture : public ::testing::Test {
 protected:
  void SetUp() override;
  void TearDown() override;

  // Run intcode with given arguments from the test directory
  auto Run(std::initializer_list<std::string> args) -> CliResult;
  auto Run(const std::vector<std::string>& args) -> CliResult;

  // Run intcode from a specific directory
  auto RunIn(
      const std::filesystem::path& dir, std::initializer_list<std::string> args)
      -> CliResult;

  // Run intcode with the given text on stdin
  auto RunWithStdin(
      std::initializer_list<std::string> args, const std::string& stdin_text)
      -> CliResult;

  // Create a file in the test directory
  void WriteFile(
      const std::filesystem::path& relative_path, const std::string& content);

  // Create an intcode.toml naming the program image, plus optional extra
  // sections appended verbatim
  void WriteConfig(
      const std::string& image, const std::string& extra_sections = "");

  // Get path to test directory
  [[nodiscard]] auto TestDir() const -> const std::filesystem::path& {
    return test_dir_;
  }

 private:
  std::filesystem::path test_dir_;
  std::filesystem::path intcode_bin_;

  auto RunImpl(
      const std::filesystem::path& working_dir,
      const std::vector<std::string>& args,
      const std::optional<std::filesystem::path>& stdin_file) -> CliResult;
};

}  // namespace intcode::test
