#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "intcode/common/diagnostic.hpp"
#include "intcode/runtime/network.hpp"
#include "intcode/vm/word.hpp"

namespace intcode::config {

inline constexpr const char* kConfigFileName = "intcode.toml";

struct NetworkConfig {
  std::optional<runtime::Topology> topology;
  std::vector<Word> phases;
  std::optional<Word> initial_signal;
};

struct ProjectConfig {
  // Program image, resolved against the config directory
  std::filesystem::path image;
  NetworkConfig network;
  // spdlog level name
  std::optional<std::string> log_level;

  // Directory where intcode.toml was found
  std::filesystem::path root_dir;
};

// Search for intcode.toml starting from dir, going up to parent dirs.
// Returns nullopt if not found.
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse intcode.toml.
// Returns error Diagnostic on parse errors, missing required fields or
// values of the wrong type.
auto LoadConfig(const std::filesystem::path& config_path)
    -> Result<ProjectConfig>;

auto ParseTopology(std::string_view name) -> std::optional<runtime::Topology>;

}  // namespace intcode::config
