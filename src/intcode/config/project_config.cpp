#include "intcode/config/project_config.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/core.h>
#include <toml++/toml.hpp>

#include "intcode/common/diagnostic.hpp"

namespace intcode::config {

namespace fs = std::filesystem;

namespace {

auto WrongType(
    const fs::path& config_path, std::string_view field,
    std::string_view expected) -> Diagnostic {
  return Diagnostic::HostError(
      fmt::format("{}: {} must be {}", config_path.string(), field, expected));
}

}  // namespace

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / kConfigFileName;
    if (fs::exists(config_path)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      // Reached root
      return std::nullopt;
    }
    dir = parent;
  }
}

auto ParseTopology(std::string_view name) -> std::optional<runtime::Topology> {
  if (name == "chain") {
    return runtime::Topology::kChain;
  }
  if (name == "ring") {
    return runtime::Topology::kRing;
  }
  return std::nullopt;
}

auto LoadConfig(const fs::path& config_path) -> Result<ProjectConfig> {
  ProjectConfig config;
  config.root_dir = config_path.parent_path();

  toml::table tbl;
  try {
    tbl = toml::parse_file(config_path.string());
  } catch (const toml::parse_error& e) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format(
                "failed to parse {}: {}", config_path.string(),
                e.description())));
  }

  // [program] section
  auto program = tbl["program"];
  if (!program) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format(
                "{}: missing [program] section", config_path.string())));
  }

  auto image = program["image"].value<std::string>();
  if (!image) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format(
                "{}: missing required field 'program.image'",
                config_path.string())));
  }
  // Resolve relative paths against config directory
  config.image = *image;
  if (config.image.is_relative()) {
    config.image = config.root_dir / config.image;
  }

  // [network] section (optional)
  if (auto network = tbl["network"]) {
    if (auto node = network["topology"]) {
      auto topology = node.value<std::string>();
      if (!topology) {
        return std::unexpected(
            WrongType(config_path, "network.topology", "a string"));
      }
      config.network.topology = ParseTopology(*topology);
      if (!config.network.topology) {
        return std::unexpected(
            Diagnostic::HostError(
                fmt::format(
                    "{}: unknown network.topology '{}', use 'chain' or "
                    "'ring'",
                    config_path.string(), *topology)));
      }
    }

    if (auto node = network["phases"]) {
      const auto* phases = node.as_array();
      if (phases == nullptr) {
        return std::unexpected(
            WrongType(config_path, "network.phases", "an array of integers"));
      }
      for (const auto& elem : *phases) {
        if (!elem.is_integer()) {
          return std::unexpected(
              Diagnostic::HostError(
                  fmt::format(
                      "{}: network.phases must contain only integers",
                      config_path.string())));
        }
        config.network.phases.push_back(*elem.value<int64_t>());
      }
    }

    if (auto node = network["initial_signal"]) {
      if (!node.is_integer()) {
        return std::unexpected(
            WrongType(config_path, "network.initial_signal", "an integer"));
      }
      config.network.initial_signal = *node.value<int64_t>();
    }
  }

  // [log] section (optional)
  if (auto log = tbl["log"]) {
    if (auto node = log["level"]) {
      auto level = node.value<std::string>();
      if (!level) {
        return std::unexpected(WrongType(config_path, "log.level", "a string"));
      }
      config.log_level = *level;
    }
  }

  return config;
}

}  // namespace intcode::config
