#include "input.hpp"

#include <expected>
#include <filesystem>
#include <optional>
#include <string>

#include <fmt/core.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "argparse/argparse.hpp"
#include "intcode/common/diagnostic.hpp"
#include "intcode/config/project_config.hpp"
#include "intcode/program/image_loader.hpp"

namespace intcode::driver {

namespace fs = std::filesystem;

void AddProgramFlags(argparse::ArgumentParser& cmd) {
  cmd.add_argument("program").nargs(0, 1).help(
      "Program image (uses intcode.toml if not specified)");
}

auto LoadOptionalConfig() -> Result<std::optional<config::ProjectConfig>> {
  auto config_path = config::FindConfig();
  if (!config_path) {
    return std::optional<config::ProjectConfig>{};
  }
  auto config = config::LoadConfig(*config_path);
  if (!config) {
    return std::unexpected(config.error());
  }
  return std::optional<config::ProjectConfig>{std::move(*config)};
}

auto PrepareInput(
    const argparse::ArgumentParser& cmd,
    const std::optional<config::ProjectConfig>& config)
    -> Result<ProgramInput> {
  ProgramInput input;

  // Program: CLI replaces config
  if (auto program = cmd.present<std::string>("program")) {
    input.image_path = fs::absolute(*program);
  } else if (config) {
    input.image_path = config->image;
  } else {
    return std::unexpected(
        Diagnostic::HostError("no program image")
            .WithNote(
                fmt::format(
                    "pass a program path or create {}",
                    config::kConfigFileName)));
  }

  auto image = program::LoadImageFile(input.image_path);
  if (!image) {
    return std::unexpected(image.error());
  }
  input.image = std::move(*image);
  spdlog::debug(
      "loaded {} word(s) from {}", input.image.size(),
      input.image_path.string());
  return input;
}

auto ConfigureLogging(
    int verbosity, const std::optional<config::ProjectConfig>& config)
    -> Result<void> {
  auto level = spdlog::level::info;
  if (verbosity >= 2) {
    level = spdlog::level::trace;
  } else if (verbosity == 1) {
    level = spdlog::level::debug;
  } else if (config && config->log_level) {
    const std::string& name = *config->log_level;
    level = spdlog::level::from_str(name);
    // from_str maps unknown names to off
    if (level == spdlog::level::off && name != "off") {
      return std::unexpected(
          Diagnostic::HostError(
              fmt::format(
                  "unknown log level '{}' in {}", name,
                  config::kConfigFileName))
              .WithNote(
                  "use trace, debug, info, warn, error, critical or off"));
    }
  }

  // Logs go to stderr; stdout carries program results only.
  auto logger = spdlog::get("intcode");
  if (!logger) {
    logger = spdlog::stderr_color_mt("intcode");
  }
  spdlog::set_default_logger(logger);
  spdlog::set_level(level);
  return {};
}

}  // namespace intcode::driver
