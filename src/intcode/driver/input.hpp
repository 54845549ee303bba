#pragma once

#include <argparse/argparse.hpp>
#include <filesystem>
#include <optional>
#include <vector>

#include "intcode/common/diagnostic.hpp"
#include "intcode/config/project_config.hpp"
#include "intcode/vm/word.hpp"

namespace intcode::driver {

// Everything a command needs about the program it runs.
struct ProgramInput {
  std::filesystem::path image_path;
  std::vector<Word> image;
};

// Add the optional positional program path to a subcommand.
void AddProgramFlags(argparse::ArgumentParser& cmd);

// Load intcode.toml if one is found from the current directory upward.
// A config that exists but fails to parse is an error.
auto LoadOptionalConfig() -> Result<std::optional<config::ProjectConfig>>;

// Resolve the program path (CLI overrides config) and load its image.
auto PrepareInput(
    const argparse::ArgumentParser& cmd,
    const std::optional<config::ProjectConfig>& config)
    -> Result<ProgramInput>;

// Set the spdlog level: each -v raises it (debug, then trace); without -v the
// config's [log] level applies, defaulting to info.
auto ConfigureLogging(
    int verbosity, const std::optional<config::ProjectConfig>& config)
    -> Result<void>;

}  // namespace intcode::driver
