#pragma once

#include <argparse/argparse.hpp>
#include <optional>

#include "intcode/config/project_config.hpp"

namespace intcode::driver {

// Each command returns the process exit code. Failures are printed to stderr.

// Run one engine, interactively or on a scripted --input list.
auto RunCommand(
    const argparse::ArgumentParser& cmd,
    const std::optional<config::ProjectConfig>& config) -> int;

// Run a chain or feedback ring of engines, or search every phase ordering.
auto AmplifyCommand(
    const argparse::ArgumentParser& cmd,
    const std::optional<config::ProjectConfig>& config) -> int;

// Drive the painting robot with the program.
auto PaintCommand(
    const argparse::ArgumentParser& cmd,
    const std::optional<config::ProjectConfig>& config) -> int;

// Print a disassembly listing of the program image.
auto DumpCommand(
    const argparse::ArgumentParser& cmd,
    const std::optional<config::ProjectConfig>& config) -> int;

}  // namespace intcode::driver
