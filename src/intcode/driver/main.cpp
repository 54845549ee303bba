#include <argparse/argparse.hpp>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>

#include <fmt/core.h>

#include "commands.hpp"
#include "input.hpp"
#include "intcode/config/project_config.hpp"
#include "print.hpp"

namespace {

namespace fs = std::filesystem;

}  // namespace

auto main(int argc, char* argv[]) -> int {
  argparse::ArgumentParser program("intcode", "0.1.0");
  program.add_description("Intcode virtual machine and process network");
  program.add_argument("-C").help("Run as if started in <dir>").metavar("dir");

  int verbosity = 0;
  program.add_argument("-v", "--verbose")
      .action([&](const auto&) { ++verbosity; })
      .append()
      .default_value(false)
      .implicit_value(true)
      .nargs(0)
      .help("Increase log verbosity (repeatable)");

  // Subcommand: run
  argparse::ArgumentParser run_cmd("run");
  run_cmd.add_description("Run a program on the console or scripted input");
  run_cmd.add_argument("--input")
      .metavar("a,b,...")
      .help("Feed these words as input and print outputs one per line");
  intcode::driver::AddProgramFlags(run_cmd);

  // Subcommand: amplify
  argparse::ArgumentParser amplify_cmd("amplify");
  amplify_cmd.add_description(
      "Run copies of a program as a chain or feedback ring of engines");
  amplify_cmd.add_argument("--phases")
      .metavar("a,b,...")
      .help("Phase per engine (searches every ordering if not specified)");
  amplify_cmd.add_argument("--feedback")
      .default_value(false)
      .implicit_value(true)
      .help("Wire the last engine back to the first");
  amplify_cmd.add_argument("--signal")
      .scan<'i', int64_t>()
      .help("Initial signal for the first engine (default 0)");
  intcode::driver::AddProgramFlags(amplify_cmd);

  // Subcommand: paint
  argparse::ArgumentParser paint_cmd("paint");
  paint_cmd.add_description("Drive the hull-painting robot");
  paint_cmd.add_argument("--start-white")
      .default_value(false)
      .implicit_value(true)
      .help("Start on a white panel");
  paint_cmd.add_argument("--render")
      .default_value(false)
      .implicit_value(true)
      .help("Print the painted hull as a PBM image");
  intcode::driver::AddProgramFlags(paint_cmd);

  // Subcommand: dump
  argparse::ArgumentParser dump_cmd("dump");
  dump_cmd.add_description("Disassemble a program image (for debugging)");
  intcode::driver::AddProgramFlags(dump_cmd);

  program.add_subparser(run_cmd);
  program.add_subparser(amplify_cmd);
  program.add_subparser(paint_cmd);
  program.add_subparser(dump_cmd);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& err) {
    intcode::driver::PrintError(err.what());
    std::cerr << program;
    return 1;
  }

  // Handle -C before looking for intcode.toml
  if (auto dir = program.present("-C")) {
    std::error_code ec;
    fs::current_path(*dir, ec);
    if (ec) {
      intcode::driver::PrintError(
          fmt::format("cannot change to '{}': {}", *dir, ec.message()));
      return 1;
    }
  }

  auto config = intcode::driver::LoadOptionalConfig();
  if (!config) {
    intcode::driver::PrintDiagnostic(config.error());
    return 1;
  }

  auto logging = intcode::driver::ConfigureLogging(verbosity, *config);
  if (!logging) {
    intcode::driver::PrintDiagnostic(logging.error());
    return 1;
  }

  if (program.is_subcommand_used("run")) {
    return intcode::driver::RunCommand(run_cmd, *config);
  }

  if (program.is_subcommand_used("amplify")) {
    return intcode::driver::AmplifyCommand(amplify_cmd, *config);
  }

  if (program.is_subcommand_used("paint")) {
    return intcode::driver::PaintCommand(paint_cmd, *config);
  }

  if (program.is_subcommand_used("dump")) {
    return intcode::driver::DumpCommand(dump_cmd, *config);
  }

  // No subcommand provided
  std::cout << program;
  return 0;
}
