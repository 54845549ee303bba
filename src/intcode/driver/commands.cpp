#include "commands.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "input.hpp"
#include "intcode/common/diagnostic.hpp"
#include "intcode/config/project_config.hpp"
#include "intcode/program/image_loader.hpp"
#include "intcode/robot/painting_robot.hpp"
#include "intcode/runtime/network.hpp"
#include "intcode/runtime/phase_search.hpp"
#include "intcode/vm/disassembler.hpp"
#include "intcode/vm/engine.hpp"
#include "intcode/vm/interactive_io.hpp"
#include "intcode/vm/scripted_io.hpp"
#include "print.hpp"

namespace intcode::driver {

namespace {

// Phase sets searched when no explicit phases are given
const std::vector<Word> kChainPhaseSet = {0, 1, 2, 3, 4};
const std::vector<Word> kRingPhaseSet = {5, 6, 7, 8, 9};

struct AmplifierSettings {
  runtime::Topology topology = runtime::Topology::kChain;
  std::vector<Word> phases;
  Word initial_signal = 0;
};

auto ResolveAmplifierSettings(
    const argparse::ArgumentParser& cmd,
    const std::optional<config::ProjectConfig>& config)
    -> Result<AmplifierSettings> {
  AmplifierSettings settings;

  if (cmd.get<bool>("--feedback")) {
    settings.topology = runtime::Topology::kRing;
  } else if (config && config->network.topology) {
    settings.topology = *config->network.topology;
  }

  if (auto phases = cmd.present<std::string>("--phases")) {
    auto parsed = program::ParseWordList(*phases);
    if (!parsed) {
      return std::unexpected(
          std::move(parsed.error()).WithNote("in --phases"));
    }
    settings.phases = std::move(*parsed);
  } else if (config) {
    settings.phases = config->network.phases;
  }

  if (auto signal = cmd.present<int64_t>("--signal")) {
    settings.initial_signal = *signal;
  } else if (config && config->network.initial_signal) {
    settings.initial_signal = *config->network.initial_signal;
  }
  return settings;
}

void PrintOutputs(const std::vector<Word>& outputs) {
  for (Word value : outputs) {
    fmt::print("{}\n", value);
  }
}

}  // namespace

auto RunCommand(
    const argparse::ArgumentParser& cmd,
    const std::optional<config::ProjectConfig>& config) -> int {
  auto input = PrepareInput(cmd, config);
  if (!input) {
    PrintDiagnostic(input.error());
    return 1;
  }

  if (auto scripted = cmd.present<std::string>("--input")) {
    auto words = program::ParseWordList(*scripted);
    if (!words) {
      PrintDiagnostic(std::move(words.error()).WithNote("in --input"));
      return 1;
    }

    vm::ScriptedIo io(std::move(*words));
    vm::Engine engine(std::move(input->image), io);
    auto result = engine.Run();
    // Outputs produced before a fault are still reported
    PrintOutputs(io.Outputs());
    if (!result) {
      PrintDiagnostic(result.error());
      return 1;
    }
    spdlog::debug(
        "engine {} after {} step(s)", vm::ToString(*result),
        engine.StepsExecuted());
    return 0;
  }

  vm::InteractiveIo io;
  vm::Engine engine(std::move(input->image), io);
  auto result = engine.Run();
  if (!result) {
    PrintDiagnostic(result.error());
    return 1;
  }
  if (*result == vm::ExitReason::kInputClosed) {
    PrintWarning("input closed before the program halted");
  }
  spdlog::debug(
      "engine {} after {} step(s)", vm::ToString(*result),
      engine.StepsExecuted());
  return 0;
}

auto AmplifyCommand(
    const argparse::ArgumentParser& cmd,
    const std::optional<config::ProjectConfig>& config) -> int {
  auto input = PrepareInput(cmd, config);
  if (!input) {
    PrintDiagnostic(input.error());
    return 1;
  }

  auto settings = ResolveAmplifierSettings(cmd, config);
  if (!settings) {
    PrintDiagnostic(settings.error());
    return 1;
  }

  if (!settings->phases.empty()) {
    auto network = runtime::ProcessNetwork::Replicated(
        input->image, settings->phases, settings->topology,
        settings->initial_signal);
    auto outcome = network.Run();
    if (!outcome) {
      PrintDiagnostic(outcome.error());
      return 1;
    }
    fmt::print("{}\n", outcome->final_signal);
    return 0;
  }

  const auto& phase_set = settings->topology == runtime::Topology::kRing
                              ? kRingPhaseSet
                              : kChainPhaseSet;
  auto best = runtime::FindMaxSignal(
      input->image, phase_set, settings->topology, settings->initial_signal);
  if (!best) {
    PrintDiagnostic(best.error());
    return 1;
  }
  spdlog::debug(
      "searched {} {} ordering(s)", best->permutations_tried,
      runtime::ToString(settings->topology));
  fmt::print("{} (phases {})\n", best->signal, fmt::join(best->phases, ","));
  return 0;
}

auto PaintCommand(
    const argparse::ArgumentParser& cmd,
    const std::optional<config::ProjectConfig>& config) -> int {
  auto input = PrepareInput(cmd, config);
  if (!input) {
    PrintDiagnostic(input.error());
    return 1;
  }

  robot::PaintingRobot robot;
  if (cmd.get<bool>("--start-white")) {
    robot.SetPanel(robot::Point{}, robot::Color::kWhite);
  }

  vm::Engine engine(std::move(input->image), robot);
  auto result = engine.Run();
  if (!result) {
    PrintDiagnostic(result.error());
    return 1;
  }

  fmt::print("{}\n", robot.PaintedCount());
  if (cmd.get<bool>("--render")) {
    fmt::print("{}", robot.RenderPbm());
  }
  return 0;
}

auto DumpCommand(
    const argparse::ArgumentParser& cmd,
    const std::optional<config::ProjectConfig>& config) -> int {
  auto input = PrepareInput(cmd, config);
  if (!input) {
    PrintDiagnostic(input.error());
    return 1;
  }

  fmt::print("{}", vm::FormatListing(vm::Disassemble(input->image)));
  return 0;
}

}  // namespace intcode::driver
