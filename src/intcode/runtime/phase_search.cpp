#include "intcode/runtime/phase_search.hpp"

#include <algorithm>
#include <expected>
#include <optional>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "intcode/common/diagnostic.hpp"
#include "intcode/runtime/network.hpp"

namespace intcode::runtime {

auto FindMaxSignal(
    const std::vector<Word>& image, std::vector<Word> phase_set,
    Topology topology, Word initial_signal) -> Result<PhaseSearchResult> {
  if (phase_set.empty()) {
    return std::unexpected(
        Diagnostic::HostError("phase search needs at least one phase value"));
  }

  std::ranges::sort(phase_set);
  std::optional<PhaseSearchResult> best;
  std::size_t tried = 0;

  do {
    auto network =
        ProcessNetwork::Replicated(image, phase_set, topology, initial_signal);
    auto outcome = network.Run();
    if (!outcome) {
      return std::unexpected(
          std::move(outcome.error())
              .WithNote(
                  fmt::format("with phases {}", fmt::join(phase_set, ","))));
    }
    ++tried;
    spdlog::debug(
        "phases {} -> {}", fmt::join(phase_set, ","), outcome->final_signal);
    if (!best || outcome->final_signal > best->signal) {
      best = PhaseSearchResult{
          .signal = outcome->final_signal, .phases = phase_set};
    }
  } while (std::ranges::next_permutation(phase_set).found);

  best->permutations_tried = tried;
  return *best;
}

}  // namespace intcode::runtime
