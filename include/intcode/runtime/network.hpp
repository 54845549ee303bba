#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "intcode/common/diagnostic.hpp"
#include "intcode/vm/engine.hpp"
#include "intcode/vm/word.hpp"

namespace intcode::runtime {

enum class Topology : uint8_t {
  kChain,  // Last engine's output goes only to the observer
  kRing,   // Observer forwards the last engine's output back to the first
};

// How one member of a network finished. Exactly one of exit_reason and
// failure is set.
struct EngineReport {
  std::size_t index = 0;
  Word phase = 0;
  std::optional<vm::ExitReason> exit_reason;
  std::optional<Diagnostic> failure;
  uint64_t steps_executed = 0;
  std::size_t dropped_outputs = 0;
};

struct NetworkOutcome {
  // Last value observed on the final engine's output
  Word final_signal = 0;
  // Every value observed on the final engine's output, in order
  std::vector<Word> observed;
  std::vector<EngineReport> engines;
};

// N engines wired so that engine i feeds engine i + 1. Each engine's inbound
// channel is primed with its phase; the first engine then receives the initial
// signal from outside. Every engine runs on its own thread and the calling
// thread acts as the observer of the last engine's output.
class ProcessNetwork {
 public:
  ProcessNetwork(
      std::vector<std::vector<Word>> images, std::vector<Word> phases,
      Topology topology, Word initial_signal = 0);

  // N copies of one image, N = phases.size()
  static auto Replicated(
      const std::vector<Word>& image, std::vector<Word> phases,
      Topology topology, Word initial_signal = 0) -> ProcessNetwork;

  // Runs every engine to completion. Fails with the first engine failure
  // (siblings still run to completion) or if nothing reached the observer.
  auto Run() const -> Result<NetworkOutcome>;

 private:
  std::vector<std::vector<Word>> images_;
  std::vector<Word> phases_;
  Topology topology_;
  Word initial_signal_;
};

auto ToString(Topology topology) -> const char*;

}  // namespace intcode::runtime
