#pragma once

#include <cstdint>
#include <functional>
#include <vector>

#include "intcode/common/diagnostic.hpp"
#include "intcode/vm/instruction.hpp"
#include "intcode/vm/io.hpp"
#include "intcode/vm/memory.hpp"
#include "intcode/vm/word.hpp"

namespace intcode::vm {

// Why a run ended without a fault
enum class ExitReason : uint8_t {
  kHalted,       // Executed opcode 99
  kInputClosed,  // Input source closed while the program waited for input
};

enum class StepOutcome : uint8_t {
  kContinue,
  kHalted,
  kInputClosed,
};

// Fetch-decode-execute loop over one program image. The engine owns its
// memory, program counter and relative base; it talks to the outside world
// only through the IoCapability it was constructed with, which must outlive
// the engine.
class Engine {
 public:
  Engine(std::vector<Word> image, IoCapability& io);

  // Decode and execute exactly one instruction. On error nothing of the
  // failing instruction has been applied.
  auto Step() -> Result<StepOutcome>;

  // Step until halt or until the input source closes.
  auto Run() -> Result<ExitReason>;

  [[nodiscard]] auto GetMemory() const -> const Memory& {
    return memory_;
  }

  [[nodiscard]] auto StepsExecuted() const -> uint64_t {
    return steps_executed_;
  }

 private:
  auto Execute(const Instruction& instr, MachineLocation loc)
      -> Result<StepOutcome>;

  auto Read(const Parameter& param) -> Word;
  auto Write(const Parameter& param, Word value, MachineLocation loc)
      -> Result<void>;
  auto JumpTo(Word target, MachineLocation loc) -> Result<void>;

  template <typename Op>
  auto ExecuteBinary(
      const Parameter& lhs, const Parameter& rhs, const Parameter& dest,
      MachineLocation loc, Op op) -> Result<StepOutcome>;

  Memory memory_;
  std::reference_wrapper<IoCapability> io_;
  Address pc_ = 0;
  Word relative_base_ = 0;
  uint64_t steps_executed_ = 0;
};

auto ToString(ExitReason reason) -> const char*;

}  // namespace intcode::vm
