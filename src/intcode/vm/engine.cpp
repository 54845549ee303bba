#include "intcode/vm/engine.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "intcode/common/diagnostic.hpp"
#include "intcode/common/overloaded.hpp"
#include "intcode/vm/decoder.hpp"

namespace intcode::vm {

namespace {

// Two's complement wraparound without signed overflow
auto WrappingAdd(Word a, Word b) -> Word {
  return static_cast<Word>(static_cast<uint64_t>(a) + static_cast<uint64_t>(b));
}

auto WrappingMultiply(Word a, Word b) -> Word {
  return static_cast<Word>(static_cast<uint64_t>(a) * static_cast<uint64_t>(b));
}

auto InvalidWrite(const Immediate& dest, MachineLocation loc) -> Diagnostic {
  return Diagnostic::Error(
      loc, fmt::format(
               "invalid write through immediate operand {} in instruction {}",
               dest.value, loc.instruction));
}

}  // namespace

Engine::Engine(std::vector<Word> image, IoCapability& io)
    : memory_(std::move(image)), io_(io) {
}

auto Engine::Read(const Parameter& param) -> Word {
  return std::visit(
      Overloaded{
          [&](const Indirect& p) { return memory_.Read(p.address); },
          [](const Immediate& p) { return p.value; },
      },
      param);
}

auto Engine::Write(const Parameter& param, Word value, MachineLocation loc)
    -> Result<void> {
  const auto* target = std::get_if<Indirect>(&param);
  if (target == nullptr) {
    return std::unexpected(InvalidWrite(std::get<Immediate>(param), loc));
  }
  memory_.Write(target->address, value);
  return {};
}

auto Engine::JumpTo(Word target, MachineLocation loc) -> Result<void> {
  if (target < 0) {
    return std::unexpected(
        Diagnostic::Error(
            loc, fmt::format("jump to negative address {}", target)));
  }
  pc_ = static_cast<Address>(target);
  return {};
}

template <typename Op>
auto Engine::ExecuteBinary(
    const Parameter& lhs, const Parameter& rhs, const Parameter& dest,
    MachineLocation loc, Op op) -> Result<StepOutcome> {
  // Operand reads may grow memory; the destination is checked first so a
  // faulting instruction leaves no trace.
  if (std::holds_alternative<Immediate>(dest)) {
    return std::unexpected(InvalidWrite(std::get<Immediate>(dest), loc));
  }
  Word a = Read(lhs);
  Word b = Read(rhs);
  if (auto written = Write(dest, op(a, b), loc); !written) {
    return std::unexpected(std::move(written.error()));
  }
  pc_ += 4;
  return StepOutcome::kContinue;
}

auto Engine::Execute(const Instruction& instr, MachineLocation loc)
    -> Result<StepOutcome> {
  return std::visit(
      Overloaded{
          [&](const Add& i) -> Result<StepOutcome> {
            return ExecuteBinary(i.lhs, i.rhs, i.dest, loc, WrappingAdd);
          },
          [&](const Multiply& i) -> Result<StepOutcome> {
            return ExecuteBinary(i.lhs, i.rhs, i.dest, loc, WrappingMultiply);
          },
          [&](const LessThan& i) -> Result<StepOutcome> {
            return ExecuteBinary(
                i.lhs, i.rhs, i.dest, loc,
                [](Word a, Word b) -> Word { return a < b ? 1 : 0; });
          },
          [&](const Equals& i) -> Result<StepOutcome> {
            return ExecuteBinary(
                i.lhs, i.rhs, i.dest, loc,
                [](Word a, Word b) -> Word { return a == b ? 1 : 0; });
          },
          [&](const Input& i) -> Result<StepOutcome> {
            if (std::holds_alternative<Immediate>(i.dest)) {
              return std::unexpected(
                  InvalidWrite(std::get<Immediate>(i.dest), loc));
            }
            std::optional<Word> value = io_.get().RequestInput();
            if (!value) {
              return StepOutcome::kInputClosed;
            }
            if (auto written = Write(i.dest, *value, loc); !written) {
              return std::unexpected(std::move(written.error()));
            }
            pc_ += 2;
            return StepOutcome::kContinue;
          },
          [&](const Output& i) -> Result<StepOutcome> {
            io_.get().EmitOutput(Read(i.source));
            pc_ += 2;
            return StepOutcome::kContinue;
          },
          [&](const JumpIfTrue& i) -> Result<StepOutcome> {
            if (Read(i.condition) != 0) {
              if (auto jumped = JumpTo(Read(i.target), loc); !jumped) {
                return std::unexpected(std::move(jumped.error()));
              }
            } else {
              pc_ += 3;
            }
            return StepOutcome::kContinue;
          },
          [&](const JumpIfFalse& i) -> Result<StepOutcome> {
            if (Read(i.condition) == 0) {
              if (auto jumped = JumpTo(Read(i.target), loc); !jumped) {
                return std::unexpected(std::move(jumped.error()));
              }
            } else {
              pc_ += 3;
            }
            return StepOutcome::kContinue;
          },
          [&](const AdjustRelativeBase& i) -> Result<StepOutcome> {
            relative_base_ = WrappingAdd(relative_base_, Read(i.offset));
            pc_ += 2;
            return StepOutcome::kContinue;
          },
          [](const Halt&) -> Result<StepOutcome> {
            return StepOutcome::kHalted;
          },
      },
      instr);
}

auto Engine::Step() -> Result<StepOutcome> {
  MachineLocation loc{.pc = pc_, .instruction = memory_.Peek(pc_)};

  auto instr = Decode(memory_, pc_, relative_base_);
  if (!instr) {
    return std::unexpected(std::move(instr.error()));
  }

  if (spdlog::should_log(spdlog::level::trace)) {
    spdlog::trace("pc {} (rb {}): {}", pc_, relative_base_, *instr);
  }

  try {
    auto outcome = Execute(*instr, loc);
    if (outcome && *outcome == StepOutcome::kContinue) {
      ++steps_executed_;
    }
    return outcome;
  } catch (const DiagnosticException& e) {
    Diagnostic diag = e.GetDiagnostic();
    return std::unexpected(std::move(diag).AtLocation(loc));
  }
}

auto Engine::Run() -> Result<ExitReason> {
  while (true) {
    auto outcome = Step();
    if (!outcome) {
      return std::unexpected(std::move(outcome.error()));
    }
    switch (*outcome) {
      case StepOutcome::kContinue:
        continue;
      case StepOutcome::kHalted:
        return ExitReason::kHalted;
      case StepOutcome::kInputClosed:
        return ExitReason::kInputClosed;
    }
  }
}

auto ToString(ExitReason reason) -> const char* {
  switch (reason) {
    case ExitReason::kHalted:
      return "halted";
    case ExitReason::kInputClosed:
      return "input closed";
  }
  return "unknown";
}

}  // namespace intcode::vm
