#include "intcode/vm/decoder.hpp"

#include <expected>
#include <limits>
#include <utility>

#include <fmt/core.h>

#include "intcode/common/diagnostic.hpp"
#include "intcode/vm/instruction.hpp"

namespace intcode::vm {

namespace {

// The opcode word and its operand words, as fetched from memory.
struct RawWords {
  Address pc;
  Word instruction;
  Word operands[3];
  Word relative_base;

  [[nodiscard]] auto Location() const -> MachineLocation {
    return MachineLocation{.pc = pc, .instruction = instruction};
  }

  [[nodiscard]] auto Resolve(Word mode, Word value) const -> Result<Parameter> {
    switch (mode) {
      case static_cast<Word>(ParameterMode::kPosition):
        return ToAddress(value);
      case static_cast<Word>(ParameterMode::kImmediate):
        return Immediate{.value = value};
      case static_cast<Word>(ParameterMode::kRelative):
        return ToRelativeAddress(value);
      default:
        return std::unexpected(
            Diagnostic::Error(
                Location(),
                fmt::format(
                    "unrecognized addressing mode {} in instruction {}", mode,
                    instruction)));
    }
  }

  [[nodiscard]] auto ToAddress(Word value) const -> Result<Parameter> {
    if (value < 0) {
      return std::unexpected(
          Diagnostic::Error(
              Location(), fmt::format(
                              "negative address {} in instruction {}", value,
                              instruction)));
    }
    return Indirect{.address = static_cast<Address>(value)};
  }

  // relative_base + offset, rejected instead of overflowing
  [[nodiscard]] auto ToRelativeAddress(Word offset) const
      -> Result<Parameter> {
    constexpr Word kMax = std::numeric_limits<Word>::max();
    constexpr Word kMin = std::numeric_limits<Word>::min();
    if ((offset > 0 && relative_base > kMax - offset) ||
        (offset < 0 && relative_base < kMin - offset)) {
      return std::unexpected(
          Diagnostic::Error(
              Location(),
              fmt::format(
                  "relative address {} + {} out of range in instruction {}",
                  relative_base, offset, instruction)));
    }
    return ToAddress(relative_base + offset);
  }

  // Operand 1, 2 or 3
  [[nodiscard]] auto Param(int operand) const -> Result<Parameter> {
    return Resolve(ModeDigitOf(instruction, operand), operands[operand - 1]);
  }
};

auto Fetch(const Memory& memory, Address pc, Word relative_base) -> RawWords {
  return RawWords{
      .pc = pc,
      .instruction = memory.Peek(pc),
      .operands =
          {memory.Peek(pc + 1), memory.Peek(pc + 2), memory.Peek(pc + 3)},
      .relative_base = relative_base,
  };
}

// Single-operand instructions (Input, Output, AdjustRelativeBase)
template <typename T>
auto DecodeUnary(const RawWords& raw) -> Result<Instruction> {
  auto operand = raw.Param(1);
  if (!operand) {
    return std::unexpected(std::move(operand.error()));
  }
  return T{*operand};
}

template <typename T>
auto DecodeBinary(const RawWords& raw) -> Result<Instruction> {
  auto lhs = raw.Param(1);
  if (!lhs) {
    return std::unexpected(std::move(lhs.error()));
  }
  auto rhs = raw.Param(2);
  if (!rhs) {
    return std::unexpected(std::move(rhs.error()));
  }
  auto dest = raw.Param(3);
  if (!dest) {
    return std::unexpected(std::move(dest.error()));
  }
  return T{.lhs = *lhs, .rhs = *rhs, .dest = *dest};
}

template <typename T>
auto DecodeJump(const RawWords& raw) -> Result<Instruction> {
  auto condition = raw.Param(1);
  if (!condition) {
    return std::unexpected(std::move(condition.error()));
  }
  auto target = raw.Param(2);
  if (!target) {
    return std::unexpected(std::move(target.error()));
  }
  return T{.condition = *condition, .target = *target};
}

}  // namespace

auto OpcodeOf(Word instruction) -> Word {
  return instruction % 100;
}

auto ModeDigitOf(Word instruction, int operand) -> Word {
  Word divisor = 10;
  for (int i = 0; i < operand; ++i) {
    divisor *= 10;
  }
  return (instruction / divisor) % 10;
}

auto Decode(const Memory& memory, Address pc, Word relative_base)
    -> Result<Instruction> {
  RawWords raw = Fetch(memory, pc, relative_base);

  switch (OpcodeOf(raw.instruction)) {
    case static_cast<Word>(Opcode::kAdd):
      return DecodeBinary<Add>(raw);
    case static_cast<Word>(Opcode::kMultiply):
      return DecodeBinary<Multiply>(raw);
    case static_cast<Word>(Opcode::kInput):
      return DecodeUnary<Input>(raw);
    case static_cast<Word>(Opcode::kOutput):
      return DecodeUnary<Output>(raw);
    case static_cast<Word>(Opcode::kJumpIfTrue):
      return DecodeJump<JumpIfTrue>(raw);
    case static_cast<Word>(Opcode::kJumpIfFalse):
      return DecodeJump<JumpIfFalse>(raw);
    case static_cast<Word>(Opcode::kLessThan):
      return DecodeBinary<LessThan>(raw);
    case static_cast<Word>(Opcode::kEquals):
      return DecodeBinary<Equals>(raw);
    case static_cast<Word>(Opcode::kAdjustRelativeBase):
      return DecodeUnary<AdjustRelativeBase>(raw);
    case static_cast<Word>(Opcode::kHalt):
      return Halt{};
    default:
      return std::unexpected(
          Diagnostic::Error(
              raw.Location(), fmt::format(
                                  "unrecognized opcode {} in instruction {}",
                                  OpcodeOf(raw.instruction), raw.instruction)));
  }
}

}  // namespace intcode::vm
