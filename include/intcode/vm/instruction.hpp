#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include <fmt/core.h>

#include "intcode/vm/word.hpp"

namespace intcode::vm {

enum class Opcode : uint8_t {
  kAdd = 1,
  kMultiply = 2,
  kInput = 3,
  kOutput = 4,
  kJumpIfTrue = 5,
  kJumpIfFalse = 6,
  kLessThan = 7,
  kEquals = 8,
  kAdjustRelativeBase = 9,
  kHalt = 99,
};

enum class ParameterMode : uint8_t {
  kPosition = 0,
  kImmediate = 1,
  kRelative = 2,
};

// Operand read or written through memory.
struct Indirect {
  Address address;

  auto operator==(const Indirect&) const -> bool = default;
};

// Operand used literally. Never a valid destination.
struct Immediate {
  Word value;

  auto operator==(const Immediate&) const -> bool = default;
};

using Parameter = std::variant<Indirect, Immediate>;

struct Add {
  Parameter lhs;
  Parameter rhs;
  Parameter dest;

  auto operator==(const Add&) const -> bool = default;
};

struct Multiply {
  Parameter lhs;
  Parameter rhs;
  Parameter dest;

  auto operator==(const Multiply&) const -> bool = default;
};

struct Input {
  Parameter dest;

  auto operator==(const Input&) const -> bool = default;
};

struct Output {
  Parameter source;

  auto operator==(const Output&) const -> bool = default;
};

struct JumpIfTrue {
  Parameter condition;
  Parameter target;

  auto operator==(const JumpIfTrue&) const -> bool = default;
};

struct JumpIfFalse {
  Parameter condition;
  Parameter target;

  auto operator==(const JumpIfFalse&) const -> bool = default;
};

struct LessThan {
  Parameter lhs;
  Parameter rhs;
  Parameter dest;

  auto operator==(const LessThan&) const -> bool = default;
};

struct Equals {
  Parameter lhs;
  Parameter rhs;
  Parameter dest;

  auto operator==(const Equals&) const -> bool = default;
};

struct AdjustRelativeBase {
  Parameter offset;

  auto operator==(const AdjustRelativeBase&) const -> bool = default;
};

struct Halt {
  auto operator==(const Halt&) const -> bool = default;
};

// A decoded instruction with its operands already resolved against the
// relative base. Lives for one execute step.
using Instruction = std::variant<
    Add, Multiply, Input, Output, JumpIfTrue, JumpIfFalse, LessThan, Equals,
    AdjustRelativeBase, Halt>;

// Number of words the instruction occupies (opcode word included).
auto InstructionWidth(const Instruction& instr) -> Address;

// Opcode for the low two digits of an instruction word, if it is one.
auto ToOpcode(Word opcode) -> std::optional<Opcode>;

auto Mnemonic(Opcode opcode) -> const char*;

// Operands following the opcode word
auto OperandCount(Opcode opcode) -> int;

auto ToString(const Parameter& param) -> std::string;
auto ToString(const Instruction& instr) -> std::string;

}  // namespace intcode::vm

template <>
struct fmt::formatter<intcode::vm::Parameter> {
  template <typename ParseContext>
  constexpr auto parse(ParseContext& ctx) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const intcode::vm::Parameter& param, FormatContext& ctx) const {
    return fmt::format_to(ctx.out(), "{}", intcode::vm::ToString(param));
  }
};

template <>
struct fmt::formatter<intcode::vm::Instruction> {
  template <typename ParseContext>
  constexpr auto parse(ParseContext& ctx) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const intcode::vm::Instruction& instr, FormatContext& ctx) const {
    return fmt::format_to(ctx.out(), "{}", intcode::vm::ToString(instr));
  }
};
