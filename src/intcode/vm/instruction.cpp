#include "intcode/vm/instruction.hpp"

#include <optional>
#include <string>
#include <variant>

#include <fmt/core.h>

#include "intcode/common/overloaded.hpp"

namespace intcode::vm {

auto InstructionWidth(const Instruction& instr) -> Address {
  return std::visit(
      Overloaded{
          [](const Add&) -> Address { return 4; },
          [](const Multiply&) -> Address { return 4; },
          [](const Input&) -> Address { return 2; },
          [](const Output&) -> Address { return 2; },
          [](const JumpIfTrue&) -> Address { return 3; },
          [](const JumpIfFalse&) -> Address { return 3; },
          [](const LessThan&) -> Address { return 4; },
          [](const Equals&) -> Address { return 4; },
          [](const AdjustRelativeBase&) -> Address { return 2; },
          [](const Halt&) -> Address { return 1; },
      },
      instr);
}

auto ToOpcode(Word opcode) -> std::optional<Opcode> {
  switch (opcode) {
    case 1:
    case 2:
    case 3:
    case 4:
    case 5:
    case 6:
    case 7:
    case 8:
    case 9:
    case 99:
      return static_cast<Opcode>(opcode);
    default:
      return std::nullopt;
  }
}

auto Mnemonic(Opcode opcode) -> const char* {
  switch (opcode) {
    case Opcode::kAdd:
      return "add";
    case Opcode::kMultiply:
      return "mul";
    case Opcode::kInput:
      return "in";
    case Opcode::kOutput:
      return "out";
    case Opcode::kJumpIfTrue:
      return "jnz";
    case Opcode::kJumpIfFalse:
      return "jz";
    case Opcode::kLessThan:
      return "lt";
    case Opcode::kEquals:
      return "eq";
    case Opcode::kAdjustRelativeBase:
      return "arb";
    case Opcode::kHalt:
      return "halt";
  }
  return "?";
}

auto OperandCount(Opcode opcode) -> int {
  switch (opcode) {
    case Opcode::kAdd:
    case Opcode::kMultiply:
    case Opcode::kLessThan:
    case Opcode::kEquals:
      return 3;
    case Opcode::kJumpIfTrue:
    case Opcode::kJumpIfFalse:
      return 2;
    case Opcode::kInput:
    case Opcode::kOutput:
    case Opcode::kAdjustRelativeBase:
      return 1;
    case Opcode::kHalt:
      return 0;
  }
  return 0;
}

auto ToString(const Parameter& param) -> std::string {
  return std::visit(
      Overloaded{
          [](const Indirect& p) { return fmt::format("[{}]", p.address); },
          [](const Immediate& p) { return fmt::format("{}", p.value); },
      },
      param);
}

auto ToString(const Instruction& instr) -> std::string {
  return std::visit(
      Overloaded{
          [](const Add& i) {
            return fmt::format("add {}, {} -> {}", i.lhs, i.rhs, i.dest);
          },
          [](const Multiply& i) {
            return fmt::format("mul {}, {} -> {}", i.lhs, i.rhs, i.dest);
          },
          [](const Input& i) { return fmt::format("in -> {}", i.dest); },
          [](const Output& i) { return fmt::format("out {}", i.source); },
          [](const JumpIfTrue& i) {
            return fmt::format("jnz {}, {}", i.condition, i.target);
          },
          [](const JumpIfFalse& i) {
            return fmt::format("jz {}, {}", i.condition, i.target);
          },
          [](const LessThan& i) {
            return fmt::format("lt {}, {} -> {}", i.lhs, i.rhs, i.dest);
          },
          [](const Equals& i) {
            return fmt::format("eq {}, {} -> {}", i.lhs, i.rhs, i.dest);
          },
          [](const AdjustRelativeBase& i) {
            return fmt::format("arb {}", i.offset);
          },
          [](const Halt&) { return std::string("halt"); },
      },
      instr);
}

}  // namespace intcode::vm
