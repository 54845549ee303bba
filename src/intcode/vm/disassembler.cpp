#include "intcode/vm/disassembler.hpp"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>

#include "intcode/vm/decoder.hpp"
#include "intcode/vm/instruction.hpp"

namespace intcode::vm {

namespace {

auto FormatOperand(Word mode, Word value) -> std::string {
  switch (mode) {
    case static_cast<Word>(ParameterMode::kPosition):
      return fmt::format("[{}]", value);
    case static_cast<Word>(ParameterMode::kImmediate):
      return fmt::format("{}", value);
    case static_cast<Word>(ParameterMode::kRelative):
      return value < 0 ? fmt::format("[rb{}]", value)
                       : fmt::format("[rb+{}]", value);
    default:
      return fmt::format("?{}:{}", mode, value);
  }
}

auto DataLine(Address pc, Word word) -> DisassembledLine {
  return DisassembledLine{
      .pc = pc, .words = {word}, .text = fmt::format(".word {}", word)};
}

}  // namespace

auto Disassemble(const std::vector<Word>& image)
    -> std::vector<DisassembledLine> {
  std::vector<DisassembledLine> lines;
  Address pc = 0;

  while (pc < image.size()) {
    Word instruction = image[pc];
    auto opcode = ToOpcode(OpcodeOf(instruction));
    if (!opcode) {
      lines.push_back(DataLine(pc, instruction));
      ++pc;
      continue;
    }

    auto count = static_cast<std::size_t>(OperandCount(*opcode));
    if (pc + count >= image.size()) {
      // Operands would run off the end of the image.
      lines.push_back(DataLine(pc, instruction));
      ++pc;
      continue;
    }

    DisassembledLine line{.pc = pc, .words = {instruction}, .text = {}};
    std::vector<std::string> operands;
    bool valid = true;
    for (std::size_t k = 1; k <= count; ++k) {
      Word mode = ModeDigitOf(instruction, static_cast<int>(k));
      if (mode > static_cast<Word>(ParameterMode::kRelative) || mode < 0) {
        valid = false;
      }
      line.words.push_back(image[pc + k]);
      operands.push_back(FormatOperand(mode, image[pc + k]));
    }
    if (!valid) {
      lines.push_back(DataLine(pc, instruction));
      ++pc;
      continue;
    }

    line.text = operands.empty()
                    ? std::string(Mnemonic(*opcode))
                    : fmt::format(
                          "{} {}", Mnemonic(*opcode),
                          fmt::join(operands, ", "));
    lines.push_back(std::move(line));
    pc += count + 1;
  }
  return lines;
}

auto FormatListing(const std::vector<DisassembledLine>& lines) -> std::string {
  std::string out;
  for (const auto& line : lines) {
    std::string raw = fmt::format("{}", fmt::join(line.words, ","));
    out += fmt::format("{:>6}  {:<28}  {}\n", line.pc, raw, line.text);
  }
  return out;
}

}  // namespace intcode::vm
