#pragma once

#include <string>
#include <vector>

#include "intcode/vm/word.hpp"

namespace intcode::vm {

struct DisassembledLine {
  Address pc = 0;
  std::vector<Word> words;
  std::string text;
};

// Linear sweep from address 0. Operands print by mode: "[n]" position,
// "n" immediate, "[rb+n]" relative. Words that do not start a valid
// instruction print as ".word n" and advance by one.
auto Disassemble(const std::vector<Word>& image) -> std::vector<DisassembledLine>;

// One line per instruction: address, raw words, text.
auto FormatListing(const std::vector<DisassembledLine>& lines) -> std::string;

}  // namespace intcode::vm
