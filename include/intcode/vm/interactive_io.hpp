#pragma once

#include <iostream>
#include <istream>
#include <optional>
#include <ostream>
#include <string_view>

#include "intcode/vm/io.hpp"
#include "intcode/vm/word.hpp"

namespace intcode::vm {

// Console binding: prompts for one integer per line and prints each output on
// its own line. Malformed lines are re-prompted; end of input closes the
// source.
class InteractiveIo : public IoCapability {
 public:
  InteractiveIo() : InteractiveIo(std::cin, std::cout) {
  }
  InteractiveIo(std::istream& in, std::ostream& out) : in_(in), out_(out) {
  }

  auto RequestInput() -> std::optional<Word> override;
  void EmitOutput(Word value) override;

 private:
  std::istream& in_;
  std::ostream& out_;
};

// Parses a whole line as one signed integer, surrounding whitespace allowed.
auto ParseWordLine(std::string_view line) -> std::optional<Word>;

}  // namespace intcode::vm
