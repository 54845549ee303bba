#pragma once

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

#include "intcode/vm/io.hpp"
#include "intcode/vm/word.hpp"

namespace intcode::vm {

// Feeds a fixed sequence of inputs and records every output. Asking for more
// inputs than were supplied is fatal.
class ScriptedIo : public IoCapability {
 public:
  ScriptedIo() = default;
  explicit ScriptedIo(std::vector<Word> inputs) : inputs_(std::move(inputs)) {
  }

  auto RequestInput() -> std::optional<Word> override;
  void EmitOutput(Word value) override;

  [[nodiscard]] auto Outputs() const -> const std::vector<Word>& {
    return outputs_;
  }

  // Last emitted value, if any
  [[nodiscard]] auto LastOutput() const -> std::optional<Word> {
    if (outputs_.empty()) {
      return std::nullopt;
    }
    return outputs_.back();
  }

  [[nodiscard]] auto InputsConsumed() const -> std::size_t {
    return next_input_;
  }

 private:
  std::vector<Word> inputs_;
  std::size_t next_input_ = 0;
  std::vector<Word> outputs_;
};

}  // namespace intcode::vm
