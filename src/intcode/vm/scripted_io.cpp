#include "intcode/vm/scripted_io.hpp"

#include <optional>

#include <fmt/core.h>

#include "intcode/common/diagnostic.hpp"

namespace intcode::vm {

auto ScriptedIo::RequestInput() -> std::optional<Word> {
  if (next_input_ >= inputs_.size()) {
    throw DiagnosticException(
        Diagnostic::HostError(
            fmt::format(
                "scripted input exhausted: program requested input #{} but "
                "only {} value(s) were supplied",
                next_input_ + 1, inputs_.size())));
  }
  return inputs_[next_input_++];
}

void ScriptedIo::EmitOutput(Word value) {
  outputs_.push_back(value);
}

}  // namespace intcode::vm
