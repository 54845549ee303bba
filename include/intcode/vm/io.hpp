#pragma once

#include <optional>

#include "intcode/vm/word.hpp"

namespace intcode::vm {

// Everything an engine knows about its environment. The engine calls
// RequestInput when it executes an input instruction and EmitOutput when it
// executes an output instruction; what those mean is up to the binding.
class IoCapability {
 public:
  IoCapability() = default;
  virtual ~IoCapability() = default;

  IoCapability(const IoCapability&) = delete;
  IoCapability(IoCapability&&) = delete;
  auto operator=(const IoCapability&) -> IoCapability& = delete;
  auto operator=(IoCapability&&) -> IoCapability& = delete;

  // Blocks until a value is available. Returns nullopt once the source is
  // permanently closed, which ends the run normally. Bindings report fatal
  // conditions by throwing DiagnosticException.
  virtual auto RequestInput() -> std::optional<Word> = 0;

  virtual void EmitOutput(Word value) = 0;
};

}  // namespace intcode::vm
