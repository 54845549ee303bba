#pragma once

#include <stdexcept>
#include <string>

#include <fmt/core.h>

namespace intcode::common {

// Broken library invariant (a bug in intcode, not a fault of the program
// being executed)
class InternalError : public std::runtime_error {
 public:
  InternalError(const char* context, const std::string& detail)
      : std::runtime_error(
            fmt::format("internal error in {}: {}", context, detail)) {
  }
};

[[noreturn]] inline void ThrowInternalError(
    const char* context, const std::string& detail) {
  throw InternalError(context, detail);
}

}  // namespace intcode::common
