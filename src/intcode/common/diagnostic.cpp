#include "intcode/common/diagnostic.hpp"

#include <string>

#include <fmt/core.h>

namespace intcode {

namespace {

auto FormatItem(const DiagItem& item) -> std::string {
  if (item.location) {
    return fmt::format("pc {}: {}", item.location->pc, item.message);
  }
  return item.message;
}

}  // namespace

auto FormatDiagnostic(const Diagnostic& diag) -> std::string {
  std::string out = FormatItem(diag.primary);
  for (const auto& note : diag.notes) {
    out += "\n  note: ";
    out += FormatItem(note);
  }
  return out;
}

}  // namespace intcode
