#pragma once

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "intcode/vm/word.hpp"

namespace intcode {

// Type of diagnostic message
enum class DiagKind : uint8_t {
  kError,      // Machine fault: malformed program, invalid write
  kHostError,  // I/O, malformed external input, configuration
  kWarning,    // Non-fatal
  kNote,       // Auxiliary message
};

// Point in a running program a diagnostic refers to
struct MachineLocation {
  Address pc = 0;
  Word instruction = 0;

  auto operator==(const MachineLocation&) const -> bool = default;
};

// Single diagnostic item (primary or note)
struct DiagItem {
  DiagKind kind;
  std::optional<MachineLocation> location;
  std::string message;

  auto operator==(const DiagItem&) const -> bool = default;
};

// Complete diagnostic with primary message and optional notes
struct Diagnostic {
  DiagItem primary;
  std::vector<DiagItem> notes;

  auto operator==(const Diagnostic&) const -> bool = default;

  // Factory: machine fault at a program location
  static auto Error(MachineLocation location, std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kError,
             .location = location,
             .message = std::move(msg)},
        .notes = {},
    };
  }

  // Factory: machine fault raised below the engine; the engine attaches the
  // location with AtLocation.
  static auto Fault(std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kError,
             .location = std::nullopt,
             .message = std::move(msg)},
        .notes = {},
    };
  }

  // Factory: host error without program location
  static auto HostError(std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kHostError,
             .location = std::nullopt,
             .message = std::move(msg)},
        .notes = {},
    };
  }

  // Factory: warning
  static auto Warning(std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kWarning,
             .location = std::nullopt,
             .message = std::move(msg)},
        .notes = {},
    };
  }

  // Attach a location to the primary item if it has none yet
  auto AtLocation(MachineLocation location) && -> Diagnostic {
    if (!primary.location) {
      primary.location = location;
    }
    return std::move(*this);
  }

  // Add a note without location
  auto WithNote(std::string msg) && -> Diagnostic {
    notes.push_back(
        DiagItem{
            .kind = DiagKind::kNote,
            .location = std::nullopt,
            .message = std::move(msg),
        });
    return std::move(*this);
  }
};

template <typename T>
using Result = std::expected<T, Diagnostic>;

class DiagnosticException : public std::exception {
 public:
  explicit DiagnosticException(Diagnostic diag) : diag_(std::move(diag)) {
  }

  [[nodiscard]] auto GetDiagnostic() const -> const Diagnostic& {
    return diag_;
  }
  [[nodiscard]] auto what() const noexcept -> const char* override {
    return diag_.primary.message.c_str();
  }

 private:
  Diagnostic diag_;
};

// Render a diagnostic as plain text: "pc 12: message" plus one line per note.
auto FormatDiagnostic(const Diagnostic& diag) -> std::string;

}  // namespace intcode
