#include "intcode/vm/interactive_io.hpp"

#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace intcode::vm {

auto ParseWordLine(std::string_view line) -> std::optional<Word> {
  auto start = line.find_first_not_of(" \t\r\n");
  if (start == std::string_view::npos) {
    return std::nullopt;
  }
  auto end = line.find_last_not_of(" \t\r\n");
  line = line.substr(start, end - start + 1);

  // from_chars rejects an explicit plus sign
  if (line.size() > 1 && line.front() == '+' && line[1] != '-') {
    line.remove_prefix(1);
  }

  Word value = 0;
  const char* first = line.data();
  const char* last = line.data() + line.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  return value;
}

auto InteractiveIo::RequestInput() -> std::optional<Word> {
  out_ << "Input required.\n" << std::flush;
  std::string line;
  while (std::getline(in_, line)) {
    if (auto value = ParseWordLine(line)) {
      return value;
    }
    out_ << "Invalid integer, try again.\n" << std::flush;
  }
  return std::nullopt;
}

void InteractiveIo::EmitOutput(Word value) {
  out_ << value << '\n' << std::flush;
}

}  // namespace intcode::vm
