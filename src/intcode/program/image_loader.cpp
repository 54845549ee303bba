#include "intcode/program/image_loader.hpp"

#include <cctype>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "intcode/common/diagnostic.hpp"
#include "intcode/vm/interactive_io.hpp"

namespace intcode::program {

namespace {

auto IsSpace(char c) -> bool {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// `what` names the input in messages ("program image", "word list").
auto ParseWords(std::string_view text, std::string_view what, bool allow_empty)
    -> Result<std::vector<Word>> {
  std::vector<Word> words;
  bool comma_pending = false;
  std::size_t i = 0;

  while (i < text.size()) {
    char c = text[i];
    if (IsSpace(c)) {
      ++i;
      continue;
    }
    if (c == ',') {
      if (words.empty() || comma_pending) {
        return std::unexpected(
            Diagnostic::HostError(
                fmt::format(
                    "{}: empty field before word #{}", what,
                    words.size() + 1)));
      }
      comma_pending = true;
      ++i;
      continue;
    }

    std::size_t end = i;
    while (end < text.size() && !IsSpace(text[end]) && text[end] != ',') {
      ++end;
    }
    std::string_view token = text.substr(i, end - i);
    auto value = vm::ParseWordLine(token);
    if (!value) {
      return std::unexpected(
          Diagnostic::HostError(
              fmt::format(
                  "{}: invalid word '{}' at position {}", what, token,
                  words.size() + 1)));
    }
    words.push_back(*value);
    comma_pending = false;
    i = end;
  }

  if (words.empty() && !allow_empty) {
    return std::unexpected(
        Diagnostic::HostError(fmt::format("{} is empty", what)));
  }
  return words;
}

}  // namespace

auto ParseImage(std::string_view text) -> Result<std::vector<Word>> {
  return ParseWords(text, "program image", false);
}

auto LoadImageFile(const std::filesystem::path& path)
    -> Result<std::vector<Word>> {
  std::ifstream in(path);
  if (!in) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format("cannot open program image '{}'", path.string())));
  }
  std::ostringstream contents;
  contents << in.rdbuf();

  auto image = ParseImage(contents.str());
  if (!image) {
    return std::unexpected(
        std::move(image.error())
            .WithNote(fmt::format("while reading '{}'", path.string())));
  }
  return image;
}

auto ParseWordList(std::string_view text) -> Result<std::vector<Word>> {
  return ParseWords(text, "word list", true);
}

}  // namespace intcode::program
