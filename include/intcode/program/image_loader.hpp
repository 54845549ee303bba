#pragma once

#include <filesystem>
#include <string_view>
#include <vector>

#include "intcode/common/diagnostic.hpp"
#include "intcode/vm/word.hpp"

namespace intcode::program {

// Parse a program image: signed decimal words separated by commas and/or
// whitespace. Empty fields between consecutive commas are rejected.
auto ParseImage(std::string_view text) -> Result<std::vector<Word>>;

// Read and parse an image file.
auto LoadImageFile(const std::filesystem::path& path)
    -> Result<std::vector<Word>>;

// Parse a comma-separated list of words given on the command line or in
// configuration, e.g. "4,3,2,1,0". An empty list is allowed.
auto ParseWordList(std::string_view text) -> Result<std::vector<Word>>;

}  // namespace intcode::program
