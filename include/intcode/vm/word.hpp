#pragma once

#include <cstddef>
#include <cstdint>

namespace intcode {

// The machine's only value type: code, data and addresses are all words.
using Word = int64_t;

// Index into word memory. Always obtained from a non-negative word.
using Address = std::size_t;

}  // namespace intcode
