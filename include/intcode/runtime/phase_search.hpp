#pragma once

#include <cstddef>
#include <vector>

#include "intcode/common/diagnostic.hpp"
#include "intcode/runtime/network.hpp"
#include "intcode/vm/word.hpp"

namespace intcode::runtime {

struct PhaseSearchResult {
  Word signal = 0;
  std::vector<Word> phases;
  std::size_t permutations_tried = 0;
};

// Runs a network of copies of `image` for every ordering of `phase_set` and
// keeps the ordering with the highest final signal. Ties keep the first
// ordering in lexicographic order. Any failing network aborts the search.
auto FindMaxSignal(
    const std::vector<Word>& image, std::vector<Word> phase_set,
    Topology topology, Word initial_signal = 0) -> Result<PhaseSearchResult>;

}  // namespace intcode::runtime
