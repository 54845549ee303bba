#pragma once

#include <cstddef>
#include <utility>
#include <vector>

#include "intcode/vm/word.hpp"

namespace intcode::vm {

// Zero-filled word store that grows on demand. Reading or writing at or past
// the current size first extends it to at least 2 * address + 1 words, so an
// access never fails and untouched cells read as zero. Existing contents are
// never moved or truncated. An address whose growth cannot be allocated throws
// DiagnosticException ("address N out of range") and leaves memory unchanged.
class Memory {
 public:
  Memory() = default;
  explicit Memory(std::vector<Word> image) : words_(std::move(image)) {
  }

  auto Read(Address address) -> Word;
  void Write(Address address, Word value);

  // Non-growing read: cells past the end read as zero.
  [[nodiscard]] auto Peek(Address address) const -> Word {
    return address < words_.size() ? words_[address] : 0;
  }

  [[nodiscard]] auto Size() const -> std::size_t {
    return words_.size();
  }

  [[nodiscard]] auto Words() const -> const std::vector<Word>& {
    return words_;
  }

 private:
  void EnsureAddressable(Address address);

  std::vector<Word> words_;
};

}  // namespace intcode::vm
