#include "intcode/vm/memory.hpp"

#include <new>
#include <stdexcept>

#include <fmt/core.h>

#include "intcode/common/diagnostic.hpp"

namespace intcode::vm {

namespace {

[[noreturn]] void ThrowOutOfRange(Address address) {
  throw DiagnosticException(
      Diagnostic::Fault(fmt::format("address {} out of range", address)));
}

}  // namespace

void Memory::EnsureAddressable(Address address) {
  if (address < words_.size()) {
    return;
  }
  if (address >= words_.max_size() / 2) {
    ThrowOutOfRange(address);
  }
  try {
    words_.resize((2 * address) + 1, 0);
  } catch (const std::bad_alloc&) {
    ThrowOutOfRange(address);
  } catch (const std::length_error&) {
    ThrowOutOfRange(address);
  }
}

auto Memory::Read(Address address) -> Word {
  EnsureAddressable(address);
  return words_[address];
}

void Memory::Write(Address address, Word value) {
  EnsureAddressable(address);
  words_[address] = value;
}

}  // namespace intcode::vm
