#pragma once

namespace intcode {

// Builds one visitor for std::visit out of several lambdas, one per
// alternative. A missing alternative fails to compile.
template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};

template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace intcode
