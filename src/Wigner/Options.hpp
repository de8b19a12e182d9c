#pragma once
#include "IO/InputBlock.hpp"
#include "Wigner/Symbol.hpp"
#include <optional>

namespace Wigner {

//! Output options, read from the Output{} input block
struct Options {
  //! Number of digits after the decimal point
  int precision = 8;
  //! Also print exact value, e.g., -sqrt(1/2)
  bool exact = false;
  //! Also print which selection rule failed (if any)
  bool rule = false;
};

//! Reads Output{precision; exact; rule;} block. Missing block/options take
//! the defaults; an unusable precision is warned about and ignored
Options read_options(const IO::InputBlock &input);

//! Reads the symbol from a ThreeJ{j1;j2;j3;m1;m2;m3;} or SixJ{j1;...;j6;}
//! block. Exactly one such block must be given. Prints error message and
//! returns empty on bad input
std::optional<SymbolRequest> read_request(const IO::InputBlock &input);

} // namespace Wigner
