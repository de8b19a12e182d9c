#pragma once
#include "Angular/Racah.hpp"
#include "Angular/SelectionRules.hpp"
#include "Wigner/Options.hpp"
#include "Wigner/Symbol.hpp"
#include <string>
#include <variant>

namespace IO {

//! Fixed-point with 'precision' digits after decimal point. Rounds half to
//! even on the exact binary value; a negative value that rounds to zero is
//! printed as zero (no "-0.00000000")
std::string format_value(double value, int precision = 8);

//! Formats the two rows of the symbol, e.g. "{ 1/2 1/2 0 }\n<pad>{ 1/2 -1/2 0 }"
std::string format_symbol(const Wigner::SymbolRequest &request);

//! Formats the full result block, from the result of Wigner::evaluate():
/*!
========================================
RESULT:
Wigner 3-j symbol { 1 1 1 }
                     { 1 -1 0 }
Value: 0.40824829
========================================
  Optionally with exact value, and selection rule, see Wigner::Options.
  The exact value is only computed (Wigner::evaluate_exact) if requested
*/
std::string
format_result(const Wigner::SymbolRequest &request,
              const std::variant<double, Angular::InvalidSymbol> &result,
              const Wigner::Options &options = {});

} // namespace IO
