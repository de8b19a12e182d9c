#pragma once
#include "Angular/Rational.hpp"
#include "Wigner/Symbol.hpp"
#include <string>
#include <string_view>
#include <variant>

namespace IO {

//! Input text that could not be read as a quantum number/symbol
struct ParseError {
  std::string message;
};

//! Parses an integer or fraction, "int" or "int/int" (e.g., 1, -3, 1/2,
//! -3/2). Surrounding white space is ignored; either part may carry a sign.
//! Empty text, anything else, or a zero denominator give a ParseError.
std::variant<Angular::Rational, ParseError>
parse_quantum_number(std::string_view text);

//! Parses one-line symbol notation: (j1 j2 j3 m1 m2 m3) for 3j, or
//! {j1 j2 j3 j4 j5 j6} for 6j. Numbers may be separated by any of: space,
//! comma, semi-colon, or '|'. Does not check selection rules.
std::variant<Wigner::SymbolRequest, ParseError>
parse_symbol(std::string_view text);

} // namespace IO
