#pragma once
#include "Angular/Racah.hpp"
#include "Angular/Rational.hpp"
#include "Angular/SelectionRules.hpp"
#include <optional>
#include <string>
#include <variant>

//! Requests for a single 3j or 6j symbol, and their evaluation
namespace Wigner {

//! 3j symbol (j1 j2 j3 \\ m1 m2 m3)
struct ThreeJRequest {
  Angular::Rational j1, j2, j3, m1, m2, m3;
};

//! 6j symbol {j1 j2 j3 \\ j4 j5 j6}
struct SixJRequest {
  Angular::Rational j1, j2, j3, j4, j5, j6;
};

using SymbolRequest = std::variant<ThreeJRequest, SixJRequest>;

//! "3-j" or "6-j"
std::string name(const SymbolRequest &request);

//! Checks selection rules. Empty if the symbol may be non-zero
std::optional<Angular::InvalidSymbol> validate(const SymbolRequest &request);

//! Evaluates symbol exactly. If any selection rule fails, returns the rule
//! instead (the symbol is then exactly zero)
std::variant<Angular::SqrtRational, Angular::InvalidSymbol>
evaluate_exact(const SymbolRequest &request);

//! Evaluates symbol, as double (not rounded). If any selection rule fails,
//! returns the rule instead (the symbol is then exactly zero)
std::variant<double, Angular::InvalidSymbol>
evaluate(const SymbolRequest &request);

//! Value of the symbol, where failing the selection rules gives 0
inline double
value_or_zero(const std::variant<double, Angular::InvalidSymbol> &result) {
  const auto value = std::get_if<double>(&result);
  return value ? *value : 0.0;
}

} // namespace Wigner
