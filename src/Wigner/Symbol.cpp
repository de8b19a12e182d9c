#include "Wigner/Symbol.hpp"
#include <cstdlib>
#include <iostream>
#include <type_traits>

namespace Wigner {

namespace {
// Only called after validation, so the conversion can't fail
int twice_checked(const Angular::Rational &q) {
  const auto tj = Angular::twice(q);
  if (!tj) {
    std::cerr << "Fail 19 in Wigner::evaluate: value " << q
              << " was not validated\n";
    std::abort();
  }
  return *tj;
}
} // namespace

//==============================================================================
std::string name(const SymbolRequest &request) {
  return std::holds_alternative<ThreeJRequest>(request) ? "3-j" : "6-j";
}

//==============================================================================
std::optional<Angular::InvalidSymbol> validate(const SymbolRequest &request) {
  return std::visit(
      [](const auto &r) -> std::optional<Angular::InvalidSymbol> {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, ThreeJRequest>) {
          return Angular::validate_3j(r.j1, r.j2, r.j3, r.m1, r.m2, r.m3);
        } else {
          return Angular::validate_6j(r.j1, r.j2, r.j3, r.j4, r.j5, r.j6);
        }
      },
      request);
}

//==============================================================================
std::variant<Angular::SqrtRational, Angular::InvalidSymbol>
evaluate_exact(const SymbolRequest &request) {
  if (auto bad = validate(request))
    return *bad;

  return std::visit(
      [](const auto &r) -> Angular::SqrtRational {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, ThreeJRequest>) {
          return Angular::threej_exact_2(
              twice_checked(r.j1), twice_checked(r.j2), twice_checked(r.j3),
              twice_checked(r.m1), twice_checked(r.m2), twice_checked(r.m3));
        } else {
          return Angular::sixj_exact_2(
              twice_checked(r.j1), twice_checked(r.j2), twice_checked(r.j3),
              twice_checked(r.j4), twice_checked(r.j5), twice_checked(r.j6));
        }
      },
      request);
}

//==============================================================================
std::variant<double, Angular::InvalidSymbol>
evaluate(const SymbolRequest &request) {
  if (auto bad = validate(request))
    return *bad;

  return std::visit(
      [](const auto &r) -> double {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, ThreeJRequest>) {
          return Angular::threej_2(twice_checked(r.j1), twice_checked(r.j2),
                                   twice_checked(r.j3), twice_checked(r.m1),
                                   twice_checked(r.m2), twice_checked(r.m3));
        } else {
          return Angular::sixj_2(twice_checked(r.j1), twice_checked(r.j2),
                                 twice_checked(r.j3), twice_checked(r.j4),
                                 twice_checked(r.j5), twice_checked(r.j6));
        }
      },
      request);
}

} // namespace Wigner
