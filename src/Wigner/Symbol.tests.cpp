#include "Wigner/Symbol.hpp"
#include "catch2/catch.hpp"
#include <cmath>
#include <iostream>

namespace {
Angular::Rational q(int n, int d = 1) { return Angular::Rational(n, d); }
} // namespace

//==============================================================================
TEST_CASE("Wigner: evaluate", "[Wigner][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "Wigner: evaluate\n";

  using namespace Wigner;

  // 3j (1 1 1 \\ 1 -1 0) = 1/sqrt(6)
  const SymbolRequest s1 = ThreeJRequest{q(1), q(1), q(1), q(1), q(-1), q(0)};
  REQUIRE(name(s1) == "3-j");
  REQUIRE(!validate(s1));
  const auto r1 = evaluate(s1);
  REQUIRE(std::holds_alternative<double>(r1));
  REQUIRE(std::get<double>(r1) == Approx(1.0 / std::sqrt(6.0)));
  REQUIRE(value_or_zero(r1) == Approx(0.40824829));

  // 3j (1/2 1/2 0 \\ 1/2 -1/2 0) = +1/sqrt(2), (1/2 1/2 0 \\ -1/2 1/2 0) = -1/sqrt(2)
  const SymbolRequest s2a =
      ThreeJRequest{q(1, 2), q(1, 2), q(0), q(1, 2), q(-1, 2), q(0)};
  const SymbolRequest s2b =
      ThreeJRequest{q(1, 2), q(1, 2), q(0), q(-1, 2), q(1, 2), q(0)};
  REQUIRE(value_or_zero(evaluate(s2a)) == Approx(0.70710678));
  REQUIRE(value_or_zero(evaluate(s2b)) == Approx(-0.70710678));

  // 3j fails triangle rule: exactly zero, with rule
  const SymbolRequest s3 = ThreeJRequest{q(1), q(1), q(3), q(0), q(0), q(0)};
  const auto r3 = evaluate(s3);
  REQUIRE(std::holds_alternative<Angular::InvalidSymbol>(r3));
  REQUIRE(std::get<Angular::InvalidSymbol>(r3).rule == Angular::Rule::Triangle);
  REQUIRE(value_or_zero(r3) == 0.0);

  // 6j {1 1 1 \\ 1 1 1} = 1/6
  const SymbolRequest s4 = SixJRequest{q(1), q(1), q(1), q(1), q(1), q(1)};
  REQUIRE(name(s4) == "6-j");
  REQUIRE(value_or_zero(evaluate(s4)) == Approx(1.0 / 6.0));

  // 6j, triad {j4,j2,j6} fails
  const SymbolRequest s5 = SixJRequest{q(1), q(1), q(1), q(3), q(1), q(1)};
  const auto r5 = evaluate(s5);
  REQUIRE(std::holds_alternative<Angular::InvalidSymbol>(r5));
  REQUIRE(value_or_zero(r5) == 0.0);

  // Not half-integer: reported, never evaluated
  const SymbolRequest s6 = SixJRequest{q(1, 3), q(1), q(1), q(1), q(1), q(1)};
  REQUIRE(validate(s6)->rule == Angular::Rule::NotHalfInteger);
  REQUIRE(value_or_zero(evaluate(s6)) == 0.0);

  // Valid by selection rules, but zero "by accident": a value, not a rule
  const SymbolRequest s7 = ThreeJRequest{q(1), q(1), q(1), q(0), q(0), q(0)};
  const auto r7 = evaluate(s7);
  REQUIRE(std::holds_alternative<double>(r7));
  REQUIRE(std::get<double>(r7) == 0.0);
}

//==============================================================================
TEST_CASE("Wigner: evaluate_exact", "[Wigner][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "Wigner: evaluate_exact\n";

  using namespace Wigner;

  const SymbolRequest s1 =
      ThreeJRequest{q(1, 2), q(1, 2), q(0), q(-1, 2), q(1, 2), q(0)};
  const auto e1 = evaluate_exact(s1);
  REQUIRE(std::get<Angular::SqrtRational>(e1).to_string() == "-sqrt(1/2)");

  const SymbolRequest s2 = SixJRequest{q(1), q(1), q(1), q(1), q(1), q(1)};
  REQUIRE(std::get<Angular::SqrtRational>(evaluate_exact(s2)).to_string() ==
          "1/6");

  // Large j, beyond any fixed-width factorial
  const SymbolRequest s3 = ThreeJRequest{q(60), q(60), q(0), q(0), q(0), q(0)};
  REQUIRE(std::get<Angular::SqrtRational>(evaluate_exact(s3)).to_string() ==
          "1/11");

  // Determinism
  const SymbolRequest s4 = SixJRequest{q(4), q(3), q(2), q(3), q(4), q(5)};
  REQUIRE(value_or_zero(evaluate(s4)) ==
          Approx(-std::sqrt(13.0 / 3024.0)).epsilon(1.0e-15));
  REQUIRE(value_or_zero(evaluate(s4)) == value_or_zero(evaluate(s4)));
  REQUIRE(std::get<Angular::SqrtRational>(evaluate_exact(s4)) ==
          std::get<Angular::SqrtRational>(evaluate_exact(s4)));
}
