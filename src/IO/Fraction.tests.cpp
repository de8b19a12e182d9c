#include "IO/Fraction.hpp"
#include "catch2/catch.hpp"
#include <iostream>

namespace {
bool parses_to(std::string_view text, const Angular::Rational &expected) {
  const auto result = IO::parse_quantum_number(text);
  const auto q = std::get_if<Angular::Rational>(&result);
  return q && *q == expected;
}
bool fails(std::string_view text) {
  return std::holds_alternative<IO::ParseError>(
      IO::parse_quantum_number(text));
}
} // namespace

//==============================================================================
TEST_CASE("IO: parse_quantum_number", "[IO][Fraction][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "IO: parse_quantum_number\n";

  using Angular::Rational;

  REQUIRE(parses_to("1", Rational(1)));
  REQUIRE(parses_to("0", Rational(0)));
  REQUIRE(parses_to("-3", Rational(-3)));
  REQUIRE(parses_to("+3", Rational(3)));
  REQUIRE(parses_to("1/2", Rational(1, 2)));
  REQUIRE(parses_to("-1/2", Rational(-1, 2)));
  REQUIRE(parses_to("1/-2", Rational(-1, 2)));
  REQUIRE(parses_to("-1/-2", Rational(1, 2)));
  REQUIRE(parses_to("3/-4", Rational(-3, 4)));
  REQUIRE(parses_to("0/-5", Rational(0)));
  REQUIRE(parses_to("  3/2 \n", Rational(3, 2)));
  REQUIRE(parses_to("3 / 2", Rational(3, 2)));
  // reduced to lowest terms
  REQUIRE(parses_to("2/4", Rational(1, 2)));
  REQUIRE(parses_to("4/2", Rational(2)));
  // not octal
  REQUIRE(parses_to("010", Rational(10)));
  REQUIRE(parses_to("07/02", Rational(7, 2)));
  // not restricted to half-integers (that's a selection rule)
  REQUIRE(parses_to("1/3", Rational(1, 3)));
  // arbitrarily large
  REQUIRE(parses_to("123456789012345678901234567890/2",
                    Rational(Angular::Integer{"61728394506172839450617283945"})));

  REQUIRE(fails(""));
  REQUIRE(fails("   "));
  REQUIRE(fails("x"));
  REQUIRE(fails("1.5"));
  REQUIRE(fails("1/"));
  REQUIRE(fails("/2"));
  REQUIRE(fails("1/2/3"));
  REQUIRE(fails("1 2"));
  REQUIRE(fails("--1"));
  REQUIRE(fails("0x10"));
  REQUIRE(fails("1/0"));
  REQUIRE(fails("0/0"));

  const auto zero_den = IO::parse_quantum_number("3/0");
  REQUIRE(std::get<IO::ParseError>(zero_den).message ==
          "'3/0' has zero denominator");
}

//==============================================================================
TEST_CASE("IO: parse_symbol", "[IO][Fraction][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "IO: parse_symbol\n";

  using Angular::Rational;

  const auto s1 = IO::parse_symbol("(1 1 1 1 -1 0)");
  REQUIRE(std::holds_alternative<Wigner::SymbolRequest>(s1));
  const auto &r1 = std::get<Wigner::SymbolRequest>(s1);
  REQUIRE(std::holds_alternative<Wigner::ThreeJRequest>(r1));
  const auto &t1 = std::get<Wigner::ThreeJRequest>(r1);
  REQUIRE(t1.j1 == 1);
  REQUIRE(t1.m2 == -1);
  REQUIRE(t1.m3 == 0);

  const auto s2 = IO::parse_symbol(" {1/2, 1/2, 1; 1/2 | 1/2 , 0} ");
  REQUIRE(std::holds_alternative<Wigner::SymbolRequest>(s2));
  const auto &r2 = std::get<Wigner::SymbolRequest>(s2);
  REQUIRE(std::holds_alternative<Wigner::SixJRequest>(r2));
  const auto &t2 = std::get<Wigner::SixJRequest>(r2);
  REQUIRE(t2.j1 == Rational(1, 2));
  REQUIRE(t2.j3 == 1);
  REQUIRE(t2.j5 == Rational(1, 2));
  REQUIRE(t2.j6 == 0);

  // sign may be carried by the denominator
  const auto s3 = IO::parse_symbol("(1/2 1/2 0 1/-2 -1/-2 0)");
  REQUIRE(std::holds_alternative<Wigner::SymbolRequest>(s3));
  const auto &t3 =
      std::get<Wigner::ThreeJRequest>(std::get<Wigner::SymbolRequest>(s3));
  REQUIRE(t3.m1 == Rational(-1, 2));
  REQUIRE(t3.m2 == Rational(1, 2));
  REQUIRE(Angular::denominator(t3.m1) == 2);

  // invalid symbols are still parsed; selection rules are checked later
  REQUIRE(std::holds_alternative<Wigner::SymbolRequest>(
      IO::parse_symbol("(1 1 3 0 0 0)")));

  REQUIRE(std::holds_alternative<IO::ParseError>(IO::parse_symbol("")));
  REQUIRE(std::holds_alternative<IO::ParseError>(IO::parse_symbol("()")));
  REQUIRE(std::holds_alternative<IO::ParseError>(
      IO::parse_symbol("(1 1 1 1 -1)")));
  REQUIRE(std::holds_alternative<IO::ParseError>(
      IO::parse_symbol("(1 1 1 1 -1 0 0)")));
  REQUIRE(std::holds_alternative<IO::ParseError>(
      IO::parse_symbol("(1 1 1 1 -1 0}")));
  REQUIRE(std::holds_alternative<IO::ParseError>(
      IO::parse_symbol("[1 1 1 1 -1 0]")));
  REQUIRE(std::holds_alternative<IO::ParseError>(
      IO::parse_symbol("(1 1 1 1 x 0)")));
  REQUIRE(std::holds_alternative<IO::ParseError>(
      IO::parse_symbol("{1 1 1 1 1/0 1}")));

  const auto bad = IO::parse_symbol("(1 2 3)");
  REQUIRE(std::get<IO::ParseError>(bad).message ==
          "'(1 2 3)': expected 6 numbers, found 3");
}
