#include "IO/Format.hpp"
#include "catch2/catch.hpp"
#include <cmath>
#include <iostream>
#include <string>
#include <variant>

namespace {
Angular::Rational q(int n, int d = 1) { return Angular::Rational(n, d); }
} // namespace

//==============================================================================
TEST_CASE("IO: format_value", "[IO][Format][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "IO: format_value\n";

  REQUIRE(IO::format_value(1.0 / std::sqrt(6.0)) == "0.40824829");
  REQUIRE(IO::format_value(-1.0 / std::sqrt(2.0)) == "-0.70710678");
  REQUIRE(IO::format_value(1.0 / 6.0) == "0.16666667");
  REQUIRE(IO::format_value(0.0) == "0.00000000");
  REQUIRE(IO::format_value(-0.0) == "0.00000000");
  REQUIRE(IO::format_value(-1.0e-12) == "0.00000000");
  REQUIRE(IO::format_value(-1.0e-12, 14) == "-0.00000000000100");
  REQUIRE(IO::format_value(1.0, 0) == "1");
  REQUIRE(IO::format_value(-1.0, 2) == "-1.00");
  REQUIRE(IO::format_value(1.0 / 6.0, 12) == "0.166666666667");
}

//==============================================================================
TEST_CASE("IO: format_result", "[IO][Format][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "IO: format_result\n";

  const std::string line(40, '=');
  const std::string pad3j(21, ' ');
  const std::string pad6j(19, ' ');

  const Wigner::SymbolRequest s3j =
      Wigner::ThreeJRequest{q(1), q(1), q(1), q(1), q(-1), q(0)};
  REQUIRE(IO::format_symbol(s3j) == "{ 1 1 1 }\n" + pad3j + "{ 1 -1 0 }");
  REQUIRE(IO::format_result(s3j, Wigner::evaluate(s3j)) ==
          "\n" + line + "\nRESULT:\nWigner 3-j symbol { 1 1 1 }\n" + pad3j +
              "{ 1 -1 0 }\nValue: 0.40824829\n" + line + "\n");

  const Wigner::SymbolRequest s6j =
      Wigner::SixJRequest{q(1, 2), q(1, 2), q(1), q(1, 2), q(1, 2), q(0)};
  REQUIRE(IO::format_symbol(s6j) ==
          "{ 1/2 1/2 1 }\n" + pad6j + "{ 1/2 1/2 0 }");

  Wigner::Options options;
  options.exact = true;
  options.rule = true;
  options.precision = 4;
  REQUIRE(IO::format_result(s6j, Wigner::evaluate(s6j), options) ==
          "\n" + line + "\nRESULT:\nWigner 6-j symbol { 1/2 1/2 1 }\n" +
              pad6j +
              "{ 1/2 1/2 0 }\nValue: 0.5000\nExact: 1/2\n"
              "Selection rules: satisfied\n" +
              line + "\n");

  // Invalid: value is zero, rule optionally printed
  const Wigner::SymbolRequest bad =
      Wigner::ThreeJRequest{q(1), q(1), q(3), q(0), q(0), q(0)};
  const auto bad_result = IO::format_result(bad, Wigner::evaluate(bad));
  REQUIRE(bad_result.find("Value: 0.00000000\n") != std::string::npos);
  REQUIRE(bad_result.find("Selection rule") == std::string::npos);

  const auto bad_rule =
      IO::format_result(bad, Wigner::evaluate(bad), options);
  REQUIRE(bad_rule.find("Value: 0.0000\n") != std::string::npos);
  REQUIRE(bad_rule.find("Exact: 0\n") != std::string::npos);
  REQUIRE(bad_rule.find("Selection rule failed: triangle rule (1, 1, 3)\n") !=
          std::string::npos);

  // The value printed is the one given (from Wigner::evaluate); the exact form
  // is only computed on request
  const std::variant<double, Angular::InvalidSymbol> given{-0.125};
  const auto given_result = IO::format_result(s3j, given);
  REQUIRE(given_result.find("Value: -0.12500000\n") != std::string::npos);
  REQUIRE(given_result.find("Exact:") == std::string::npos);
}
