#include "IO/Prompt.hpp"
#include "catch2/catch.hpp"
#include <iostream>
#include <sstream>
#include <string>

namespace {
std::string header() {
  const std::string line60(60, '=');
  return line60 + "\nWIGNER SYMBOLS CALCULATOR\n" + line60 +
         "\nCalculate quantum angular momentum coupling coefficients\n\n";
}
} // namespace

//==============================================================================
TEST_CASE("IO: interactive session, 6j", "[IO][Prompt][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "IO: interactive session, 6j\n";

  std::istringstream in("6\n1\n1\n1\n1\n1\n1\n");
  std::ostringstream out;
  REQUIRE(IO::run_interactive(in, out));

  const std::string line40(40, '-');
  const std::string eq40(40, '=');
  const std::string expected =
      header() + "Select symbol type (3-j or 6-j). Enter 3 or 6: \n" + line40 +
      "\nWIGNER 6-j SYMBOL CALCULATION\n" + line40 +
      "\nEnter angular momentum quantum numbers\n\n"
      "Enter j1: Enter j2: Enter j3: Enter j4: Enter j5: Enter j6: \n" +
      eq40 + "\nRESULT:\nWigner 6-j symbol { 1 1 1 }\n" +
      std::string(19, ' ') + "{ 1 1 1 }\nValue: 0.16666667\n" + eq40 + "\n";
  REQUIRE(out.str() == expected);
}

//==============================================================================
TEST_CASE("IO: interactive session, 3j with re-prompts", "[IO][Prompt][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "IO: interactive session, 3j with re-prompts\n";

  std::istringstream in("x\n5\n 3 \n1/2\n1/2\nabc\n1/0\n0\n1/2\n-1/2\n0\n");
  std::ostringstream out;
  REQUIRE(IO::run_interactive(in, out));
  const auto str = out.str();

  const std::string bad_selection = "Invalid selection. Please enter '3' for "
                                    "3-j symbol or '6' for 6-j symbol.\n";
  const std::string bad_number = "Invalid input. Please enter a valid "
                                 "fraction (e.g., 1/2) or integer.\n";

  // two bad selections
  const auto first = str.find(bad_selection);
  REQUIRE(first != std::string::npos);
  REQUIRE(str.find(bad_selection, first + 1) != std::string::npos);

  REQUIRE(str.find("WIGNER 3-j SYMBOL CALCULATION\n") != std::string::npos);
  REQUIRE(str.find("Enter angular momentum (j) and magnetic (m) quantum "
                   "numbers\n") != std::string::npos);
  // j3 asked three times
  REQUIRE(str.find("Enter j3: " + bad_number + "Enter j3: " + bad_number +
                   "Enter j3: Enter m1: ") != std::string::npos);

  REQUIRE(str.find("Wigner 3-j symbol { 1/2 1/2 0 }\n" + std::string(21, ' ') +
                   "{ 1/2 -1/2 0 }\nValue: 0.70710678\n") !=
          std::string::npos);
}

//==============================================================================
TEST_CASE("IO: interactive session, options and end of input",
          "[IO][Prompt][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "IO: interactive session, options and end of input\n";

  {
    // triangle rule fails: 0, not an error
    std::istringstream in("3\n1\n1\n3\n0\n0\n0\n");
    std::ostringstream out;
    Wigner::Options options;
    options.rule = true;
    REQUIRE(IO::run_interactive(in, out, options));
    REQUIRE(out.str().find("Value: 0.00000000\n") != std::string::npos);
    REQUIRE(out.str().find("Selection rule failed: triangle rule") !=
            std::string::npos);
  }

  {
    // input ends before selection
    std::istringstream in("x\n");
    std::ostringstream out;
    REQUIRE_FALSE(IO::run_interactive(in, out));
  }

  {
    // input ends part way through
    std::istringstream in("3\n1\n1\n");
    std::ostringstream out;
    REQUIRE_FALSE(IO::run_interactive(in, out));
    REQUIRE(out.str().find("RESULT") == std::string::npos);
  }

  {
    std::istringstream in("  -3/2\n");
    std::ostringstream out;
    const auto value = IO::prompt_quantum_number(in, out, "Enter m1: ");
    REQUIRE(value);
    REQUIRE(*value == Angular::Rational(-3, 2));
    REQUIRE(out.str() == "Enter m1: ");
  }

  {
    std::istringstream in("1/-2\n");
    std::ostringstream out;
    const auto value = IO::prompt_quantum_number(in, out, "Enter m2: ");
    REQUIRE(value);
    REQUIRE(*value == Angular::Rational(-1, 2));
    REQUIRE(out.str() == "Enter m2: ");
  }
}
