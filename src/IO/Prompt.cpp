#include "IO/Prompt.hpp"
#include "IO/Format.hpp"
#include "IO/Fraction.hpp"
#include "Wigner/Symbol.hpp"
#include "qip/String.hpp"
#include <array>
#include <fmt/ostream.h>
#include <string>

namespace IO {

//==============================================================================
std::optional<Angular::Rational>
prompt_quantum_number(std::istream &in, std::ostream &out,
                      const std::string &prompt) {
  std::string line;
  while (true) {
    fmt::print(out, "{}", prompt);
    out.flush();
    if (!std::getline(in, line))
      return std::nullopt;
    auto value = parse_quantum_number(line);
    if (const auto q = std::get_if<Angular::Rational>(&value))
      return *q;
    fmt::print(out, "Invalid input. Please enter a valid fraction (e.g., 1/2) "
                    "or integer.\n");
  }
}

//==============================================================================
bool run_interactive(std::istream &in, std::ostream &out,
                     const Wigner::Options &options) {
  const std::string line60(60, '=');
  const std::string line40(40, '-');

  fmt::print(out, "{}\nWIGNER SYMBOLS CALCULATOR\n{}\n", line60, line60);
  fmt::print(out, "Calculate quantum angular momentum coupling coefficients\n\n");

  std::string selection;
  while (true) {
    fmt::print(out, "Select symbol type (3-j or 6-j). Enter 3 or 6: ");
    out.flush();
    if (!std::getline(in, selection))
      return false;
    selection = std::string(qip::trim(selection));
    if (selection == "3" || selection == "6")
      break;
    fmt::print(out, "Invalid selection. Please enter '3' for 3-j symbol or "
                    "'6' for 6-j symbol.\n");
  }

  const bool is_3j = selection == "3";
  fmt::print(out, "\n{}\nWIGNER {}-j SYMBOL CALCULATION\n{}\n", line40,
             selection, line40);
  fmt::print(out, "{}\n\n",
             is_3j ? "Enter angular momentum (j) and magnetic (m) quantum "
                     "numbers"
                   : "Enter angular momentum quantum numbers");

  const auto names = is_3j ? std::array<const char *, 6>{"j1", "j2", "j3",
                                                         "m1", "m2", "m3"}
                           : std::array<const char *, 6>{"j1", "j2", "j3",
                                                         "j4", "j5", "j6"};
  std::array<Angular::Rational, 6> q;
  for (std::size_t i = 0; i < names.size(); ++i) {
    const auto value =
        prompt_quantum_number(in, out, fmt::format("Enter {}: ", names[i]));
    if (!value)
      return false;
    q[i] = *value;
  }

  const auto request =
      is_3j ? Wigner::SymbolRequest{Wigner::ThreeJRequest{q[0], q[1], q[2],
                                                          q[3], q[4], q[5]}}
            : Wigner::SymbolRequest{
                  Wigner::SixJRequest{q[0], q[1], q[2], q[3], q[4], q[5]}};

  fmt::print(out, "{}",
             format_result(request, Wigner::evaluate(request), options));
  return true;
}

} // namespace IO
