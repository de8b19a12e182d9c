#include "IO/Format.hpp"
#include "IO/Fraction.hpp"
#include "IO/InputBlock.hpp"
#include "IO/Prompt.hpp"
#include "IO/Styled.hpp"
#include "Wigner/Options.hpp"
#include "Wigner/Symbol.hpp"
#include "qip/String.hpp"
#include "version/version.hpp"
#include <algorithm>
#include <fmt/format.h>
#include <fstream>
#include <iostream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

//! Man page info
namespace man {

const std::string name{"wigner - Wigner 3j and 6j symbols, evaluated exactly "
                       "from the Racah formulas."};

const std::string synopsis{"wigner\n"
                           "wigner '(j1 j2 j3 m1 m2 m3)'\n"
                           "wigner '{j1 j2 j3 j4 j5 j6}'\n"
                           "wigner [InputFile]\n"
                           "wigner -s [InputBlock]\n"};

const std::string description{
    "wigner calculates Wigner 3j and 6j angular momentum coupling "
    "coefficients. Quantum numbers are integers or half-integers, entered as "
    "integers or fractions (e.g., 1, 3/2, -1/2). The symbols are summed "
    "exactly (arbitrary precision rationals), and only converted to floating "
    "point at the end. A symbol that fails any triangle/selection rule is "
    "exactly zero; this is not an error.\n"
    "With no arguments, runs interactively."};

const std::vector<std::pair<std::string, std::string>> options{
    {"(j1 j2 j3 m1 m2 m3)",
     "Evaluates a single 3j symbol. Numbers may be separated by spaces, "
     "commas, semi-colons, or '|'. Must be quoted on the command line.\n"
     "Example:\n"
     "./wigner '(1 1 1 1 -1 0)'\n"
     "    - 1/sqrt(6) = 0.40824829"},
    {"{j1 j2 j3 j4 j5 j6}",
     "Evaluates a single 6j symbol. Must be quoted on the command line.\n"
     "Example:\n"
     "./wigner '{1/2, 1/2, 1, 1/2, 1/2, 0}'\n"
     "    - 1/2 = 0.50000000"},
    {"[InputFile], -f [InputFile]",
     "Reads the symbol, and output options, from a file. Format is:\n"
     "ThreeJ{ j1; j2; j3; m1; m2; m3; } or SixJ{ j1; j2; j3; j4; j5; j6; }\n"
     "Output{ precision; exact; rule; }\n"
     "Example:\n"
     "./wigner input.in"},
    {"-s [input options as string], --string",
     "Takes input options as a string, using same format as input file\n"
     "Example:\n"
     "./wigner -s 'SixJ{j1=1;j2=1;j3=1;j4=1;j5=1;j6=1;} Output{exact=true;}'"},
    {"-h, --help, -?", "Prints this help info"},
    {"-l, --libs, --libraries",
     "Prints version details for libaries used by wigner"},
    {"-v, --version", "Prints wigner version (and git commit) details"} //
};

//! Prints 'man page' style info
void print_manual() {
  const std::size_t wrap_at = 80;
  std::string tab = "    ";
  IO::styled_print(fmt::emphasis::bold, "NAME\n");
  fmt::print("{}", qip::wrap(name, wrap_at, tab + tab));

  fmt::print("\n");
  fmt::print("WIGNER v: {}\n", version::version());
  fmt::print("Libraries:\n{}\n", version::libraries());
  fmt::print("Compiled: {}\n", version::compiled());

  fmt::print("\n\n");

  IO::styled_print(fmt::emphasis::bold, "SYNOPSIS\n");
  fmt::print("{}", qip::wrap(synopsis, wrap_at, tab + tab));

  fmt::print("\n\n");

  IO::styled_print(fmt::emphasis::bold, "DESCRIPTION\n");
  fmt::print("{}", qip::wrap(description, wrap_at, tab + tab));

  fmt::print("\n\n");

  IO::styled_print(fmt::emphasis::bold, "OPTIONS\n");
  for (const auto &[option, text] : options) {
    IO::styled_print(fg(fmt::color::steel_blue), "{}",
                     qip::wrap(option, wrap_at, tab + tab));
    fmt::print("{}\n", qip::wrap(text, wrap_at, tab + tab + tab));
  }
}

} // namespace man

//==============================================================================
//! Evaluates and prints result. Returns program exit status
int run(const Wigner::SymbolRequest &request, const Wigner::Options &options) {
  fmt::print("{}", IO::format_result(request, Wigner::evaluate(request),
                                     options));
  return 0;
}

//! Reads symbol + options from input blocks, and runs
int run(const IO::InputBlock &input) {
  // Echo the (parsed) input, unless in 'help' mode
  const auto help_mode = std::any_of(
      input.options().cbegin(), input.options().cend(),
      [](const IO::Option &o) { return qip::ci_compare(o.key, "help"); });
  if (!help_mode) {
    std::cout << '\n';
    input.print(std::cout);
  }

  input.check({{"ThreeJ{}", "3j symbol: j1; j2; j3; m1; m2; m3;"},
               {"SixJ{}", "6j symbol: j1; j2; j3; j4; j5; j6;"},
               {"Output{}", "Output options: precision; exact; rule;"}});
  const auto options = Wigner::read_options(input);
  const auto request = Wigner::read_request(input);
  if (!request)
    return 1;
  return run(*request, options);
}

//==============================================================================
//==============================================================================
//! Parses command-line input, then runs wigner
int main(int argc, char *argv[]) {

  // Parse input text into strings:
  const std::string in_text_1 = (argc > 1) ? argv[1] : "";
  const std::string in_text_2 = (argc > 2) ? argv[2] : "";

  // check for special commands
  if (argc <= 1) {
    return IO::run_interactive(std::cin, std::cout) ? 0 : 1;
  } else if (in_text_1 == "-v" || in_text_1 == "--version") {
    fmt::print("WIGNER v: {}\n", version::version());
    fmt::print("Libraries:\n{}\n", version::libraries());
    fmt::print("Compiled: {}\n", version::compiled());
    return 0;
  } else if (in_text_1 == "-l" || in_text_1.substr(0, 5) == "--lib") {
    fmt::print("Libraries:\n{}\n", version::libraries());
    return 0;
  } else if (in_text_1 == "-h" || in_text_1 == "--help" || in_text_1 == "-?") {
    man::print_manual();
    return 0;
  } else if (in_text_1 == "-s" || in_text_1 == "--string") {
    fmt::print("Reading input from command-line string\n");
    return run(IO::InputBlock("wigner", in_text_2));
  } else if (in_text_1 == "-f" || in_text_1 == "--file") {
    std::ifstream file(in_text_2);
    if (!file.good()) {
      IO::styled_print(fg(fmt::color::red), "\nError 149: ");
      fmt::print("Cannot open input file: '{}'\n", in_text_2);
      return 1;
    }
    return run(IO::InputBlock("wigner", file));
  }

  const auto first = qip::trim(in_text_1);
  if (!first.empty() && (first.front() == '(' || first.front() == '{')) {
    // Single symbol, given directly
    const auto symbol = IO::parse_symbol(in_text_1);
    if (const auto error = std::get_if<IO::ParseError>(&symbol)) {
      IO::styled_print(fg(fmt::color::red), "\nError 162: ");
      fmt::print("{}\n", error->message);
      fmt::print("Run 'wigner -h' for usage\n");
      return 1;
    }
    return run(std::get<Wigner::SymbolRequest>(symbol), Wigner::Options{});
  }

  if (!in_text_1.empty() && in_text_1.front() == '-') {
    fmt::print("Unrecognised option: {}\n", in_text_1);
    man::print_manual();
    return 1;
  }

  // Otherwise, should be an input file
  std::ifstream file(in_text_1);
  if (!file.good()) {
    IO::styled_print(fg(fmt::color::red), "\nError 179: ");
    fmt::print("I don't understand the input: '{}'\n"
               "Not a symbol, and not a readable input file. "
               "Run 'wigner -h' for usage\n",
               in_text_1);
    return 1;
  }
  return run(IO::InputBlock("wigner", file));
}
