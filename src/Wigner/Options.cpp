#include "Wigner/Options.hpp"
#include "IO/Fraction.hpp"
#include "IO/Styled.hpp"
#include <array>
#include <fmt/format.h>
#include <string>
#include <utility>
#include <vector>

namespace Wigner {

//==============================================================================
Options read_options(const IO::InputBlock &input) {
  Options options;
  const auto output = input.getBlock("Output");
  if (!output)
    return options;

  output->check({{"precision", "Digits after decimal point [8]"},
                 {"exact", "Print exact value, sign*sqrt(p/q) [false]"},
                 {"rule", "Print failed selection rule, if any [false]"}});

  // largest number of digits that make sense for a double
  constexpr int max_precision = 17;
  const auto precision = output->get<int>("precision");
  if (precision && *precision >= 0 && *precision <= max_precision) {
    options.precision = *precision;
  } else if (output->get("precision")) {
    IO::warning();
    fmt::print("Output: precision = {} not usable, must be integer in [0, {}]."
               " Using {}\n",
               *output->get("precision"), max_precision, options.precision);
  }

  options.exact = output->get("exact", options.exact);
  options.rule = output->get("rule", options.rule);
  return options;
}

//==============================================================================
std::optional<SymbolRequest> read_request(const IO::InputBlock &input) {
  const auto threej = input.getBlock("ThreeJ");
  const auto sixj = input.getBlock("SixJ");

  if (threej && sixj) {
    IO::styled_print(fg(fmt::color::red), "\nError 34: ");
    fmt::print("Both ThreeJ{{}} and SixJ{{}} given; one symbol per run\n");
    return std::nullopt;
  }
  if (!threej && !sixj) {
    IO::styled_print(fg(fmt::color::red), "\nError 39: ");
    fmt::print("No symbol given: need ThreeJ{{}} or SixJ{{}} block\n");
    return std::nullopt;
  }

  const auto &block = threej ? *threej : *sixj;
  const auto keys = threej ? std::array<const char *, 6>{"j1", "j2", "j3",
                                                         "m1", "m2", "m3"}
                           : std::array<const char *, 6>{"j1", "j2", "j3",
                                                         "j4", "j5", "j6"};

  std::vector<std::pair<std::string, std::string>> allowed;
  for (const auto &key : keys)
    allowed.push_back({key, "integer or fraction, e.g., 1/2"});
  block.check(allowed);

  std::array<Angular::Rational, 6> q;
  for (std::size_t i = 0; i < keys.size(); ++i) {
    const auto text = block.get(keys[i]);
    if (!text) {
      IO::styled_print(fg(fmt::color::red), "\nError 58: ");
      fmt::print("{}{{}} is missing {}\n", block.name(), keys[i]);
      return std::nullopt;
    }
    auto value = IO::parse_quantum_number(*text);
    if (const auto error = std::get_if<IO::ParseError>(&value)) {
      IO::styled_print(fg(fmt::color::red), "\nError 64: ");
      fmt::print("{}{{}}: {} = {}: {}\n", block.name(), keys[i], *text,
                 error->message);
      return std::nullopt;
    }
    q[i] = std::get<Angular::Rational>(value);
  }

  if (threej)
    return SymbolRequest{ThreeJRequest{q[0], q[1], q[2], q[3], q[4], q[5]}};
  return SymbolRequest{SixJRequest{q[0], q[1], q[2], q[3], q[4], q[5]}};
}

} // namespace Wigner
