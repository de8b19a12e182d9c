#include "IO/Format.hpp"
#include <fmt/format.h>
#include <string>
#include <type_traits>

namespace IO {

//==============================================================================
std::string format_value(double value, int precision) {
  auto out = fmt::format("{:.{}f}", value, precision);
  if (out.front() == '-' &&
      out.find_first_not_of("0.", 1) == std::string::npos) {
    out.erase(0, 1);
  }
  return out;
}

//==============================================================================
std::string format_symbol(const Wigner::SymbolRequest &request) {
  const auto j = [](const auto &q) { return Angular::to_string(q); };
  return std::visit(
      [&](const auto &r) -> std::string {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, Wigner::ThreeJRequest>) {
          return fmt::format("{{ {} {} {} }}\n{:21}{{ {} {} {} }}", j(r.j1),
                             j(r.j2), j(r.j3), "", j(r.m1), j(r.m2), j(r.m3));
        } else {
          return fmt::format("{{ {} {} {} }}\n{:19}{{ {} {} {} }}", j(r.j1),
                             j(r.j2), j(r.j3), "", j(r.j4), j(r.j5), j(r.j6));
        }
      },
      request);
}

//==============================================================================
std::string
format_result(const Wigner::SymbolRequest &request,
              const std::variant<double, Angular::InvalidSymbol> &result,
              const Wigner::Options &options) {
  const auto bad = std::get_if<Angular::InvalidSymbol>(&result);

  const std::string line(40, '=');
  std::string out = fmt::format("\n{}\nRESULT:\n", line);
  out += fmt::format("Wigner {} symbol {}\n", Wigner::name(request),
                     format_symbol(request));
  out += fmt::format("Value: {}\n", format_value(Wigner::value_or_zero(result),
                                                 options.precision));
  if (options.exact) {
    const auto exact = Wigner::evaluate_exact(request);
    const auto value = std::get_if<Angular::SqrtRational>(&exact);
    out += fmt::format("Exact: {}\n", value ? value->to_string() : "0");
  }
  if (options.rule) {
    if (bad)
      out += fmt::format("Selection rule failed: {} {}\n",
                         Angular::to_string(bad->rule), bad->detail);
    else
      out += "Selection rules: satisfied\n";
  }
  out += line + "\n";
  return out;
}

} // namespace IO
