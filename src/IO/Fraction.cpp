#include "IO/Fraction.hpp"
#include "qip/String.hpp"
#include <array>
#include <fmt/format.h>
#include <vector>

namespace IO {

namespace {
// Parses integer text (optional sign, then digits). Caller checks format.
Angular::Integer to_integer(std::string_view s) {
  bool negative = false;
  if (s.front() == '+' || s.front() == '-') {
    negative = s.front() == '-';
    s.remove_prefix(1);
  }
  // cpp_int reads a leading 0 as octal
  while (s.size() > 1 && s.front() == '0')
    s.remove_prefix(1);
  const Angular::Integer out{std::string(s)};
  return negative ? Angular::Integer(-out) : out;
}
} // namespace

//==============================================================================
std::variant<Angular::Rational, ParseError>
parse_quantum_number(std::string_view text) {
  const auto trimmed = qip::trim(text);
  if (trimmed.empty())
    return ParseError{"empty input"};

  const auto slash = trimmed.find('/');
  const auto num_str = qip::trim(trimmed.substr(0, slash));
  const auto den_str = slash == std::string_view::npos
                           ? std::string_view{"1"}
                           : qip::trim(trimmed.substr(slash + 1));

  if (!qip::string_is_integer(num_str) || !qip::string_is_integer(den_str)) {
    return ParseError{
        fmt::format("'{}' is not an integer or fraction", trimmed)};
  }

  auto num = to_integer(num_str);
  auto den = to_integer(den_str);
  if (den == 0)
    return ParseError{fmt::format("'{}' has zero denominator", trimmed)};
  // boost::rational (Boost < 1.77) throws on a negative denominator
  if (den < 0) {
    num = -num;
    den = -den;
  }

  return Angular::Rational(num, den);
}

//==============================================================================
std::variant<Wigner::SymbolRequest, ParseError>
parse_symbol(std::string_view text) {
  const auto trimmed = qip::trim(text);
  if (trimmed.size() < 2)
    return ParseError{fmt::format("'{}' is not a 3j or 6j symbol", trimmed)};

  const auto open = trimmed.front();
  const auto close = trimmed.back();
  const bool is_3j = open == '(' && close == ')';
  const bool is_6j = open == '{' && close == '}';
  if (!is_3j && !is_6j) {
    return ParseError{fmt::format(
        "'{}': expected (j1 j2 j3 m1 m2 m3) or {{j1 j2 j3 j4 j5 j6}}",
        trimmed)};
  }

  const auto parts =
      qip::split_any(trimmed.substr(1, trimmed.size() - 2), " \t,;|");
  if (parts.size() != 6) {
    return ParseError{
        fmt::format("'{}': expected 6 numbers, found {}", trimmed,
                    parts.size())};
  }

  std::array<Angular::Rational, 6> q;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    auto value = parse_quantum_number(parts[i]);
    if (const auto error = std::get_if<ParseError>(&value))
      return *error;
    q[i] = std::get<Angular::Rational>(value);
  }

  if (is_3j)
    return Wigner::SymbolRequest{
        Wigner::ThreeJRequest{q[0], q[1], q[2], q[3], q[4], q[5]}};
  return Wigner::SymbolRequest{
      Wigner::SixJRequest{q[0], q[1], q[2], q[3], q[4], q[5]}};
}

} // namespace IO
