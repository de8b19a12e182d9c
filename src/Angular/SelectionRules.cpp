#include "Angular/SelectionRules.hpp"
#include <array>
#include <fmt/format.h>

namespace Angular {

//==============================================================================
std::string to_string(Rule rule) {
  switch (rule) {
  case Rule::NotHalfInteger:
    return "not integer or half-integer";
  case Rule::NegativeMomentum:
    return "negative angular momentum";
  case Rule::ProjectionParity:
    return "j-m not integer";
  case Rule::ProjectionRange:
    return "|m| > j";
  case Rule::ProjectionSum:
    return "m1+m2+m3 != 0";
  case Rule::Triangle:
    return "triangle rule";
  case Rule::TrianglePerimeter:
    return "a+b+c not integer";
  }
  return "unknown";
}

namespace {
// Converts list of rationals to 2*j. Fails with name of first bad one
template <std::size_t N>
std::optional<InvalidSymbol>
to_twice(const std::array<const Rational *, N> &in,
         const std::array<const char *, N> &names, std::array<int, N> &out) {
  for (std::size_t i = 0; i < N; ++i) {
    const auto tj = twice(*in[i]);
    if (!tj) {
      return InvalidSymbol{Rule::NotHalfInteger,
                           fmt::format("{}={}", names[i], to_string(*in[i]))};
    }
    out[i] = *tj;
  }
  return std::nullopt;
}

std::string j_str(int two_j) { return to_string(from_twice(two_j)); }
} // namespace

//==============================================================================
std::optional<InvalidSymbol> validate_triad_2(int a, int b, int c) {
  if (triangle(a, b, c) == 0) {
    return InvalidSymbol{Rule::Triangle, fmt::format("({}, {}, {})", j_str(a),
                                                     j_str(b), j_str(c))};
  }
  if (!evenQ(a + b + c)) {
    return InvalidSymbol{Rule::TrianglePerimeter,
                         fmt::format("({}, {}, {})", j_str(a), j_str(b),
                                     j_str(c))};
  }
  return std::nullopt;
}

//==============================================================================
std::optional<InvalidSymbol> validate_3j(const Rational &j1, const Rational &j2,
                                         const Rational &j3, const Rational &m1,
                                         const Rational &m2,
                                         const Rational &m3) {
  std::array<int, 6> t{};
  if (auto bad = to_twice<6>({&j1, &j2, &j3, &m1, &m2, &m3},
                             {"j1", "j2", "j3", "m1", "m2", "m3"}, t))
    return bad;
  const auto [tj1, tj2, tj3, tm1, tm2, tm3] = t;

  const std::array<int, 3> tj{tj1, tj2, tj3};
  const std::array<int, 3> tm{tm1, tm2, tm3};
  for (std::size_t i = 0; i < 3; ++i) {
    if (tj[i] < 0)
      return InvalidSymbol{Rule::NegativeMomentum,
                           fmt::format("j{}={}", i + 1, j_str(tj[i]))};
  }
  for (std::size_t i = 0; i < 3; ++i) {
    if (!evenQ(tj[i] - tm[i]))
      return InvalidSymbol{Rule::ProjectionParity,
                           fmt::format("j{}={}, m{}={}", i + 1, j_str(tj[i]),
                                       i + 1, j_str(tm[i]))};
  }
  for (std::size_t i = 0; i < 3; ++i) {
    if (std::abs(tm[i]) > tj[i])
      return InvalidSymbol{Rule::ProjectionRange,
                           fmt::format("j{}={}, m{}={}", i + 1, j_str(tj[i]),
                                       i + 1, j_str(tm[i]))};
  }
  if (sumsToZero(tm1, tm2, tm3) == 0) {
    return InvalidSymbol{Rule::ProjectionSum,
                         fmt::format("m1+m2+m3={}", j_str(tm1 + tm2 + tm3))};
  }
  return validate_triad_2(tj1, tj2, tj3);
}

//==============================================================================
std::optional<InvalidSymbol> validate_6j(const Rational &j1, const Rational &j2,
                                         const Rational &j3, const Rational &j4,
                                         const Rational &j5,
                                         const Rational &j6) {
  std::array<int, 6> t{};
  if (auto bad = to_twice<6>({&j1, &j2, &j3, &j4, &j5, &j6},
                             {"j1", "j2", "j3", "j4", "j5", "j6"}, t))
    return bad;

  for (std::size_t i = 0; i < t.size(); ++i) {
    if (t[i] < 0)
      return InvalidSymbol{Rule::NegativeMomentum,
                           fmt::format("j{}={}", i + 1, j_str(t[i]))};
  }

  const auto [a, b, c, d, e, f] = t;
  const std::array<std::array<int, 3>, 4> triads{
      {{a, b, c}, {a, e, f}, {d, b, f}, {d, e, c}}};
  for (const auto &[x, y, z] : triads) {
    if (auto bad = validate_triad_2(x, y, z))
      return bad;
  }
  return std::nullopt;
}

} // namespace Angular
