#pragma once
#include "Angular/Rational.hpp"
#include <cstdlib>
#include <optional>
#include <string>

/*!
@brief
Triangle and selection rules for 3j and 6j symbols.
@details
Two layers:
 - constexpr helpers acting on 2*j (integers). These are what the Racah sums
   use (fast, no allocation).
 - validate_3j() / validate_6j(), taking exact rationals, which report *which*
   rule failed. A symbol failing any rule is exactly zero; this is not an
   error, the rule is reported for diagnostics only.
*/
namespace Angular {

//==============================================================================
//! @brief Returns true if a is even
constexpr bool evenQ(int a) { return (a % 2 == 0); }
//! @brief Returns true if a is even, given 2*a (i.e., true if two_a/2 is even)
constexpr bool evenQ_2(int two_a) { return (two_a % 4 == 0); }
//! Evaluates (-1)^{a}
constexpr int neg1pow(int a) { return evenQ(a) ? 1 : -1; }
//! Evaluates (-1)^{two_a/2}
constexpr int neg1pow_2(int two_a) { return evenQ_2(two_a) ? 1 : -1; }

//! @brief Returns 1 if triangle rule is satisfied. nb: works with j OR twoj!
constexpr int triangle(int j1, int j2, int J) {
  return ((j1 + j2 < J) || (std::abs(j1 - j2) > J)) ? 0 : 1;
}

constexpr int sumsToZero(int m1, int m2, int m3) {
  return (m1 + m2 + m3 != 0) ? 0 : 1;
}

//! Triangle rule, plus a+b+c integer (given 2*j: sum of 2j's even)
constexpr bool triad_2(int a, int b, int c) {
  return triangle(a, b, c) == 1 && evenQ(a + b + c);
}

//! True if 3j symbol is zero by selection rules (takes 2*j and 2*m)
constexpr bool threej_zeroQ_2(int tj1, int tj2, int tj3, int tm1, int tm2,
                              int tm3) {
  if (tj1 < 0 || tj2 < 0 || tj3 < 0)
    return true;
  if (sumsToZero(tm1, tm2, tm3) == 0)
    return true;
  if (std::abs(tm1) > tj1 || std::abs(tm2) > tj2 || std::abs(tm3) > tj3)
    return true;
  // j-m must be integer
  if (!evenQ(tj1 - tm1) || !evenQ(tj2 - tm2) || !evenQ(tj3 - tm3))
    return true;
  return !triad_2(tj1, tj2, tj3);
}

//! True if 6j symbol {a b c \\ d e f} is zero by triangle rules (takes 2*j)
constexpr bool sixj_zeroQ_2(int a, int b, int c, int d, int e, int f) {
  if (a < 0 || b < 0 || c < 0 || d < 0 || e < 0 || f < 0)
    return true;
  return !(triad_2(a, b, c) && triad_2(a, e, f) && triad_2(d, b, f) &&
           triad_2(d, e, c));
}

//==============================================================================
//! Selection rules a symbol may fail
enum class Rule {
  NotHalfInteger,    //!< value is not a multiple of 1/2 (or is out of range)
  NegativeMomentum,  //!< j < 0
  ProjectionParity,  //!< j - m not an integer
  ProjectionRange,   //!< |m| > j
  ProjectionSum,     //!< m1 + m2 + m3 != 0
  Triangle,          //!< |a-b| <= c <= a+b violated
  TrianglePerimeter, //!< a+b+c not an integer
};

//! Short human-readable name of the rule
std::string to_string(Rule rule);

//! The rule a symbol failed, with the offending values
struct InvalidSymbol {
  Rule rule;
  std::string detail;
};

//! Checks all 3j selection rules. Empty if the symbol may be non-zero
std::optional<InvalidSymbol> validate_3j(const Rational &j1, const Rational &j2,
                                         const Rational &j3, const Rational &m1,
                                         const Rational &m2,
                                         const Rational &m3);

//! Checks the four 6j triads {j1,j2,j3}, {j1,j5,j6}, {j4,j2,j6}, {j4,j5,j3}.
//! Empty if the symbol may be non-zero
std::optional<InvalidSymbol> validate_6j(const Rational &j1, const Rational &j2,
                                         const Rational &j3, const Rational &j4,
                                         const Rational &j5,
                                         const Rational &j6);

//! Checks a single triad (triangle + integer perimeter), given 2*j
std::optional<InvalidSymbol> validate_triad_2(int a, int b, int c);

} // namespace Angular
