#pragma once
#include <boost/multiprecision/cpp_int.hpp>
#include <optional>
#include <string>

/*!
@brief
Exact integer/rational types used by the Racah formulas.
@details
Angular momenta are integer or half-integer. Everywhere in the numerical core
they are carried as 2*j (int), and converted to/from exact rationals only at
the boundary. Factorials (and their ratios) are exact (arbitrary precision),
so there is no overflow for any j that fits into the 2j representation.
*/
namespace Angular {

//! Arbitrary precision integer
using Integer = boost::multiprecision::cpp_int;
//! Arbitrary precision rational: always in lowest terms, sign on numerator
using Rational = boost::multiprecision::cpp_rational;

//! Largest |2j| accepted by twice(). Factorials of ~2^20 are already far beyond
//! anything the Racah sums can be evaluated for in reasonable time.
constexpr int max_twoj = 1 << 20;

//==============================================================================
inline Integer numerator(const Rational &q) {
  return boost::multiprecision::numerator(q);
}
inline Integer denominator(const Rational &q) {
  return boost::multiprecision::denominator(q);
}

//! Returns true if q is an integer
inline bool is_integer(const Rational &q) { return denominator(q) == 1; }

//! Returns true if q is an integer or half-integer (denominator 1 or 2)
inline bool is_half_integer(const Rational &q) {
  const auto d = denominator(q);
  return d == 1 || d == 2;
}

//! Converts j -> 2*j. Empty if j is not a multiple of 1/2, or |2j|>max_twoj
inline std::optional<int> twice(const Rational &q) {
  if (!is_half_integer(q))
    return std::nullopt;
  const Integer two_q = 2 * numerator(q) / denominator(q);
  if (abs(two_q) > max_twoj)
    return std::nullopt;
  return two_q.convert_to<int>();
}

//! Converts 2*j -> j (exact)
inline Rational from_twice(int two_j) { return Rational(two_j, 2); }

//! Renders as "n" or "n/d", e.g. 1, -1/2, 3/2
inline std::string to_string(const Rational &q) {
  if (is_integer(q))
    return numerator(q).str();
  return numerator(q).str() + "/" + denominator(q).str();
}

} // namespace Angular
