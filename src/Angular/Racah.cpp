#include "Angular/Racah.hpp"
#include "Angular/Factorial.hpp"
#include "Angular/SelectionRules.hpp"
#include "qip/Maths.hpp"
#include <boost/multiprecision/integer.hpp>
#include <algorithm>
#include <cmath>
#include <optional>
#include <vector>

namespace Angular {

//==============================================================================
double to_double(const Rational &q) {
  const auto sgn = q.sign();
  if (sgn == 0)
    return 0.0;
  Integer num = abs(numerator(q));
  Integer den = denominator(q);
  // Keep ~960 significant bits at most, so neither piece overflows a double.
  // Relative error from the shift is ~2^-900
  constexpr unsigned keep_bits = 960;
  const auto msb = std::max(boost::multiprecision::msb(num),
                            boost::multiprecision::msb(den));
  if (msb > keep_bits) {
    const auto shift = msb - keep_bits;
    num >>= shift;
    den >>= shift;
    if (den == 0) // |q| is astronomically large
      return sgn * HUGE_VAL;
  }
  return sgn * (num.convert_to<double>() / den.convert_to<double>());
}

//==============================================================================
double SqrtRational::value() const {
  if (sign == 0)
    return 0.0;
  return sign * std::sqrt(to_double(square));
}

std::string SqrtRational::to_string() const {
  if (sign == 0)
    return "0";
  const auto s = sign < 0 ? std::string{"-"} : std::string{};
  // perfect square? then print without the root
  Integer rn, rd;
  const Integer sn = boost::multiprecision::sqrt(numerator(square), rn);
  const Integer sd = boost::multiprecision::sqrt(denominator(square), rd);
  if (rn == 0 && rd == 0)
    return s + Angular::to_string(Rational(sn, sd));
  return s + "sqrt(" + Angular::to_string(square) + ")";
}

//==============================================================================
Rational triangle_delta_sq_2(int tja, int tjb, int tjc) {
  const auto s = (tja + tjb + tjc) / 2;
  const Integer num = factorial((tja + tjb - tjc) / 2) *
                      factorial((tja - tjb + tjc) / 2) *
                      factorial((-tja + tjb + tjc) / 2);
  return Rational(num, factorial(s + 1));
}

//==============================================================================
namespace {
// n!/m! = (m+1)(m+2)...n, for n >= m >= 0
Integer factorial_ratio(int n, int m) {
  Integer r{1};
  for (int i = m + 1; i <= n; ++i)
    r *= i;
  return r;
}

// Exact alternating factorial sum, as appears in the Racah formulas:
//   sum_{k=k_min}^{k_max} (-1)^k (k+s)! / [prod_i (k+p_i)! prod_j (q_j-k)!]
// The (k+s)! numerator is only present if 'shift' is given.
// Every term is scaled to the common denominator
//   D = prod_i (k_max+p_i)! prod_j (q_j-k_min)!
// so each c_k = term_k * D / (k_min+s)! is an integer, and consecutive c_k are
// related by a ratio of small integers. Only the final result is reduced.
Rational alternating_sum(int k_min, int k_max, const std::vector<int> &rising,
                         const std::vector<int> &falling,
                         std::optional<int> shift = std::nullopt) {
  if (k_min > k_max)
    return Rational{0};
  Integer c{1};
  for (const auto p : rising)
    c *= factorial_ratio(k_max + p, k_min + p);

  Integer sum{0};
  for (int k = k_min;; ++k) {
    if (evenQ(k))
      sum += c;
    else
      sum -= c;
    if (k == k_max)
      break;
    // c_{k+1} = c_k * (k+1+s) prod_j (q_j-k) / prod_i (k+1+p_i): exact
    Integer up{1}, down{1};
    if (shift)
      up *= k + 1 + *shift;
    for (const auto q : falling)
      up *= q - k;
    for (const auto p : rising)
      down *= k + 1 + p;
    c *= up;
    c /= down;
  }

  Integer den{1};
  for (const auto p : rising)
    den *= factorial(k_max + p);
  for (const auto q : falling)
    den *= factorial(q - k_min);
  if (shift)
    sum *= factorial(k_min + *shift);
  return Rational(sum, den);
}
} // namespace

//==============================================================================
SqrtRational threej_exact_2(int tj1, int tj2, int tj3, int tm1, int tm2,
                            int tm3) {
  if (threej_zeroQ_2(tj1, tj2, tj3, tm1, tm2, tm3))
    return {};

  // Selection rules guarantee every one of these is an integer
  const auto j1pj2mj3 = (tj1 + tj2 - tj3) / 2;
  const auto j1mm1 = (tj1 - tm1) / 2;
  const auto j2pm2 = (tj2 + tm2) / 2;
  const auto j3mj2pm1 = (tj3 - tj2 + tm1) / 2;
  const auto j3mj1mm2 = (tj3 - tj1 - tm2) / 2;

  // range of k for which every factorial argument is non-negative
  const auto k_min = qip::max(0, -j3mj2pm1, -j3mj1mm2);
  const auto k_max = qip::min(j1pj2mj3, j1mm1, j2pm2);

  // 1 / [k! (j3-j2+m1+k)! (j3-j1-m2+k)! (j1+j2-j3-k)! (j1-m1-k)! (j2+m2-k)!]
  const Rational sum = alternating_sum(k_min, k_max, {0, j3mj2pm1, j3mj1mm2},
                                       {j1pj2mj3, j1mm1, j2pm2});
  if (sum == 0)
    return {};

  const Integer jm_factorials =
      factorial((tj1 + tm1) / 2) * factorial((tj1 - tm1) / 2) *
      factorial((tj2 + tm2) / 2) * factorial((tj2 - tm2) / 2) *
      factorial((tj3 + tm3) / 2) * factorial((tj3 - tm3) / 2);

  const auto phase = neg1pow_2(tj1 - tj2 - tm3);
  const Rational square =
      triangle_delta_sq_2(tj1, tj2, tj3) * Rational(jm_factorials) * sum * sum;
  return {phase * sum.sign(), square};
}

//==============================================================================
SqrtRational sixj_exact_2(int tj1, int tj2, int tj3, int tj4, int tj5,
                          int tj6) {
  if (sixj_zeroQ_2(tj1, tj2, tj3, tj4, tj5, tj6))
    return {};

  // triad perimeters: {j1,j2,j3}, {j1,j5,j6}, {j4,j2,j6}, {j4,j5,j3}
  const auto a1 = (tj1 + tj2 + tj3) / 2;
  const auto a2 = (tj1 + tj5 + tj6) / 2;
  const auto a3 = (tj4 + tj2 + tj6) / 2;
  const auto a4 = (tj4 + tj5 + tj3) / 2;
  // "crossed" sums
  const auto b1 = (tj1 + tj2 + tj4 + tj5) / 2;
  const auto b2 = (tj2 + tj3 + tj5 + tj6) / 2;
  const auto b3 = (tj3 + tj1 + tj6 + tj4) / 2;

  const auto k_min = qip::max(a1, a2, a3, a4);
  const auto k_max = qip::min(b1, b2, b3);

  // (k+1)! / [prod_i (k-a_i)! prod_j (b_j-k)!]
  const Rational sum =
      alternating_sum(k_min, k_max, {-a1, -a2, -a3, -a4}, {b1, b2, b3}, 1);
  if (sum == 0)
    return {};

  const Rational square =
      triangle_delta_sq_2(tj1, tj2, tj3) * triangle_delta_sq_2(tj1, tj5, tj6) *
      triangle_delta_sq_2(tj4, tj2, tj6) * triangle_delta_sq_2(tj4, tj5, tj3) *
      sum * sum;
  return {sum.sign(), square};
}

} // namespace Angular
