#pragma once
#include "Angular/Rational.hpp"
#include <string>

/*!
@brief
Exact Wigner 3j and 6j symbols, from the Racah summation formulas.
@details
The symbols have the closed form (rational) x sqrt(rational). Both pieces are
accumulated exactly (arbitrary precision rationals), and combined into a
single SqrtRational = sign * sqrt(square). The square root is only taken once,
when converting to floating point (SqrtRational::value()).

All functions take 2*j and 2*m as integers (the '_2' suffix), same as the
rest of the Angular namespace. If the selection rules fail, the symbol is
exactly zero and no summation is done.

3j:
\f[
\begin{pmatrix}j_1&j_2&j_3\\m_1&m_2&m_3\end{pmatrix}
 = (-1)^{j_1-j_2-m_3}\Delta(j_1j_2j_3)
 \sqrt{\prod_i (j_i+m_i)!(j_i-m_i)!}
 \sum_k \frac{(-1)^k}{k!(j_1+j_2-j_3-k)!(j_1-m_1-k)!(j_2+m_2-k)!
 (j_3-j_2+m_1+k)!(j_3-j_1-m_2+k)!}
\f]
6j:
\f[
\begin{Bmatrix}j_1&j_2&j_3\\j_4&j_5&j_6\end{Bmatrix}
 = \Delta(j_1j_2j_3)\Delta(j_1j_5j_6)\Delta(j_4j_2j_6)\Delta(j_4j_5j_3)
 \sum_k \frac{(-1)^k (k+1)!}{\prod_{i=1}^4(k-a_i)!\prod_{j=1}^3(b_j-k)!}
\f]
with a_i the four triad perimeters, b_j the three "crossed" sums.
*/
namespace Angular {

//==============================================================================
//! Exact value: sign * sqrt(square), with sign in {-1, 0, +1}
struct SqrtRational {
  int sign{0};
  Rational square{0};

  //! Converts to double. The only place a square root is taken
  double value() const;

  //! e.g. "-sqrt(1/2)", "1/6" (perfect squares printed without root), "0"
  std::string to_string() const;

  friend bool operator==(const SqrtRational &a, const SqrtRational &b) {
    return a.sign == b.sign && a.square == b.square;
  }
  friend bool operator!=(const SqrtRational &a, const SqrtRational &b) {
    return !(a == b);
  }
};

//! Converts exact rational to nearest double (safe for huge num/den)
double to_double(const Rational &q);

//==============================================================================
//! Delta(a,b,c)^2 = (a+b-c)!(a-b+c)!(-a+b+c)!/(a+b+c+1)!. Takes 2*j. Assumes
//! the triad is valid (triangle + integer perimeter)
Rational triangle_delta_sq_2(int tja, int tjb, int tjc);

//! Exact 3j symbol (j1 j2 j3 \\ m1 m2 m3). Takes 2*j, 2*m.
//! Zero if any selection rule fails
SqrtRational threej_exact_2(int tj1, int tj2, int tj3, int tm1, int tm2,
                            int tm3);

//! Exact 6j symbol {j1 j2 j3 \\ j4 j5 j6}. Takes 2*j. Zero if any triad fails
SqrtRational sixj_exact_2(int tj1, int tj2, int tj3, int tj4, int tj5,
                          int tj6);

//==============================================================================
//! @brief Calculates wigner 3j symbol. Takes INTEGER values, that have
//! already been multiplied by 2. Works for l and j (integer and half-integer)
inline double threej_2(int two_j1, int two_j2, int two_j3, int two_m1,
                       int two_m2, int two_m3) {
  return threej_exact_2(two_j1, two_j2, two_j3, two_m1, two_m2, two_m3)
      .value();
}

//! @brief Calculates wigner 6j symbol {j1 j2 j3 \\ j4 j5 j6}. Takes 2*j
inline double sixj_2(int two_j1, int two_j2, int two_j3, int two_j4,
                     int two_j5, int two_j6) {
  return sixj_exact_2(two_j1, two_j2, two_j3, two_j4, two_j5, two_j6).value();
}

} // namespace Angular
