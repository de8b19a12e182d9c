#include "Angular/Racah.hpp"
#include "Angular/SelectionRules.hpp"
#include "catch2/catch.hpp"
#include <algorithm>
#include <cmath>
#include <gsl/gsl_sf_coupling.h>
#include <iostream>
#include <string>

//==============================================================================
TEST_CASE("Angular: Racah 3j - known values", "[Angular][Racah][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "Angular: Racah 3j - known values\n";

  using Angular::Rational;
  using Angular::SqrtRational;

  // (1 1 1 \\ 1 -1 0) = 1/sqrt(6)
  REQUIRE(Angular::threej_exact_2(2, 2, 2, 2, -2, 0) ==
          SqrtRational{1, Rational(1, 6)});
  REQUIRE(Angular::threej_2(2, 2, 2, 2, -2, 0) ==
          Approx(1.0 / std::sqrt(6.0)).epsilon(1.0e-15));

  // (1/2 1/2 0 \\ 1/2 -1/2 0) = +1/sqrt(2), and swapping m's flips sign
  REQUIRE(Angular::threej_exact_2(1, 1, 0, 1, -1, 0) ==
          SqrtRational{1, Rational(1, 2)});
  REQUIRE(Angular::threej_exact_2(1, 1, 0, -1, 1, 0) ==
          SqrtRational{-1, Rational(1, 2)});
  REQUIRE(Angular::threej_2(1, 1, 0, -1, 1, 0) ==
          Approx(-1.0 / std::sqrt(2.0)).epsilon(1.0e-15));

  // (1 1 0 \\ 0 0 0) = -1/sqrt(3)
  REQUIRE(Angular::threej_exact_2(2, 2, 0, 0, 0, 0) ==
          SqrtRational{-1, Rational(1, 3)});
  REQUIRE(Angular::threej_exact_2(2, 2, 0, 0, 0, 0).to_string() ==
          "-sqrt(1/3)");

  // (2 2 2 \\ 0 0 0) = -sqrt(2/35)
  REQUIRE(Angular::threej_exact_2(4, 4, 4, 0, 0, 0) ==
          SqrtRational{-1, Rational(2, 35)});

  // (5/2 1 3/2 \\ 1/2 0 -1/2) = -1/sqrt(10)
  REQUIRE(Angular::threej_2(5, 2, 3, 1, 0, -1) ==
          Approx(-1.0 / std::sqrt(10.0)).epsilon(1.0e-15));
  // (3/2 7/2 4 \\ 1/2 -1/2 0) = sqrt(5/7)/6
  REQUIRE(Angular::threej_2(3, 7, 8, 1, -1, 0) ==
          Approx(std::sqrt(5.0 / 7.0) / 6.0).epsilon(1.0e-15));
  // (4 3 2 \\ 1 -2 1) = -sqrt(7/180)
  REQUIRE(Angular::threej_exact_2(8, 6, 4, 2, -4, 2) ==
          SqrtRational{-1, Rational(7, 180)});
  // (10 10 10 \\ 0 0 0)
  REQUIRE(Angular::threej_exact_2(20, 20, 20, 0, 0, 0) ==
          SqrtRational{-1, Rational(111132, 33393355)});

  // Large j: 120! etc. is far beyond 64 bit. (60 60 0 \\ 0 0 0) = 1/11
  REQUIRE(Angular::threej_exact_2(120, 120, 0, 0, 0, 0) ==
          SqrtRational{1, Rational(1, 121)});
  REQUIRE(Angular::threej_exact_2(120, 120, 0, 0, 0, 0).to_string() == "1/11");
  REQUIRE(Angular::threej_2(120, 120, 0, 0, 0, 0) ==
          Approx(1.0 / 11).epsilon(1.0e-15));

}

//==============================================================================
TEST_CASE("Angular: Racah 3j - selection rules give exact zero",
          "[Angular][Racah][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "Angular: Racah 3j - selection rules give exact zero\n";

  // triangle: (1 1 3)
  REQUIRE(Angular::threej_exact_2(2, 2, 6, 0, 0, 0).sign == 0);
  REQUIRE(Angular::threej_2(2, 2, 6, 0, 0, 0) == 0.0);
  // m's don't sum to zero
  REQUIRE(Angular::threej_2(2, 2, 2, 2, 2, -2) == 0.0);
  // |m| > j
  REQUIRE(Angular::threej_2(2, 2, 2, 4, -4, 0) == 0.0);
  // j-m not integer
  REQUIRE(Angular::threej_2(2, 2, 2, 1, -1, 0) == 0.0);
  // negative j
  REQUIRE(Angular::threej_2(-2, 2, 2, 0, 0, 0) == 0.0);
  // (l1 l2 l3 \\ 0 0 0) with odd l1+l2+l3 is zero by symmetry
  REQUIRE(Angular::threej_exact_2(2, 2, 2, 0, 0, 0).sign == 0);
  REQUIRE(Angular::threej_exact_2(2, 2, 2, 0, 0, 0).to_string() == "0");
}

//==============================================================================
TEST_CASE("Angular: Racah 3j - symmetries", "[Angular][Racah][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "Angular: Racah 3j - symmetries\n";

  const int max_tj = 6;
  for (int tj1 = 0; tj1 <= max_tj; ++tj1) {
    for (int tj2 = 0; tj2 <= max_tj; ++tj2) {
      for (int tj3 = std::abs(tj1 - tj2); tj3 <= tj1 + tj2; tj3 += 2) {
        // (-1)^{j1+j2+j3}
        const auto eta = Angular::neg1pow_2(tj1 + tj2 + tj3);
        for (int tm1 = -tj1; tm1 <= tj1; tm1 += 2) {
          for (int tm2 = -tj2; tm2 <= tj2; tm2 += 2) {
            const auto tm3 = -tm1 - tm2;
            const auto s = Angular::threej_exact_2(tj1, tj2, tj3, tm1, tm2, tm3);

            // even (cyclic) permutations of columns
            REQUIRE(Angular::threej_exact_2(tj2, tj3, tj1, tm2, tm3, tm1) == s);
            REQUIRE(Angular::threej_exact_2(tj3, tj1, tj2, tm3, tm1, tm2) == s);

            // odd permutation of columns: (-1)^{j1+j2+j3}
            const auto odd =
                Angular::threej_exact_2(tj2, tj1, tj3, tm2, tm1, tm3);
            REQUIRE(odd.sign == eta * s.sign);
            REQUIRE(odd.square == s.square);

            // m -> -m: (-1)^{j1+j2+j3}
            const auto flip =
                Angular::threej_exact_2(tj1, tj2, tj3, -tm1, -tm2, -tm3);
            REQUIRE(flip.sign == eta * s.sign);
            REQUIRE(flip.square == s.square);
          }
        }
      }
    }
  }
}

//==============================================================================
TEST_CASE("Angular: Racah 3j - orthogonality", "[Angular][Racah][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "Angular: Racah 3j - orthogonality\n";

  // sum_{j3} (2j3+1) (j1 j2 j3 \\ m1 m2 m3)^2 = 1, exactly
  const int max_tj = 7;
  for (int tj1 = 0; tj1 <= max_tj; ++tj1) {
    for (int tj2 = 0; tj2 <= max_tj; ++tj2) {
      for (int tm1 = -tj1; tm1 <= tj1; tm1 += 2) {
        for (int tm2 = -tj2; tm2 <= tj2; tm2 += 2) {
          Angular::Rational sum{0};
          for (int tj3 = std::abs(tj1 - tj2); tj3 <= tj1 + tj2; tj3 += 2) {
            const auto s =
                Angular::threej_exact_2(tj1, tj2, tj3, tm1, tm2, -tm1 - tm2);
            sum += Angular::Rational(tj3 + 1) * s.square;
          }
          REQUIRE(sum == 1);
        }
      }
    }
  }

  // sum_{m1,m2} (j1 j2 j3 \\ m1 m2 m3)^2 = 1/(2j3+1)
  for (int tj1 = 0; tj1 <= max_tj; ++tj1) {
    for (int tj2 = 0; tj2 <= max_tj; ++tj2) {
      for (int tj3 = std::abs(tj1 - tj2); tj3 <= tj1 + tj2; tj3 += 2) {
        for (int tm3 = -tj3; tm3 <= tj3; tm3 += 2) {
          Angular::Rational sum{0};
          for (int tm1 = -tj1; tm1 <= tj1; tm1 += 2) {
            const auto tm2 = -tm1 - tm3;
            sum += Angular::threej_exact_2(tj1, tj2, tj3, tm1, tm2, tm3).square;
          }
          REQUIRE(sum == Angular::Rational(1, tj3 + 1));
        }
      }
    }
  }
}

//==============================================================================
TEST_CASE("Angular: Racah 6j - known values", "[Angular][Racah][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "Angular: Racah 6j - known values\n";

  using Angular::Rational;
  using Angular::SqrtRational;

  // {1 1 1 \\ 1 1 1} = 1/6
  REQUIRE(Angular::sixj_exact_2(2, 2, 2, 2, 2, 2) ==
          SqrtRational{1, Rational(1, 36)});
  REQUIRE(Angular::sixj_exact_2(2, 2, 2, 2, 2, 2).to_string() == "1/6");
  REQUIRE(Angular::sixj_2(2, 2, 2, 2, 2, 2) ==
          Approx(1.0 / 6.0).epsilon(1.0e-15));

  // {2 2 2 \\ 2 2 2} = -3/70
  REQUIRE(Angular::sixj_exact_2(4, 4, 4, 4, 4, 4).to_string() == "-3/70");

  // {1/2 1/2 1 \\ 1/2 1/2 0} = 1/2
  REQUIRE(Angular::sixj_2(1, 1, 2, 1, 1, 0) == Approx(0.5).epsilon(1.0e-15));

  // {5/2 3/2 2 \\ 3/2 3/2 2} = -1/10
  REQUIRE(Angular::sixj_exact_2(5, 3, 4, 3, 3, 4).to_string() == "-1/10");
  // {5/2 3/2 2 \\ 3/2 3/2 3} = -sqrt(2/7)/5
  REQUIRE(Angular::sixj_2(5, 3, 4, 3, 3, 6) ==
          Approx(-std::sqrt(2.0 / 7.0) / 5.0).epsilon(1.0e-15));
  REQUIRE(Angular::sixj_exact_2(5, 3, 4, 3, 3, 6).to_string() ==
          "-sqrt(2/175)");
  // {5/2 3/2 2 \\ 3/2 5/2 4} = 0
  REQUIRE(Angular::sixj_2(5, 3, 4, 3, 5, 8) == 0.0);
  // {4 3 2 \\ 3 4 5}
  REQUIRE(Angular::sixj_exact_2(8, 6, 4, 6, 8, 10) ==
          SqrtRational{-1, Rational(13, 3024)});

  // {a b c \\ 0 c b} = (-1)^{a+b+c} / sqrt((2b+1)(2c+1))
  for (int ta = 0; ta <= 8; ++ta) {
    for (int tb = 0; tb <= 8; ++tb) {
      for (int tc = std::abs(ta - tb); tc <= ta + tb; tc += 2) {
        const auto s = Angular::sixj_exact_2(ta, tb, tc, 0, tc, tb);
        REQUIRE(s.sign == Angular::neg1pow_2(ta + tb + tc));
        REQUIRE(s.square == Rational(1, (tb + 1) * (tc + 1)));
      }
    }
  }

}

//==============================================================================
TEST_CASE("Angular: Racah 6j - triangle zeros", "[Angular][Racah][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "Angular: Racah 6j - triangle zeros\n";

  // {1 1 3 \\ 1 1 1}: {j1,j2,j3} fails
  REQUIRE(Angular::sixj_exact_2(2, 2, 6, 2, 2, 2).sign == 0);
  // {j1,j5,j6} fails
  REQUIRE(Angular::sixj_2(2, 2, 2, 2, 2, 6) == 0.0);
  // {j4,j2,j6} fails
  REQUIRE(Angular::sixj_2(4, 4, 4, 10, 4, 4) == 0.0);
  // {j4,j5,j3} fails
  REQUIRE(Angular::sixj_2(2, 2, 4, 0, 2, 2) == 0.0);
  // half-integer perimeter
  REQUIRE(Angular::sixj_2(1, 1, 1, 1, 1, 1) == 0.0);
  // negative
  REQUIRE(Angular::sixj_2(2, 2, 2, 2, 2, -2) == 0.0);
}

//==============================================================================
TEST_CASE("Angular: Racah 6j - symmetries and orthogonality",
          "[Angular][Racah][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "Angular: Racah 6j - symmetries and orthogonality\n";

  const int max_tj = 5;
  for (int a = 0; a <= max_tj; ++a) {
    for (int b = 0; b <= max_tj; ++b) {
      for (int c = 0; c <= max_tj; ++c) {
        for (int d = 0; d <= max_tj; ++d) {
          for (int e = 0; e <= max_tj; ++e) {
            for (int f = 0; f <= max_tj; ++f) {
              const auto s = Angular::sixj_exact_2(a, b, c, d, e, f);
              if (s.sign == 0)
                continue;
              // any permutation of columns
              REQUIRE(Angular::sixj_exact_2(b, a, c, e, d, f) == s);
              REQUIRE(Angular::sixj_exact_2(c, b, a, f, e, d) == s);
              REQUIRE(Angular::sixj_exact_2(b, c, a, e, f, d) == s);
              // upper/lower swap in any two columns
              REQUIRE(Angular::sixj_exact_2(d, e, c, a, b, f) == s);
              REQUIRE(Angular::sixj_exact_2(a, e, f, d, b, c) == s);
            }
          }
        }
      }
    }
  }

  // sum_{j3} (2j3+1)(2j6+1) {j1 j2 j3 \\ j4 j5 j6}^2 = 1, for valid
  // {j1,j5,j6} and {j4,j2,j6}
  for (int a = 0; a <= max_tj; ++a) {
    for (int b = 0; b <= max_tj; ++b) {
      for (int d = 0; d <= max_tj; ++d) {
        for (int e = 0; e <= max_tj; ++e) {
          for (int f = 0; f <= 2 * max_tj; ++f) {
            if (!Angular::triad_2(a, e, f) || !Angular::triad_2(d, b, f))
              continue;
            Angular::Rational sum{0};
            for (int c = 0; c <= 2 * max_tj; ++c) {
              const auto s = Angular::sixj_exact_2(a, b, c, d, e, f);
              sum += Angular::Rational((c + 1) * (f + 1)) * s.square;
            }
            REQUIRE(sum == 1);
          }
        }
      }
    }
  }
}

//==============================================================================
TEST_CASE("Angular: Racah vs GSL", "[Angular][Racah][GSL][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "Angular: Racah vs GSL\n";

  const int max_tj = 6;
  const double eps = 1.0e-12;

  double max_del_3j = 0.0;
  for (int tj1 = 0; tj1 <= max_tj; ++tj1) {
    for (int tj2 = 0; tj2 <= max_tj; ++tj2) {
      for (int tj3 = 0; tj3 <= max_tj; ++tj3) {
        for (int tm1 = -tj1; tm1 <= tj1; tm1 += 2) {
          for (int tm2 = -tj2; tm2 <= tj2; tm2 += 2) {
            const auto tm3 = -tm1 - tm2;
            const auto a = Angular::threej_2(tj1, tj2, tj3, tm1, tm2, tm3);
            const auto b = gsl_sf_coupling_3j(tj1, tj2, tj3, tm1, tm2, tm3);
            max_del_3j = std::max(max_del_3j, std::abs(a - b));
          }
        }
      }
    }
  }
  std::cout << "3j: max|Racah - GSL| = " << max_del_3j << "\n";
  REQUIRE(max_del_3j < eps);

  double max_del_6j = 0.0;
  const int max_tj6 = 4;
  for (int a = 0; a <= max_tj6; ++a) {
    for (int b = 0; b <= max_tj6; ++b) {
      for (int c = 0; c <= max_tj6; ++c) {
        for (int d = 0; d <= max_tj6; ++d) {
          for (int e = 0; e <= max_tj6; ++e) {
            for (int f = 0; f <= max_tj6; ++f) {
              // gsl_sf_coupling_6j returns non-zero result when
              // triads are not satisfied, so only compare where valid
              if (Angular::sixj_zeroQ_2(a, b, c, d, e, f))
                continue;
              const auto x = Angular::sixj_2(a, b, c, d, e, f);
              const auto y = gsl_sf_coupling_6j(a, b, c, d, e, f);
              max_del_6j = std::max(max_del_6j, std::abs(x - y));
            }
          }
        }
      }
    }
  }
  std::cout << "6j: max|Racah - GSL| = " << max_del_6j << "\n";
  REQUIRE(max_del_6j < eps);
}

//==============================================================================
TEST_CASE("Angular: SqrtRational", "[Angular][Racah][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "Angular: SqrtRational\n";

  using Angular::Rational;
  using Angular::SqrtRational;

  REQUIRE(SqrtRational{}.value() == 0.0);
  REQUIRE(SqrtRational{}.to_string() == "0");
  REQUIRE(SqrtRational{1, Rational(1, 4)}.to_string() == "1/2");
  REQUIRE(SqrtRational{-1, Rational(9)}.to_string() == "-3");
  REQUIRE(SqrtRational{1, Rational(2, 3)}.to_string() == "sqrt(2/3)");
  REQUIRE(SqrtRational{-1, Rational(2, 3)}.value() ==
          Approx(-std::sqrt(2.0 / 3.0)).epsilon(1.0e-15));
  REQUIRE(SqrtRational{1, Rational(1, 6)} != SqrtRational{-1, Rational(1, 6)});

  // to_double for rationals whose pieces individually overflow a double
  const Angular::Integer big = Angular::Integer(1) << 3000;
  REQUIRE(Angular::to_double(Rational(big, 3 * big)) ==
          Approx(1.0 / 3.0).epsilon(1.0e-15));
  REQUIRE(Angular::to_double(Rational(-big, 4 * big + 1)) ==
          Approx(-0.25).epsilon(1.0e-15));
  REQUIRE(Angular::to_double(Rational(0)) == 0.0);
  REQUIRE(Angular::to_double(Rational(-7, 2)) == -3.5);
}

//==============================================================================
TEST_CASE("Angular: Racah - repeated calls identical", "[Angular][Racah][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "Angular: Racah - repeated calls identical\n";

  const auto a1 = Angular::threej_2(9, 7, 6, 3, -1, -2);
  const auto a2 = Angular::threej_2(9, 7, 6, 3, -1, -2);
  REQUIRE(a1 == a2);
  const auto b1 = Angular::sixj_2(8, 6, 4, 6, 8, 10);
  const auto b2 = Angular::sixj_2(8, 6, 4, 6, 8, 10);
  REQUIRE(b1 == b2);
}

//==============================================================================
TEST_CASE("Angular: Racah - large j", "[Angular][Racah][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "Angular: Racah - large j\n";

  using Angular::Rational;
  using Angular::SqrtRational;

  // (j j 0 \\ m -m 0) = (-1)^(j-m) / sqrt(2j+1)
  // Sums have ~j terms, with factorials of several thousand digits
  REQUIRE(Angular::threej_exact_2(2000, 2000, 0, 0, 0, 0) ==
          SqrtRational{1, Rational(1, 2001)});
  REQUIRE(Angular::threej_exact_2(2000, 2000, 0, 2, -2, 0) ==
          SqrtRational{-1, Rational(1, 2001)});
  REQUIRE(Angular::threej_exact_2(1999, 1999, 0, 1, -1, 0) ==
          SqrtRational{-1, Rational(1, 2000)});

  // {a b c \\ 0 c b} = (-1)^(a+b+c) / sqrt((2b+1)(2c+1))
  REQUIRE(Angular::sixj_exact_2(1200, 1200, 1200, 0, 1200, 1200) ==
          SqrtRational{1, Rational(1, 1201 * 1201)});
  REQUIRE(Angular::sixj_exact_2(1000, 801, 1201, 0, 1201, 801) ==
          SqrtRational{-1, Rational(1, 802 * 1202)});

  // sum over j3 of (2j3+1)|(j1 j2 j3 \\ m1 m2 m3)|^2 = 1, exactly
  const int tj1 = 200, tj2 = 160, tm1 = 40, tm2 = -100;
  Rational norm{0};
  for (int tj3 = tj1 - tj2; tj3 <= tj1 + tj2; tj3 += 2) {
    const auto s = Angular::threej_exact_2(tj1, tj2, tj3, tm1, tm2, -tm1 - tm2);
    norm += Rational(tj3 + 1) * s.square;
  }
  REQUIRE(norm == 1);
}
