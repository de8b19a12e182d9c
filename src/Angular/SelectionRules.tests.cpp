#include "Angular/SelectionRules.hpp"
#include "catch2/catch.hpp"
#include <cmath>
#include <iostream>

namespace {
Angular::Rational q(int n, int d = 1) { return Angular::Rational(n, d); }
} // namespace

//==============================================================================
TEST_CASE("Angular: integer selection rules", "[Angular][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "Angular: integer selection rules\n";

  REQUIRE(Angular::evenQ(0));
  REQUIRE(Angular::evenQ(-2));
  REQUIRE(Angular::evenQ(2));
  REQUIRE(!Angular::evenQ(-1));
  REQUIRE(!Angular::evenQ(1));

  REQUIRE(Angular::evenQ_2(2 * 0));
  REQUIRE(Angular::evenQ_2(-2 * 2));
  REQUIRE(Angular::evenQ_2(2 * 2));
  REQUIRE(!Angular::evenQ_2(-2 * 1));
  REQUIRE(!Angular::evenQ_2(2 * 1));

  REQUIRE(Angular::neg1pow(0) == 1);
  REQUIRE(Angular::neg1pow(1) == -1);
  REQUIRE(Angular::neg1pow(-1) == -1);
  REQUIRE(Angular::neg1pow(-2) == 1);
  REQUIRE(Angular::neg1pow_2(2 * 1) == -1);
  REQUIRE(Angular::neg1pow_2(-2 * 2) == 1);

  int max_l = 6;
  for (int la = 0; la <= max_l; ++la) {
    for (int lb = 0; lb <= max_l; ++lb) {
      auto l_min = std::abs(la - lb);
      auto l_max = (la + lb);
      REQUIRE(Angular::triangle(la, lb, l_min) == 1);
      REQUIRE(Angular::triangle(la, lb, l_max) == 1);
      REQUIRE(Angular::triangle(la, lb, l_min - 1) == 0);
      REQUIRE(Angular::triangle(la, lb, l_max + 1) == 0);
      const auto m_q = -la - lb;
      REQUIRE(Angular::sumsToZero(la, lb, m_q) == 1);
      REQUIRE(Angular::sumsToZero(la, lb, m_q + 1) == 0);
    }
  }

  // triad_2 takes 2*j: (1/2, 1/2, 1) ok, (1/2, 1/2, 1/2) has odd perimeter
  REQUIRE(Angular::triad_2(1, 1, 2));
  REQUIRE(Angular::triad_2(1, 1, 0));
  REQUIRE(!Angular::triad_2(1, 1, 1));
  REQUIRE(!Angular::triad_2(2, 2, 6));

  REQUIRE(!Angular::threej_zeroQ_2(2, 2, 2, 2, -2, 0));
  REQUIRE(Angular::threej_zeroQ_2(2, 2, 6, 0, 0, 0));
  REQUIRE(Angular::threej_zeroQ_2(2, 2, 2, 2, 2, -4));
  REQUIRE(Angular::threej_zeroQ_2(2, 2, 2, 1, -1, 0));

  REQUIRE(!Angular::sixj_zeroQ_2(2, 2, 2, 2, 2, 2));
  REQUIRE(Angular::sixj_zeroQ_2(2, 2, 6, 2, 2, 2));
  REQUIRE(Angular::sixj_zeroQ_2(2, 2, 2, 2, 2, -2));
}

//==============================================================================
TEST_CASE("Angular: validate_3j", "[Angular][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "Angular: validate_3j\n";

  using Angular::Rule;

  // valid
  REQUIRE(!Angular::validate_3j(q(1), q(1), q(1), q(1), q(-1), q(0)));
  REQUIRE(!Angular::validate_3j(q(1, 2), q(1, 2), q(0), q(1, 2), q(-1, 2),
                                q(0)));
  REQUIRE(!Angular::validate_3j(q(5, 2), q(1), q(3, 2), q(1, 2), q(0),
                                q(-1, 2)));

  const auto rule_of = [](auto &&result) {
    REQUIRE(result.has_value());
    return result->rule;
  };

  REQUIRE(rule_of(Angular::validate_3j(q(1, 3), q(1), q(1), q(0), q(0),
                                       q(0))) == Rule::NotHalfInteger);
  REQUIRE(rule_of(Angular::validate_3j(q(1), q(1), q(1), q(1, 4), q(0),
                                       q(0))) == Rule::NotHalfInteger);
  REQUIRE(rule_of(Angular::validate_3j(q(-1), q(1), q(1), q(0), q(0), q(0))) ==
          Rule::NegativeMomentum);
  // j integer, m half-integer
  REQUIRE(rule_of(Angular::validate_3j(q(1), q(1), q(1), q(1, 2), q(-1, 2),
                                       q(0))) == Rule::ProjectionParity);
  REQUIRE(rule_of(Angular::validate_3j(q(1), q(1), q(2), q(2), q(-2), q(0))) ==
          Rule::ProjectionRange);
  REQUIRE(rule_of(Angular::validate_3j(q(1), q(1), q(1), q(1), q(1), q(1))) ==
          Rule::ProjectionSum);
  REQUIRE(rule_of(Angular::validate_3j(q(1), q(1), q(3), q(0), q(0), q(0))) ==
          Rule::Triangle);
  REQUIRE(rule_of(Angular::validate_3j(q(0), q(0), q(1), q(0), q(0), q(0))) ==
          Rule::Triangle);

  // Detail names the offending values
  const auto bad = Angular::validate_3j(q(1), q(1), q(3), q(0), q(0), q(0));
  REQUIRE(bad->detail == "(1, 1, 3)");
  const auto bad_m =
      Angular::validate_3j(q(1), q(1), q(1), q(1, 2), q(-1, 2), q(0));
  REQUIRE(bad_m->detail == "j1=1, m1=1/2");
}

//==============================================================================
TEST_CASE("Angular: validate_6j", "[Angular][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "Angular: validate_6j\n";

  using Angular::Rule;

  REQUIRE(!Angular::validate_6j(q(1), q(1), q(1), q(1), q(1), q(1)));
  REQUIRE(!Angular::validate_6j(q(5, 2), q(3, 2), q(2), q(3, 2), q(3, 2),
                                q(2)));

  REQUIRE(Angular::validate_6j(q(1, 3), q(1), q(1), q(1), q(1), q(1))->rule ==
          Rule::NotHalfInteger);
  REQUIRE(Angular::validate_6j(q(1), q(1), q(1), q(1), q(-1), q(1))->rule ==
          Rule::NegativeMomentum);

  // Each of the four triads, in turn
  // {j1,j2,j3}
  const auto t1 = Angular::validate_6j(q(1), q(1), q(3), q(1), q(1), q(1));
  REQUIRE(t1->rule == Rule::Triangle);
  REQUIRE(t1->detail == "(1, 1, 3)");
  // {j1,j5,j6}
  const auto t2 = Angular::validate_6j(q(1), q(1), q(1), q(1), q(1), q(3));
  REQUIRE(t2->rule == Rule::Triangle);
  REQUIRE(t2->detail == "(1, 1, 3)");
  // {j4,j2,j6}
  const auto t3 = Angular::validate_6j(q(2), q(2), q(2), q(5), q(2), q(2));
  REQUIRE(t3->rule == Rule::Triangle);
  REQUIRE(t3->detail == "(5, 2, 2)");
  // {j4,j5,j3}
  const auto t4 = Angular::validate_6j(q(1), q(1), q(2), q(0), q(1), q(1));
  REQUIRE(t4->rule == Rule::Triangle);
  REQUIRE(t4->detail == "(0, 1, 2)");
  // perimeter 1/2+1/2+1/2 not integer
  const auto p1 = Angular::validate_6j(q(1, 2), q(1, 2), q(1, 2), q(1, 2),
                                       q(1, 2), q(1, 2));
  REQUIRE(p1->rule == Rule::TrianglePerimeter);
  REQUIRE(p1->detail == "(1/2, 1/2, 1/2)");

  REQUIRE(Angular::to_string(Rule::Triangle) == "triangle rule");
  REQUIRE(Angular::to_string(Rule::ProjectionSum) == "m1+m2+m3 != 0");
}
