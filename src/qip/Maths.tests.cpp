#include "Maths.hpp"
#include "catch2/catch.hpp"
#include <iostream>

TEST_CASE("qip::Maths", "[qip][Maths][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "qip::Maths\n";

  REQUIRE(qip::max(1, -4, 3, -10, 0, 99, -100) == 99);
  REQUIRE(qip::min(1, -4, 3, -10, 0, 99, -100) == -100);

  REQUIRE(qip::max(1.0, -4.0, 3.0, -10.0, 0.0, 99.0, -100.0) == 99.0);
  REQUIRE(qip::min(1.0, -4.0, 3.0, -10.0, 0.0, 99.0, -100.0) == -100.0);

  // single argument
  REQUIRE(qip::max(7) == 7);
  REQUIRE(qip::min(-7) == -7);

  // Racah summation bounds: k from max(0, ...) to min(...)
  REQUIRE(qip::max(0, -3, -1) == 0);
  REQUIRE(qip::max(0, 2, -1) == 2);
  REQUIRE(qip::min(4, 2, 5) == 2);
  REQUIRE(qip::min(4, 4, 4) == 4);
}
