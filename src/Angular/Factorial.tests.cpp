#include "Angular/Factorial.hpp"
#include "catch2/catch.hpp"
#include <algorithm>
#include <iostream>
#include <thread>
#include <vector>

//==============================================================================
TEST_CASE("Angular: Factorial", "[Angular][Factorial][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "Angular: Factorial\n";

  REQUIRE(Angular::factorial(0) == 1);
  REQUIRE(Angular::factorial(1) == 1);
  REQUIRE(Angular::factorial(3) == 6);
  REQUIRE(Angular::factorial(5) == 120);
  REQUIRE(Angular::factorial(12) == 479001600);
  REQUIRE(Angular::factorial(20) == Angular::Integer{2432902008176640000ul});

  // Past 20! a 64-bit integer overflows; these must stay exact
  REQUIRE(Angular::factorial(21).str() == "51090942171709440000");
  REQUIRE(Angular::factorial(25).str() == "15511210043330985984000000");
  REQUIRE(Angular::factorial(50).str() ==
          "30414093201713378043612608166064768844377641568960512000000000000");

  for (int n = 1; n < 60; ++n) {
    REQUIRE(Angular::factorial(n) == n * Angular::factorial(n - 1));
  }
}

//==============================================================================
TEST_CASE("Angular: Binomial", "[Angular][Factorial][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "Angular: Binomial\n";

  REQUIRE(Angular::binomial(0, 0) == 1);
  REQUIRE(Angular::binomial(5, 0) == 1);
  REQUIRE(Angular::binomial(5, 2) == 10);
  REQUIRE(Angular::binomial(5, 5) == 1);
  REQUIRE(Angular::binomial(52, 5) == 2598960);
  REQUIRE(Angular::binomial(5, -1) == 0);
  REQUIRE(Angular::binomial(5, 6) == 0);
  REQUIRE(Angular::binomial(100, 50).str() ==
          "100891344545564193334812497256");

  // Pascal's rule
  for (int n = 1; n < 40; ++n) {
    for (int k = 1; k < n; ++k) {
      REQUIRE(Angular::binomial(n, k) ==
              Angular::binomial(n - 1, k - 1) + Angular::binomial(n - 1, k));
    }
  }
}

//==============================================================================
TEST_CASE("Angular: FactorialTable", "[Angular][Factorial][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "Angular: FactorialTable\n";

  Angular::FactorialTable table;
  REQUIRE(table.size() == 1); // just 0!

  REQUIRE(table.get(10) == 3628800);
  REQUIRE(table.size() == 11);

  // Asking for a smaller one does not shrink/grow table
  REQUIRE(table.get(4) == 24);
  REQUIRE(table.size() == 11);

  table.fill(30);
  REQUIRE(table.size() == 31);
  REQUIRE(table.get(30) == Angular::factorial(30));

  // Growing the table does not move stored values
  const auto &ten = table.get(10);
  table.fill(3000);
  REQUIRE(&table.get(10) == &ten);
  REQUIRE(ten == 3628800);
  REQUIRE(table.get(3000) == table.get(2999) * 3000);

  table.clear();
  REQUIRE(table.size() == 0);
  REQUIRE(table.get(3) == 6);
  REQUIRE(table.size() == 4);

  // Table may be pre-filled on construction
  Angular::FactorialTable table2(15);
  REQUIRE(table2.size() == 16);
}

//==============================================================================
TEST_CASE("Angular: FactorialTable - concurrent fill",
          "[Angular][Factorial][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "Angular: FactorialTable - concurrent fill\n";

  // Reference values, from a single-threaded table
  const int max_n = 300;
  Angular::FactorialTable reference;
  std::vector<Angular::Integer> expected;
  for (int n = 0; n <= max_n; ++n) {
    expected.push_back(reference.get(n));
  }

  // Several threads populate a fresh table at the same time, each in a
  // different order
  Angular::FactorialTable table;
  const int num_threads = 8;
  std::vector<std::vector<Angular::Integer>> results(num_threads);
  std::vector<std::thread> threads;
  for (int t = 0; t < num_threads; ++t) {
    threads.emplace_back([&table, &results, t]() {
      auto &out = results[std::size_t(t)];
      out.resize(max_n + 1);
      for (int i = 0; i <= max_n; ++i) {
        // even threads go up, odd threads go down
        const auto n = (t % 2 == 0) ? i : max_n - i;
        out[std::size_t(n)] = table.get(n);
      }
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }

  REQUIRE(table.size() == max_n + 1);
  for (const auto &result : results) {
    REQUIRE(result == expected);
  }
}
