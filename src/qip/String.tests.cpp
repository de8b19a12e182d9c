#include "qip/String.hpp"
#include "catch2/catch.hpp"
#include <iostream>
#include <vector>

TEST_CASE("qip::String", "[qip][String][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "qip::String\n";

  REQUIRE(qip::ci_compare("hello", "hello") == true);
  REQUIRE(qip::ci_compare("hello", "hellob") == false);
  REQUIRE(qip::ci_compare("hellob", "hello") == false);
  REQUIRE(qip::ci_compare("hello", "hEllO") == true);
  REQUIRE(qip::ci_compare("ThreeJ", "threej") == true);
  REQUIRE(qip::ci_compare("hello!", "hello?") == false);

  std::vector<std::string> list = {"precision", "exact", "rule"};
  REQUIRE(qip::ci_Levenstein("rule", "RULE") == 0);
  REQUIRE(qip::ci_Levenstein("rule", "rules") == 1);
  REQUIRE(*qip::ci_closest_match("precison", list) == "precision");
  REQUIRE(*qip::ci_closest_match("EXCT", list) == "exact");
  REQUIRE(*qip::ci_closest_match("rul", list) == "rule");

  //--------------------------------------------------------------
  REQUIRE(qip::string_is_integer("16"));
  REQUIRE(qip::string_is_integer("-16"));
  REQUIRE(qip::string_is_integer("+16"));
  REQUIRE_FALSE(qip::string_is_integer("16.0"));
  REQUIRE_FALSE(qip::string_is_integer("16x"));
  REQUIRE_FALSE(qip::string_is_integer("16 12"));
  REQUIRE_FALSE(qip::string_is_integer(" "));
  REQUIRE_FALSE(qip::string_is_integer(""));
  REQUIRE_FALSE(qip::string_is_integer("-"));

  //--------------------------------------------------------------
  REQUIRE(qip::trim("  1/2 \t\n") == "1/2");
  REQUIRE(qip::trim("x") == "x");
  REQUIRE(qip::trim("   ").empty());
  REQUIRE(qip::trim("").empty());

  REQUIRE(qip::split_any("1 1, 1;1|-1  0", " ,;|") ==
          std::vector<std::string>{"1", "1", "1", "1", "-1", "0"});
  REQUIRE(qip::split_any("a", " ") == std::vector<std::string>{"a"});
  REQUIRE(qip::split_any("", " ").empty());
  REQUIRE(qip::split_any(" , ", " ,").empty());

  //--------------------------------------------------------------
  REQUIRE(qip::wrap("aa bb cc", 5) == "aa bb\ncc\n");
  REQUIRE(qip::wrap("aa bb cc", 5, "  ") == "  aa\n  bb\n  cc\n");
  REQUIRE(qip::wrap("aa\nbb", 80) == "aa\nbb\n");
  REQUIRE(qip::wrap("aa\n\nbb", 80, "-") == "-aa\n-\n-bb\n");
  REQUIRE(qip::wrap("abcdefgh", 3) == "abcdefgh\n");
  REQUIRE(qip::wrap("", 10).empty());
}
