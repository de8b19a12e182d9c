#include "IO/InputBlock.hpp"
#include "catch2/catch.hpp"
#include <algorithm>
#include <iostream>
#include <sstream>

inline void run_tests(const IO::InputBlock &ib);

TEST_CASE("InputBlock", "[InputBlock][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "InputBlock\n";
  // A basic unit test of IO::InputBlock

  using namespace IO;

  InputBlock ib("name1", {{"k1", "1"}, {"k2", "2.5"}});
  ib.add(Option{"k3", "number_3"});
  ib.add(Option{"k4", ""});
  ib.add(std::string{"ThreeJ{ j1 = 1/2; j2=1/2; j3 = 0; m1=1/2; m2=-1/2; "
                     "m3=0; m3=1; }"});
  ib.add(std::string{"Output{ precision = 10; exact=true; } "});
  ib.add(Option{"bool1", "true"});
  ib.add(Option{"bool2", "false"});
  ib.add(std::string{"label = 'two words';"});

  run_tests(ib);

  // Construct a new InputBlock using the string output of another
  std::stringstream ostr1;
  ib.print(ostr1);
  InputBlock ib2("name2", ostr1.str());

  // Run same tests on this one
  run_tests(ib2);

  // test copy construct
  auto ib3 = ib2;
  run_tests(ib3);

  // Test that the two string outputs are identical
  std::stringstream ostr2;
  ib3.print(ostr2);
  REQUIRE(ostr1.str() == ostr2.str());
}

//==============================================================================
void run_tests(const IO::InputBlock &ib) {

  REQUIRE(ib.get("k1", 0) == 1);
  REQUIRE(ib.get("k2", 0.0) == Approx(2.5));
  REQUIRE(ib.get<std::string>("k3") == "number_3");
  // empty value: not set
  REQUIRE(!ib.get("k4"));
  // ..but still listed
  REQUIRE(std::any_of(ib.options().cbegin(), ib.options().cend(),
                      [](const auto &o) { return o.key == "k4"; }));
  REQUIRE(!ib.get("k5"));
  // quoted: spaces are kept
  REQUIRE(ib.get("label") == "two words");
  // Can't be parsed as int
  REQUIRE(!ib.get<int>("k3"));
  REQUIRE(ib.get("k3", 7) == 7);
  REQUIRE(!ib.get<int>("k2"));

  REQUIRE(ib.get("bool1", false) == true);
  REQUIRE(ib.get("bool2", true) == false);
  REQUIRE(ib.get("bool3", true) == true);

  // case insensitive
  REQUIRE(ib.getBlock("threej"));
  REQUIRE(ib.getBlock("ThreeJ"));
  REQUIRE(!ib.getBlock("SixJ"));

  const auto tj = ib.getBlock("ThreeJ");
  REQUIRE(tj->get("J1") == "1/2");
  REQUIRE(tj->get("m2") == "-1/2");
  // later option overrides earlier
  REQUIRE(tj->get("m3") == "1");

  const auto out = ib.getBlock("Output");
  REQUIRE(out->get("precision", 8) == 10);
  REQUIRE(out->get("exact", false) == true);
  REQUIRE(out->get("rule", false) == false);

  REQUIRE(ib.check({{"k1", ""},
                    {"k2", ""},
                    {"k3", ""},
                    {"k4", ""},
                    {"ThreeJ{}", ""},
                    {"Output{}", ""},
                    {"bool1", ""},
                    {"bool2", ""},
                    {"label", ""},
                    {"Extra_not_in_list", ""}}));

  std::cout
      << "Note: following warning message is expected as part of tests:\n";
  REQUIRE_FALSE(ib.check({{"k1", ""},
                          {"k2", ""},
                          {"k3", ""},
                          {"ThreeJ{}", ""},
                          {"Output{}", ""},
                          {"bool1", ""},
                          {"bool2", ""},
                          {"label", ""}}));
  std::cout
      << "Note: following warning message is expected as part of tests:\n";
  REQUIRE_FALSE(ib.check({{"k1", ""},
                          {"k2", ""},
                          {"k3", ""},
                          {"k4", ""},
                          {"Output{}", ""},
                          {"bool1", ""},
                          {"bool2", ""},
                          {"label", ""}}));
}

//==============================================================================
TEST_CASE("InputBlock: comments and parsing", "[InputBlock][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "InputBlock: comments and parsing\n";

  const std::string input = R"(
    // Line comment
    SixJ {
      j1 = 1; j2 = 1; // trailing comment
      j3 = 1;
      # shell-style comment
      j4 = 1; ! fortran-style comment
      /* block
         comment j4 = 7; */
      j5 = "1";
      j6 = '1';
    }
  )";
  const IO::InputBlock ib("wigner", input);

  REQUIRE(ib.blocks().size() == 1);
  const auto sj = ib.getBlock("SixJ");
  REQUIRE(sj);
  REQUIRE(sj->options().size() == 6);
  REQUIRE(sj->get("j4") == "1");
  REQUIRE(sj->get("j5") == "1");
  REQUIRE(sj->get("j6") == "1");

  REQUIRE(IO::strip_comments("x; // y\nz;") == "x; \nz;");
  REQUIRE(IO::strip_comments("x; # y") == "x; ");
  REQUIRE(IO::strip_comments("a/* b */c") == "ac");
  // unclosed block comment runs to the end
  REQUIRE(IO::strip_comments("a; /* b; c;") == "a; ");

  REQUIRE(IO::parse_value<int>("12") == 12);
  REQUIRE(IO::parse_value<int>(" -3 ") == -3);
  REQUIRE(!IO::parse_value<int>("12x"));
  REQUIRE(!IO::parse_value<int>(""));
  REQUIRE(IO::parse_value<std::string>("12x") == "12x");
  REQUIRE(IO::parse_value<double>("0.5") == 0.5);

  // "default" means not set
  const IO::InputBlock ib2("x", {{"precision", "default"}});
  REQUIRE(ib2.get("precision", 8) == 8);

  std::stringstream file;
  file << "Output{ rule = yes; }";
  const IO::InputBlock ib3("file", file);
  REQUIRE(ib3.getBlock("Output")->get("rule", false));
}

//==============================================================================
TEST_CASE("InputBlock: malformed input", "[InputBlock][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "InputBlock: malformed input\n";

  // last option before '}' needs no ';'
  const IO::InputBlock a("a", std::string{"Output{ precision = 6 } k = 1"});
  REQUIRE(a.getBlock("Output")->get("precision", 8) == 6);
  REQUIRE(a.get("k", 0) == 1);

  // block never closed: runs to the end of the input
  const IO::InputBlock b("b", std::string{"ThreeJ{ j1 = 1; j2 = 1;"});
  REQUIRE(b.blocks().size() == 1);
  REQUIRE(b.getBlock("ThreeJ")->options().size() == 2);
  REQUIRE(b.options().empty());

  // stray '}' is skipped
  const IO::InputBlock c("c", std::string{"x = 1; } y = 2;"});
  REQUIRE(c.get("x", 0) == 1);
  REQUIRE(c.get("y", 0) == 2);
  REQUIRE(c.blocks().empty());

  // nested blocks, empty statements
  const IO::InputBlock d("d", std::string{";; Outer{ Inner{ z = 3; }; w; }"});
  const auto outer = d.getBlock("outer");
  REQUIRE(outer);
  REQUIRE(outer->getBlock("inner")->get("z", 0) == 3);
  REQUIRE(outer->options().size() == 1);
  REQUIRE(!outer->get("w"));
  REQUIRE(d.options().empty());

  // printed form of nested blocks
  std::stringstream out;
  d.print(out);
  REQUIRE(out.str() == "Outer{\n  w;\n  Inner{\n    z = 3;\n  }\n}\n");
}
