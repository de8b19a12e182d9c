#include "Wigner/Options.hpp"
#include "catch2/catch.hpp"
#include <iostream>
#include <string>

//==============================================================================
TEST_CASE("Wigner: read_options", "[Wigner][Options][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "Wigner: read_options\n";

  {
    const IO::InputBlock input("wigner", std::string{""});
    const auto options = Wigner::read_options(input);
    REQUIRE(options.precision == 8);
    REQUIRE(options.exact == false);
    REQUIRE(options.rule == false);
  }

  {
    const IO::InputBlock input(
        "wigner", std::string{"Output{ precision=12; exact=true; rule=yes; }"});
    const auto options = Wigner::read_options(input);
    REQUIRE(options.precision == 12);
    REQUIRE(options.exact == true);
    REQUIRE(options.rule == true);
  }

  {
    std::cout
        << "Note: following warning message is expected as part of tests:\n";
    const IO::InputBlock input(
        "wigner", std::string{"output{ precision=-3; exct=true; }"});
    const auto options = Wigner::read_options(input);
    REQUIRE(options.precision == 8);
    REQUIRE(options.exact == false);
  }
}

//==============================================================================
TEST_CASE("Wigner: read_request", "[Wigner][Options][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "Wigner: read_request\n";

  {
    const IO::InputBlock input(
        "wigner",
        std::string{"ThreeJ{ j1=1/2; j2=1/2; j3=0; m1=1/2; m2=-1/2; m3=0; }"});
    const auto request = Wigner::read_request(input);
    REQUIRE(request);
    REQUIRE(std::holds_alternative<Wigner::ThreeJRequest>(*request));
    const auto &r = std::get<Wigner::ThreeJRequest>(*request);
    REQUIRE(r.j1 == Angular::Rational(1, 2));
    REQUIRE(r.m2 == Angular::Rational(-1, 2));
    REQUIRE(Wigner::value_or_zero(Wigner::evaluate(*request)) ==
            Approx(0.70710678));
  }

  {
    const IO::InputBlock input(
        "wigner", std::string{"SixJ{ j1=1; j2=1; j3=1; j4=1; j5=1; j6=1; }"});
    const auto request = Wigner::read_request(input);
    REQUIRE(request);
    REQUIRE(std::holds_alternative<Wigner::SixJRequest>(*request));
    REQUIRE(Wigner::value_or_zero(Wigner::evaluate(*request)) ==
            Approx(1.0 / 6.0));
  }

  std::cout << "Note: following error messages are expected as part of tests:\n";
  // none
  REQUIRE(!Wigner::read_request(
      IO::InputBlock("wigner", std::string{"Output{exact=true;}"})));
  // both
  REQUIRE(!Wigner::read_request(IO::InputBlock(
      "wigner", std::string{"ThreeJ{j1=1;j2=1;j3=1;m1=1;m2=-1;m3=0;} "
                            "SixJ{j1=1;j2=1;j3=1;j4=1;j5=1;j6=1;}"})));
  // missing one
  REQUIRE(!Wigner::read_request(IO::InputBlock(
      "wigner", std::string{"SixJ{j1=1;j2=1;j3=1;j4=1;j5=1;}"})));
  // bad number
  REQUIRE(!Wigner::read_request(IO::InputBlock(
      "wigner", std::string{"SixJ{j1=1;j2=1;j3=1;j4=1;j5=1;j6=1/0;}"})));
}
