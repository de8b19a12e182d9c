#include "IO/Styled.hpp"
#include "catch2/catch.hpp"
#include <iostream>
#include <string>

TEST_CASE("IO: styled text", "[IO][Styled][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "IO: styled text\n";

  const auto red = fg(fmt::color::red);

  // no style: plain formatted text only
  REQUIRE(IO::styled(false, red, "\nError {}: ", 58) == "\nError 58: ");
  REQUIRE(IO::styled(false, fmt::emphasis::bold, "NAME\n") == "NAME\n");
  REQUIRE(IO::styled(false, red, "{} = {}", "j1", std::string{"1/2"}) ==
          "j1 = 1/2");

  // styled: same text, wrapped in ANSI escape codes
  const auto text = IO::styled(true, red, "\nError {}: ", 58);
  REQUIRE(text.find("\nError 58: ") != std::string::npos);
  REQUIRE(text.rfind("\x1b[", 0) == 0);
  REQUIRE(text.size() > std::string("\nError 58: ").size());

  // Braces in the argument are not re-interpreted as format fields
  REQUIRE(IO::styled(true, red, "{}", "ThreeJ{}").find("ThreeJ{}") !=
          std::string::npos);
}
