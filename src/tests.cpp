// #define CATCH_CONFIG_MAIN
#define CATCH_CONFIG_RUNNER
#include "catch2/catch.hpp"
#include "version/version.hpp"
#include <gsl/gsl_version.h>
#include <iostream>

int main(int argc, char *argv[]) {

  std::cout << "wigner tests (Catch2):\n";
  std::cout << "WIGNER v: " << version::version() << '\n';
  std::cout << "Libraries:\n" << version::libraries() << '\n';
  std::cout << "GSL v: " << GSL_VERSION << " (cross-checks only)\n";
  std::cout << "Compiled: " << version::compiled() << '\n';

  int result = Catch::Session().run(argc, argv);

  return result;
}
