#pragma once
#include "Angular/Rational.hpp"
#include "Wigner/Options.hpp"
#include <istream>
#include <optional>
#include <ostream>
#include <string>

namespace IO {

//! Prints 'prompt', reads one line. Repeats until the line is a valid integer
//! or fraction. Empty if input ends first
std::optional<Angular::Rational>
prompt_quantum_number(std::istream &in, std::ostream &out,
                      const std::string &prompt);

//! Interactive session: asks for symbol type (3 or 6), then each of the six
//! quantum numbers, then prints the result. Returns false if input ended
//! before a symbol was complete
bool run_interactive(std::istream &in, std::ostream &out,
                     const Wigner::Options &options = {});

} // namespace IO
