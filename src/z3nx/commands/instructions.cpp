#include "instructions.hpp"
#include <z3n/instructions.hpp>
#include <iostream>

namespace z3nx::commands {

int instructions() {
  std::cout << z3n::instructions();
  return 0;
}

} // namespace z3nx::commands
