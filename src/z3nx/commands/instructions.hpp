#pragma once

namespace z3nx::commands {

// prints the patch-format guide to stdout
int instructions();

} // namespace z3nx::commands
