#pragma once

#include <string>

namespace z3n {

// process-level settings, read from Z3N_* environment variables
struct config {
  // 0 info, 1 verbose, 2 trace, 3 debug, 4+ pedantic
  int verbosity = 0;
  std::string root = ".";
  bool rollback_on_failure = true;

  static config from_environment();
};

} // namespace z3n
