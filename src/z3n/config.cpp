#include "config.hpp"
#include "utils/env_config.hpp"

namespace z3n {

config config::from_environment() {
  utils::env_config env("Z3N");
  config cfg;
  cfg.verbosity = env.get<int>("VERBOSITY", cfg.verbosity);
  cfg.root = env.get<std::string>("ROOT", cfg.root);
  cfg.rollback_on_failure = env.get<bool>("ROLLBACK", cfg.rollback_on_failure);
  return cfg;
}

} // namespace z3n
