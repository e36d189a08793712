#include "commands/apply.hpp"
#include "commands/check.hpp"
#include "commands/instructions.hpp"
#include <z3n/config.hpp>
#include <args.hxx>
#include <redlog.hpp>
#include <iostream>
#include <string>

namespace cli {
args::Group arguments("arguments");
args::HelpFlag help_flag(arguments, "help", "help", {'h', "help"});
args::CounterFlag verbosity_flag(arguments, "verbosity", "verbosity level", {'v'});

// -v count wins; otherwise Z3N_VERBOSITY
void apply_verbosity(const z3n::config& cfg) {
  int verbosity_count = verbosity_flag ? static_cast<int>(args::get(verbosity_flag)) : cfg.verbosity;

  // info -> verbose -> trace -> debug -> pedantic
  redlog::level log_level = redlog::level::info;

  switch (verbosity_count) {
  case 0:
    log_level = redlog::level::info;
    break;
  case 1:
    log_level = redlog::level::verbose;
    break;
  case 2:
    log_level = redlog::level::trace;
    break;
  case 3:
    log_level = redlog::level::debug;
    break;
  default:
    log_level = redlog::level::pedantic;
    break;
  }

  redlog::set_level(log_level);
}
} // namespace cli

int cmd_apply(
    args::ValueFlag<std::string>& patch_flag, args::ValueFlag<std::string>& root_flag, args::Flag& dry_run_flag,
    args::Flag& no_rollback_flag
) {
  auto log = redlog::get_logger("z3nx.apply");
  auto cfg = z3n::config::from_environment();
  cli::apply_verbosity(cfg);

  if (!patch_flag) {
    log.err("patch required");
    std::cerr << "error: patch (-p/--patch) is required, use - for stdin" << std::endl;
    return 1;
  }

  std::string root = root_flag ? args::get(root_flag) : cfg.root;
  bool rollback = cfg.rollback_on_failure && !no_rollback_flag;

  return z3nx::commands::apply(args::get(patch_flag), root, static_cast<bool>(dry_run_flag), rollback);
}

int cmd_check(args::ValueFlag<std::string>& patch_flag, args::ValueFlag<std::string>& root_flag) {
  auto log = redlog::get_logger("z3nx.check");
  auto cfg = z3n::config::from_environment();
  cli::apply_verbosity(cfg);

  if (!patch_flag) {
    log.err("patch required");
    std::cerr << "error: patch (-p/--patch) is required, use - for stdin" << std::endl;
    return 1;
  }

  std::string root = root_flag ? args::get(root_flag) : cfg.root;
  return z3nx::commands::check(args::get(patch_flag), root);
}

int cmd_instructions() {
  cli::apply_verbosity(z3n::config::from_environment());
  return z3nx::commands::instructions();
}

int main(int argc, char* argv[]) {
  args::ArgumentParser parser("z3nx - content-anchored patch applier");
  parser.helpParams.showTerminator = false;
  parser.helpParams.helpindent = 2;
  parser.helpParams.width = 120;

  // global flags
  parser.Add(cli::arguments);

  // apply command
  args::Command apply_cmd(parser, "apply", "apply a patch document to a directory tree");
  args::ValueFlag<std::string> apply_patch_flag(apply_cmd, "patch", "patch file path (- for stdin)", {'p', "patch"});
  args::ValueFlag<std::string> apply_root_flag(
      apply_cmd, "root", "directory patch paths are relative to (default: .)", {'C', "root"}
  );
  args::Flag apply_dry_run_flag(apply_cmd, "dry-run", "resolve every action without writing", {"dry-run"});
  args::Flag apply_no_rollback_flag(
      apply_cmd, "no-rollback", "keep files already written when a later write fails", {"no-rollback"}
  );

  // check command
  args::Command check_cmd(parser, "check", "verify that a patch resolves and list its changes");
  args::ValueFlag<std::string> check_patch_flag(check_cmd, "patch", "patch file path (- for stdin)", {'p', "patch"});
  args::ValueFlag<std::string> check_root_flag(
      check_cmd, "root", "directory patch paths are relative to (default: .)", {'C', "root"}
  );

  // instructions command
  args::Command instructions_cmd(parser, "instructions", "print the patch format guide");

  try {
    parser.ParseCLI(argc, argv);

    if (apply_cmd) {
      return cmd_apply(apply_patch_flag, apply_root_flag, apply_dry_run_flag, apply_no_rollback_flag);
    } else if (check_cmd) {
      return cmd_check(check_patch_flag, check_root_flag);
    } else if (instructions_cmd) {
      return cmd_instructions();
    } else {
      std::cerr << "error: no command specified" << std::endl;
      std::cerr << parser;
      return 1;
    }

  } catch (const args::Help&) {
    std::cout << parser;
    return 0;
  } catch (const args::ParseError& e) {
    std::cerr << e.what() << std::endl;
    std::cerr << parser;
    return 1;
  } catch (const args::ValidationError& e) {
    std::cerr << e.what() << std::endl;
    std::cerr << parser;
    return 1;
  }

  return 0;
}
