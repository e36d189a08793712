#include "check.hpp"
#include "patch_source.hpp"
#include <z3n/z3n.hpp>
#include <redlog.hpp>
#include <iostream>

namespace z3nx::commands {

int check(const std::string& patch_path, const std::string& root) {
  auto log = redlog::get_logger("z3nx.check");

  auto patch_text = read_patch_source(patch_path);
  if (!patch_text) {
    log.err("failed to read patch", redlog::field("path", patch_path));
    std::cerr << "error: could not read patch: " << patch_path << std::endl;
    return 1;
  }

  auto sess = z3n::engine::session::for_directory(root);

  auto document = sess.parse(*patch_text);
  if (!document.ok()) {
    std::cerr << "error: " << z3n::engine::describe(document.status_info) << std::endl;
    return 1;
  }

  for (const auto& action : document.value.actions) {
    std::cout << z3n::engine::action_kind_name(action) << " " << z3n::engine::action_path(action) << std::endl;
  }

  auto plan = sess.plan(document.value);
  if (!plan.ok()) {
    std::cerr << "error: " << z3n::engine::describe(plan.status_info) << std::endl;
    return 1;
  }

  for (const auto& change : plan.value) {
    if (change.kind == z3n::engine::change_kind::remove) {
      std::cout << "  remove " << change.path << std::endl;
    } else if (change.previous) {
      std::cout << "  write  " << change.path << " (" << change.previous->size() << " -> " << change.content.size()
                << " bytes)" << std::endl;
    } else {
      std::cout << "  create " << change.path << " (" << change.content.size() << " bytes)" << std::endl;
    }
  }

  log.inf(
      "patch resolves cleanly", redlog::field("actions", document.value.size()),
      redlog::field("changes", plan.value.size())
  );
  std::cout << "ok: " << plan.value.size() << " change(s)" << std::endl;
  return 0;
}

} // namespace z3nx::commands
