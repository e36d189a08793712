#include "apply.hpp"
#include "patch_source.hpp"
#include <z3n/z3n.hpp>
#include <redlog.hpp>
#include <iostream>

namespace z3nx::commands {

int apply(const std::string& patch_path, const std::string& root, bool dry_run, bool rollback) {
  auto log = redlog::get_logger("z3nx.apply");

  log.inf(
      "applying patch", redlog::field("patch", patch_path), redlog::field("root", root),
      redlog::field("dry_run", dry_run), redlog::field("rollback", rollback)
  );

  auto patch_text = read_patch_source(patch_path);
  if (!patch_text) {
    log.err("failed to read patch", redlog::field("path", patch_path));
    std::cerr << "error: could not read patch: " << patch_path << std::endl;
    return 1;
  }

  auto sess = z3n::engine::session::for_directory(root);

  z3n::engine::apply_options options;
  options.dry_run = dry_run;
  options.rollback_on_failure = rollback;

  auto report = sess.apply_text(*patch_text, options);
  if (!report.ok()) {
    log.err("patch failed", redlog::field("error", z3n::engine::describe(report.status_info)));
    std::cerr << "error: " << z3n::engine::describe(report.status_info) << std::endl;
    return 1;
  }

  log.inf(
      "patch applied", redlog::field("written", report.value.written), redlog::field("removed", report.value.removed),
      redlog::field("dry_run", dry_run)
  );

  for (const auto& path : report.value.touched_paths) {
    std::cout << (dry_run ? "would change " : "changed ") << path << std::endl;
  }
  std::cout << "files written: " << report.value.written << ", removed: " << report.value.removed << std::endl;
  return 0;
}

} // namespace z3nx::commands
