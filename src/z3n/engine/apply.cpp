#include "apply.hpp"
#include <redlog.hpp>

namespace z3n::engine {

namespace {

status commit_change(content_store& store, const file_change& change) {
  if (change.kind == change_kind::remove) {
    return store.remove(change.path);
  }
  return store.write(change.path, change.content);
}

status revert_change(content_store& store, const file_change& change) {
  if (change.previous) {
    return store.write(change.path, *change.previous);
  }
  return store.remove(change.path);
}

// undoes committed[0, count) newest first; returns the paths that could not be restored
std::vector<std::string> rollback(content_store& store, const std::vector<file_change>& plan, size_t count) {
  auto log = redlog::get_logger("z3n.apply");
  std::vector<std::string> unrestored;

  for (size_t i = count; i > 0; --i) {
    const file_change& change = plan[i - 1];
    status st = revert_change(store, change);
    if (!st.ok()) {
      log.err("rollback failed", redlog::field("path", change.path), redlog::field("error", describe(st)));
      unrestored.push_back(change.path);
      continue;
    }
    log.trc("rolled back change", redlog::field("path", change.path));
  }
  return unrestored;
}

} // namespace

result<apply_report> apply_plan(
    content_store& store, const std::vector<file_change>& plan, const apply_options& options
) {
  auto log = redlog::get_logger("z3n.apply");
  apply_report report;
  report.dry_run = options.dry_run;

  for (size_t i = 0; i < plan.size(); ++i) {
    const file_change& change = plan[i];
    report.touched_paths.push_back(change.path);

    if (!options.dry_run) {
      status st = commit_change(store, change);
      if (!st.ok()) {
        log.err("commit failed", redlog::field("path", change.path), redlog::field("error", describe(st)));
        if (options.rollback_on_failure) {
          auto unrestored = rollback(store, plan, i);
          if (!unrestored.empty()) {
            st.message += "; rollback left " + std::to_string(unrestored.size()) + " file(s) modified";
          }
        }
        return result<apply_report>{report, st};
      }
    }

    if (change.kind == change_kind::remove) {
      report.removed++;
      log.vrb("removed", redlog::field("path", change.path), redlog::field("dry_run", options.dry_run));
    } else {
      report.written++;
      log.vrb(
          "wrote", redlog::field("path", change.path), redlog::field("bytes", change.content.size()),
          redlog::field("dry_run", options.dry_run)
      );
    }
  }

  log.dbg(
      "applied plan", redlog::field("written", report.written), redlog::field("removed", report.removed),
      redlog::field("dry_run", options.dry_run)
  );
  return ok_result(report);
}

} // namespace z3n::engine
