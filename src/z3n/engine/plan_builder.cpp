#include "plan_builder.hpp"
#include "hunk_applier.hpp"
#include "leniency.hpp"
#include "resolver.hpp"
#include "text_buffer.hpp"
#include <redlog.hpp>
#include <type_traits>
#include <variant>

namespace z3n::engine {

namespace {

status path_status(error_code code, const std::string& path, std::string message) {
  status st = make_status(code, std::move(message));
  st.path = path;
  return st;
}

} // namespace

plan_builder::plan_builder(const content_store& store) : store_(store) {}

void plan_builder::reset() {
  overlay_.clear();
  original_.clear();
  touch_order_.clear();
}

result<std::optional<std::string>> plan_builder::current(const std::string& path) {
  const std::string key = store_.canonical_path(path);
  auto it = overlay_.find(key);
  if (it != overlay_.end()) {
    return ok_result(it->second);
  }

  auto stored = store_.read(key);
  if (!stored.ok()) {
    return stored;
  }
  overlay_.emplace(key, stored.value);
  original_.emplace(key, stored.value);
  touch_order_.push_back(key);
  return stored;
}

void plan_builder::set(const std::string& path, std::optional<std::string> content) {
  const std::string key = store_.canonical_path(path);
  if (original_.find(key) == original_.end()) {
    // first touch through a write; current() was already consulted by every caller
    original_.emplace(key, std::nullopt);
    touch_order_.push_back(key);
  }
  overlay_[key] = std::move(content);
}

status plan_builder::plan_add(const add_file& action) {
  auto log = redlog::get_logger("z3n.plan_builder");

  auto existing = current(action.path);
  if (!existing.ok()) {
    return existing.status_info;
  }
  if (existing.value) {
    log.err("add targets an existing file", redlog::field("path", action.path));
    return path_status(error_code::file_exists, action.path, "file already exists");
  }

  text_buffer buffer;
  buffer.lines = action.lines;
  set(action.path, buffer.join());

  log.dbg("planned add", redlog::field("path", action.path), redlog::field("lines", action.lines.size()));
  return ok_status();
}

status plan_builder::plan_delete(const delete_file& action) {
  auto log = redlog::get_logger("z3n.plan_builder");

  auto existing = current(action.path);
  if (!existing.ok()) {
    return existing.status_info;
  }
  if (!existing.value) {
    log.err("delete targets a missing file", redlog::field("path", action.path));
    return path_status(error_code::unknown_file, action.path, "file not found");
  }

  // the expected lines are one implicit hunk that must cover the whole file
  text_buffer buffer = text_buffer::split(*existing.value);
  auto resolved = resolve_pattern(buffer.lines, action.lines, 0);
  if (!resolved.ok()) {
    status st = resolved.status_info;
    st.path = action.path;
    log.err("delete content does not match", redlog::field("path", action.path), redlog::field("error", describe(st)));
    return st;
  }
  if (resolved.value.offset != 0 || action.lines.size() != buffer.size()) {
    log.err(
        "delete content covers only part of the file", redlog::field("path", action.path),
        redlog::field("offset", resolved.value.offset), redlog::field("expected_lines", action.lines.size()),
        redlog::field("file_lines", buffer.size())
    );
    return path_status(error_code::no_match, action.path, "delete content does not match the whole file");
  }

  set(action.path, std::nullopt);
  log.dbg(
      "planned delete", redlog::field("path", action.path),
      redlog::field("level", leniency_level_name(resolved.value.level))
  );
  return ok_status();
}

status plan_builder::plan_update(const update_file& action) {
  auto log = redlog::get_logger("z3n.plan_builder");

  auto existing = current(action.path);
  if (!existing.ok()) {
    return existing.status_info;
  }
  if (!existing.value) {
    log.err("update targets a missing file", redlog::field("path", action.path));
    return path_status(error_code::unknown_file, action.path, "file not found");
  }

  text_buffer buffer = text_buffer::split(*existing.value);
  auto patched = apply_hunks(buffer.lines, action.hunks, action.path);
  if (!patched.ok()) {
    return patched.status_info;
  }
  buffer.lines = std::move(patched.value);
  std::string content = buffer.join();

  if (action.new_path && store_.canonical_path(*action.new_path) != store_.canonical_path(action.path)) {
    const std::string& target = *action.new_path;
    auto occupant = current(target);
    if (!occupant.ok()) {
      return occupant.status_info;
    }
    if (occupant.value) {
      log.err("move target already exists", redlog::field("path", action.path), redlog::field("target", target));
      return path_status(error_code::file_exists, target, "move target already exists");
    }

    set(action.path, std::nullopt);
    set(target, std::move(content));
    log.dbg(
        "planned update with move", redlog::field("path", action.path), redlog::field("target", target),
        redlog::field("hunks", action.hunks.size())
    );
    return ok_status();
  }

  set(action.path, std::move(content));
  log.dbg("planned update", redlog::field("path", action.path), redlog::field("hunks", action.hunks.size()));
  return ok_status();
}

std::vector<file_change> plan_builder::collect_changes() const {
  std::vector<file_change> changes;
  for (const auto& path : touch_order_) {
    const auto& before = original_.at(path);
    const auto& after = overlay_.at(path);

    if (after) {
      if (before && *before == *after) {
        continue;
      }
      file_change change;
      change.kind = change_kind::write;
      change.path = path;
      change.content = *after;
      change.previous = before;
      changes.push_back(std::move(change));
    } else if (before) {
      file_change change;
      change.kind = change_kind::remove;
      change.path = path;
      change.previous = before;
      changes.push_back(std::move(change));
    }
  }
  return changes;
}

result<std::vector<file_change>> plan_builder::build(const patch_document& document) {
  auto log = redlog::get_logger("z3n.plan_builder");
  log.trc("building patch plan", redlog::field("actions", document.size()));

  reset();
  for (size_t i = 0; i < document.actions.size(); ++i) {
    const file_action& action = document.actions[i];

    status st = std::visit(
        [this](const auto& a) -> status {
          using action_type = std::decay_t<decltype(a)>;
          if constexpr (std::is_same_v<action_type, add_file>) {
            return plan_add(a);
          } else if constexpr (std::is_same_v<action_type, delete_file>) {
            return plan_delete(a);
          } else {
            return plan_update(a);
          }
        },
        action
    );

    if (!st.ok()) {
      st.action_index = i;
      if (st.path.empty()) {
        st.path = action_path(action);
      }
      log.err(
          "patch action failed", redlog::field("action", i), redlog::field("kind", action_kind_name(action)),
          redlog::field("path", action_path(action)), redlog::field("error", describe(st))
      );
      reset();
      return error_result<std::vector<file_change>>(std::move(st));
    }
  }

  auto changes = collect_changes();
  reset();
  log.dbg("built patch plan", redlog::field("changes", changes.size()));
  return ok_result(std::move(changes));
}

} // namespace z3n::engine
