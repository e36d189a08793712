#include "z3n.hpp"
#include "engine/patch_parser.hpp"
#include "engine/plan_builder.hpp"
#include <redlog.hpp>
#include <variant>

namespace z3n {

result<std::string> apply(std::string_view patch_text, std::string_view content) {
  auto log = redlog::get_logger("z3n");

  auto document = engine::parse_patch_document(patch_text);
  if (!document.ok()) {
    return engine::error_result<std::string>(std::move(document.status_info));
  }
  if (document.value.size() != 1) {
    log.err("single-content apply needs exactly one action", redlog::field("actions", document.value.size()));
    return engine::error_result<std::string>(
        error_code::invalid_argument,
        "expected exactly one file action, found " + std::to_string(document.value.size())
    );
  }

  const engine::file_action& action = document.value.actions.front();
  const std::string& path = engine::action_path(action);
  bool is_add = std::holds_alternative<engine::add_file>(action);

  // an add treats empty content as the file not existing yet
  engine::memory_store store;
  if (!is_add || !content.empty()) {
    status seeded = store.write(path, content);
    if (!seeded.ok()) {
      return engine::error_result<std::string>(std::move(seeded));
    }
  }

  engine::plan_builder builder(store);
  auto changes = builder.build(document.value);
  if (!changes.ok()) {
    return engine::error_result<std::string>(std::move(changes.status_info));
  }
  auto applied = engine::apply_plan(store, changes.value, engine::apply_options{});
  if (!applied.ok()) {
    return engine::error_result<std::string>(std::move(applied.status_info));
  }

  std::string result_path = path;
  if (const auto* update = std::get_if<engine::update_file>(&action); update && update->new_path) {
    result_path = *update->new_path;
  }

  auto it = store.files().find(result_path);
  return engine::ok_result(it == store.files().end() ? std::string() : it->second);
}

result<file_map> apply(std::string_view patch_text, const file_map& files) {
  auto document = engine::parse_patch_document(patch_text);
  if (!document.ok()) {
    return engine::error_result<file_map>(std::move(document.status_info));
  }

  // plan against the caller's files through a read-only view, commit into a copy
  engine::memory_store working(files);
  engine::plan_builder builder(working);
  auto changes = builder.build(document.value);
  if (!changes.ok()) {
    return engine::error_result<file_map>(std::move(changes.status_info));
  }

  auto applied = engine::apply_plan(working, changes.value, engine::apply_options{});
  if (!applied.ok()) {
    return engine::error_result<file_map>(std::move(applied.status_info));
  }

  return engine::ok_result(working.take());
}

result<std::vector<engine::file_change>> check(std::string_view patch_text, const file_map& files) {
  auto document = engine::parse_patch_document(patch_text);
  if (!document.ok()) {
    return engine::error_result<std::vector<engine::file_change>>(std::move(document.status_info));
  }

  engine::memory_store view(files);
  engine::plan_builder builder(view);
  return builder.build(document.value);
}

} // namespace z3n
