#include "session.hpp"
#include <redlog.hpp>

namespace z3n::engine {

session::session(std::unique_ptr<content_store> store) : store_(std::move(store)) {}

session session::for_files(file_map files) { return session(std::make_unique<memory_store>(std::move(files))); }

session session::for_directory(std::filesystem::path root) {
  return session(std::make_unique<directory_store>(std::move(root)));
}

result<patch_document> session::parse(std::string_view patch_text) const { return parse_patch_document(patch_text); }

result<std::vector<file_change>> session::plan(const patch_document& document) const {
  plan_builder builder(*store_);
  return builder.build(document);
}

result<apply_report> session::apply(const std::vector<file_change>& plan, const apply_options& options) {
  return apply_plan(*store_, plan, options);
}

result<apply_report> session::apply_text(std::string_view patch_text, const apply_options& options) {
  auto log = redlog::get_logger("z3n.session");

  auto document = parse(patch_text);
  if (!document.ok()) {
    return error_result<apply_report>(std::move(document.status_info));
  }

  auto changes = plan(document.value);
  if (!changes.ok()) {
    return error_result<apply_report>(std::move(changes.status_info));
  }

  log.trc("committing plan", redlog::field("changes", changes.value.size()), redlog::field("dry_run", options.dry_run));
  return apply(changes.value, options);
}

} // namespace z3n::engine
