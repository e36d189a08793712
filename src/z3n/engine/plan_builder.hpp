#pragma once

#include "content_store.hpp"
#include "types.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace z3n::engine {

// resolves every action of a document against a read-only store.
// actions run in document order over a private overlay, so later actions see earlier ones;
// the store itself is never written. the first failing action aborts the build.
class plan_builder {
public:
  explicit plan_builder(const content_store& store);

  result<std::vector<file_change>> build(const patch_document& document);

private:
  const content_store& store_;
  // working state of every touched path, keyed by the store's canonical path; nullopt means absent
  std::map<std::string, std::optional<std::string>> overlay_;
  // state each touched path had in the store before the document
  std::map<std::string, std::optional<std::string>> original_;
  std::vector<std::string> touch_order_;

  void reset();
  result<std::optional<std::string>> current(const std::string& path);
  void set(const std::string& path, std::optional<std::string> content);

  status plan_add(const add_file& action);
  status plan_delete(const delete_file& action);
  status plan_update(const update_file& action);

  std::vector<file_change> collect_changes() const;
};

} // namespace z3n::engine
