#pragma once

#include "engine/apply.hpp"
#include "engine/content_store.hpp"
#include "engine/patch_parser.hpp"
#include "engine/plan_builder.hpp"
#include "engine/types.hpp"
#include <filesystem>
#include <memory>
#include <string_view>
#include <vector>

namespace z3n::engine {

// a content store plus the parse -> plan -> apply pipeline over it
class session {
public:
  static session for_files(file_map files);
  static session for_directory(std::filesystem::path root);

  const content_store& store() const noexcept { return *store_; }

  result<patch_document> parse(std::string_view patch_text) const;
  result<std::vector<file_change>> plan(const patch_document& document) const;
  result<apply_report> apply(const std::vector<file_change>& plan, const apply_options& options = {});

  // parse, plan and commit in one step; nothing is written unless every action resolves
  result<apply_report> apply_text(std::string_view patch_text, const apply_options& options = {});

private:
  explicit session(std::unique_ptr<content_store> store);

  std::unique_ptr<content_store> store_;
};

} // namespace z3n::engine
