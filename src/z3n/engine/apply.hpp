#pragma once

#include "content_store.hpp"
#include "types.hpp"
#include <vector>

namespace z3n::engine {

struct apply_options {
  // validate and report only
  bool dry_run = false;
  // restore already committed changes when a later one fails
  bool rollback_on_failure = true;
};

result<apply_report> apply_plan(
    content_store& store, const std::vector<file_change>& plan, const apply_options& options
);

} // namespace z3n::engine
