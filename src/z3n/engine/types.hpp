#pragma once

#include "result.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace z3n::engine {

// line-equality predicates, strictest first
enum class leniency_level : int { exact = 0, trailing_whitespace = 1, normalized = 2 };

constexpr size_t k_leniency_level_count = 3;

enum class line_tag : uint8_t { context, remove, add };

struct hunk_line {
  line_tag tag = line_tag::context;
  std::string text;
};

bool operator==(const hunk_line& lhs, const hunk_line& rhs);

// one contiguous edit; tags may interleave freely
struct hunk {
  std::vector<hunk_line> lines;
  // text after the @@ separator, documentation only
  std::string label;
  // 1-based patch line where the hunk starts (its @@ separator when present)
  size_t source_line = 0;

  // context and remove lines, in order: what must be found in the target
  std::vector<std::string> pattern() const;
  // context and add lines, in order: what takes the pattern's place
  std::vector<std::string> replacement() const;

  size_t pattern_size() const noexcept;
  size_t replacement_size() const noexcept;
  bool has_anchor() const noexcept { return pattern_size() > 0; }
};

struct add_file {
  std::string path;
  std::vector<std::string> lines;
  size_t source_line = 0;
};

struct delete_file {
  std::string path;
  // expected current content
  std::vector<std::string> lines;
  size_t source_line = 0;
};

struct update_file {
  std::string path;
  std::optional<std::string> new_path;
  std::vector<hunk> hunks;
  size_t source_line = 0;
};

using file_action = std::variant<add_file, delete_file, update_file>;

const std::string& action_path(const file_action& action);
const char* action_kind_name(const file_action& action);

struct patch_document {
  std::vector<file_action> actions;

  size_t size() const noexcept { return actions.size(); }
  bool empty() const noexcept { return actions.empty(); }
};

// ascending start offsets of a pattern in a target under one predicate
using match_set = std::vector<size_t>;

// outcome of walking the ladder for one pattern
struct resolution {
  size_t offset = 0;
  leniency_level level = leniency_level::exact;
  // candidates seen at each visited level; levels not visited stay zero
  std::array<size_t, k_leniency_level_count> candidates{};
  size_t levels_visited = 0;
};

enum class change_kind { write, remove };

// final state of one path once the whole document has been planned
struct file_change {
  change_kind kind = change_kind::write;
  std::string path;
  std::string content;
  // prior content, used to roll back a failed commit
  std::optional<std::string> previous;
};

struct apply_report {
  size_t written = 0;
  size_t removed = 0;
  std::vector<std::string> touched_paths;
  bool dry_run = false;
};

} // namespace z3n::engine
