#include "types.hpp"

namespace z3n::engine {

bool operator==(const hunk_line& lhs, const hunk_line& rhs) { return lhs.tag == rhs.tag && lhs.text == rhs.text; }

std::vector<std::string> hunk::pattern() const {
  std::vector<std::string> out;
  out.reserve(lines.size());
  for (const auto& line : lines) {
    if (line.tag != line_tag::add) {
      out.push_back(line.text);
    }
  }
  return out;
}

std::vector<std::string> hunk::replacement() const {
  std::vector<std::string> out;
  out.reserve(lines.size());
  for (const auto& line : lines) {
    if (line.tag != line_tag::remove) {
      out.push_back(line.text);
    }
  }
  return out;
}

size_t hunk::pattern_size() const noexcept {
  size_t count = 0;
  for (const auto& line : lines) {
    if (line.tag != line_tag::add) {
      count++;
    }
  }
  return count;
}

size_t hunk::replacement_size() const noexcept {
  size_t count = 0;
  for (const auto& line : lines) {
    if (line.tag != line_tag::remove) {
      count++;
    }
  }
  return count;
}

const std::string& action_path(const file_action& action) {
  return std::visit([](const auto& a) -> const std::string& { return a.path; }, action);
}

const char* action_kind_name(const file_action& action) {
  if (std::holds_alternative<add_file>(action)) {
    return "add";
  }
  if (std::holds_alternative<delete_file>(action)) {
    return "delete";
  }
  return "update";
}

} // namespace z3n::engine
