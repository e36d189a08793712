#include "patch_parser.hpp"
#include "text_buffer.hpp"
#include <redlog.hpp>
#include <string>
#include <vector>

namespace z3n::engine {

namespace {

bool starts_with(std::string_view s, std::string_view prefix) { return s.substr(0, prefix.size()) == prefix; }

bool is_blank(std::string_view s) { return s.find_first_not_of(" \t") == std::string_view::npos; }

// blank line that cannot be a context line; a line of spaces may be context for an empty target line
bool is_padding(std::string_view s) { return is_blank(s) && (s.empty() || s[0] != ' '); }

std::string_view trim(std::string_view s) {
  size_t first = s.find_first_not_of(" \t");
  if (first == std::string_view::npos) {
    return {};
  }
  size_t last = s.find_last_not_of(" \t");
  return s.substr(first, last - first + 1);
}

std::string_view trim_trailing(std::string_view s) {
  size_t last = s.find_last_not_of(" \t");
  return last == std::string_view::npos ? std::string_view{} : s.substr(0, last + 1);
}

// everything the parser needs to report is a line number and a reason
class parser {
public:
  parser(std::vector<std::string> lines, size_t begin_sentinel, size_t end_sentinel)
      : lines_(std::move(lines)), begin_sentinel_(begin_sentinel), end_(end_sentinel) {}

  result<patch_document> parse() {
    patch_document doc;

    // blank lines directly inside the sentinels are padding, not content
    index_ = begin_sentinel_ + 1;
    while (index_ < end_ && is_blank(lines_[index_])) {
      index_++;
    }
    while (end_ > index_ && is_padding(lines_[end_ - 1])) {
      end_--;
    }

    while (index_ < end_) {
      std::string_view line = lines_[index_];
      result<file_action> action;
      if (starts_with(line, k_add_file)) {
        action = parse_add();
      } else if (starts_with(line, k_update_file)) {
        action = parse_update();
      } else if (starts_with(line, k_delete_file)) {
        action = parse_delete();
      } else if (starts_with(line, k_move_to)) {
        return fail<patch_document>(index_, "move directive must directly follow an update header");
      } else {
        return fail<patch_document>(index_, "expected a file header, found '" + std::string(line) + "'");
      }

      if (!action.ok()) {
        return error_result<patch_document>(std::move(action.status_info));
      }
      doc.actions.push_back(std::move(action.value));
    }

    if (doc.empty()) {
      return fail<patch_document>(begin_sentinel_, "patch contains no file actions");
    }
    return ok_result(std::move(doc));
  }

private:
  std::vector<std::string> lines_;
  size_t begin_sentinel_ = 0;
  // one past the last content line
  size_t end_ = 0;
  size_t index_ = 0;

  template <typename T> result<T> fail(size_t index, std::string reason) const {
    auto log = redlog::get_logger("z3n.parser");
    log.err("patch parse failed", redlog::field("line", index + 1), redlog::field("reason", reason));
    status st = make_status(error_code::parse_error, std::move(reason));
    st.line = index + 1;
    return error_result<T>(std::move(st));
  }

  bool at_body_end() const { return index_ >= end_ || starts_with(lines_[index_], "***"); }

  result<std::string> header_path(std::string_view directive) const {
    std::string_view path = trim(std::string_view(lines_[index_]).substr(directive.size()));
    if (path.empty()) {
      return fail<std::string>(index_, "header without path");
    }
    return ok_result(std::string(path));
  }

  // body of an add or delete: one or more lines all carrying the given prefix
  result<std::vector<std::string>> parse_tagged_body(char prefix, size_t header_index, const char* kind) {
    std::vector<std::string> body;
    while (!at_body_end()) {
      const std::string& line = lines_[index_];
      if (line.empty() || line[0] != prefix) {
        return fail<std::vector<std::string>>(
            index_, std::string("expected '") + prefix + "' line in " + kind + " body"
        );
      }
      body.push_back(line.substr(1));
      index_++;
    }

    if (body.empty()) {
      return fail<std::vector<std::string>>(header_index, std::string(kind) + " action has no lines");
    }
    return ok_result(std::move(body));
  }

  result<file_action> parse_add() {
    size_t header_index = index_;
    auto path = header_path(k_add_file);
    if (!path.ok()) {
      return error_result<file_action>(std::move(path.status_info));
    }
    index_++;

    auto body = parse_tagged_body('+', header_index, "add");
    if (!body.ok()) {
      return error_result<file_action>(std::move(body.status_info));
    }

    add_file action;
    action.path = std::move(path.value);
    action.lines = std::move(body.value);
    action.source_line = header_index + 1;
    return ok_result(file_action{std::move(action)});
  }

  result<file_action> parse_delete() {
    size_t header_index = index_;
    auto path = header_path(k_delete_file);
    if (!path.ok()) {
      return error_result<file_action>(std::move(path.status_info));
    }
    index_++;

    auto body = parse_tagged_body('-', header_index, "delete");
    if (!body.ok()) {
      return error_result<file_action>(std::move(body.status_info));
    }

    delete_file action;
    action.path = std::move(path.value);
    action.lines = std::move(body.value);
    action.source_line = header_index + 1;
    return ok_result(file_action{std::move(action)});
  }

  result<file_action> parse_update() {
    size_t header_index = index_;
    auto path = header_path(k_update_file);
    if (!path.ok()) {
      return error_result<file_action>(std::move(path.status_info));
    }
    index_++;

    update_file action;
    action.path = std::move(path.value);
    action.source_line = header_index + 1;

    if (index_ < end_ && starts_with(lines_[index_], k_move_to)) {
      auto new_path = header_path(k_move_to);
      if (!new_path.ok()) {
        return error_result<file_action>(std::move(new_path.status_info));
      }
      action.new_path = std::move(new_path.value);
      index_++;
    }

    bool open = false;
    hunk current;
    while (!at_body_end()) {
      const std::string& line = lines_[index_];

      if (starts_with(line, k_hunk_separator)) {
        if (open) {
          action.hunks.push_back(std::move(current));
        }
        current = hunk{};
        current.label = std::string(trim(std::string_view(line).substr(k_hunk_separator.size())));
        current.source_line = index_ + 1;
        open = true;
        index_++;
        continue;
      }

      hunk_line parsed;
      if (line.empty()) {
        return fail<file_action>(index_, "empty line inside hunk, context lines need a leading space");
      }
      switch (line[0]) {
      case ' ':
        parsed.tag = line_tag::context;
        break;
      case '-':
        parsed.tag = line_tag::remove;
        break;
      case '+':
        parsed.tag = line_tag::add;
        break;
      default:
        return fail<file_action>(index_, "hunk line lacks a ' ', '-' or '+' prefix");
      }
      parsed.text = line.substr(1);

      if (!open) {
        current = hunk{};
        current.source_line = index_ + 1;
        open = true;
      }
      current.lines.push_back(std::move(parsed));
      index_++;
    }
    if (open) {
      action.hunks.push_back(std::move(current));
    }

    if (action.hunks.empty()) {
      return fail<file_action>(header_index, "update action has no hunks");
    }
    for (const auto& h : action.hunks) {
      if (h.lines.empty()) {
        return fail<file_action>(h.source_line - 1, "empty hunk");
      }
      if (!h.has_anchor()) {
        return fail<file_action>(h.source_line - 1, "hunk has no context or removed lines to anchor it");
      }
    }

    return ok_result(file_action{std::move(action)});
  }
};

} // namespace

result<patch_document> parse_patch_document(std::string_view text) {
  auto log = redlog::get_logger("z3n.parser");

  std::vector<std::string> lines = split_patch_lines(text);

  size_t first = 0;
  while (first < lines.size() && is_blank(lines[first])) {
    first++;
  }
  if (first == lines.size()) {
    log.err("patch is empty");
    status st = make_status(error_code::parse_error, "patch is empty");
    st.line = 1;
    return error_result<patch_document>(std::move(st));
  }

  size_t last = lines.size() - 1;
  while (last > first && is_blank(lines[last])) {
    last--;
  }

  if (trim_trailing(lines[first]) != k_begin_patch) {
    log.err("missing begin sentinel", redlog::field("line", first + 1));
    status st = make_status(error_code::parse_error, "expected '*** Begin Patch'");
    st.line = first + 1;
    return error_result<patch_document>(std::move(st));
  }
  if (last == first || trim_trailing(lines[last]) != k_end_patch) {
    log.err("missing end sentinel", redlog::field("line", last + 1));
    status st = make_status(error_code::parse_error, "expected '*** End Patch'");
    st.line = last + 1;
    return error_result<patch_document>(std::move(st));
  }

  parser p(std::move(lines), first, last);
  auto doc = p.parse();
  if (doc.ok()) {
    log.dbg("parsed patch document", redlog::field("actions", doc.value.size()));
  }
  return doc;
}

} // namespace z3n::engine
