#include "text_buffer.hpp"

namespace z3n::engine {

namespace {

bool all_terminators_crlf(std::string_view content) {
  size_t newlines = 0;
  for (size_t i = 0; i < content.size(); ++i) {
    if (content[i] != '\n') {
      continue;
    }
    if (i == 0 || content[i - 1] != '\r') {
      return false;
    }
    newlines++;
  }
  return newlines > 0;
}

} // namespace

text_buffer text_buffer::split(std::string_view content) {
  text_buffer buffer;
  if (content.empty()) {
    return buffer;
  }

  buffer.crlf = all_terminators_crlf(content);
  buffer.trailing_newline = content.back() == '\n';

  size_t start = 0;
  while (start < content.size()) {
    size_t end = content.find('\n', start);
    if (end == std::string_view::npos) {
      buffer.lines.emplace_back(content.substr(start));
      break;
    }
    size_t line_end = end;
    if (buffer.crlf) {
      line_end--;
    }
    buffer.lines.emplace_back(content.substr(start, line_end - start));
    start = end + 1;
  }

  return buffer;
}

std::string text_buffer::join() const {
  const std::string_view eol = crlf ? "\r\n" : "\n";

  size_t total = 0;
  for (const auto& line : lines) {
    total += line.size() + eol.size();
  }

  std::string out;
  out.reserve(total);
  for (size_t i = 0; i < lines.size(); ++i) {
    out += lines[i];
    if (i + 1 < lines.size() || trailing_newline) {
      out += eol;
    }
  }
  return out;
}

std::vector<std::string> split_patch_lines(std::string_view text) {
  std::vector<std::string> lines;
  size_t start = 0;
  while (start <= text.size()) {
    size_t end = text.find('\n', start);
    std::string_view line = text.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    lines.emplace_back(line);
    if (end == std::string_view::npos) {
      break;
    }
    start = end + 1;
  }
  return lines;
}

} // namespace z3n::engine
