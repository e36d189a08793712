#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace z3n::engine {

// file content as lines plus the terminator details needed to write it back unchanged
struct text_buffer {
  std::vector<std::string> lines;
  bool trailing_newline = false;
  // every terminator was \r\n; lines are stored without the \r
  bool crlf = false;

  static text_buffer split(std::string_view content);
  std::string join() const;

  size_t size() const noexcept { return lines.size(); }
  bool empty() const noexcept { return lines.empty(); }
};

// splits patch text on \n, dropping a trailing \r from each line
std::vector<std::string> split_patch_lines(std::string_view text);

} // namespace z3n::engine
