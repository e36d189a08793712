#include "result.hpp"
#include <sstream>

namespace z3n::engine {

const char* error_code_name(error_code code) noexcept {
  switch (code) {
  case error_code::ok:
    return "ok";
  case error_code::parse_error:
    return "parse_error";
  case error_code::file_exists:
    return "file_exists";
  case error_code::unknown_file:
    return "unknown_file";
  case error_code::no_match:
    return "no_match";
  case error_code::ambiguous_match:
    return "ambiguous_match";
  case error_code::invalid_argument:
    return "invalid_argument";
  case error_code::io_error:
    return "io_error";
  case error_code::internal_error:
    return "internal_error";
  }
  return "unknown";
}

std::string describe(const status& st) {
  std::ostringstream oss;
  oss << error_code_name(st.code);

  switch (st.code) {
  case error_code::parse_error:
    oss << " at line " << st.line;
    break;
  case error_code::no_match:
    oss << " in " << st.path << " hunk " << st.hunk_index;
    break;
  case error_code::ambiguous_match:
    oss << " in " << st.path << " hunk " << st.hunk_index << " (level " << st.level << ", " << st.count
        << " candidates)";
    break;
  default:
    if (!st.path.empty()) {
      oss << " for " << st.path;
    }
    break;
  }

  if (!st.message.empty()) {
    oss << ": " << st.message;
  }
  return oss.str();
}

} // namespace z3n::engine
