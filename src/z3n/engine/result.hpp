#pragma once

#include <cstddef>
#include <string>
#include <utility>

namespace z3n::engine {

// engine error codes for structured results
enum class error_code {
  ok,
  parse_error,
  file_exists,
  unknown_file,
  no_match,
  ambiguous_match,
  invalid_argument,
  io_error,
  internal_error
};

// status holds an error code, a human-readable message and the location it refers to
struct status {
  error_code code = error_code::ok;
  std::string message;

  // empty for document-level failures
  std::string path;
  // 1-based patch line, parse errors only
  size_t line = 0;
  size_t action_index = 0;
  size_t hunk_index = 0;
  // leniency level and candidate count, ambiguous matches only
  int level = -1;
  size_t count = 0;

  bool ok() const noexcept { return code == error_code::ok; }
};

inline status ok_status() { return {}; }

inline status make_status(error_code code, std::string message) {
  status st;
  st.code = code;
  st.message = std::move(message);
  return st;
}

// result carries a value and a status; value is default-initialized on errors
template <typename T> struct result {
  T value{};
  status status_info{};

  bool ok() const noexcept { return status_info.ok(); }
};

template <typename T> inline result<T> ok_result(T value) { return result<T>{std::move(value), ok_status()}; }

template <typename T> inline result<T> error_result(error_code code, std::string message) {
  return result<T>{T{}, make_status(code, std::move(message))};
}

template <typename T> inline result<T> error_result(status st) { return result<T>{T{}, std::move(st)}; }

const char* error_code_name(error_code code) noexcept;

// single-line rendering with every populated location field
std::string describe(const status& st);

} // namespace z3n::engine
