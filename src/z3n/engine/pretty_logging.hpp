#pragma once

#include "leniency.hpp"
#include "types.hpp"
#include <redlog.hpp>
#include <algorithm>
#include <span>
#include <sstream>
#include <string>

namespace z3n::engine::pretty_logging {

inline bool verbose_enabled() {
  return static_cast<int>(redlog::get_level()) >= static_cast<int>(redlog::level::verbose);
}

inline char tag_prefix(line_tag tag) {
  switch (tag) {
  case line_tag::context:
    return ' ';
  case line_tag::remove:
    return '-';
  case line_tag::add:
    return '+';
  }
  return '?';
}

inline std::string render_hunk(const hunk& h) {
  std::ostringstream oss;
  oss << "@@";
  if (!h.label.empty()) {
    oss << " " << h.label;
  }
  for (const auto& line : h.lines) {
    oss << "\n" << tag_prefix(line.tag) << line.text;
  }
  return oss.str();
}

// target lines [offset, offset + count) with 1-based line numbers
inline std::string render_span(std::span<const std::string> lines, size_t offset, size_t count) {
  std::ostringstream oss;
  size_t end = std::min(lines.size(), offset + count);
  for (size_t i = offset; i < end; ++i) {
    if (i != offset) {
      oss << "\n";
    }
    oss << (i + 1) << " | " << lines[i];
  }
  return oss.str();
}

inline void log_hunk_resolved(
    redlog::logger& log, const std::string& path, size_t hunk_index, const hunk& h, const resolution& res,
    std::span<const std::string> target
) {
  log.dbg(
      "hunk resolved", redlog::field("path", path), redlog::field("hunk", hunk_index),
      redlog::field("offset", res.offset), redlog::field("level", leniency_level_name(res.level))
  );

  if (!verbose_enabled()) {
    return;
  }
  log.vrb(redlog::fmt("hunk\n%s", render_hunk(h).c_str()));
  std::string span = render_span(target, res.offset, h.pattern_size());
  if (!span.empty()) {
    log.vrb(redlog::fmt("matched\n%s", span.c_str()));
  }
}

} // namespace z3n::engine::pretty_logging
