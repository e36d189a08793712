#include "hunk_applier.hpp"
#include "pretty_logging.hpp"
#include "resolver.hpp"
#include <redlog.hpp>
#include <cstddef>

namespace z3n::engine {

result<splice_result> splice_hunk(const std::vector<std::string>& buffer, const hunk& h, size_t offset) {
  const size_t pattern_len = h.pattern_size();
  if (offset > buffer.size() || pattern_len > buffer.size() - offset) {
    return error_result<splice_result>(error_code::invalid_argument, "hunk span exceeds buffer");
  }

  splice_result out;
  out.lines.reserve(buffer.size() - pattern_len + h.replacement_size());
  out.lines.insert(out.lines.end(), buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(offset));

  size_t cursor = offset;
  for (const auto& line : h.lines) {
    switch (line.tag) {
    case line_tag::context:
      out.lines.push_back(buffer[cursor]);
      cursor++;
      break;
    case line_tag::remove:
      cursor++;
      break;
    case line_tag::add:
      out.lines.push_back(line.text);
      break;
    }
  }
  out.end = out.lines.size();

  out.lines.insert(out.lines.end(), buffer.begin() + static_cast<std::ptrdiff_t>(cursor), buffer.end());
  return ok_result(std::move(out));
}

result<std::vector<std::string>> apply_hunks(
    const std::vector<std::string>& buffer, const std::vector<hunk>& hunks, const std::string& path
) {
  auto log = redlog::get_logger("z3n.applier");

  std::vector<std::string> current = buffer;
  size_t floor = 0;

  for (size_t i = 0; i < hunks.size(); ++i) {
    const hunk& h = hunks[i];
    std::vector<std::string> pattern = h.pattern();

    auto resolved = resolve_pattern(current, pattern, floor);
    if (!resolved.ok()) {
      status st = resolved.status_info;
      st.path = path;
      st.hunk_index = i;
      log.err(
          "hunk failed to resolve", redlog::field("path", path), redlog::field("hunk", i),
          redlog::field("line", h.source_line), redlog::field("levels_visited", resolved.value.levels_visited),
          redlog::field("error", describe(st))
      );
      return error_result<std::vector<std::string>>(std::move(st));
    }

    pretty_logging::log_hunk_resolved(log, path, i, h, resolved.value, current);

    auto spliced = splice_hunk(current, h, resolved.value.offset);
    if (!spliced.ok()) {
      status st = spliced.status_info;
      st.path = path;
      st.hunk_index = i;
      log.err("hunk splice failed", redlog::field("path", path), redlog::field("hunk", i));
      return error_result<std::vector<std::string>>(std::move(st));
    }

    current = std::move(spliced.value.lines);
    floor = spliced.value.end;
  }

  log.dbg("hunks applied", redlog::field("path", path), redlog::field("hunks", hunks.size()));
  return ok_result(std::move(current));
}

} // namespace z3n::engine
