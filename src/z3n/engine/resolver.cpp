#include "resolver.hpp"
#include "leniency.hpp"
#include "line_matcher.hpp"
#include <redlog.hpp>

namespace z3n::engine {

result<resolution> resolve_pattern(
    std::span<const std::string> target, std::span<const std::string> pattern, size_t floor
) {
  auto log = redlog::get_logger("z3n.resolver");

  if (pattern.empty()) {
    log.err("pattern has no context or removed lines");
    return error_result<resolution>(error_code::invalid_argument, "pattern has no anchor lines");
  }

  resolution res;
  for (leniency_level level : leniency_ladder()) {
    line_matcher matcher(pattern, level);
    match_set matches = matcher.search(target, floor);

    size_t index = static_cast<size_t>(level);
    res.candidates[index] = matches.size();
    res.levels_visited = index + 1;

    log.trc(
        "ladder level searched", redlog::field("level", leniency_level_name(level)),
        redlog::field("candidates", matches.size()), redlog::field("floor", floor),
        redlog::field("pattern_lines", pattern.size())
    );

    if (matches.empty()) {
      continue;
    }

    if (matches.size() > 1) {
      log.dbg(
          "pattern is ambiguous", redlog::field("level", leniency_level_name(level)),
          redlog::field("candidates", matches.size()), redlog::field("first", matches[0]),
          redlog::field("second", matches[1])
      );
      status st = make_status(
          error_code::ambiguous_match, std::to_string(matches.size()) + " candidate locations at level " +
                                           leniency_level_name(level) + ", add more context lines"
      );
      st.level = static_cast<int>(level);
      st.count = matches.size();
      return result<resolution>{res, std::move(st)};
    }

    res.offset = matches[0];
    res.level = level;
    return ok_result(res);
  }

  log.dbg(
      "pattern not found at any level", redlog::field("floor", floor),
      redlog::field("pattern_lines", pattern.size())
  );
  return result<resolution>{res, make_status(error_code::no_match, "pattern lines not found at any leniency level")};
}

} // namespace z3n::engine
