#include "line_matcher.hpp"
#include "leniency.hpp"
#include <redlog.hpp>

namespace z3n::engine {

line_matcher::line_matcher(std::span<const std::string> pattern, leniency_level level) : level_(level) {
  pattern_.reserve(pattern.size());
  for (const auto& line : pattern) {
    pattern_.push_back(normalize_line(line, level_));
  }
}

match_set line_matcher::search(std::span<const std::string> target, size_t floor) const {
  match_set results;
  const size_t pattern_len = pattern_.size();
  if (!is_valid() || target.size() < pattern_len || floor > target.size() - pattern_len) {
    return results;
  }

  // canonical forms are computed once per target line, not once per comparison
  std::vector<std::string> canonical;
  canonical.reserve(target.size());
  for (size_t i = 0; i < target.size(); ++i) {
    canonical.push_back(i < floor ? std::string() : normalize_line(target[i], level_));
  }

  auto log = redlog::get_logger("z3n.matcher");
  bool pedantic_enabled = static_cast<int>(redlog::get_level()) >= static_cast<int>(redlog::level::pedantic);

  const size_t last_start = target.size() - pattern_len;
  for (size_t i = floor; i <= last_start; ++i) {
    if (match_at_position(canonical, i)) {
      results.push_back(i);
      if (pedantic_enabled) {
        log.ped("candidate", redlog::field("offset", i), redlog::field("level", leniency_level_name(level_)));
      }
    }
  }

  return results;
}

bool line_matcher::match_at_position(const std::vector<std::string>& target, size_t pos) const {
  for (size_t k = 0; k < pattern_.size(); ++k) {
    if (target[pos + k] != pattern_[k]) {
      return false;
    }
  }
  return true;
}

} // namespace z3n::engine
