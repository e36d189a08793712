#pragma once

#include "types.hpp"
#include <span>
#include <string>
#include <vector>

namespace z3n::engine {

// contiguous line-run search under one leniency level
class line_matcher {
public:
  line_matcher(std::span<const std::string> pattern, leniency_level level);

  // every start offset i >= floor where the whole pattern matches, ascending; overlapping runs are all reported
  match_set search(std::span<const std::string> target, size_t floor = 0) const;

  size_t pattern_size() const { return pattern_.size(); }
  bool is_valid() const { return !pattern_.empty(); }
  leniency_level level() const { return level_; }

private:
  // pattern lines in canonical form for level_
  std::vector<std::string> pattern_;
  leniency_level level_;

  bool match_at_position(const std::vector<std::string>& target, size_t pos) const;
};

} // namespace z3n::engine
