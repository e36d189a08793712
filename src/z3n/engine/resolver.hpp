#pragma once

#include "types.hpp"
#include <span>
#include <string>

namespace z3n::engine {

// walks the leniency ladder for one pattern, searching only offsets >= floor.
// the first level with any candidate decides: exactly one is a resolution, more than one is
// ambiguous_match (no later level is tried), and no candidates at any level is no_match.
// failures carry level and count in the status, and the per-level candidate counts in the value;
// the caller adds path and hunk index.
result<resolution> resolve_pattern(
    std::span<const std::string> target, std::span<const std::string> pattern, size_t floor
);

} // namespace z3n::engine
