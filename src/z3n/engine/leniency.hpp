#pragma once

#include "types.hpp"
#include <array>
#include <string>
#include <string_view>

namespace z3n::engine {

// the ladder, strictest first; equality at one level implies equality at every later level
const std::array<leniency_level, k_leniency_level_count>& leniency_ladder() noexcept;

const char* leniency_level_name(leniency_level level) noexcept;

// canonical form of a line at a level; two lines are equal at a level iff their forms are equal
std::string normalize_line(std::string_view line, leniency_level level);

bool lines_equal(std::string_view a, std::string_view b, leniency_level level);

// maps typographic dashes, quotes and unicode spaces to plain ascii
std::string fold_lookalikes(std::string_view line);

} // namespace z3n::engine
