#pragma once

#include "types.hpp"
#include <string_view>

namespace z3n::engine {

inline constexpr std::string_view k_begin_patch = "*** Begin Patch";
inline constexpr std::string_view k_end_patch = "*** End Patch";
inline constexpr std::string_view k_add_file = "*** Add File:";
inline constexpr std::string_view k_update_file = "*** Update File:";
inline constexpr std::string_view k_delete_file = "*** Delete File:";
inline constexpr std::string_view k_move_to = "*** Move to:";
inline constexpr std::string_view k_hunk_separator = "@@";

// parses a whole patch document; parse errors carry the 1-based line and the reason
result<patch_document> parse_patch_document(std::string_view text);

} // namespace z3n::engine
