#pragma once

#include "types.hpp"
#include <string>
#include <vector>

namespace z3n::engine {

struct splice_result {
  std::vector<std::string> lines;
  // offset just past the replacement; search floor for the next hunk
  size_t end = 0;
};

// buffer[0:offset] ++ replacement ++ buffer[offset+m:], m being the hunk's pattern size.
// context lines keep the target's text so whitespace forgiven by the ladder is not rewritten.
result<splice_result> splice_hunk(const std::vector<std::string>& buffer, const hunk& h, size_t offset);

// resolves and splices each hunk in order, threading the search floor.
// failures carry path and the failing hunk's index.
result<std::vector<std::string>> apply_hunks(
    const std::vector<std::string>& buffer, const std::vector<hunk>& hunks, const std::string& path
);

} // namespace z3n::engine
