#pragma once

#include <z3n/utils/file_utils.hpp>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>

namespace z3nx::commands {

// patch text from a file, or from stdin when the path is "-"
inline std::optional<std::string> read_patch_source(const std::string& patch_path) {
  if (patch_path == "-") {
    std::string text(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    if (std::cin.bad()) {
      return std::nullopt;
    }
    return text;
  }
  return z3n::utils::read_file_string(patch_path);
}

} // namespace z3nx::commands
