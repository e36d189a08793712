#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace z3n::utils {

// whole-file reads and writes; bytes are preserved exactly, no newline translation
std::optional<std::string> read_file_string(const std::string& file_path);
bool write_file(const std::string& file_path, std::string_view data);

bool file_exists(const std::string& file_path);

} // namespace z3n::utils
