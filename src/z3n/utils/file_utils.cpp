#include "file_utils.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace z3n::utils {

std::optional<std::string> read_file_string(const std::string& file_path) {
  std::ifstream file(file_path, std::ios::binary);
  if (!file.is_open()) {
    return std::nullopt;
  }

  std::string content;
  content.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
  if (file.bad()) {
    return std::nullopt;
  }
  return content;
}

bool write_file(const std::string& file_path, std::string_view data) {
  std::ofstream file(file_path, std::ios::binary | std::ios::trunc);
  if (!file.is_open()) {
    return false;
  }

  file.write(data.data(), static_cast<std::streamsize>(data.size()));
  return file.good();
}

bool file_exists(const std::string& file_path) {
  std::error_code ec;
  return std::filesystem::exists(file_path, ec);
}

} // namespace z3n::utils
