#pragma once

#include "result.hpp"
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace z3n::engine {

// path -> content; keys are unique and case-sensitive
using file_map = std::map<std::string, std::string>;

class content_store {
public:
  virtual ~content_store() = default;

  // nullopt when the path is absent
  virtual result<std::optional<std::string>> read(const std::string& path) const = 0;
  virtual bool contains(const std::string& path) const = 0;
  virtual status write(const std::string& path, std::string_view content) = 0;
  virtual status remove(const std::string& path) = 0;
  virtual result<std::vector<std::string>> paths() const = 0;

  // key naming the same file for every spelling of a path; plans key their state by it
  virtual std::string canonical_path(const std::string& path) const = 0;
};

class memory_store final : public content_store {
public:
  memory_store() = default;
  explicit memory_store(file_map files);
  ~memory_store() override = default;

  result<std::optional<std::string>> read(const std::string& path) const override;
  bool contains(const std::string& path) const override;
  status write(const std::string& path, std::string_view content) override;
  status remove(const std::string& path) override;
  result<std::vector<std::string>> paths() const override;
  std::string canonical_path(const std::string& path) const override { return path; }

  const file_map& files() const noexcept { return files_; }
  file_map take() { return std::move(files_); }

private:
  file_map files_;
};

// files under a root directory; store paths are relative to the root and may not leave it,
// lexically or through links. removing a file also removes the directories it leaves empty
class directory_store final : public content_store {
public:
  explicit directory_store(std::filesystem::path root);
  ~directory_store() override = default;

  result<std::optional<std::string>> read(const std::string& path) const override;
  bool contains(const std::string& path) const override;
  status write(const std::string& path, std::string_view content) override;
  status remove(const std::string& path) override;
  result<std::vector<std::string>> paths() const override;
  std::string canonical_path(const std::string& path) const override;

  const std::filesystem::path& root() const noexcept { return root_; }

private:
  std::filesystem::path root_;

  result<std::filesystem::path> resolve(const std::string& path) const;
  // removes directories below the root that the removal of full left empty
  void prune_empty_parents(const std::filesystem::path& full) const;
};

} // namespace z3n::engine
