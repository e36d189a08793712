#pragma once

#include <z3n/engine/content_store.hpp>
#include <z3n/engine/result.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <initializer_list>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace z3n::test_helpers {

// joins lines with \n and adds the final terminator
inline std::string make_text(std::initializer_list<std::string_view> lines) {
  std::string out;
  for (auto line : lines) {
    out.append(line);
    out.push_back('\n');
  }
  return out;
}

// patch document: begin sentinel, body lines, end sentinel
inline std::string make_patch(std::initializer_list<std::string_view> body) {
  std::string out = "*** Begin Patch\n";
  for (auto line : body) {
    out.append(line);
    out.push_back('\n');
  }
  out += "*** End Patch\n";
  return out;
}

// scratch directory removed on scope exit
class temp_dir {
public:
  temp_dir() {
    static std::atomic<unsigned> counter{0};
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    path_ = std::filesystem::temp_directory_path() /
            ("z3n_test_" + std::to_string(stamp) + "_" + std::to_string(counter.fetch_add(1)));
    std::filesystem::create_directories(path_);
  }
  ~temp_dir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  temp_dir(const temp_dir&) = delete;
  temp_dir& operator=(const temp_dir&) = delete;

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
};

// memory store whose writes to selected paths fail with io_error
class failing_store final : public engine::content_store {
public:
  failing_store(engine::file_map files, std::set<std::string> failing_paths)
      : inner_(std::move(files)), failing_(std::move(failing_paths)) {}

  engine::result<std::optional<std::string>> read(const std::string& path) const override { return inner_.read(path); }
  bool contains(const std::string& path) const override { return inner_.contains(path); }

  engine::status write(const std::string& path, std::string_view content) override {
    if (failing_.count(path) != 0) {
      engine::status st = engine::make_status(engine::error_code::io_error, "simulated write failure");
      st.path = path;
      return st;
    }
    return inner_.write(path, content);
  }

  engine::status remove(const std::string& path) override { return inner_.remove(path); }
  engine::result<std::vector<std::string>> paths() const override { return inner_.paths(); }
  std::string canonical_path(const std::string& path) const override { return inner_.canonical_path(path); }

  const engine::file_map& files() const { return inner_.files(); }

private:
  engine::memory_store inner_;
  std::set<std::string> failing_;
};

} // namespace z3n::test_helpers
