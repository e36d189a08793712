#include "content_store.hpp"
#include "utils/file_utils.hpp"
#include <redlog.hpp>
#include <algorithm>
#include <system_error>

namespace z3n::engine {

memory_store::memory_store(file_map files) : files_(std::move(files)) {}

result<std::optional<std::string>> memory_store::read(const std::string& path) const {
  auto it = files_.find(path);
  if (it == files_.end()) {
    return ok_result(std::optional<std::string>{});
  }
  return ok_result(std::optional<std::string>{it->second});
}

bool memory_store::contains(const std::string& path) const { return files_.count(path) != 0; }

status memory_store::write(const std::string& path, std::string_view content) {
  files_[path] = std::string(content);
  return ok_status();
}

status memory_store::remove(const std::string& path) {
  if (files_.erase(path) == 0) {
    status st = make_status(error_code::unknown_file, "path not present in store");
    st.path = path;
    return st;
  }
  return ok_status();
}

result<std::vector<std::string>> memory_store::paths() const {
  std::vector<std::string> out;
  out.reserve(files_.size());
  for (const auto& [path, content] : files_) {
    out.push_back(path);
  }
  return ok_result(std::move(out));
}

directory_store::directory_store(std::filesystem::path root) : root_(std::move(root)) {}

namespace {

bool is_within(const std::filesystem::path& root, const std::filesystem::path& candidate) {
  std::filesystem::path relative = candidate.lexically_relative(root);
  if (relative.empty()) {
    return false;
  }
  auto first = relative.begin();
  return *first != ".." && *first != ".";
}

} // namespace

result<std::filesystem::path> directory_store::resolve(const std::string& path) const {
  std::filesystem::path relative(path);
  if (path.empty() || relative.is_absolute() || relative.has_root_name()) {
    status st = make_status(error_code::invalid_argument, "store paths must be relative to the root");
    st.path = path;
    return error_result<std::filesystem::path>(std::move(st));
  }

  std::filesystem::path normal = relative.lexically_normal();
  auto first = normal.begin();
  if (normal.empty() || (first != normal.end() && (*first == ".." || *first == "."))) {
    status st = make_status(error_code::invalid_argument, "path escapes the store root");
    st.path = path;
    return error_result<std::filesystem::path>(std::move(st));
  }

  std::filesystem::path full = root_ / normal;

  // links inside the root may not lead out of it
  std::error_code ec;
  std::filesystem::path real_root = std::filesystem::weakly_canonical(root_, ec);
  std::filesystem::path real_full;
  if (!ec) {
    real_full = std::filesystem::weakly_canonical(full, ec);
  }
  if (ec) {
    status st = make_status(error_code::io_error, "failed to resolve path: " + ec.message());
    st.path = path;
    return error_result<std::filesystem::path>(std::move(st));
  }
  if (!is_within(real_root, real_full)) {
    auto log = redlog::get_logger("z3n.store");
    log.err(
        "path leaves the root through a link", redlog::field("path", path),
        redlog::field("target", real_full.string())
    );
    status st = make_status(error_code::invalid_argument, "path leaves the store root through a link");
    st.path = path;
    return error_result<std::filesystem::path>(std::move(st));
  }

  return ok_result(std::move(full));
}

std::string directory_store::canonical_path(const std::string& path) const {
  std::filesystem::path relative(path);
  if (path.empty() || relative.is_absolute() || relative.has_root_name()) {
    return path;
  }
  return relative.lexically_normal().generic_string();
}

void directory_store::prune_empty_parents(const std::filesystem::path& full) const {
  auto log = redlog::get_logger("z3n.store");
  std::filesystem::path relative = full.lexically_relative(root_).parent_path();

  while (!relative.empty()) {
    std::filesystem::path dir = root_ / relative;
    std::error_code ec;
    if (!std::filesystem::is_empty(dir, ec) || ec) {
      break;
    }
    if (!std::filesystem::remove(dir, ec) || ec) {
      log.dbg("left directory in place", redlog::field("path", dir.string()), redlog::field("error", ec.message()));
      break;
    }
    log.trc("removed empty directory", redlog::field("path", dir.string()));
    relative = relative.parent_path();
  }
}

result<std::optional<std::string>> directory_store::read(const std::string& path) const {
  auto full = resolve(path);
  if (!full.ok()) {
    return error_result<std::optional<std::string>>(std::move(full.status_info));
  }

  std::error_code ec;
  if (!std::filesystem::is_regular_file(full.value, ec)) {
    return ok_result(std::optional<std::string>{});
  }

  auto content = utils::read_file_string(full.value.string());
  if (!content) {
    status st = make_status(error_code::io_error, "failed to read file");
    st.path = path;
    return error_result<std::optional<std::string>>(std::move(st));
  }
  return ok_result(std::optional<std::string>{std::move(*content)});
}

bool directory_store::contains(const std::string& path) const {
  auto full = resolve(path);
  if (!full.ok()) {
    return false;
  }
  std::error_code ec;
  return std::filesystem::is_regular_file(full.value, ec);
}

status directory_store::write(const std::string& path, std::string_view content) {
  auto log = redlog::get_logger("z3n.store");
  auto full = resolve(path);
  if (!full.ok()) {
    return full.status_info;
  }

  std::error_code ec;
  std::filesystem::path parent = full.value.parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      log.err(
          "failed to create directory", redlog::field("path", parent.string()), redlog::field("error", ec.message())
      );
      status st = make_status(error_code::io_error, "failed to create directory: " + ec.message());
      st.path = path;
      return st;
    }
  }

  if (!utils::write_file(full.value.string(), content)) {
    log.err("failed to write file", redlog::field("path", full.value.string()));
    status st = make_status(error_code::io_error, "failed to write file");
    st.path = path;
    return st;
  }

  log.trc("wrote file", redlog::field("path", path), redlog::field("bytes", content.size()));
  return ok_status();
}

status directory_store::remove(const std::string& path) {
  auto log = redlog::get_logger("z3n.store");
  auto full = resolve(path);
  if (!full.ok()) {
    return full.status_info;
  }

  std::error_code ec;
  bool removed = std::filesystem::remove(full.value, ec);
  if (ec) {
    log.err("failed to remove file", redlog::field("path", full.value.string()), redlog::field("error", ec.message()));
    status st = make_status(error_code::io_error, "failed to remove file: " + ec.message());
    st.path = path;
    return st;
  }
  if (!removed) {
    status st = make_status(error_code::unknown_file, "path not present in store");
    st.path = path;
    return st;
  }

  log.trc("removed file", redlog::field("path", path));
  prune_empty_parents(full.value);
  return ok_status();
}

result<std::vector<std::string>> directory_store::paths() const {
  std::vector<std::string> out;
  std::error_code ec;
  std::filesystem::recursive_directory_iterator it(root_, ec);
  if (ec) {
    return error_result<std::vector<std::string>>(error_code::io_error, "failed to list root: " + ec.message());
  }

  std::filesystem::recursive_directory_iterator end;
  for (; it != end; it.increment(ec)) {
    if (ec) {
      return error_result<std::vector<std::string>>(error_code::io_error, "failed to list root: " + ec.message());
    }
    if (it->is_regular_file(ec)) {
      out.push_back(it->path().lexically_relative(root_).generic_string());
    }
  }
  std::sort(out.begin(), out.end());
  return ok_result(std::move(out));
}

} // namespace z3n::engine
