#include "env_config.hpp"
#include <redlog.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace z3n::utils {

env_config::env_config(const std::string& prefix) : prefix_(prefix) {
  if (!prefix_.empty() && prefix_.back() != '_') {
    prefix_ += "_";
  }
}

std::string env_config::env_name(const std::string& name) const { return prefix_ + name; }

std::string env_config::get_env_value(const std::string& name) const {
  const char* value = std::getenv(env_name(name).c_str());
  return value ? trim(value) : std::string();
}

std::string env_config::to_lower(const std::string& value) {
  std::string result = value;
  std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return result;
}

std::string env_config::trim(const std::string& value) {
  size_t first = value.find_first_not_of(" \t");
  if (first == std::string::npos) {
    return std::string();
  }
  size_t last = value.find_last_not_of(" \t");
  return value.substr(first, last - first + 1);
}

template <> std::string env_config::get<std::string>(const std::string& name, std::string default_value) const {
  std::string value = get_env_value(name);
  return value.empty() ? default_value : value;
}

template <> bool env_config::get<bool>(const std::string& name, bool default_value) const {
  std::string value = get_env_value(name);
  if (value.empty()) {
    return default_value;
  }

  std::string lower_value = to_lower(value);
  if (lower_value == "1" || lower_value == "true" || lower_value == "yes" || lower_value == "on") {
    return true;
  }
  if (lower_value == "0" || lower_value == "false" || lower_value == "no" || lower_value == "off") {
    return false;
  }

  auto log = redlog::get_logger("z3n.config");
  log.wrn(
      "unrecognized boolean, using default", redlog::field("variable", env_name(name)),
      redlog::field("value", value)
  );
  return default_value;
}

template <> int env_config::get<int>(const std::string& name, int default_value) const {
  std::string value = get_env_value(name);
  if (value.empty()) {
    return default_value;
  }

  try {
    size_t consumed = 0;
    int parsed = std::stoi(value, &consumed);
    if (consumed == value.size()) {
      return parsed;
    }
  } catch (const std::exception& e) {
    auto log = redlog::get_logger("z3n.config");
    log.wrn(
        "failed to parse integer, using default", redlog::field("variable", env_name(name)),
        redlog::field("error", e.what())
    );
    return default_value;
  }

  auto log = redlog::get_logger("z3n.config");
  log.wrn(
      "trailing characters in integer, using default", redlog::field("variable", env_name(name)),
      redlog::field("value", value)
  );
  return default_value;
}

} // namespace z3n::utils
