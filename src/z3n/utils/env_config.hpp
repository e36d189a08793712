#pragma once

#include <string>

namespace z3n::utils {

// typed lookups of prefixed environment variables; unset or unparsable values fall back to the default
class env_config {
public:
  explicit env_config(const std::string& prefix = "");

  template <typename T> T get(const std::string& name, T default_value) const;

  std::string env_name(const std::string& name) const;

private:
  std::string prefix_;
  std::string get_env_value(const std::string& name) const;
  static std::string to_lower(const std::string& value);
  static std::string trim(const std::string& value);
};

template <> std::string env_config::get<std::string>(const std::string& name, std::string default_value) const;
template <> bool env_config::get<bool>(const std::string& name, bool default_value) const;
template <> int env_config::get<int>(const std::string& name, int default_value) const;

} // namespace z3n::utils
