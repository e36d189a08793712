#pragma once

#include <string_view>

namespace z3n {

// patch-format guide for whoever writes patches (people or models); static, never changes at runtime
std::string_view instructions() noexcept;

} // namespace z3n
