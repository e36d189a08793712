#pragma once

#include <string>

namespace z3nx::commands {

/**
 * @brief Resolve a patch document against a directory and list the changes without writing
 *
 * @param patch_path Patch file path, or "-" for stdin
 * @param root Directory the patch paths are relative to
 * @return 0 when every action resolves, 1 otherwise
 */
int check(const std::string& patch_path, const std::string& root);

} // namespace z3nx::commands
