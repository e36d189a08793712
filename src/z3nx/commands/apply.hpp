#pragma once

#include <string>

namespace z3nx::commands {

/**
 * @brief Apply a patch document to the files under a root directory
 *
 * Every action is resolved before anything is written; a failed write rolls back the
 * files already written unless rollback is disabled.
 *
 * @param patch_path Patch file path, or "-" for stdin
 * @param root Directory the patch paths are relative to
 * @param dry_run Resolve and report without writing
 * @param rollback Restore written files when a later write fails
 * @return 0 for success, 1 for failure
 */
int apply(const std::string& patch_path, const std::string& root, bool dry_run, bool rollback);

} // namespace z3nx::commands
