#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "config.hpp"
#include "instructions.hpp"

#include "engine/apply.hpp"
#include "engine/content_store.hpp"
#include "engine/result.hpp"
#include "engine/session.hpp"
#include "engine/types.hpp"

namespace z3n {

using engine::error_code;
using engine::file_map;
using engine::result;
using engine::status;

/**
 * @brief Apply a single-action patch document to one file's content
 *
 * The content stands in for the action's path. Update returns the patched content, Delete
 * returns an empty string once the content is verified, Add requires empty content.
 *
 * @param patch_text Patch document holding exactly one file action
 * @param content Current file content
 * @return New content, or the first failure (invalid_argument for multi-action documents)
 */
result<std::string> apply(std::string_view patch_text, std::string_view content);

/**
 * @brief Apply a patch document to a set of files
 *
 * All or nothing: the input map is never modified, and on failure no new map is produced.
 *
 * @param patch_text Patch document
 * @param files Current files by path
 * @return New files by path, or the first failing action's status
 */
result<file_map> apply(std::string_view patch_text, const file_map& files);

/**
 * @brief Resolve a patch document without producing new content
 *
 * @return The changes applying the document would make
 */
result<std::vector<engine::file_change>> check(std::string_view patch_text, const file_map& files);

} // namespace z3n
