#pragma once

/**
 * @file remove.hpp
 * @brief Recursive directory removal
 */

#include "progman/export.hpp"
#include "progman/result.hpp"

#include <string>

namespace progman {

/**
 * @brief Delete a directory and everything beneath it
 *
 * The path is handed to the filesystem as given: it is not validated,
 * normalized or canonicalized. Symbolic links are never followed; a link
 * passed as @p path is itself removed.
 *
 * The removal is not atomic. When it fails partway through, entries that
 * were already unlinked stay deleted.
 *
 * @param path Directory to remove
 * @return ok, or an Error carrying the OS error description:
 *   - FILE_NOT_FOUND     path (or the empty string) does not exist
 *   - PERMISSION_DENIED  the OS refused access
 *   - NOT_A_DIRECTORY    path names a regular file or other non-directory
 *   - IO_ERROR           any other failure during traversal or unlink
 */
PROGMAN_API Result<void> remove_dir_all(const std::string& path);

} // namespace progman
