#ifndef __BURROW_PATH_UTILS__
#define __BURROW_PATH_UTILS__

#include "Headers.hpp"

namespace burrow {
/**
 * @brief Normalizes a path string for the frontend: drops the Windows
 * extended-length prefix and uses '/' as the only separator.
 */
string cleanPath(const string& path);

/**
 * @brief Canonical form of `path` (symlinks, `.` and `..` resolved), cleaned
 * with `cleanPath`.  Falls back to the path as given if it cannot be
 * canonicalized.
 */
string displayPath(const fs::path& path);
}  // namespace burrow

#endif  // __BURROW_PATH_UTILS__
