#pragma once

#include <filesystem>

namespace FS {

/**
 * Returns the home directory path of the current user.
 *
 * @param buf A reference to a std::filesystem::path object that will be set
 * to the home directory path.
 * @return `true` if the home directory was successfully retrieved, or
 * `false` if an error occurred.
 */
bool getHomePath(std::filesystem::path& buf);

}  // namespace FS
