#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Create a zip archive at zip_path containing the whole tree under base_dir.
// Entry names are relative to base_dir. An existing file at zip_path is replaced.
// Returns the number of regular files written. Throws std::runtime_error.
std::size_t create_zip(const std::filesystem::path& zip_path,
                       const std::filesystem::path& base_dir);

} // namespace platform
