#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Create `parent/<prefix><n random hex>` exclusively. Retries on collision.
// Throws std::filesystem::filesystem_error if the directory cannot be created.
std::filesystem::path create_unique_dir(const std::filesystem::path& parent,
                                        const std::string& prefix);

// Recursive copy of `src` into a freshly created `dst`.
void copy_tree(const std::filesystem::path& src, const std::filesystem::path& dst);

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
