#include "platform.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <cerrno>
#include <system_error>

#include <unistd.h>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace platform {

fs::path create_unique_dir(const fs::path& parent, const std::string& prefix) {
    fs::create_directories(parent);
    for (int attempt = 0; attempt < 16; attempt++) {
        fs::path p = parent / (prefix + random_hex(WORKSPACE_SUFFIX_HEX));
        // mkdir(2) fails with EEXIST instead of silently reusing a directory
        if (mkdir(p.c_str(), 0755) == 0) return p;
        if (errno != EEXIST) {
            throw fs::filesystem_error("create_unique_dir", p,
                                       std::error_code(errno, std::generic_category()));
        }
    }
    throw fs::filesystem_error("create_unique_dir: too many collisions", parent,
                               std::make_error_code(std::errc::file_exists));
}

void copy_tree(const fs::path& src, const fs::path& dst) {
    fs::create_directories(dst);
    fs::copy(src, dst, fs::copy_options::recursive | fs::copy_options::overwrite_existing);
}

void sleep_ms(int ms) {
    usleep(static_cast<useconds_t>(ms) * 1000);
}

} // namespace platform
