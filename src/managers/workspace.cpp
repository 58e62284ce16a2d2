#include "workspace.hpp"
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

SceneWorkspace::SceneWorkspace(const fs::path& root, const std::string& scene_id)
    : path_(platform::create_unique_dir(root, scene_id + "-")) {
    log_debug(fmt::format("Allocated workspace {}", path_.string()));
}

SceneWorkspace::~SceneWorkspace() {
    release();
}

bool SceneWorkspace::release() noexcept {
    if (released_) return true;
    released_ = true;
    try {
        std::error_code ec;
        fs::remove_all(path_, ec);
        if (ec) {
            log_warn(fmt::format("Failed to cleanup {}: {}", path_.string(), ec.message()));
            return false;
        }
        log_debug(fmt::format("Removed workspace {}", path_.string()));
        return true;
    } catch (const std::exception& e) {
        log_warn(fmt::format("Failed to cleanup workspace: {}", e.what()));
        return false;
    }
}
