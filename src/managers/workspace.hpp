#pragma once

#include <string>
#include <filesystem>

namespace fs = std::filesystem;

// Scene directory owned by exactly one job: <root>/<scene_id>-<hex>.
// Created exclusively on construction, removed best-effort on destruction.
class SceneWorkspace {
public:
    SceneWorkspace(const fs::path& root, const std::string& scene_id);
    ~SceneWorkspace();

    SceneWorkspace(const SceneWorkspace&) = delete;
    SceneWorkspace& operator=(const SceneWorkspace&) = delete;

    const fs::path& path() const { return path_; }

    // Remove the tree now. Failures are logged, never thrown.
    // Returns true if the directory is gone afterwards.
    bool release() noexcept;

private:
    fs::path path_;
    bool released_ = false;
};
