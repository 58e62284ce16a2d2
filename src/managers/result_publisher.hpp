#pragma once

#include <memory>
#include <string>
#include <filesystem>
#include "sinks.hpp"

namespace fs = std::filesystem;

// Archives a result directory and hands it to the configured sink.
class ResultPublisher {
public:
    // A null sink means nothing is configured; publish() then fails.
    explicit ResultPublisher(std::shared_ptr<Sink> sink);

    // <result_dir parent>/<scene_id>.zip
    static fs::path archive_path(const fs::path& result_dir, const std::string& scene_id);

    // Zip the whole tree, replacing an earlier archive of the same scene.
    fs::path create_archive(const fs::path& result_dir, const std::string& scene_id) const;

    // Returns the public locator. Throws PublishFailure.
    std::string publish(const fs::path& result_dir, const std::string& scene_id);

    bool has_sink() const { return sink_ != nullptr; }

private:
    std::shared_ptr<Sink> sink_;
};
