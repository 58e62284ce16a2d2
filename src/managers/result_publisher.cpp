#include "result_publisher.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <platform/archive.hpp>
#include <fmt/format.h>

ResultPublisher::ResultPublisher(std::shared_ptr<Sink> sink) : sink_(std::move(sink)) {}

fs::path ResultPublisher::archive_path(const fs::path& result_dir, const std::string& scene_id) {
    return result_dir.parent_path() / (scene_id + ".zip");
}

fs::path ResultPublisher::create_archive(const fs::path& result_dir, const std::string& scene_id) const {
    fs::path zip_path = archive_path(result_dir, scene_id);
    log_info(fmt::format("Creating archive: {}", zip_path.string()));
    try {
        std::size_t files = platform::create_zip(zip_path, result_dir);
        log_info(fmt::format("Archived {} file(s), {} bytes", files, fs::file_size(zip_path)));
    } catch (const std::exception& e) {
        throw PublishFailure(fmt::format("cannot archive {}: {}", result_dir.string(), e.what()));
    }
    return zip_path;
}

std::string ResultPublisher::publish(const fs::path& result_dir, const std::string& scene_id) {
    if (!sink_) {
        throw PublishFailure("no upload sink configured (set S3 credentials, "
                             "UPLOAD_SERVER_URL or OUTPUT_BUCKET_URL)");
    }
    fs::path zip_path = create_archive(result_dir, scene_id);
    return sink_->deliver(zip_path, zip_path.filename().string());
}
