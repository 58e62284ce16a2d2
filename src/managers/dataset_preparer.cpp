#include "dataset_preparer.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <algorithm>

DatasetPreparer::DatasetPreparer(const ToolsConfig& tools, const DatasetConfig& dataset,
                                 const CommandRunner& runner, Deadline deadline)
    : tools_(tools), dataset_(dataset), runner_(runner), deadline_(deadline) {}

Command DatasetPreparer::tool(const std::string& program, std::vector<std::string> args) const {
    Command cmd;
    cmd.program = program;
    cmd.args = std::move(args);
    cmd.deadline = deadline_;
    return cmd;
}

// ── Frames ─────────────────────────────────────────────────

int DatasetPreparer::count_frames(const fs::path& dir) {
    if (!fs::is_directory(dir)) return 0;
    int n = 0;
    for (const auto& e : fs::directory_iterator(dir)) {
        if (e.is_regular_file() && e.path().extension() == FRAME_EXTENSION) n++;
    }
    return n;
}

int DatasetPreparer::extract_frames(const fs::path& video, const fs::path& out_dir, int fps) {
    // Leftover frames would inflate the count
    if (fs::exists(out_dir)) {
        fs::remove_all(out_dir);
    }
    fs::create_directories(out_dir);

    runner_.run(tool(tools_.ffmpeg, {
        "-y",
        "-i", video.string(),
        "-vf", fmt::format("fps={}", fps),
        "-q:v", JPEG_QUALITY,
        (out_dir / FRAME_PATTERN).string(),
    }));

    int frames = count_frames(out_dir);
    log_info(fmt::format("Extracted {} frames", frames));
    return frames;
}

void DatasetPreparer::validate_frame_count(int frames) {
    if (frames < MIN_FRAMES) {
        throw InsufficientInputError(fmt::format(
            "Not enough frames extracted ({}). Need at least {}.", frames, MIN_FRAMES));
    }
}

void DatasetPreparer::duplicate_to_working_dir(const fs::path& input_dir, const fs::path& images_dir) {
    if (fs::exists(images_dir)) {
        fs::remove_all(images_dir);
    }
    platform::copy_tree(input_dir, images_dir);
}

// ── Reconstruction ─────────────────────────────────────────

fs::path DatasetPreparer::locate_reconstruction(const fs::path& sparse_dir) {
    fs::path preferred = sparse_dir / DEFAULT_RECON_NAME;
    if (fs::is_directory(preferred)) return preferred;

    std::vector<fs::path> candidates;
    if (fs::is_directory(sparse_dir)) {
        for (const auto& e : fs::directory_iterator(sparse_dir)) {
            if (e.is_directory()) candidates.push_back(e.path());
        }
    }
    if (candidates.empty()) {
        throw ReconstructionFailure(
            "colmap failed to produce a sparse reconstruction in " + sparse_dir.string());
    }
    std::sort(candidates.begin(), candidates.end());
    log_warn(fmt::format("{} missing, falling back to {}",
                         preferred.string(), candidates.front().string()));
    return candidates.front();
}

fs::path DatasetPreparer::run_reconstruction(const fs::path& scene_dir, const fs::path& images_dir) {
    fs::path database = scene_dir / DATABASE_NAME;
    fs::path sparse_dir = scene_dir / SPARSE_DIR_NAME;
    std::string gpu = tools_.colmap_use_gpu ? "1" : "0";

    // Stale features from an earlier run would poison matching
    if (fs::exists(database)) {
        fs::remove(database);
    }

    log_info("Running colmap feature extraction...");
    runner_.run(tool(tools_.colmap, {
        "feature_extractor",
        "--database_path", database.string(),
        "--image_path", images_dir.string(),
        "--ImageReader.camera_model", "OPENCV",
        "--ImageReader.single_camera", "1",
        "--SiftExtraction.use_gpu", gpu,
    }));

    log_info("Running colmap exhaustive matching...");
    runner_.run(tool(tools_.colmap, {
        "exhaustive_matcher",
        "--database_path", database.string(),
        "--SiftMatching.use_gpu", gpu,
    }));

    log_info("Running colmap mapper...");
    fs::create_directories(sparse_dir);
    runner_.run(tool(tools_.colmap, {
        "mapper",
        "--database_path", database.string(),
        "--image_path", images_dir.string(),
        "--output_path", sparse_dir.string(),
        "--Mapper.ba_refine_focal_length", "0",
        "--Mapper.ba_refine_extra_params", "0",
    }));

    fs::path recon = locate_reconstruction(sparse_dir);
    log_info(fmt::format("Sparse reconstruction created at: {}", recon.string()));
    return recon;
}

void DatasetPreparer::undistort(const fs::path& images_dir, const fs::path& reconstruction_dir,
                                const fs::path& out_dir) {
    log_info("Running colmap image undistorter...");
    runner_.run(tool(tools_.colmap, {
        "image_undistorter",
        "--image_path", images_dir.string(),
        "--input_path", reconstruction_dir.string(),
        "--output_path", out_dir.string(),
        "--output_type", "COLMAP",
    }));
}

std::vector<fs::path> DatasetPreparer::verify_layout(const DatasetLayout& layout) const {
    std::vector<fs::path> required = {layout.images_dir};
    for (const char* name : RECON_FILES) {
        required.push_back(layout.reconstruction_dir / name);
    }

    std::vector<fs::path> missing;
    for (const auto& p : required) {
        if (!fs::exists(p)) {
            log_warn(fmt::format("Missing expected file/dir: {}", p.string()));
            missing.push_back(p);
        }
    }

    if (!missing.empty() && dataset_.strict_reconstruction) {
        throw ReconstructionFailure(fmt::format(
            "reconstruction incomplete: {} expected file(s) missing, first {}",
            missing.size(), missing.front().string()));
    }
    return missing;
}

// ── Full chain ─────────────────────────────────────────────

DatasetLayout DatasetPreparer::prepare(const fs::path& video, const fs::path& scene_dir, int fps,
                                       StatusCallback cb) {
    log_info(fmt::format("Preparing scene from {} into {}", video.string(), scene_dir.string()));
    if (!fs::is_regular_file(video)) {
        throw InsufficientInputError("Video file not found: " + video.string());
    }

    DatasetLayout layout;
    layout.scene_dir = scene_dir;
    layout.input_dir = scene_dir / INPUT_DIR_NAME;
    layout.images_dir = scene_dir / IMAGES_DIR_NAME;
    layout.database = scene_dir / DATABASE_NAME;
    layout.sparse_dir = scene_dir / SPARSE_DIR_NAME;
    fs::create_directories(scene_dir);

    if (cb) cb("Extracting frames from video...");
    layout.frame_count = extract_frames(video, layout.input_dir, fps);
    validate_frame_count(layout.frame_count);

    if (cb) cb("Preparing images directory...");
    duplicate_to_working_dir(layout.input_dir, layout.images_dir);

    if (cb) cb("Running colmap pipeline...");
    layout.reconstruction_dir = run_reconstruction(scene_dir, layout.images_dir);

    layout.missing = verify_layout(layout);

    if (dataset_.undistort_images) {
        if (cb) cb("Undistorting images...");
        undistort(layout.images_dir, layout.reconstruction_dir, scene_dir / UNDISTORTED_DIR_NAME);
    }

    log_info("Scene preparation complete");
    return layout;
}
