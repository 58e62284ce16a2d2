#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>
#include <core/deadline.hpp>
#include "command_runner.hpp"

namespace fs = std::filesystem;

// Directory layout handed to the trainer.
//
//   scene/
//   ├── input/            extracted frames (archival copy)
//   ├── images/           working copy read by colmap and the trainer
//   ├── database.db       colmap feature database
//   └── sparse/0/         cameras.bin, images.bin, points3D.bin
struct DatasetLayout {
    fs::path scene_dir;
    fs::path input_dir;
    fs::path images_dir;
    fs::path database;
    fs::path sparse_dir;
    fs::path reconstruction_dir;     // sparse/0, or the fallback that was found
    int frame_count = 0;
    std::vector<fs::path> missing;   // expected files absent after mapping
};

// Turns a video into a reconstruction-ready scene directory:
// extract_frames -> validate_frame_count -> duplicate_to_working_dir -> run_reconstruction.
// Any failing stage aborts the whole preparation.
class DatasetPreparer {
public:
    DatasetPreparer(const ToolsConfig& tools, const DatasetConfig& dataset,
                    const CommandRunner& runner, Deadline deadline = Deadline());

    DatasetLayout prepare(const fs::path& video, const fs::path& scene_dir, int fps,
                          StatusCallback cb = nullptr);

    // ffmpeg into a fresh `out_dir`; returns the number of frames written.
    int extract_frames(const fs::path& video, const fs::path& out_dir, int fps);

    // Throws InsufficientInputError below MIN_FRAMES.
    static void validate_frame_count(int frames);

    static int count_frames(const fs::path& dir);

    // Replaces `images_dir` wholesale with a copy of `input_dir`.
    static void duplicate_to_working_dir(const fs::path& input_dir, const fs::path& images_dir);

    // feature_extractor -> exhaustive_matcher -> mapper against a fresh database.
    // Returns the selected reconstruction directory.
    fs::path run_reconstruction(const fs::path& scene_dir, const fs::path& images_dir);

    // sparse/0 if present, else the first subdirectory by name.
    // Throws ReconstructionFailure when there is none.
    static fs::path locate_reconstruction(const fs::path& sparse_dir);

    // Logs each missing expected file. Throws ReconstructionFailure in strict mode.
    std::vector<fs::path> verify_layout(const DatasetLayout& layout) const;

private:
    void undistort(const fs::path& images_dir, const fs::path& reconstruction_dir,
                   const fs::path& out_dir);
    Command tool(const std::string& program, std::vector<std::string> args) const;

    const ToolsConfig& tools_;
    const DatasetConfig& dataset_;
    const CommandRunner& runner_;
    Deadline deadline_;
};
