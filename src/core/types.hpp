#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// External process execution result
struct CommandResult {
    int exit_code = 0;
    std::string stdout_data;
    std::string stderr_data;

    bool failed() const { return exit_code != 0; }

    std::string get_output() const {
        return stderr_data.empty() ? stdout_data : stderr_data;
    }
};

// ── Configuration structures ────────────────────────────────

struct ToolsConfig {
    std::string ffmpeg = "ffmpeg";
    std::string colmap = "colmap";
    bool colmap_use_gpu = true;
    std::string train_program = "python3";
    std::string train_script = "train.py";   // empty = program is the trainer itself
    std::string train_workdir;               // defaults to workdir
};

struct DatasetConfig {
    bool strict_reconstruction = false;      // missing sparse files are fatal
    bool undistort_images = false;           // run colmap image_undistorter after mapping
};

struct TimeoutConfig {
    int download_secs = 120;
    int upload_secs = 600;
};

struct S3Config {
    std::string endpoint;                    // empty = AWS virtual-host URL for the locator
    std::string bucket = "gsplatt-results";
    std::string region = "us-east-1";
    std::string access_key;
    std::string secret_key;

    bool configured() const { return !access_key.empty() && !secret_key.empty(); }
};

struct HttpSinkConfig {
    std::string bucket_url;                  // PUT <bucket_url>/<archive>
    std::string bucket_key;                  // bearer token for bucket_url
    std::string server_url;                  // multipart POST <server_url><server_route>
    std::string server_route = "/upload";
    std::string server_token;
};

struct LogConfig {
    std::string level = "info";
    std::string file;
};

// ── Job model ───────────────────────────────────────────────

enum class JobState {
    Created,
    Downloading,
    Preparing,
    Training,
    Uploading,
    Done,
    Failed,
};

struct JobOptions {
    int iterations = 30000;
    int fps = 2;
    std::optional<std::string> scene_id;
    int timeout_secs = 0;                    // 0 = no deadline
};

struct Job {
    std::string id;
    std::string video_url;
    JobOptions options;
    JobState state = JobState::Created;
};

struct ProgressReport {
    int progress = 0;
    std::string stage;
};

struct JobResult {
    bool success = false;
    std::string scene_id;
    int progress = 0;
    std::string plt_url;
    std::string error;
};

// Progress callback supplied by the invoking runtime
using ProgressCallback = std::function<void(const ProgressReport&)>;

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
