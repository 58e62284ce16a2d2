#pragma once

#include <cstddef>

// ── Dataset layout ──────────────────────────────────────────
// Names the trainer and colmap expect inside a scene directory.
constexpr const char* INPUT_DIR_NAME     = "input";
constexpr const char* IMAGES_DIR_NAME    = "images";
constexpr const char* SPARSE_DIR_NAME    = "sparse";
constexpr const char* DEFAULT_RECON_NAME = "0";
constexpr const char* DATABASE_NAME      = "database.db";
constexpr const char* OUTPUT_DIR_NAME    = "output";
constexpr const char* UNDISTORTED_DIR_NAME = "undistorted";
constexpr const char* VIDEO_FILE_NAME    = "input.mp4";
constexpr const char* FRAME_PATTERN      = "frame_%05d.jpg";
constexpr const char* FRAME_EXTENSION    = ".jpg";
constexpr const char* RECON_FILES[]      = {"cameras.bin", "images.bin", "points3D.bin"};

// Fewer frames than this cannot be triangulated.
constexpr int MIN_FRAMES = 3;

// ── Frame extraction ────────────────────────────────────────
constexpr const char* JPEG_QUALITY = "2";   // ffmpeg -q:v scale, 2 = high

// ── Progress milestones ─────────────────────────────────────
constexpr int PROGRESS_START    = 0;
constexpr int PROGRESS_FETCHED  = 10;
constexpr int PROGRESS_PREPARED = 30;
constexpr int PROGRESS_TRAINED  = 90;
constexpr int PROGRESS_DONE     = 100;

constexpr const char* STAGE_DOWNLOADING       = "downloading_video";
constexpr const char* STAGE_DOWNLOADED        = "video_downloaded";
constexpr const char* STAGE_PREPARING         = "preparing_dataset";
constexpr const char* STAGE_DATASET_READY     = "dataset_ready";
constexpr const char* STAGE_TRAINING          = "training";
constexpr const char* STAGE_TRAINING_COMPLETE = "training_complete";
constexpr const char* STAGE_UPLOADING         = "uploading";
constexpr const char* STAGE_DONE              = "done";

// ── Timeouts ────────────────────────────────────────────────
constexpr int CONNECT_TIMEOUT_SECS  = 30;
constexpr int TERMINATE_GRACE_MS    = 2000;  // SIGTERM -> SIGKILL window

// ── Buffer sizes ────────────────────────────────────────────
constexpr std::size_t PIPE_READ_BUF_SIZE   = 4096;
constexpr std::size_t ARCHIVE_BUF_SIZE     = 65536;
constexpr std::size_t FETCH_CHUNK_SIZE     = 8192;
constexpr std::size_t ERROR_EXCERPT_BYTES  = 2000;

// ── Publishing ──────────────────────────────────────────────
constexpr const char* S3_KEY_PREFIX       = "results/";
constexpr const char* SERVER_FILES_ROUTE  = "/files/";

// ── Scene ids ───────────────────────────────────────────────
constexpr std::size_t MAX_SCENE_ID_LENGTH = 128;
constexpr std::size_t WORKSPACE_SUFFIX_HEX = 8;

constexpr const char* GSWORKER_VERSION = "0.1.0";
