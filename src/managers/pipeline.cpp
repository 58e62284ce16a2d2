#include "pipeline.hpp"
#include "dataset_preparer.hpp"
#include "workspace.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/job.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

namespace {

// Per-run bookkeeping: milestone tracking plus the job log.
class JobTracker {
public:
    JobTracker(Job& job, const fs::path& workdir, const ProgressCallback& cb)
        : job_(job), workdir_(workdir), cb_(cb) {}

    void transition(JobState next) {
        note(fmt::format("state {} -> {}", job_state_name(job_.state), job_state_name(next)));
        job_.state = next;
    }

    void milestone(int pct, const char* stage) {
        // Milestones never go backwards
        if (pct < progress_) pct = progress_;
        progress_ = pct;
        note(fmt::format("progress {}% {}", pct, stage));
        if (!cb_) return;
        try {
            cb_(ProgressReport{pct, stage});
        } catch (const std::exception& e) {
            log_warn(fmt::format("[{}] progress callback threw: {}", job_.id, e.what()));
        }
    }

    void note(const std::string& msg) {
        log_info(fmt::format("[{}] {}", job_.id, msg));
        append_job_log(workdir_, job_.id, msg);
    }

    int progress() const { return progress_; }

private:
    Job& job_;
    fs::path workdir_;
    const ProgressCallback& cb_;
    int progress_ = PROGRESS_START;
};

} // namespace

Pipeline::Pipeline(const Config& config, ArtifactFetcher& fetcher,
                   ResultPublisher& publisher, const CommandRunner& runner)
    : config_(config), fetcher_(fetcher), publisher_(publisher), runner_(runner) {}

void Pipeline::run_training(const fs::path& scene_dir, const fs::path& output_dir,
                            int iterations, const Deadline& deadline) {
    const auto& tools = config_.tools();
    Command cmd;
    cmd.program = tools.train_program;
    if (!tools.train_script.empty()) cmd.args.push_back(tools.train_script);
    cmd.args.insert(cmd.args.end(), {
        "-s", scene_dir.string(),
        "-m", output_dir.string(),
        fmt::format("--iterations={}", iterations),
    });
    if (!tools.train_workdir.empty()) cmd.cwd = fs::path(tools.train_workdir);
    cmd.deadline = deadline;
    runner_.run(cmd);
}

JobResult Pipeline::run(Job& job, const ProgressCallback& on_progress) {
    JobTracker tracker(job, config_.workdir(), on_progress);
    JobResult result;

    try {
        auto valid = validate_job(job);
        if (valid.is_err()) throw WorkerError("invalid job: " + valid.error);

        std::string scene_id = job.options.scene_id.value_or(generate_uuid());
        result.scene_id = scene_id;
        tracker.note(fmt::format("scene {} from {} (iterations={}, fps={})",
                                 scene_id, job.video_url, job.options.iterations, job.options.fps));

        Deadline deadline = Deadline::after_seconds(job.options.timeout_secs);
        SceneWorkspace workspace(config_.scenes_dir(), scene_id);
        const fs::path& scene_dir = workspace.path();

        // ── Stage 0: download (0-10%) ──
        tracker.transition(JobState::Downloading);
        tracker.milestone(PROGRESS_START, STAGE_DOWNLOADING);
        fs::path video = scene_dir / VIDEO_FILE_NAME;
        try {
            fetcher_.fetch(job.video_url, video);
        } catch (const FetchFailure& e) {
            throw FetchFailure(std::string("download error: ") + e.what());
        }
        tracker.milestone(PROGRESS_FETCHED, STAGE_DOWNLOADED);

        // ── Stage 1: dataset (10-30%) ──
        tracker.transition(JobState::Preparing);
        tracker.milestone(PROGRESS_FETCHED, STAGE_PREPARING);
        DatasetPreparer preparer(config_.tools(), config_.dataset(), runner_, deadline);
        DatasetLayout layout = preparer.prepare(video, scene_dir, job.options.fps,
            [&](const std::string& msg) { tracker.note(msg); });
        tracker.note(fmt::format("dataset ready: {} frames, reconstruction {}",
                                 layout.frame_count, layout.reconstruction_dir.filename().string()));
        tracker.milestone(PROGRESS_PREPARED, STAGE_DATASET_READY);

        // ── Stage 2: training (30-90%) ──
        tracker.transition(JobState::Training);
        tracker.milestone(PROGRESS_PREPARED, STAGE_TRAINING);
        fs::path output_dir = scene_dir / OUTPUT_DIR_NAME;
        fs::create_directories(output_dir);
        run_training(scene_dir, output_dir, job.options.iterations, deadline);
        tracker.milestone(PROGRESS_TRAINED, STAGE_TRAINING_COMPLETE);

        // ── Stage 3: upload (90-100%) ──
        tracker.transition(JobState::Uploading);
        tracker.milestone(PROGRESS_TRAINED, STAGE_UPLOADING);
        std::string locator = publisher_.publish(output_dir, scene_id);
        tracker.milestone(PROGRESS_DONE, STAGE_DONE);
        tracker.transition(JobState::Done);

        result.success = true;
        result.progress = PROGRESS_DONE;
        result.plt_url = locator;
        // workspace released here, before the result goes back
    } catch (const std::exception& e) {
        const char* kind = dynamic_cast<const WorkerError*>(&e) ? "" : "unexpected error: ";
        result.success = false;
        result.error = std::string(kind) + e.what();
        result.progress = tracker.progress();
        log_error(fmt::format("[{}] Job failed at {}%: {}", job.id, result.progress, result.error));
        append_job_log(config_.workdir(), job.id, "FAILED: " + result.error);
        job.state = JobState::Failed;
    }

    return result;
}
