#include "test_support.hpp"
#include <managers/pipeline.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <atomic>
#include <mutex>
#include <thread>

namespace {

class FakeFetcher : public ArtifactFetcher {
public:
    FetchStats fetch(const std::string& url, const fs::path& dest) override {
        calls++;
        if (!fail_with.empty()) throw FetchFailure(fail_with + " fetching " + url);
        fs::create_directories(dest.parent_path());
        std::ofstream(dest, std::ios::binary) << "video bytes";
        return FetchStats{11, 200};
    }

    std::string fail_with;
    std::atomic<int> calls{0};
};

class FakeSink : public Sink {
public:
    std::string deliver(const fs::path& archive, const std::string& name) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!fs::exists(archive)) throw PublishFailure("archive missing: " + archive.string());
        names.push_back(name);
        return "https://cdn.example.test/results/" + name;
    }
    std::string describe() const override { return "fake"; }

    std::vector<std::string> names;

private:
    std::mutex mutex_;
};

} // namespace

class PipelineTest : public ScratchTest {
protected:
    Config config;
    FakeFetcher fetcher;
    std::shared_ptr<FakeSink> sink = std::make_shared<FakeSink>();
    CommandRunner runner;

    void SetUp() override {
        ScratchTest::SetUp();
        config.set_workdir(test_dir / "work");
        auto& tools = config.mutable_tools();
        tools.ffmpeg = fake_ffmpeg(42).string();
        tools.colmap = fake_colmap().string();
        tools.train_program = fake_trainer().string();
        tools.train_script = "";
        tools.train_workdir = "";
    }

    Job make_job(const std::string& scene_id = "abc123", int iterations = 100) {
        Job job;
        job.id = "job-" + scene_id;
        job.video_url = "https://videos.example/" + scene_id + ".mp4";
        job.options.iterations = iterations;
        job.options.fps = 2;
        if (!scene_id.empty()) job.options.scene_id = scene_id;
        return job;
    }

    JobResult run(Job& job, std::vector<int>* progress = nullptr,
                  std::vector<std::string>* stages = nullptr) {
        ResultPublisher publisher(sink);
        Pipeline pipeline(config, fetcher, publisher, runner);
        return pipeline.run(job, [&](const ProgressReport& r) {
            if (progress) progress->push_back(r.progress);
            if (stages) stages->push_back(r.stage);
        });
    }

    bool scenes_empty() const {
        auto dir = config.scenes_dir();
        return !fs::exists(dir) || fs::is_empty(dir);
    }
};

TEST_F(PipelineTest, SuccessfulJob) {
    Job job = make_job("abc123", 100);
    std::vector<int> progress;
    std::vector<std::string> stages;
    JobResult result = run(job, &progress, &stages);

    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.scene_id, "abc123");
    EXPECT_EQ(result.progress, 100);
    EXPECT_EQ(result.plt_url, "https://cdn.example.test/results/abc123.zip");
    EXPECT_TRUE(result.error.empty());
    EXPECT_EQ(job.state, JobState::Done);

    std::vector<int> expected_progress = {0, 10, 10, 30, 30, 90, 90, 100};
    EXPECT_EQ(progress, expected_progress);
    std::vector<std::string> expected_stages = {
        "downloading_video", "video_downloaded", "preparing_dataset", "dataset_ready",
        "training", "training_complete", "uploading", "done",
    };
    EXPECT_EQ(stages, expected_stages);

    ASSERT_EQ(sink->names.size(), 1u);
    EXPECT_EQ(sink->names[0], "abc123.zip");
    EXPECT_TRUE(scenes_empty());
}

TEST_F(PipelineTest, TrainerReceivesWorkspaceAndIterations) {
    Job job = make_job("abc123", 100);
    ASSERT_TRUE(run(job).success);

    std::string train_line;
    for (const auto& line : read_lines(calls_log())) {
        if (line.rfind("train ", 0) == 0) train_line = line;
    }
    ASSERT_FALSE(train_line.empty());
    EXPECT_NE(train_line.find("-s " + config.scenes_dir().string() + "/abc123-"), std::string::npos);
    EXPECT_NE(train_line.find("/output --iterations=100"), std::string::npos);
}

TEST_F(PipelineTest, DownloadFailureReportsZeroProgress) {
    fetcher.fail_with = "HTTP 404";
    Job job = make_job();
    std::vector<int> progress;
    JobResult result = run(job, &progress);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.progress, 0);
    EXPECT_EQ(result.error.rfind("download error:", 0), 0u) << result.error;
    EXPECT_NE(result.error.find("404"), std::string::npos);
    EXPECT_EQ(job.state, JobState::Failed);
    EXPECT_EQ(progress, std::vector<int>{0});
    EXPECT_TRUE(read_lines(calls_log()).empty());
    EXPECT_TRUE(scenes_empty());
}

TEST_F(PipelineTest, TooFewFramesFailsAtTenPercent) {
    config.mutable_tools().ffmpeg = fake_ffmpeg(2).string();
    Job job = make_job();
    JobResult result = run(job);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.progress, 10);
    EXPECT_NE(result.error.find("3"), std::string::npos);
    EXPECT_TRUE(sink->names.empty());
    EXPECT_TRUE(scenes_empty());
}

TEST_F(PipelineTest, TrainerFailureFailsAtThirtyPercent) {
    config.mutable_tools().train_program =
        write_script("train-broken", "echo 'CUDA out of memory' >&2\nexit 2\n").string();
    Job job = make_job();
    JobResult result = run(job);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.progress, 30);
    EXPECT_NE(result.error.find("CUDA out of memory"), std::string::npos);
    EXPECT_TRUE(scenes_empty());
}

TEST_F(PipelineTest, MissingTrainerIsLaunchFailure) {
    config.mutable_tools().train_program = (test_dir / "bin" / "absent").string();
    Job job = make_job();
    JobResult result = run(job);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.progress, 30);
    EXPECT_NE(result.error.find("Failed to launch"), std::string::npos);
}

TEST_F(PipelineTest, NoSinkFailsAtNinetyPercent) {
    Job job = make_job();
    ResultPublisher publisher(nullptr);
    Pipeline pipeline(config, fetcher, publisher, runner);
    JobResult result = pipeline.run(job);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.progress, 90);
    EXPECT_TRUE(scenes_empty());
}

TEST_F(PipelineTest, InvalidJobRejectedBeforeAnyStage) {
    Job job = make_job("../escape");
    std::vector<int> progress;
    JobResult result = run(job, &progress);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.progress, 0);
    EXPECT_TRUE(progress.empty());
    EXPECT_EQ(fetcher.calls.load(), 0);
}

TEST_F(PipelineTest, GeneratesSceneIdWhenAbsent) {
    Job job = make_job("");
    JobResult result = run(job);

    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.scene_id.size(), 36u);
    ASSERT_EQ(sink->names.size(), 1u);
    EXPECT_EQ(sink->names[0], result.scene_id + ".zip");
}

TEST_F(PipelineTest, JobTimeoutTerminatesTrainer) {
    config.mutable_tools().train_program = fake_trainer("sleep 30\n").string();
    Job job = make_job();
    job.options.timeout_secs = 2;
    JobResult result = run(job);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.progress, 30);
    EXPECT_NE(result.error.find("timed out"), std::string::npos);
    EXPECT_TRUE(scenes_empty());
}

TEST_F(PipelineTest, ThrowingProgressCallbackDoesNotFailJob) {
    Job job = make_job();
    ResultPublisher publisher(sink);
    Pipeline pipeline(config, fetcher, publisher, runner);
    JobResult result = pipeline.run(job, [](const ProgressReport&) {
        throw std::runtime_error("listener went away");
    });
    EXPECT_TRUE(result.success) << result.error;
}

TEST_F(PipelineTest, ConcurrentJobsWithSameSceneId) {
    ResultPublisher publisher(sink);
    Pipeline pipeline(config, fetcher, publisher, runner);

    std::vector<Job> jobs = {make_job("shared"), make_job("shared")};
    jobs[1].id = "job-shared-2";
    std::vector<JobResult> results(jobs.size());
    std::vector<std::thread> threads;
    for (size_t i = 0; i < jobs.size(); i++) {
        threads.emplace_back([&, i]() { results[i] = pipeline.run(jobs[i]); });
    }
    for (auto& t : threads) t.join();

    for (const auto& r : results) {
        EXPECT_TRUE(r.success) << r.error;
        EXPECT_EQ(r.scene_id, "shared");
    }
    EXPECT_EQ(sink->names.size(), 2u);
    EXPECT_TRUE(scenes_empty());
}

TEST_F(PipelineTest, WritesPerJobLog) {
    Job job = make_job();
    run(job);
    auto log = read_file(job_log_path(config.workdir(), job.id));
    EXPECT_NE(log.find("downloading"), std::string::npos);
    EXPECT_NE(log.find("done"), std::string::npos);
}
