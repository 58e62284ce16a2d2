#pragma once

#include <string>
#include <filesystem>
#include <core/config.hpp>
#include <core/deadline.hpp>
#include <core/types.hpp>
#include "artifact_fetcher.hpp"
#include "command_runner.hpp"
#include "result_publisher.hpp"

namespace fs = std::filesystem;

// Sequences one job: created -> downloading -> preparing -> training ->
// uploading -> done, with `failed` reachable from every non-terminal state.
//
// run() never throws. Every stage error becomes a failed JobResult carrying
// the last milestone reached, and the scene workspace is removed on every path.
// One Pipeline may serve several jobs on different threads at once.
class Pipeline {
public:
    Pipeline(const Config& config, ArtifactFetcher& fetcher,
             ResultPublisher& publisher, const CommandRunner& runner);

    JobResult run(Job& job, const ProgressCallback& on_progress = nullptr);

private:
    void run_training(const fs::path& scene_dir, const fs::path& output_dir,
                      int iterations, const Deadline& deadline);

    const Config& config_;
    ArtifactFetcher& fetcher_;
    ResultPublisher& publisher_;
    const CommandRunner& runner_;
};
