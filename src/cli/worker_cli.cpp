#include "worker_cli.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/job.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <managers/artifact_fetcher.hpp>
#include <managers/command_runner.hpp>
#include <managers/dataset_preparer.hpp>
#include <managers/pipeline.hpp>
#include <managers/result_publisher.hpp>
#include <managers/sinks.hpp>
#include <fmt/format.h>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>
#include <atomic>

namespace {

std::mutex g_stdout_mutex;

void emit_line(const std::string& json) {
    std::lock_guard<std::mutex> lock(g_stdout_mutex);
    std::cout << json << "\n" << std::flush;
}

Result<std::string> read_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) return Result<std::string>::Err("cannot open " + path);
    std::stringstream ss;
    ss << in.rdbuf();
    return Result<std::string>::Ok(ss.str());
}

JobResult rejected(const std::string& error) {
    JobResult r;
    r.success = false;
    r.progress = PROGRESS_START;
    r.error = error;
    return r;
}

} // namespace

WorkerCLI::WorkerCLI() {
    auto config_result = Config::load();
    if (config_result.is_ok()) {
        config = config_result.value;
        init_logging();
    } else {
        config_error_ = config_result.error;
    }
}

void WorkerCLI::init_logging() {
    LogLevel level = LogLevel::Info;
    parse_log_level(config->log().level, level);
    log_set_level(level);
    if (!config->log().file.empty()) log_set_file(config->log().file);
}

bool WorkerCLI::require_config() {
    if (!config.has_value()) {
        std::cerr << theme::fail("Configuration error: " + config_error_);
        return false;
    }
    return true;
}

// ── run ────────────────────────────────────────────────────

int WorkerCLI::run_jobs(const std::vector<std::string>& job_files) {
    if (!require_config()) return EXIT_CONFIG_ERROR;
    if (job_files.empty()) {
        std::cerr << theme::fail("No job files given.");
        std::cerr << theme::step("Usage: gsworker run <job.json> [more.json...]");
        return EXIT_JOB_FAILED;
    }

    // Parse everything up front so a malformed file is reported immediately
    std::vector<Job> jobs;
    bool any_failed = false;
    for (const auto& file : job_files) {
        auto text = read_file(file);
        auto parsed = text.is_ok() ? parse_job(text.value)
                                   : Result<Job>::Err(text.error);
        if (parsed.is_err()) {
            std::cerr << theme::fail(fmt::format("{}: {}", file, parsed.error));
            emit_line(job_result_json(file, rejected(parsed.error)));
            any_failed = true;
            continue;
        }
        jobs.push_back(parsed.value);
    }

    const Config& cfg = config.value();
    std::shared_ptr<Sink> sink = make_sink(cfg);
    if (sink) {
        log_info("Publishing to " + sink->describe());
    } else {
        log_warn("No upload sink configured; jobs will fail at the upload stage");
    }

    HttpFetcher fetcher(cfg.timeouts().download_secs);
    ResultPublisher publisher(sink);
    CommandRunner runner;
    Pipeline pipeline(cfg, fetcher, publisher, runner);

    std::atomic<int> failures{0};
    std::vector<std::thread> workers;
    workers.reserve(jobs.size());
    for (auto& job : jobs) {
        workers.emplace_back([&pipeline, &failures, &job]() {
            auto on_progress = [&job](const ProgressReport& report) {
                emit_line(progress_json(job.id, report));
            };
            JobResult result = pipeline.run(job, on_progress);
            if (!result.success) failures++;
            emit_line(job_result_json(job.id, result));
        });
    }
    for (auto& t : workers) t.join();

    if (failures > 0) any_failed = true;
    std::cerr << theme::kv("jobs", fmt::format("{} run, {} failed", job_files.size(),
                                               failures.load() + (job_files.size() - jobs.size())));
    return any_failed ? EXIT_JOB_FAILED : EXIT_OK;
}

// ── prepare ────────────────────────────────────────────────

int WorkerCLI::run_prepare(const std::vector<std::string>& args) {
    if (!require_config()) return EXIT_CONFIG_ERROR;

    std::string video, out;
    int fps = 2;
    for (size_t i = 0; i < args.size(); i++) {
        const std::string& a = args[i];
        bool has_value = i + 1 < args.size();
        if (a == "--video" && has_value) {
            video = args[++i];
        } else if (a == "--out" && has_value) {
            out = args[++i];
        } else if (a == "--fps" && has_value) {
            if (!parse_int(args[++i], fps) || fps <= 0) {
                std::cerr << theme::fail("--fps must be a positive integer");
                return EXIT_JOB_FAILED;
            }
        } else {
            std::cerr << theme::fail("Unexpected argument: " + a);
            std::cerr << theme::step("Usage: gsworker prepare --video <file> --out <dir> [--fps <n>]");
            return EXIT_JOB_FAILED;
        }
    }
    if (video.empty() || out.empty()) {
        std::cerr << theme::fail("--video and --out are required");
        return EXIT_JOB_FAILED;
    }
    if (!fs::is_regular_file(video)) {
        std::cerr << theme::fail("Video file not found: " + video);
        return EXIT_JOB_FAILED;
    }

    const Config& cfg = config.value();
    CommandRunner runner;
    DatasetPreparer preparer(cfg.tools(), cfg.dataset(), runner);

    try {
        fs::create_directories(out);
        auto layout = preparer.prepare(video, out, fps, [](const std::string& msg) {
            std::cerr << theme::step(msg);
        });
        std::cerr << theme::ok("Dataset ready");
        std::cerr << theme::kv("frames", std::to_string(layout.frame_count));
        std::cerr << theme::kv("images", layout.images_dir.string());
        std::cerr << theme::kv("sparse", layout.reconstruction_dir.string());
        if (!layout.missing.empty()) {
            std::cerr << theme::kv("missing", std::to_string(layout.missing.size()) + " file(s)");
        }
        return EXIT_OK;
    } catch (const std::exception& e) {
        std::cerr << theme::fail(e.what());
        return EXIT_JOB_FAILED;
    }
}

// ── config ─────────────────────────────────────────────────

int WorkerCLI::run_config() {
    if (!require_config()) return EXIT_CONFIG_ERROR;
    std::cout << theme::section("Configuration");
    std::istringstream lines(config->describe());
    std::string line;
    while (std::getline(lines, line)) {
        std::cout << "    " << line << "\n";
    }
    std::cout << "\n";
    return EXIT_OK;
}
