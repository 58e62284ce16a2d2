#pragma once

#include <string>
#include <vector>
#include <optional>
#include <core/config.hpp>

// Exit codes shared by every subcommand.
constexpr int EXIT_OK = 0;
constexpr int EXIT_JOB_FAILED = 1;
constexpr int EXIT_CONFIG_ERROR = 2;

class WorkerCLI {
public:
    WorkerCLI();

    // Jobs run concurrently, one thread each. Progress and results are
    // written to stdout as JSON lines; diagnostics go to stderr.
    int run_jobs(const std::vector<std::string>& job_files);

    // Standalone dataset preparation: --video <path> --out <dir> [--fps <n>]
    int run_prepare(const std::vector<std::string>& args);

    int run_config();

    bool require_config();

    std::optional<Config> config;

private:
    void init_logging();

    std::string config_error_;
};
