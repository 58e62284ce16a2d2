#include <iostream>
#include <vector>
#include <string>
#include "cli/worker_cli.hpp"
#include "cli/theme.hpp"
#include <core/constants.hpp>
#include <platform/http.hpp>

void print_usage() {
    std::cerr << theme::banner();
    std::cerr << theme::section("Usage");
    std::cerr << theme::usage("gsworker run <job.json> [more.json...]", "Run jobs concurrently");
    std::cerr << theme::usage("gsworker prepare --video <f> --out <dir>", "Build a dataset only (--fps <n>)");
    std::cerr << theme::usage("gsworker config", "Show resolved configuration");
    std::cerr << "\n";
    std::cerr << theme::color::DIM
              << "    gsworker --version                          Show version\n"
              << "    gsworker --help                             Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage();
        return EXIT_JOB_FAILED;
    }

    std::string cmd = argv[1];
    std::vector<std::string> args(argv + 2, argv + argc);

    if (cmd == "--version") {
        std::cout << "gsworker version " << GSWORKER_VERSION << "\n";
        return EXIT_OK;
    } else if (cmd == "--help" || cmd == "help") {
        print_usage();
        return EXIT_OK;
    }

    try {
        platform::CurlGlobal curl;
        WorkerCLI cli;

        if (cmd == "run") {
            return cli.run_jobs(args);
        } else if (cmd == "prepare") {
            return cli.run_prepare(args);
        } else if (cmd == "config") {
            return cli.run_config();
        }

        std::cerr << theme::fail("Unknown command: " + cmd);
        print_usage();
        return EXIT_JOB_FAILED;
    } catch (const std::exception& e) {
        std::cerr << theme::fail(std::string(e.what()));
        return EXIT_JOB_FAILED;
    }
}
