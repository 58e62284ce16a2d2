#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <core/types.hpp>
#include <core/deadline.hpp>

namespace fs = std::filesystem;

struct Command {
    std::string program;
    std::vector<std::string> args;
    std::optional<fs::path> cwd;
    Deadline deadline;            // unbounded by default
};

// Runs external tools to completion. Fail-fast, no retries.
//
// Throws LaunchFailure when the process cannot start, CommandTimeout when the
// deadline passes (the child is terminated), CommandFailure on nonzero exit.
class CommandRunner {
public:
    CommandResult run(const Command& cmd) const;
};
