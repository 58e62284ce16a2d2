#include "command_runner.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>
#include <chrono>

CommandResult CommandRunner::run(const Command& cmd) const {
    log_info(fmt::format("RUN: {}{}", join_command(cmd.program, cmd.args),
                         cmd.cwd ? fmt::format(" (cwd {})", cmd.cwd->string()) : ""));

    int budget_ms = cmd.deadline.remaining_ms();
    if (cmd.deadline.bounded() && budget_ms == 0) {
        throw CommandTimeout(cmd.program, 0);
    }

    std::string launch_error;
    platform::ProcessHandle proc = platform::spawn(cmd.program, cmd.args, cmd.cwd, launch_error);
    if (!proc.valid()) {
        throw LaunchFailure(cmd.program, launch_error);
    }

    auto started = std::chrono::steady_clock::now();
    CommandResult result;
    if (!proc.communicate(result.stdout_data, result.stderr_data, budget_ms)) {
        log_warn(fmt::format("{} exceeded its {}ms budget, terminating pid {}",
                             cmd.program, budget_ms, proc.native_handle()));
        proc.terminate(TERMINATE_GRACE_MS);
        throw CommandTimeout(cmd.program, (budget_ms + 999) / 1000);
    }
    result.exit_code = proc.exit_code();

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();
    log_debug(fmt::format("{} exit={} after {}ms", cmd.program, result.exit_code, elapsed));
    if (!result.stdout_data.empty())
        log_debug(fmt::format("{} stdout: {}", cmd.program,
                              tail_excerpt(result.stdout_data, ERROR_EXCERPT_BYTES)));
    if (!result.stderr_data.empty())
        log_debug(fmt::format("{} stderr: {}", cmd.program,
                              tail_excerpt(result.stderr_data, ERROR_EXCERPT_BYTES)));

    if (result.failed()) {
        throw CommandFailure(cmd.program, result.exit_code,
                             tail_excerpt(result.get_output(), ERROR_EXCERPT_BYTES));
    }
    return result;
}
