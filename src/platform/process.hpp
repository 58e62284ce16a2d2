#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>

namespace platform {

// Handle to a spawned child process whose stdout/stderr are piped back.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // Drain stdout/stderr until both close, then reap the child.
    // timeout_ms < 0 waits indefinitely. Returns false if the deadline passed
    // (the child is left running; call terminate()).
    bool communicate(std::string& out, std::string& err, int timeout_ms = -1);

    // Exit status after communicate(): exit code, or 128+signal if killed.
    int exit_code() const { return exit_code_; }

    // Terminate the process (SIGTERM, then SIGKILL after grace_ms).
    void terminate(int grace_ms = 2000);

    int native_handle() const { return pid_; }

private:
    int pid_ = -1;
    int out_fd_ = -1;
    int err_fd_ = -1;
    int exit_code_ = -1;
    bool reaped_ = false;

    void close_fds();
    void reap(int status);

    friend ProcessHandle spawn(const std::string& program,
                               const std::vector<std::string>& args,
                               const std::optional<std::filesystem::path>& cwd,
                               std::string& launch_error);
};

// Spawn a child process with stdin closed and stdout/stderr piped.
// On failure returns an invalid handle and fills launch_error with the
// OS reason (exec, chdir, fork or pipe errors).
ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const std::optional<std::filesystem::path>& cwd,
                    std::string& launch_error);

} // namespace platform
