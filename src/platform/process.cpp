#include "process.hpp"
#include "platform.hpp"
#include <core/constants.hpp>

#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <chrono>
#include <utility>

namespace platform {

namespace {

// Written by the child to the status pipe when chdir/exec fails.
struct LaunchStatus {
    int stage;  // 0 = chdir, 1 = exec
    int err;
};

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

int remaining_ms(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

} // namespace

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    if (valid() && !reaped_) {
        terminate();
    }
    close_fds();
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept {
    *this = std::move(other);
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        close_fds();
        pid_ = other.pid_;
        out_fd_ = other.out_fd_;
        err_fd_ = other.err_fd_;
        exit_code_ = other.exit_code_;
        reaped_ = other.reaped_;
        other.pid_ = -1;
        other.out_fd_ = -1;
        other.err_fd_ = -1;
        other.reaped_ = false;
    }
    return *this;
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

void ProcessHandle::close_fds() {
    close_fd(out_fd_);
    close_fd(err_fd_);
}

void ProcessHandle::reap(int status) {
    reaped_ = true;
    if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code_ = 128 + WTERMSIG(status);
    } else {
        exit_code_ = -1;
    }
}

bool ProcessHandle::communicate(std::string& out, std::string& err, int timeout_ms) {
    if (!valid()) return true;

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    char buf[PIPE_READ_BUF_SIZE];

    while (out_fd_ >= 0 || err_fd_ >= 0) {
        pollfd fds[2];
        int* owners[2];
        nfds_t n = 0;
        if (out_fd_ >= 0) { fds[n] = {out_fd_, POLLIN, 0}; owners[n++] = &out_fd_; }
        if (err_fd_ >= 0) { fds[n] = {err_fd_, POLLIN, 0}; owners[n++] = &err_fd_; }

        int wait_ms = -1;
        if (timeout_ms >= 0) {
            wait_ms = remaining_ms(deadline);
            if (wait_ms == 0) return false;
        }

        int rc = poll(fds, n, wait_ms);
        if (rc < 0) {
            if (errno == EINTR) continue;
            close_fds();
            break;
        }
        if (rc == 0) return false;

        for (nfds_t i = 0; i < n; i++) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            ssize_t got = read(fds[i].fd, buf, sizeof(buf));
            if (got > 0) {
                std::string& sink = (owners[i] == &out_fd_) ? out : err;
                sink.append(buf, static_cast<size_t>(got));
            } else if (got == 0 || errno != EINTR) {
                close_fd(*owners[i]);
            }
        }
    }

    // Both streams closed; the child may still be finishing.
    while (!reaped_) {
        int status;
        pid_t ret = waitpid(pid_, &status, timeout_ms < 0 ? 0 : WNOHANG);
        if (ret == pid_) {
            reap(status);
            break;
        }
        if (ret < 0) {
            if (errno == EINTR) continue;
            reaped_ = true;
            exit_code_ = -1;
            break;
        }
        if (remaining_ms(deadline) == 0) return false;
        sleep_ms(20);
    }
    return true;
}

void ProcessHandle::terminate(int grace_ms) {
    if (pid_ <= 0 || reaped_) return;

    // The child leads its own process group, so tools it spawned go too.
    if (kill(-pid_, SIGTERM) != 0) kill(pid_, SIGTERM);

    for (int waited = 0; waited < grace_ms; waited += 100) {
        int status;
        if (waitpid(pid_, &status, WNOHANG) == pid_) {
            reap(status);
            close_fds();
            return;
        }
        sleep_ms(100);
    }

    if (kill(-pid_, SIGKILL) != 0) kill(pid_, SIGKILL);
    int status;
    if (waitpid(pid_, &status, 0) == pid_) {
        reap(status);
    } else {
        reaped_ = true;
    }
    close_fds();
}

// ── spawn ────────────────────────────────────────────────────

ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const std::optional<std::filesystem::path>& cwd,
                    std::string& launch_error) {
    ProcessHandle handle;

    int out_pipe[2], err_pipe[2], status_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) != 0) {
        launch_error = std::string("pipe: ") + std::strerror(errno);
        return handle;
    }
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        launch_error = std::string("pipe: ") + std::strerror(errno);
        close(out_pipe[0]); close(out_pipe[1]);
        return handle;
    }
    if (pipe2(status_pipe, O_CLOEXEC) != 0) {
        launch_error = std::string("pipe: ") + std::strerror(errno);
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);
        return handle;
    }

    // Build argv before fork; the child must not allocate.
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);
    std::string cwd_str = cwd ? cwd->string() : std::string();

    pid_t pid = fork();
    if (pid < 0) {
        launch_error = std::string("fork: ") + std::strerror(errno);
        for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1],
                       status_pipe[0], status_pipe[1]}) {
            close(fd);
        }
        return handle;
    }

    if (pid == 0) {
        // Child process
        setpgid(0, 0);

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);

        if (!cwd_str.empty() && chdir(cwd_str.c_str()) != 0) {
            LaunchStatus st{0, errno};
            ssize_t ignored = write(status_pipe[1], &st, sizeof(st));
            (void)ignored;
            _exit(127);
        }

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));

        LaunchStatus st{1, errno};
        ssize_t ignored = write(status_pipe[1], &st, sizeof(st));
        (void)ignored;
        _exit(127);  // exec failed
    }

    // Parent
    close(out_pipe[1]);
    close(err_pipe[1]);
    close(status_pipe[1]);

    // EOF on the status pipe means exec succeeded (CLOEXEC closed it).
    LaunchStatus st{};
    ssize_t got;
    do {
        got = read(status_pipe[0], &st, sizeof(st));
    } while (got < 0 && errno == EINTR);
    close(status_pipe[0]);

    if (got == static_cast<ssize_t>(sizeof(st))) {
        waitpid(pid, nullptr, 0);
        close(out_pipe[0]);
        close(err_pipe[0]);
        launch_error = (st.stage == 0)
            ? "cannot enter working directory " + cwd_str + ": " + std::strerror(st.err)
            : std::string(std::strerror(st.err));
        return handle;
    }

    handle.pid_ = pid;
    handle.out_fd_ = out_pipe[0];
    handle.err_fd_ = err_pipe[0];
    return handle;
}

} // namespace platform
