#pragma once

#include <stdexcept>
#include <string>

// Base for every failure that ends a job. Caught at the pipeline boundary.
class WorkerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Executable missing, not runnable, or the OS refused to start it.
class LaunchFailure : public WorkerError {
public:
    LaunchFailure(const std::string& program, const std::string& reason)
        : WorkerError("Failed to launch " + program + ": " + reason),
          program_(program) {}

    const std::string& program() const { return program_; }

private:
    std::string program_;
};

// External tool ran but exited nonzero.
class CommandFailure : public WorkerError {
public:
    CommandFailure(const std::string& program, int exit_code, const std::string& excerpt)
        : WorkerError(program + " exited with code " + std::to_string(exit_code) +
                      (excerpt.empty() ? "" : ": " + excerpt)),
          program_(program), exit_code_(exit_code), excerpt_(excerpt) {}

    const std::string& program() const { return program_; }
    int exit_code() const { return exit_code_; }
    const std::string& excerpt() const { return excerpt_; }

protected:
    CommandFailure(const std::string& what, const std::string& program, int exit_code)
        : WorkerError(what), program_(program), exit_code_(exit_code) {}

private:
    std::string program_;
    int exit_code_;
    std::string excerpt_;
};

// External tool was terminated because its deadline passed.
class CommandTimeout : public CommandFailure {
public:
    CommandTimeout(const std::string& program, int timeout_secs)
        : CommandFailure(program + " timed out after " + std::to_string(timeout_secs) + "s",
                         program, -1) {}
};

class FetchFailure : public WorkerError {
public:
    using WorkerError::WorkerError;
};

class InsufficientInputError : public WorkerError {
public:
    using WorkerError::WorkerError;
};

class ReconstructionFailure : public WorkerError {
public:
    using WorkerError::WorkerError;
};

class PublishFailure : public WorkerError {
public:
    using WorkerError::WorkerError;
};
