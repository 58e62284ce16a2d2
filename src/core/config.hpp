#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include <functional>
#include "types.hpp"

namespace fs = std::filesystem;

// Looks up an environment variable; nullopt when unset.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Reads the real process environment.
std::optional<std::string> process_env(const std::string& name);

// Which sink the publisher talks to. Decided once, from configuration.
enum class SinkKind {
    None,
    ObjectStore,
    UploadServer,
    BucketPut,
};

const char* sink_kind_name(SinkKind kind);

class Config {
public:
    // YAML file (if any) first, then environment on top.
    // File: `config_file` when given, else $GSW_CONFIG, else ./gsworker.yaml when present.
    static Result<Config> load(const EnvLookup& env = process_env,
                               const std::optional<fs::path>& config_file = std::nullopt);

    // Accessors
    const fs::path& workdir() const { return workdir_; }
    fs::path scenes_dir() const { return workdir_ / "scenes"; }
    const ToolsConfig& tools() const { return tools_; }
    const DatasetConfig& dataset() const { return dataset_; }
    const TimeoutConfig& timeouts() const { return timeouts_; }
    const S3Config& s3() const { return s3_; }
    const HttpSinkConfig& http() const { return http_; }
    const LogConfig& log() const { return log_; }
    const std::optional<fs::path>& source_file() const { return source_file_; }

    // Object store wins over the upload server, which wins over a bucket URL.
    SinkKind sink_kind() const;

    // Human-readable dump with secrets masked.
    std::string describe() const;

    // Test and CLI overrides
    void set_workdir(const fs::path& p) { workdir_ = p; }
    ToolsConfig& mutable_tools() { return tools_; }
    S3Config& mutable_s3() { return s3_; }
    HttpSinkConfig& mutable_http() { return http_; }

public:
    Config() = default;

private:
    Result<void> apply_yaml(const fs::path& path);
    Result<void> apply_env(const EnvLookup& env);
    Result<void> validate() const;

    fs::path workdir_ = "/workspace";
    ToolsConfig tools_;
    DatasetConfig dataset_;
    TimeoutConfig timeouts_;
    S3Config s3_;
    HttpSinkConfig http_;
    LogConfig log_;
    std::optional<fs::path> source_file_;
};

// Default config file looked up in the current directory.
fs::path get_local_config_path(const fs::path& dir = fs::current_path());
