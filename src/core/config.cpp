#include "config.hpp"
#include "log.hpp"
#include "utils.hpp"
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <cstdlib>

namespace fs = std::filesystem;

std::optional<std::string> process_env(const std::string& name) {
    const char* v = std::getenv(name.c_str());
    if (!v) return std::nullopt;
    return std::string(v);
}

const char* sink_kind_name(SinkKind kind) {
    switch (kind) {
        case SinkKind::None:         return "none";
        case SinkKind::ObjectStore:  return "object-store";
        case SinkKind::UploadServer: return "upload-server";
        case SinkKind::BucketPut:    return "bucket-put";
    }
    return "none";
}

fs::path get_local_config_path(const fs::path& dir) {
    return dir / "gsworker.yaml";
}

// ── YAML ───────────────────────────────────────────────────

static void parse_tools(const YAML::Node& node, ToolsConfig& t) {
    t.ffmpeg = node["ffmpeg"].as<std::string>(t.ffmpeg);
    t.colmap = node["colmap"].as<std::string>(t.colmap);
    t.colmap_use_gpu = node["colmap_use_gpu"].as<bool>(t.colmap_use_gpu);
    t.train_program = node["train_program"].as<std::string>(t.train_program);
    t.train_script = node["train_script"].as<std::string>(t.train_script);
    t.train_workdir = node["train_workdir"].as<std::string>(t.train_workdir);
}

static void parse_s3(const YAML::Node& node, S3Config& s) {
    s.endpoint = node["endpoint"].as<std::string>(s.endpoint);
    s.bucket = node["bucket"].as<std::string>(s.bucket);
    s.region = node["region"].as<std::string>(s.region);
    s.access_key = node["access_key"].as<std::string>(s.access_key);
    s.secret_key = node["secret_key"].as<std::string>(s.secret_key);
}

static void parse_http(const YAML::Node& node, HttpSinkConfig& h) {
    h.bucket_url = node["bucket_url"].as<std::string>(h.bucket_url);
    h.bucket_key = node["bucket_key"].as<std::string>(h.bucket_key);
    h.server_url = node["server_url"].as<std::string>(h.server_url);
    h.server_route = node["server_route"].as<std::string>(h.server_route);
    h.server_token = node["server_token"].as<std::string>(h.server_token);
}

Result<void> Config::apply_yaml(const fs::path& path) {
    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (!root.IsMap()) {
            // Empty file loads as Null; treat as "no overrides"
            if (root.IsNull()) return Result<void>::Ok();
            return Result<void>::Err("Config root must be a mapping: " + path.string());
        }

        if (root["workdir"]) workdir_ = root["workdir"].as<std::string>();
        if (root["tools"] && root["tools"].IsMap()) parse_tools(root["tools"], tools_);

        if (root["dataset"] && root["dataset"].IsMap()) {
            const auto& d = root["dataset"];
            dataset_.strict_reconstruction = d["strict_reconstruction"].as<bool>(dataset_.strict_reconstruction);
            dataset_.undistort_images = d["undistort_images"].as<bool>(dataset_.undistort_images);
        }

        if (root["timeouts"] && root["timeouts"].IsMap()) {
            const auto& t = root["timeouts"];
            timeouts_.download_secs = t["download_secs"].as<int>(timeouts_.download_secs);
            timeouts_.upload_secs = t["upload_secs"].as<int>(timeouts_.upload_secs);
        }

        if (root["s3"] && root["s3"].IsMap()) parse_s3(root["s3"], s3_);
        if (root["http"] && root["http"].IsMap()) parse_http(root["http"], http_);

        if (root["log"] && root["log"].IsMap()) {
            log_.level = root["log"]["level"].as<std::string>(log_.level);
            log_.file = root["log"]["file"].as<std::string>(log_.file);
        }

        source_file_ = path;
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err(fmt::format("Failed to parse config {}: {}", path.string(), e.what()));
    }
}

// ── Environment ────────────────────────────────────────────

Result<void> Config::apply_env(const EnvLookup& env) {
    auto str = [&](const char* name, std::string& dst) {
        auto v = env(name);
        if (v) dst = *v;
    };
    auto num = [&](const char* name, int& dst) -> bool {
        auto v = env(name);
        if (!v) return true;
        return parse_int(*v, dst);
    };
    auto flag = [&](const char* name, bool& dst) -> bool {
        auto v = env(name);
        if (!v) return true;
        return parse_bool(*v, dst);
    };

    if (auto w = env("GSW_WORKDIR")) workdir_ = *w;

    str("GSW_FFMPEG", tools_.ffmpeg);
    str("GSW_COLMAP", tools_.colmap);
    if (!flag("GSW_COLMAP_USE_GPU", tools_.colmap_use_gpu))
        return Result<void>::Err("GSW_COLMAP_USE_GPU must be a boolean");
    str("GSW_TRAIN_PROGRAM", tools_.train_program);
    str("GSW_TRAIN_SCRIPT", tools_.train_script);
    str("GSW_TRAIN_WORKDIR", tools_.train_workdir);

    if (!flag("GSW_STRICT_RECONSTRUCTION", dataset_.strict_reconstruction))
        return Result<void>::Err("GSW_STRICT_RECONSTRUCTION must be a boolean");
    if (!flag("GSW_UNDISTORT_IMAGES", dataset_.undistort_images))
        return Result<void>::Err("GSW_UNDISTORT_IMAGES must be a boolean");

    if (!num("GSW_DOWNLOAD_TIMEOUT_SECS", timeouts_.download_secs))
        return Result<void>::Err("GSW_DOWNLOAD_TIMEOUT_SECS must be an integer");
    if (!num("GSW_UPLOAD_TIMEOUT_SECS", timeouts_.upload_secs))
        return Result<void>::Err("GSW_UPLOAD_TIMEOUT_SECS must be an integer");

    str("S3_ENDPOINT_URL", s3_.endpoint);
    str("S3_BUCKET_NAME", s3_.bucket);
    // S3_REGION takes precedence over the SDK-standard AWS_REGION
    if (auto r = env("S3_REGION")) s3_.region = *r;
    else str("AWS_REGION", s3_.region);
    str("AWS_ACCESS_KEY_ID", s3_.access_key);
    str("AWS_SECRET_ACCESS_KEY", s3_.secret_key);

    str("OUTPUT_BUCKET_URL", http_.bucket_url);
    str("OUTPUT_BUCKET_KEY", http_.bucket_key);
    str("UPLOAD_SERVER_URL", http_.server_url);
    str("UPLOAD_ROUTE", http_.server_route);
    str("UPLOAD_SERVER_TOKEN", http_.server_token);

    str("GSW_LOG_LEVEL", log_.level);
    str("GSW_LOG_FILE", log_.file);

    return Result<void>::Ok();
}

Result<void> Config::validate() const {
    if (workdir_.empty()) return Result<void>::Err("workdir must not be empty");
    if (timeouts_.download_secs <= 0) return Result<void>::Err("download timeout must be positive");
    if (timeouts_.upload_secs <= 0) return Result<void>::Err("upload timeout must be positive");
    if (tools_.ffmpeg.empty() || tools_.colmap.empty() || tools_.train_program.empty())
        return Result<void>::Err("tool paths must not be empty");
    if (s3_.configured() && s3_.bucket.empty())
        return Result<void>::Err("S3 credentials are set but the bucket name is empty");
    LogLevel lvl;
    if (!parse_log_level(log_.level, lvl))
        return Result<void>::Err("unknown log level: " + log_.level);
    return Result<void>::Ok();
}

Result<Config> Config::load(const EnvLookup& env, const std::optional<fs::path>& config_file) {
    Config config;

    std::optional<fs::path> file = config_file;
    if (!file) {
        if (auto p = env("GSW_CONFIG")) {
            file = fs::path(*p);
        } else if (fs::exists(get_local_config_path())) {
            file = get_local_config_path();
        }
    }

    if (file) {
        if (!fs::exists(*file)) {
            return Result<Config>::Err("Config file not found at " + file->string());
        }
        auto yr = config.apply_yaml(*file);
        if (yr.is_err()) return Result<Config>::Err(yr.error);
    }

    auto er = config.apply_env(env);
    if (er.is_err()) return Result<Config>::Err(er.error);

    if (config.tools_.train_workdir.empty()) {
        config.tools_.train_workdir = config.workdir_.string();
    }

    auto vr = config.validate();
    if (vr.is_err()) return Result<Config>::Err(vr.error);

    return Result<Config>::Ok(config);
}

SinkKind Config::sink_kind() const {
    if (s3_.configured()) return SinkKind::ObjectStore;
    if (!http_.server_url.empty()) return SinkKind::UploadServer;
    if (!http_.bucket_url.empty()) return SinkKind::BucketPut;
    return SinkKind::None;
}

std::string Config::describe() const {
    std::string out;
    out += fmt::format("config file:      {}\n", source_file_ ? source_file_->string() : "(none)");
    out += fmt::format("workdir:          {}\n", workdir_.string());
    out += fmt::format("ffmpeg:           {}\n", tools_.ffmpeg);
    out += fmt::format("colmap:           {} (gpu={})\n", tools_.colmap, tools_.colmap_use_gpu);
    out += fmt::format("trainer:          {} {} (cwd {})\n",
                       tools_.train_program, tools_.train_script, tools_.train_workdir);
    out += fmt::format("strict sparse:    {}\n", dataset_.strict_reconstruction);
    out += fmt::format("undistort:        {}\n", dataset_.undistort_images);
    out += fmt::format("timeouts:         download={}s upload={}s\n",
                       timeouts_.download_secs, timeouts_.upload_secs);
    out += fmt::format("sink:             {}\n", sink_kind_name(sink_kind()));
    switch (sink_kind()) {
        case SinkKind::ObjectStore:
            out += fmt::format("  endpoint:       {}\n", s3_.endpoint.empty() ? "(aws)" : s3_.endpoint);
            out += fmt::format("  bucket:         {}\n", s3_.bucket);
            out += fmt::format("  region:         {}\n", s3_.region);
            out += fmt::format("  access key:     {}\n", mask_secret(s3_.access_key));
            out += fmt::format("  secret key:     {}\n", mask_secret(s3_.secret_key));
            break;
        case SinkKind::UploadServer:
            out += fmt::format("  server:         {}{}\n", http_.server_url, http_.server_route);
            out += fmt::format("  token:          {}\n", mask_secret(http_.server_token));
            break;
        case SinkKind::BucketPut:
            out += fmt::format("  bucket url:     {}\n", http_.bucket_url);
            out += fmt::format("  token:          {}\n", mask_secret(http_.bucket_key));
            break;
        case SinkKind::None:
            break;
    }
    out += fmt::format("log:              {} {}\n", log_.level, log_.file);
    return out;
}
