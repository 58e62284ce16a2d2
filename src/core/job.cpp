#include "job.hpp"
#include "utils.hpp"
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>

static Result<int> read_positive(const YAML::Node& params, const char* key, int fallback) {
    const YAML::Node v = params[key];
    if (!v || v.IsNull()) return Result<int>::Ok(fallback);
    int n = 0;
    if (!v.IsScalar() || !parse_int(v.as<std::string>(), n)) {
        return Result<int>::Err(fmt::format("params.{} must be an integer", key));
    }
    if (n <= 0) {
        return Result<int>::Err(fmt::format("params.{} must be > 0 (got {})", key, n));
    }
    return Result<int>::Ok(n);
}

Result<Job> parse_job(const std::string& text) {
    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        return Result<Job>::Err(std::string("Malformed job description: ") + e.what());
    }
    if (!root.IsMap()) {
        return Result<Job>::Err("Job description must be an object");
    }

    try {
        Job job;
        job.id = root["id"].as<std::string>("");
        if (job.id.empty()) job.id = "local-" + random_hex(12);

        const YAML::Node input = root["input"] ? root["input"] : root;
        if (!input.IsMap()) return Result<Job>::Err("input must be an object");

        job.video_url = input["video_url"].as<std::string>("");
        trim(job.video_url);
        if (job.video_url.empty()) return Result<Job>::Err("input.video_url is required");

        if (input["scene_id"] && !input["scene_id"].IsNull()) {
            std::string sid = input["scene_id"].as<std::string>("");
            trim(sid);
            if (!sid.empty()) job.options.scene_id = sid;
        }

        const YAML::Node params = input["params"];
        if (params && !params.IsNull()) {
            if (!params.IsMap()) return Result<Job>::Err("input.params must be an object");
            auto it = read_positive(params, "iterations", job.options.iterations);
            if (it.is_err()) return Result<Job>::Err(it.error);
            auto fps = read_positive(params, "fps", job.options.fps);
            if (fps.is_err()) return Result<Job>::Err(fps.error);
            job.options.iterations = it.value;
            job.options.fps = fps.value;
        }

        const YAML::Node timeout = input["timeout_secs"];
        if (timeout && !timeout.IsNull()) {
            int secs = 0;
            if (!timeout.IsScalar() || !parse_int(timeout.as<std::string>(), secs) || secs < 0) {
                return Result<Job>::Err("input.timeout_secs must be a non-negative integer");
            }
            job.options.timeout_secs = secs;
        }

        auto valid = validate_job(job);
        if (valid.is_err()) return Result<Job>::Err(valid.error);
        return Result<Job>::Ok(job);
    } catch (const YAML::Exception& e) {
        return Result<Job>::Err(std::string("Invalid job description: ") + e.what());
    }
}

Result<void> validate_job(const Job& job) {
    if (job.video_url.empty()) return Result<void>::Err("video_url is required");
    if (job.options.iterations <= 0) return Result<void>::Err("iterations must be > 0");
    if (job.options.fps <= 0) return Result<void>::Err("fps must be > 0");
    if (job.options.timeout_secs < 0) return Result<void>::Err("timeout_secs must be >= 0");
    if (job.options.scene_id && !is_valid_scene_id(*job.options.scene_id)) {
        return Result<void>::Err(fmt::format(
            "invalid scene_id '{}': use letters, digits, '.', '_' or '-'", *job.options.scene_id));
    }
    return Result<void>::Ok();
}

const char* job_state_name(JobState state) {
    switch (state) {
        case JobState::Created:     return "created";
        case JobState::Downloading: return "downloading";
        case JobState::Preparing:   return "preparing";
        case JobState::Training:    return "training";
        case JobState::Uploading:   return "uploading";
        case JobState::Done:        return "done";
        case JobState::Failed:      return "failed";
    }
    return "unknown";
}

// yaml-cpp writes C0 controls, U+0080..U+00A0 and U+FEFF as \xNN or \uNNNN
// escapes; only some of those are valid JSON. Map them all to plain text.
static std::string json_safe(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); i++) {
        unsigned char u = static_cast<unsigned char>(s[i]);
        if ((u < 0x20 && u != '\n' && u != '\t') || u == 0x7f) {
            out += ' ';
        } else if (u == 0xc2 && i + 1 < s.size() &&
                   static_cast<unsigned char>(s[i + 1]) >= 0x80 &&
                   static_cast<unsigned char>(s[i + 1]) <= 0xa0) {
            out += ' ';
            i++;
        } else if (u == 0xef && s.compare(i, 3, "\xef\xbb\xbf") == 0) {
            i += 2;  // byte order mark
        } else {
            out += s[i];
        }
    }
    return out;
}

static void begin_json(YAML::Emitter& out) {
    out.SetStringFormat(YAML::DoubleQuoted);
    out.SetMapFormat(YAML::Flow);
    out << YAML::BeginMap;
}

std::string job_result_json(const std::string& job_id, const JobResult& result) {
    YAML::Emitter out;
    begin_json(out);
    out << YAML::Key << "job_id" << YAML::Value << json_safe(job_id);
    if (result.success) {
        out << YAML::Key << "status" << YAML::Value << "success";
        out << YAML::Key << "scene_id" << YAML::Value << json_safe(result.scene_id);
        out << YAML::Key << "progress" << YAML::Value << result.progress;
        out << YAML::Key << "plt_url" << YAML::Value << json_safe(result.plt_url);
    } else {
        out << YAML::Key << "status" << YAML::Value << "fail";
        out << YAML::Key << "error" << YAML::Value << json_safe(result.error);
        out << YAML::Key << "progress" << YAML::Value << result.progress;
        if (!result.scene_id.empty())
            out << YAML::Key << "scene_id" << YAML::Value << json_safe(result.scene_id);
    }
    out << YAML::EndMap;
    return out.c_str();
}

std::string progress_json(const std::string& job_id, const ProgressReport& report) {
    YAML::Emitter out;
    begin_json(out);
    out << YAML::Key << "job_id" << YAML::Value << json_safe(job_id);
    out << YAML::Key << "progress" << YAML::Value << report.progress;
    out << YAML::Key << "stage" << YAML::Value << report.stage;
    out << YAML::EndMap;
    return out.c_str();
}
