#pragma once

#include <string>
#include "types.hpp"

// Parse a job description:
//   {"id": "...", "input": {"video_url": "...", "scene_id": "...",
//    "params": {"iterations": 30000, "fps": 2}, "timeout_secs": 0}}
// The "input" wrapper is optional. A missing id gets a generated one.
Result<Job> parse_job(const std::string& text);

// Option ranges and scene id charset.
Result<void> validate_job(const Job& job);

const char* job_state_name(JobState state);

// Single-line JSON renderings for the invoking runtime. Every line names its job.
std::string job_result_json(const std::string& job_id, const JobResult& result);
std::string progress_json(const std::string& job_id, const ProgressReport& report);
