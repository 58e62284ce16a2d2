#pragma once

#include <string>
#include <filesystem>
#include <fmt/format.h>

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

// Parse "debug" / "info" / "warn" / "error". Returns false on anything else.
bool parse_log_level(const std::string& s, LogLevel& out);

// Process-wide settings, applied once at startup.
void log_set_level(LogLevel level);
// Also append every record to this file. Empty disables the file sink.
void log_set_file(const std::string& path);

void gsw_log(LogLevel level, const std::string& msg);

inline void log_debug(const std::string& msg) { gsw_log(LogLevel::Debug, msg); }
inline void log_info(const std::string& msg)  { gsw_log(LogLevel::Info, msg); }
inline void log_warn(const std::string& msg)  { gsw_log(LogLevel::Warn, msg); }
inline void log_error(const std::string& msg) { gsw_log(LogLevel::Error, msg); }

// Persistent job log path: {workdir}/logs/{job_id}.log
std::filesystem::path job_log_path(const std::filesystem::path& workdir, const std::string& job_id);

// Append a timestamped line to a job's persistent log file. Never throws.
void append_job_log(const std::filesystem::path& workdir, const std::string& job_id,
                    const std::string& msg);
