#include "log.hpp"
#include "utils.hpp"
#include <atomic>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>
#include <thread>
#include <functional>

namespace fs = std::filesystem;

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
std::mutex g_mutex;          // guards g_file_path and both sinks
std::string g_file_path;

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    return fmt::format("{:02d}:{:02d}:{:02d}.{:03d}",
                       tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                       static_cast<int>(ms.count()));
}

} // namespace

bool parse_log_level(const std::string& s, LogLevel& out) {
    if (s == "debug") { out = LogLevel::Debug; return true; }
    if (s == "info")  { out = LogLevel::Info;  return true; }
    if (s == "warn" || s == "warning") { out = LogLevel::Warn; return true; }
    if (s == "error") { out = LogLevel::Error; return true; }
    return false;
}

void log_set_level(LogLevel level) {
    g_level.store(static_cast<int>(level));
}

void log_set_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(g_mutex);
    g_file_path = path;
}

void gsw_log(LogLevel level, const std::string& msg) {
    if (static_cast<int>(level) < g_level.load()) return;

    auto tid = std::hash<std::thread::id>{}(std::this_thread::get_id()) % 10000;
    std::string line = fmt::format("[{}] [{:<5}] [t{:04d}] {}\n",
                                   timestamp(), level_tag(level), tid, msg);

    std::lock_guard<std::mutex> lock(g_mutex);
    std::cerr << line << std::flush;
    if (!g_file_path.empty()) {
        std::ofstream out(g_file_path, std::ios::app);
        if (out) out << line;
    }
}

fs::path job_log_path(const fs::path& workdir, const std::string& job_id) {
    // Job ids come from callers; keep them inside logs/
    std::string name = job_id;
    for (auto& c : name) {
        if (c == '/' || c == '\\') c = '_';
    }
    if (name.empty() || name[0] == '.') name = "_" + name;
    return workdir / "logs" / (name + ".log");
}

void append_job_log(const fs::path& workdir, const std::string& job_id, const std::string& msg) {
    fs::path path = job_log_path(workdir, job_id);
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) return;
    std::ofstream f(path, std::ios::app);
    if (f) {
        f << "[" << now_iso() << "] " << msg << "\n";
    }
}
