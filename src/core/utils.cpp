#include "utils.hpp"
#include "constants.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <random>
#include <mutex>

std::string now_iso() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    return std::string(buf);
}

bool parse_int(const std::string& s, int& out) {
    std::string t = s;
    trim(t);
    if (t.empty()) return false;
    try {
        size_t pos = 0;
        int v = std::stoi(t, &pos);
        if (pos != t.size()) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parse_bool(const std::string& s, bool& out) {
    std::string t = s;
    trim(t);
    std::transform(t.begin(), t.end(), t.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (t == "1" || t == "true" || t == "yes" || t == "on") { out = true; return true; }
    if (t == "0" || t == "false" || t == "no" || t == "off") { out = false; return true; }
    return false;
}

// One engine for the process; jobs on different threads draw from it.
static std::mt19937_64& rng() {
    static std::mt19937_64 engine(std::random_device{}());
    return engine;
}

static std::mutex& rng_mutex() {
    static std::mutex m;
    return m;
}

std::string random_hex(std::size_t n) {
    static const char HEX[] = "0123456789abcdef";
    std::string out;
    out.reserve(n);
    std::lock_guard<std::mutex> lock(rng_mutex());
    std::uniform_int_distribution<int> dist(0, 15);
    for (std::size_t i = 0; i < n; i++) {
        out += HEX[dist(rng())];
    }
    return out;
}

std::string generate_uuid() {
    std::string hex = random_hex(32);
    hex[12] = '4';
    // Variant bits 10xx
    static const char VARIANT[] = "89ab";
    hex[16] = VARIANT[std::string("0123456789abcdef").find(hex[16]) % 4];
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

bool is_valid_scene_id(const std::string& id) {
    if (id.empty() || id.size() > MAX_SCENE_ID_LENGTH || id[0] == '.') return false;
    return std::all_of(id.begin(), id.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '.' || c == '_' || c == '-';
    });
}

std::string join_command(const std::string& program, const std::vector<std::string>& args) {
    std::string line = program;
    for (const auto& a : args) {
        line += ' ';
        if (a.find_first_of(" \t\"'") != std::string::npos) {
            line += '"' + a + '"';
        } else {
            line += a;
        }
    }
    return line;
}

std::string tail_excerpt(const std::string& s, std::size_t max_bytes) {
    std::string t = s;
    trim(t);
    if (t.size() <= max_bytes) return t;
    return "..." + t.substr(t.size() - max_bytes);
}

std::string mask_secret(const std::string& s) {
    if (s.empty()) return s;
    size_t keep = std::min<size_t>(2, s.size() / 4);
    return s.substr(0, keep) + std::string(s.size() - keep, '*');
}

std::string url_join(const std::string& base, const std::string& path) {
    if (base.empty()) return path;
    if (path.empty()) return base;
    bool base_slash = base.back() == '/';
    bool path_slash = path.front() == '/';
    if (base_slash && path_slash) return base + path.substr(1);
    if (!base_slash && !path_slash) return base + "/" + path;
    return base + path;
}
