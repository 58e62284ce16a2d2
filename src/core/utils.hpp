#pragma once

#include <string>
#include <vector>
#include <ctime>
#include <cstddef>

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Strict integer parse: whole string must be a base-10 integer.
bool parse_int(const std::string& s, int& out);

// Parse "1/0/true/false/yes/no/on/off" (case-insensitive).
bool parse_bool(const std::string& s, bool& out);

// Lowercase hex string of `n` random characters.
std::string random_hex(std::size_t n);

// Random UUID v4 in canonical 8-4-4-4-12 form.
std::string generate_uuid();

// Scene ids become directory and archive names: [A-Za-z0-9._-], no leading dot.
bool is_valid_scene_id(const std::string& id);

// Render program + args as a single loggable line.
std::string join_command(const std::string& program, const std::vector<std::string>& args);

// Last `max_bytes` of `s`, trimmed, prefixed with "..." when cut.
std::string tail_excerpt(const std::string& s, std::size_t max_bytes);

// "abcd1234" -> "ab******". Empty stays empty.
std::string mask_secret(const std::string& s);

// Join a base URL and a path without doubling or dropping the slash.
std::string url_join(const std::string& base, const std::string& path);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
