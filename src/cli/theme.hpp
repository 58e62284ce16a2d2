#pragma once

#include <string>
#include <fmt/format.h>
#include <core/constants.hpp>

namespace theme {

// Terminal colors (ANSI escape sequences)
namespace color {
    const std::string TEAL      = "\033[38;2;42;157;143m";
    const std::string SAND      = "\033[38;2;233;196;106m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

// ── Layout ──────────────────────────────────────────────

inline std::string rule() {
    std::string line = color::DIM + "  ";
    for (int i = 0; i < 44; i++) line += "\xe2\x94\x80";
    return line + color::RESET + "\n";
}

// Title + version + rule
inline std::string banner() {
    return "\n" + color::TEAL + color::BOLD
        + "  gsworker\n"
        + color::RESET + color::DIM + "  v" + GSWORKER_VERSION + "\n"
        + "  video -> gaussian splat"
        + color::RESET + "\n\n"
        + rule();
}

// Section header, blank line before and after
inline std::string section(const std::string& title) {
    return "\n" + color::SAND + color::BOLD + "  " + title + color::RESET + "\n\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return color::GREEN + "    + " + color::RESET + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return color::RED + "    x " + color::RESET + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::SAND + "    > " + color::RESET + msg + "\n";
}

// Usage row: command in color, description dimmed
inline std::string usage(const std::string& cmd, const std::string& desc) {
    return color::TEAL + fmt::format("    {:<44}", cmd) + color::RESET
        + color::DIM + desc + color::RESET + "\n";
}

inline std::string kv(const std::string& key, const std::string& value) {
    return color::DIM + fmt::format("    {:<10}", key) + color::RESET + value + "\n";
}

} // namespace theme
