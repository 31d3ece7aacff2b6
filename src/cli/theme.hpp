#pragma once

#include <string>
#include <fmt/format.h>
#include <core/constants.hpp>

namespace theme {

// ANSI escape sequences
namespace color {
    const std::string TEAL      = "\033[38;2;42;157;143m";
    const std::string SAND      = "\033[38;2;233;196;106m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string YELLOW    = "\033[93m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

// Shorthand wrapper
inline std::string dim(const std::string& s) { return color::DIM + s + color::RESET; }

// ── Layout ──────────────────────────────────────────────

inline std::string rule() {
    std::string line;
    for (int i = 0; i < 44; i++) line += "\xe2\x94\x80";
    return color::DIM + "  " + line + color::RESET + "\n";
}

inline std::string banner() {
    return "\n" + color::TEAL + color::BOLD + "  twin"
         + color::RESET + color::DIM + "  git worktrees with shared setup\n"
         + "  v" + TWIN_VERSION + color::RESET + "\n\n"
         + rule();
}

// Section header: blank line before title, blank line after
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

inline std::string warn(const std::string& msg) {
    return color::YELLOW + "    ! " + color::RESET + msg + "\n";
}

inline std::string info(const std::string& msg) {
    return color::TEAL + "    ~ " + color::RESET + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::SAND + "    > " + color::RESET + msg + "\n";
}

// Subtle log line for internal status (dimmer than program output)
inline std::string log(const std::string& msg) {
    return "\033[38;2;80;80;80m    \xc2\xb7 " + msg + "\033[0m\n";
}

// Key-value row for status panels
inline std::string kv(const std::string& key, const std::string& value) {
    return color::DIM + fmt::format("    {:<10}", key) + color::RESET + value + "\n";
}

} // namespace theme
