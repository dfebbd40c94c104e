#pragma once

#include <string>

namespace theme {

// ANSI escape sequences
namespace color {
    const std::string TEAL      = "\033[38;2;42;161;152m";
    const std::string AMBER     = "\033[38;2;181;137;0m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

inline std::string dim(const std::string& s) { return color::DIM + s + color::RESET; }

// ── Layout ──────────────────────────────────────────────

inline std::string rule() {
    std::string line;
    for (int i = 0; i < 44; i++) line += "\xe2\x94\x80";
    return color::DIM + "  " + line + color::RESET + "\n";
}

inline std::string banner(const std::string& version) {
    return "\n" + color::TEAL + color::BOLD
        + "  sshcp\n"
        + color::RESET + color::DIM + "  Cache and copy files to SSH targets\n"
        + "  v" + version
        + color::RESET + "\n\n"
        + rule();
}

// Section header, blank line before and after
inline std::string section(const std::string& title) {
    return "\n" + color::AMBER + color::BOLD + "  " + title + color::RESET + "\n\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return color::GREEN + "    + " + color::RESET + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return color::RED + "    x " + color::RESET + msg + "\n";
}

inline std::string info(const std::string& msg) {
    return color::TEAL + "    ~ " + color::RESET + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::AMBER + "    > " + color::RESET + msg + "\n";
}

} // namespace theme
