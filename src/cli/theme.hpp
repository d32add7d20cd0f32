#pragma once

#include <string>

namespace theme {

// ANSI escape sequences
namespace color {
    const std::string BLUE      = "\033[38;2;66;133;244m";
    const std::string BROWN     = "\033[38;2;128;99;58m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string YELLOW    = "\033[93m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

// Shorthand wrappers
inline std::string bold(const std::string& s)    { return color::BOLD + s + color::RESET; }
inline std::string green(const std::string& s)   { return color::GREEN + s + color::RESET; }

// ── Layout ──────────────────────────────────────────────

// Heavy double rule framing the account manager header
inline std::string double_rule() {
    std::string line;
    for (int i = 0; i < 42; i++) line += "\xe2\x95\x90";  // ═
    return line + "\n";
}

// Light rule framing the command legend
inline std::string rule() {
    std::string line;
    for (int i = 0; i < 42; i++) line += "\xe2\x94\x80";  // ─
    return line + "\n";
}

// Section header with a blank line on either side
inline std::string section(const std::string& title) {
    return "\n" + color::BLUE + color::BOLD + title + color::RESET + "\n\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return color::GREEN + "+ " + color::RESET + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return color::RED + "x " + color::RESET + msg + "\n";
}

inline std::string warn(const std::string& msg) {
    return color::YELLOW + "! " + color::RESET + msg + "\n";
}

inline std::string info(const std::string& msg) {
    return color::BLUE + "~ " + color::RESET + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::BROWN + "> " + color::RESET + msg + "\n";
}

} // namespace theme
