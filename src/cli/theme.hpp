#pragma once

#include <string>
#include <core/constants.hpp>

namespace theme {

// ANSI colors
namespace color {
    const std::string BLUE      = "\033[38;2;62;120;178m";
    const std::string BROWN     = "\033[38;2;128;99;58m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

inline std::string dim(const std::string& s) { return color::DIM + s + color::RESET; }

// ── Layout ──────────────────────────────────────────────

// Horizontal rule, no surrounding blank lines
inline std::string rule() {
    std::string line = "  ";
    for (int i = 0; i < 44; i++) line += "\xe2\x94\x80";  // U+2500
    return color::DIM + line + color::RESET + "\n";
}

// Banner: title + rule
inline std::string banner() {
    return
        "\n"
        + color::BLUE + color::BOLD
        + "  hostshell\n"
        + color::RESET + color::DIM + "  v" + HOSTSHELL_VERSION + "\n"
        + "  Persistent shell sessions, local or over SSH"
        + color::RESET + "\n\n"
        + rule();
}

// Section header, padded by blank lines
inline std::string section(const std::string& title) {
    return "\n" + color::BROWN + color::BOLD + "  " + title + color::RESET + "\n\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return color::GREEN + "    + " + color::RESET + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return color::RED + "    x " + color::RESET + msg + "\n";
}

inline std::string info(const std::string& msg) {
    return color::BLUE + "    ~ " + color::RESET + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::BROWN + "    > " + color::RESET + msg + "\n";
}

} // namespace theme
