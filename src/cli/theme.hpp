#pragma once

#include <string>

namespace theme {

// ANSI escape sequences
namespace color {
    const std::string RED       = "\033[91m";
    const std::string YELLOW    = "\033[93m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

inline std::string dim(const std::string& s)     { return color::DIM + s + color::RESET; }

// ── Status indicators ───────────────────────────────────

inline std::string fail(const std::string& msg) {
    return color::RED + "x " + color::RESET + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::YELLOW + "  > " + color::RESET + msg + "\n";
}

// One indented line, used for path listings under a failure
inline std::string item(const std::string& msg) {
    return "    " + msg + "\n";
}

} // namespace theme
