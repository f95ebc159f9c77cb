#pragma once

#include <string>
#include <unistd.h>

// Terminal styling for messages on stderr. Plain text when stderr is not a tty.
namespace theme {

namespace color {
    const std::string RED       = "\033[91m";
    const std::string BLUE      = "\033[38;2;62;120;178m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

inline bool enabled() {
    static const bool tty = isatty(STDERR_FILENO) != 0;
    return tty;
}

inline std::string paint(const std::string& c, const std::string& s) {
    return enabled() ? c + s + color::RESET : s;
}

// ── Status indicators ───────────────────────────────────

inline std::string fail(const std::string& msg) {
    return paint(color::RED, "rexec: ") + msg + "\n";
}

inline std::string info(const std::string& msg) {
    return paint(color::BLUE, "rexec: ") + msg + "\n";
}

// Subtle log line for verbose status
inline std::string log(const std::string& msg) {
    return paint(color::DIM, "  · " + msg) + "\n";
}

} // namespace theme
