#include "gauntlet/reporter.h"

#include <cstdlib>

#include <unistd.h>

namespace gauntlet {

static const char* ansi(Color c) {
    switch (c) {
        case Color::RED:    return "\033[31m";
        case Color::GREEN:  return "\033[32m";
        case Color::YELLOW: return "\033[33m";
        case Color::BLUE:   return "\033[34m";
        case Color::CYAN:   return "\033[36m";
        case Color::NONE:   return "";
    }
    return "";
}

static std::string pad(int indent) {
    return indent > 0 ? std::string((size_t)indent * 2, ' ') : std::string();
}

Reporter::Reporter(std::ostream& out, std::ostream& err, bool color, int verbosity)
    : out_(out), err_(err), color_(color), verbosity_(verbosity) {}

bool Reporter::stdout_supports_color() {
    const char* nc = std::getenv("NO_COLOR");
    if (nc && *nc) return false;
    return isatty(STDOUT_FILENO) && isatty(STDERR_FILENO);
}

std::string Reporter::paint(const std::string& s, Color c) const {
    if (!color_ || c == Color::NONE) return s;
    return std::string(ansi(c)) + s + "\033[0m";
}

void Reporter::info(const std::string& msg, int indent) {
    out_ << pad(indent) << msg << "\n";
}

void Reporter::warn(const std::string& msg) {
    err_ << paint("[WARN]", Color::YELLOW) << " " << msg << "\n";
}

void Reporter::error(const std::string& msg) {
    err_ << paint("[ERROR]", Color::RED) << " " << msg << "\n";
}

void Reporter::tagged(const std::string& tag, Color c, const std::string& msg, int indent) {
    out_ << pad(indent) << paint(tag, c) << " " << msg << "\n";
}

void Reporter::mark(char c, Color color) {
    out_ << paint(std::string(1, c), color);
    out_.flush();
}

void Reporter::raw(const std::string& s) {
    out_ << s;
}

void Reporter::newline() {
    out_ << "\n";
}

} // namespace gauntlet
