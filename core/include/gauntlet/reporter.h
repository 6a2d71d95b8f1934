#pragma once
#include "types.h"

#include <ostream>
#include <string>

namespace gauntlet {

enum class Color { NONE, RED, GREEN, YELLOW, BLUE, CYAN };

// Console output for a run. Created once by the CLI and passed down by
// reference; owns the color decision instead of a process-wide terminal state.
//
// Verbosity: 0 = summaries and failures, 1 = every test line,
//            2 = + failing step / diff, 3 = + step argv and outputs.
class Reporter {
public:
    Reporter(std::ostream& out, std::ostream& err, bool color, int verbosity);

    // Color only when both streams are terminals and NO_COLOR is unset.
    static bool stdout_supports_color();

    int verbosity() const { return verbosity_; }
    bool color() const { return color_; }

    void info(const std::string& msg, int indent = 0);
    void warn(const std::string& msg);
    void error(const std::string& msg);

    // "[PASS] stem" / "[FAIL] stem" / "[LEAK] ..." style tag + message
    void tagged(const std::string& tag, Color c, const std::string& msg, int indent = 0);

    // Single progress mark without newline (tournament mode)
    void mark(char c, Color color);
    void raw(const std::string& s);
    void newline();

    std::string paint(const std::string& s, Color c) const;

private:
    std::ostream& out_;
    std::ostream& err_;
    bool color_;
    int verbosity_;
};

} // namespace gauntlet
