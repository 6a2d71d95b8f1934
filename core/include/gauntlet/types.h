#pragma once
#include <stdexcept>
#include <string>

namespace gauntlet {

// Aggregation policy selected on the command line
enum class RunMode {
    REGULAR,
    TOURNAMENT,
    MEMCHECK,
    PERF,
};

// Why a single test run ended in FAILED
enum class FailReason {
    NONE,
    NONZERO_EXIT,
    TIMEOUT,
    OUTPUT_MISMATCH,
    LAUNCH_ERROR,
};

// Invalid or incomplete configuration (missing field, wrong type, bad path).
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

struct RunHeader {
    std::string format_version{"1"};
    std::string mode;    // regular|tournament|memcheck|perf
    std::string run_id;  // hex, unique per invocation
};

// pass/total pair kept at every aggregation scope
struct Counter {
    int pass{0};
    int total{0};

    void record(bool passed) {
        total++;
        if (passed) pass++;
    }
    void add(const Counter& o) {
        pass += o.pass;
        total += o.total;
    }
    bool all_passed() const { return pass == total; }
};

const char* run_mode_name(RunMode m);
bool parse_run_mode(const std::string& s, RunMode* out);
const char* fail_reason_name(FailReason r);

} // namespace gauntlet
