#include "gauntlet/types.h"

namespace gauntlet {

const char* run_mode_name(RunMode m) {
    switch (m) {
        case RunMode::REGULAR:    return "regular";
        case RunMode::TOURNAMENT: return "tournament";
        case RunMode::MEMCHECK:   return "memcheck";
        case RunMode::PERF:       return "perf";
    }
    return "regular";
}

bool parse_run_mode(const std::string& s, RunMode* out) {
    if (!out) return false;
    if (s == "regular")    { *out = RunMode::REGULAR; return true; }
    if (s == "tournament") { *out = RunMode::TOURNAMENT; return true; }
    if (s == "memcheck")   { *out = RunMode::MEMCHECK; return true; }
    if (s == "perf")       { *out = RunMode::PERF; return true; }
    return false;
}

const char* fail_reason_name(FailReason r) {
    switch (r) {
        case FailReason::NONE:            return "none";
        case FailReason::NONZERO_EXIT:    return "non-zero-exit";
        case FailReason::TIMEOUT:         return "timeout";
        case FailReason::OUTPUT_MISMATCH: return "output-mismatch";
        case FailReason::LAUNCH_ERROR:    return "launch-error";
    }
    return "none";
}

} // namespace gauntlet
