#pragma once
#include "executable.h"
#include "proc.h"
#include "testfile.h"
#include "toolchain.h"
#include "types.h"

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace gauntlet {

// Leak detection on one designated step. A leak is signalled by the step's
// exit code or by a substring of its stderr; a leak exit code does not count
// as a step failure.
struct LeakCheck {
    bool enabled{false};
    std::string step;                   // "" = last step of the toolchain
    int exit_code{111};
    std::string stderr_pattern;         // "" = exit code only
    std::vector<std::string> wrapper;   // prepended to the step's argv
};

// valgrind --leak-check=full ... --error-exitcode=<exit_code>
std::vector<std::string> default_leak_wrapper(int exit_code = 111);

struct RunOptions {
    ProcLimits limits;                  // limits.timeout_ms applies per step
    std::filesystem::path scratch_root; // "" = <tmp>/gauntlet
    bool keep_artifacts{false};
    LeakCheck leak;
};

struct StepRecord {
    std::string name;
    std::vector<std::string> argv;
    int exit_code{0};
    bool timed_out{false};
    bool allowed_failure{false};        // non-zero exit tolerated by allowError
    bool leak{false};
    int elapsed_ms{0};
};

// Outcome of one (executable, toolchain, test) run.
struct TestResult {
    const TestFile* test{nullptr};
    std::string exe_id;
    std::string toolchain;

    bool did_pass{false};
    FailReason reason{FailReason::NONE};
    std::string failing_step;           // "" unless a step ended the run
    std::string gen_output;
    std::string diff;                   // mismatch description
    std::string error;                  // launch error / timeout detail
    bool memory_leak{false};

    std::vector<StepRecord> steps;      // executed steps, in order
    int elapsed_ms{0};

    bool had_allowed_failure() const;
};

using Placeholders = std::vector<std::pair<std::string, std::string>>;

// Replace "$NAME" occurrences with the matching value (longest name wins).
// Unknown "$..." sequences are kept verbatim; values are not rescanned.
std::string substitute_placeholders(const std::string& tmpl, const Placeholders& vars);

// Runs every step of a toolchain for one test, threading each step's output
// into the next, and judges the final output against the expected bytes.
class ToolChainRunner {
public:
    ToolChainRunner(ToolChain tc, RunOptions opts);

    // nullopt only when no scratch directory could be created.
    std::optional<TestResult> run(const TestFile& test, const Executable& exe) const;

    const ToolChain& toolchain() const { return tc_; }
    const RunOptions& options() const { return opts_; }

    // Index of the step inspected for leaks, or npos when none.
    size_t leak_step_index() const { return leak_step_; }

private:
    ToolChain tc_;
    RunOptions opts_;
    size_t leak_step_;
};

} // namespace gauntlet
