#pragma once
#include "config.h"
#include "package.h"
#include "reporter.h"
#include "runner.h"
#include "types.h"

#include <optional>
#include <vector>

namespace gauntlet {

class JsonlLogger;

// Where a result came from; every pointer is valid for the whole run.
struct RunContext {
    const Executable* exe{nullptr};
    const ToolChain* toolchain{nullptr};
    const Package* package{nullptr};
    const Subpackage* subpackage{nullptr};
    const TestFile* test{nullptr};
};

// Per-mode behaviour plugged into the Harness driver. Scope callbacks arrive
// in traversal order: executable > toolchain > package > subpackage > result.
// Counters passed to *_end callbacks are final for that scope.
class HarnessObserver {
public:
    virtual ~HarnessObserver() = default;

    virtual void on_run_start() {}
    virtual void on_executable_start(const Executable&) {}
    virtual void on_toolchain_start(const Executable&, const ToolChain&) {}
    virtual void on_package_start(const RunContext&) {}
    virtual void on_subpackage_start(const RunContext&) {}

    // result is nullopt when the runner could not produce one; the driver
    // has already counted it as a failure.
    virtual void on_result(const RunContext& ctx, const std::optional<TestResult>& result) = 0;

    virtual void on_subpackage_end(const RunContext&, const Counter&) {}
    virtual void on_package_end(const RunContext&, const Counter&) {}
    virtual void on_toolchain_end(const Executable&, const ToolChain&, const Counter&) {}
    virtual void on_executable_end(const Executable&, const Counter&) {}
    virtual void on_run_end(const Counter&) {}

    // false suppresses the driver's per-scope summary lines
    virtual bool wants_scope_log() const { return true; }
};

// Generic iteration driver shared by every mode.
class Harness {
public:
    Harness(const Config& cfg,
            const std::vector<Package>& packages,
            RunOptions opts,
            Reporter& rep,
            HarnessObserver& obs,
            JsonlLogger* events = nullptr);

    // true only if every test of every executable/toolchain passed
    bool run();

    const Counter& totals() const { return totals_; }
    int missing_results() const { return missing_; }

private:
    const Config& cfg_;
    const std::vector<Package>& packages_;
    RunOptions opts_;
    Reporter& rep_;
    HarnessObserver& obs_;
    JsonlLogger* events_;

    Counter totals_;
    int missing_{0};

    void emit_result_event(const RunContext& ctx, const std::optional<TestResult>& r);
};

} // namespace gauntlet
