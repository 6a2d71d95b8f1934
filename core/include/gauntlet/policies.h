#pragma once
#include "harness.h"
#include "reporter.h"
#include "tournament.h"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace gauntlet {

// Console line(s) for one result at the reporter's verbosity.
void log_result(Reporter& rep, const TestResult& r, int indent);

// PASS/FAIL per test, failures listed after the run.
class RegularPolicy : public HarnessObserver {
public:
    explicit RegularPolicy(Reporter& rep) : rep_(rep) {}

    void on_result(const RunContext& ctx, const std::optional<TestResult>& result) override;
    void on_run_end(const Counter& total) override;

    const std::vector<TestResult>& failures() const { return failures_; }

private:
    Reporter& rep_;
    std::vector<TestResult> failures_;
};

// Regular behaviour plus a leak tally per executable.
class MemcheckPolicy : public HarnessObserver {
public:
    explicit MemcheckPolicy(Reporter& rep) : rep_(rep), regular_(rep) {}

    void on_executable_start(const Executable& exe) override;
    void on_result(const RunContext& ctx, const std::optional<TestResult>& result) override;
    void on_executable_end(const Executable& exe, const Counter& c) override;
    void on_run_end(const Counter& total) override;

    int total_leaks() const { return total_leaks_; }
    // Paths of leaking tests for the executable in progress (or the last one).
    const std::vector<std::string>& leaks() const { return leaks_; }

private:
    Reporter& rep_;
    RegularPolicy regular_;
    std::vector<std::string> leaks_;
    int exe_tests_{0};
    int total_leaks_{0};
};

// Regular behaviour plus per-test timings and timing_<toolchain>.csv.
class PerfPolicy : public HarnessObserver {
public:
    PerfPolicy(Reporter& rep, std::filesystem::path output_dir)
        : rep_(rep), regular_(rep), output_dir_(std::move(output_dir)) {}

    void on_package_start(const RunContext& ctx) override;
    void on_result(const RunContext& ctx, const std::optional<TestResult>& result) override;
    void on_package_end(const RunContext& ctx, const Counter& c) override;
    void on_run_end(const Counter& total) override;

    // toolchain -> (executable x package) seconds
    const std::map<std::string, ScoreMatrix>& timings() const { return timings_; }
    bool write_ok() const { return write_ok_; }

private:
    Reporter& rep_;
    RegularPolicy regular_;
    std::filesystem::path output_dir_;
    std::map<std::string, ScoreMatrix> timings_;
    long long package_ms_{0};
    bool write_ok_{true};
};

struct TournamentSettings {
    std::filesystem::path output_dir{"."};  // CSV and feedback files
    std::filesystem::path failure_log;      // "" = none
};

// Attacking packages against defending executables; dots on the console,
// a score matrix per toolchain, feedback files and the baseline failure log.
class TournamentPolicy : public HarnessObserver {
public:
    TournamentPolicy(Reporter& rep, TournamentSettings settings)
        : rep_(rep), settings_(std::move(settings)) {}

    bool wants_scope_log() const override { return false; }

    void on_toolchain_start(const Executable& exe, const ToolChain& tc) override;
    void on_package_start(const RunContext& ctx) override;
    void on_result(const RunContext& ctx, const std::optional<TestResult>& result) override;
    void on_package_end(const RunContext& ctx, const Counter& c) override;
    void on_run_end(const Counter& total) override;

    // toolchain name -> (defender x attacker) "p / t"
    const std::map<std::string, ScoreMatrix>& matrices() const { return matrices_; }
    bool write_ok() const { return write_ok_; }

private:
    Reporter& rep_;
    TournamentSettings settings_;
    std::map<std::string, ScoreMatrix> matrices_;
    bool write_ok_{true};

    void write_failed(const std::string& what);
};

} // namespace gauntlet
