#include "gauntlet/policies.h"
#include "gauntlet/comparator.h"

#include <cstdio>

namespace gauntlet {

static std::string join_argv(const std::vector<std::string>& argv) {
    std::string s;
    for (size_t i = 0; i < argv.size(); i++) {
        if (i) s += " ";
        s += argv[i];
    }
    return s;
}

void log_result(Reporter& rep, const TestResult& r, int indent) {
    const std::string name = r.test ? r.test->file() : std::string("?");
    const int v = rep.verbosity();

    if (r.did_pass) {
        if (v < 1) return;
        std::string msg = name;
        if (r.had_allowed_failure()) msg += " (allowed step failure)";
        rep.tagged("[PASS]", Color::GREEN, msg, indent);
    } else {
        std::string msg = name + " (" + fail_reason_name(r.reason);
        if (!r.failing_step.empty()) msg += " at " + r.failing_step;
        msg += ")";
        rep.tagged("[FAIL]", Color::RED, msg, indent);
        if (v >= 2) {
            if (!r.error.empty()) rep.info(r.error, indent + 1);
            if (!r.diff.empty()) rep.info(r.diff, indent + 1);
        }
    }

    if (v >= 3) {
        for (const auto& s : r.steps) {
            std::string line = s.name + ": " + join_argv(s.argv) + " -> " + std::to_string(s.exit_code);
            if (s.timed_out) line += " (timeout)";
            if (s.allowed_failure) line += " (allowed)";
            if (s.leak) line += " (leak)";
            line += " [" + std::to_string(s.elapsed_ms) + " ms]";
            rep.info(line, indent + 1);
        }
        rep.info("output: " + escape_bytes(trim_bytes(r.gen_output)), indent + 1);
    }
}

// --- regular ---

void RegularPolicy::on_result(const RunContext& ctx, const std::optional<TestResult>& result) {
    if (!result) {
        rep_.tagged("[FAIL]", Color::RED, ctx.test->file() + " (no result)", 4);
        return;
    }
    log_result(rep_, *result, 4);
    if (!result->did_pass) failures_.push_back(*result);
}

void RegularPolicy::on_run_end(const Counter& total) {
    if (!failures_.empty()) {
        rep_.newline();
        rep_.info("Failure Log:");
        for (const auto& f : failures_) {
            std::string line = f.exe_id + " " + f.toolchain + " " + (f.test ? f.test->path() : "?");
            line += " (" + std::string(fail_reason_name(f.reason));
            if (!f.failing_step.empty()) line += " at " + f.failing_step;
            line += ")";
            rep_.tagged("[FAIL]", Color::RED, line, 1);
        }
    }
    rep_.info("Total Passed: " + score_cell(total));
}

// --- memcheck ---

void MemcheckPolicy::on_executable_start(const Executable& exe) {
    regular_.on_executable_start(exe);
    leaks_.clear();
    exe_tests_ = 0;
}

void MemcheckPolicy::on_result(const RunContext& ctx, const std::optional<TestResult>& result) {
    regular_.on_result(ctx, result);
    exe_tests_++;
    if (result && result->memory_leak) {
        leaks_.push_back(ctx.test->path());
        total_leaks_++;
        if (rep_.verbosity() >= 1) rep_.tagged("[LEAK]", Color::YELLOW, ctx.test->file(), 4);
    }
}

void MemcheckPolicy::on_executable_end(const Executable& exe, const Counter& c) {
    regular_.on_executable_end(exe, c);
    if (!leaks_.empty()) {
        rep_.tagged("[LEAK]", Color::YELLOW, "Detected in:");
        for (const auto& p : leaks_) rep_.info(p, 1);
    }
    rep_.info("Total Leaked: " + std::to_string(leaks_.size()) + " / " + std::to_string(exe_tests_));
}

void MemcheckPolicy::on_run_end(const Counter& total) {
    regular_.on_run_end(total);
}

// --- perf ---

static std::string seconds_text(long long ms) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.3f", (double)ms / 1000.0);
    return buf;
}

void PerfPolicy::on_package_start(const RunContext& ctx) {
    regular_.on_package_start(ctx);
    package_ms_ = 0;
}

void PerfPolicy::on_result(const RunContext& ctx, const std::optional<TestResult>& result) {
    regular_.on_result(ctx, result);
    if (!result) return;
    package_ms_ += result->elapsed_ms;
    rep_.info(ctx.test->file() + ": " + std::to_string(result->elapsed_ms) + " ms", 4);
}

void PerfPolicy::on_package_end(const RunContext& ctx, const Counter& c) {
    regular_.on_package_end(ctx, c);
    timings_[ctx.toolchain->name()].set(ctx.exe->id(), ctx.package->name, seconds_text(package_ms_));
}

void PerfPolicy::on_run_end(const Counter& total) {
    regular_.on_run_end(total);
    for (const auto& kv : timings_) {
        const auto path = output_dir_ / ("timing_" + kv.first + ".csv");
        std::string err;
        if (!kv.second.write_csv(path, kv.first, &err)) {
            rep_.error("timing matrix: " + err);
            write_ok_ = false;
        } else {
            rep_.info("Wrote " + path.string());
        }
    }
}

// --- tournament ---

void TournamentPolicy::write_failed(const std::string& what) {
    if (write_ok_) rep_.error(what);
    write_ok_ = false;
}

void TournamentPolicy::on_toolchain_start(const Executable& exe, const ToolChain& tc) {
    rep_.newline();
    rep_.info("Toolchain: " + tc.name() + "    Defender: " + exe.id());

    // one feedback file per (exe, toolchain) and run
    const auto fb = settings_.output_dir / feedback_file_name(exe.id(), tc.name());
    std::error_code ec;
    std::filesystem::remove(fb, ec);
    if (ec) write_failed("feedback: cannot reset " + fb.string() + ": " + ec.message());
}

void TournamentPolicy::on_package_start(const RunContext& ctx) {
    rep_.raw("  " + ctx.package->name + " --> " + ctx.exe->id() + " ");
}

void TournamentPolicy::on_result(const RunContext& ctx, const std::optional<TestResult>& result) {
    const bool passed = result && result->did_pass;
    rep_.mark('.', passed ? Color::GREEN : Color::RED);
    if (passed) return;

    if (result) {
        std::string err;
        const auto fb = settings_.output_dir / feedback_file_name(ctx.exe->id(), ctx.toolchain->name());
        if (!append_text(fb, format_feedback(*result, ctx.package->name), &err))
            write_failed("feedback: " + err);
    }
    if (ctx.exe->is_baseline() && !settings_.failure_log.empty()) {
        std::string err;
        if (!append_text(settings_.failure_log,
                         failure_log_line(ctx.toolchain->name(), ctx.package->name, ctx.test->path()),
                         &err))
            write_failed("failure log: " + err);
    }
}

void TournamentPolicy::on_package_end(const RunContext& ctx, const Counter& c) {
    rep_.raw(" " + score_cell(c));
    rep_.newline();
    matrices_[ctx.toolchain->name()].set(ctx.exe->id(), ctx.package->name, score_cell(c));
}

void TournamentPolicy::on_run_end(const Counter& total) {
    rep_.newline();
    for (const auto& kv : matrices_) {
        const auto path = settings_.output_dir / ("toolchain_" + kv.first + ".csv");
        std::string err;
        if (!kv.second.write_csv(path, kv.first, &err)) write_failed("score matrix: " + err);
        else rep_.info("Wrote " + path.string());
    }
    rep_.info("Total Passed: " + score_cell(total));
}

} // namespace gauntlet
