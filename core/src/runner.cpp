#include "gauntlet/runner.h"
#include "gauntlet/comparator.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <fstream>
#include <string>

#include <unistd.h>

namespace gauntlet {

namespace fs = std::filesystem;

std::vector<std::string> default_leak_wrapper(int exit_code) {
    return {
        "valgrind",
        "--leak-check=full",
        "--errors-for-leak-kinds=definite",
        "--error-exitcode=" + std::to_string(exit_code),
        "-q",
    };
}

bool TestResult::had_allowed_failure() const {
    for (const auto& s : steps) {
        if (s.allowed_failure) return true;
    }
    return false;
}

std::string substitute_placeholders(const std::string& tmpl, const Placeholders& vars) {
    std::string out;
    out.reserve(tmpl.size());
    size_t i = 0;
    while (i < tmpl.size()) {
        if (tmpl[i] != '$') {
            out.push_back(tmpl[i++]);
            continue;
        }
        const std::pair<std::string, std::string>* best = nullptr;
        for (const auto& kv : vars) {
            if (tmpl.compare(i, kv.first.size(), kv.first) != 0) continue;
            if (!best || kv.first.size() > best->first.size()) best = &kv;
        }
        if (best) {
            out += best->second;
            i += best->first.size();
        } else {
            out.push_back(tmpl[i++]);
        }
    }
    return out;
}

static std::string sanitize_component(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                  c == '.' || c == '-' || c == '_';
        out.push_back(ok ? c : '_');
    }
    return out.empty() ? std::string("_") : out;
}

static std::string absolute_string(const std::string& p) {
    std::error_code ec;
    fs::path abs = fs::absolute(p, ec);
    return ec ? p : abs.lexically_normal().string();
}

namespace {

// Per-run working directory; removed on scope exit unless kept.
class ScratchDir {
public:
    ScratchDir(const fs::path& root, const std::string& name, bool keep) : keep_(keep) {
        static std::atomic<uint64_t> seq{0};
        path_ = root / (name + "-" + std::to_string((long long)getpid()) + "-" +
                        std::to_string(seq.fetch_add(1)));
        std::error_code ec;
        fs::remove_all(path_, ec);
        ok_ = fs::create_directories(path_, ec) && !ec;
        if (!ok_) error_ = ec.message();
    }
    ~ScratchDir() {
        if (ok_ && !keep_) {
            std::error_code ec;
            fs::remove_all(path_, ec);
        }
    }
    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    bool ok() const { return ok_; }
    const fs::path& path() const { return path_; }
    const std::string& error() const { return error_; }

private:
    fs::path path_;
    bool keep_{false};
    bool ok_{false};
    std::string error_;
};

} // namespace

ToolChainRunner::ToolChainRunner(ToolChain tc, RunOptions opts)
    : tc_(std::move(tc)), opts_(std::move(opts)), leak_step_(std::string::npos) {
    if (opts_.scratch_root.empty()) {
        std::error_code ec;
        fs::path tmp = fs::temp_directory_path(ec);
        opts_.scratch_root = (ec ? fs::path("/tmp") : tmp) / "gauntlet";
    }
    if (opts_.leak.enabled) {
        if (opts_.leak.step.empty()) {
            leak_step_ = tc_.size() - 1;
        } else {
            if (const Step* st = tc_.find_step(opts_.leak.step)) {
                leak_step_ = (size_t)(st - &tc_[0]);
            }
        }
    }
}

std::optional<TestResult> ToolChainRunner::run(const TestFile& test, const Executable& exe) const {
    const auto start = std::chrono::steady_clock::now();

    TestResult r;
    r.test = &test;
    r.exe_id = exe.id();
    r.toolchain = tc_.name();

    ScratchDir scratch(opts_.scratch_root,
                       sanitize_component(exe.id()) + "-" + sanitize_component(tc_.name()) + "-" +
                           sanitize_component(test.stem()),
                       opts_.keep_artifacts);
    if (!scratch.ok()) return std::nullopt;

    // bare names ("gcc") stay bare for PATH lookup
    const std::string exe_path = exe.binary().find('/') == std::string::npos
                                     ? exe.binary()
                                     : absolute_string(exe.binary());
    const std::string test_path = absolute_string(test.path());

    auto finish = [&](TestResult& res) {
        res.elapsed_ms = (int)std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
    };

    std::string prev_output;    // captured output of the previous step
    std::string prev_artifact;  // file the previous step produced, if any
    int prev_exit = 0;

    for (size_t i = 0; i < tc_.size(); i++) {
        const Step& step = tc_[i];

        std::string input;
        if (step.uses_input_stream()) input = test.input_stream();
        else if (i > 0) input = prev_output;

        std::string artifact;
        if (!step.pipes_output()) {
            fs::path out_path(step.output());
            if (out_path.is_relative()) out_path = scratch.path() / out_path;
            std::error_code ec;
            if (out_path.has_parent_path()) fs::create_directories(out_path.parent_path(), ec);
            fs::remove(out_path, ec);
            artifact = out_path.string();
        }

        Placeholders vars = {
            {"$EXE", exe_path},
            {"$INPUT", prev_artifact.empty() ? test_path : prev_artifact},
            {"$OUTPUT", artifact},
            {"$PREV_EXIT", std::to_string(prev_exit)},
        };
        if (step.uses_runtime()) {
            vars.emplace_back("$RT_PATH", exe.runtime_dir());
            vars.emplace_back("$RT_LIB", exe.runtime_lib());
        }

        std::vector<std::string> argv;
        argv.reserve(step.arguments().size() + 8);
        const bool leak_step = opts_.leak.enabled && i == leak_step_;
        if (leak_step) argv = opts_.leak.wrapper;
        argv.push_back(substitute_placeholders(step.command(), vars));
        for (const auto& a : step.arguments()) argv.push_back(substitute_placeholders(a, vars));

        const EnvOverlay env = step.uses_runtime() ? exe.runtime_env() : EnvOverlay{};

        ProcResult pr;
        const bool started = proc_run_capture(argv, scratch.path().string(), input, env, opts_.limits, &pr);

        StepRecord rec;
        rec.name = step.name();
        rec.argv = argv;
        rec.exit_code = pr.exit_code;
        rec.timed_out = pr.timed_out;
        rec.elapsed_ms = pr.elapsed_ms;

        if (!started) {
            r.steps.push_back(std::move(rec));
            r.reason = FailReason::LAUNCH_ERROR;
            r.failing_step = step.name();
            r.error = pr.error;
            finish(r);
            return r;
        }

        if (pr.timed_out) {
            r.steps.push_back(std::move(rec));
            r.reason = FailReason::TIMEOUT;
            r.failing_step = step.name();
            r.error = "step '" + step.name() + "' timed out after " + std::to_string(opts_.limits.timeout_ms) + " ms";
            r.gen_output = pr.out + pr.err;
            finish(r);
            return r;
        }

        int effective_exit = pr.exit_code;
        if (leak_step) {
            const bool by_code = opts_.leak.exit_code != 0 && pr.exit_code == opts_.leak.exit_code;
            const bool by_pattern = !opts_.leak.stderr_pattern.empty() &&
                                    pr.err.find(opts_.leak.stderr_pattern) != std::string::npos;
            if (by_code || by_pattern) {
                rec.leak = true;
                r.memory_leak = true;
            }
            if (by_code) effective_exit = 0;
        }

        if (effective_exit != 0 && !step.allow_error()) {
            r.steps.push_back(std::move(rec));
            r.reason = FailReason::NONZERO_EXIT;
            r.failing_step = step.name();
            r.error = "step '" + step.name() + "' exited with " + std::to_string(pr.exit_code);
            r.gen_output = pr.out + pr.err;
            finish(r);
            return r;
        }

        std::string captured = std::move(pr.out);
        if (effective_exit != 0) {
            rec.allowed_failure = true;
            captured += pr.err;
        }

        if (!artifact.empty()) {
            std::error_code ec;
            if (!fs::exists(artifact, ec)) {
                std::ofstream f(artifact, std::ios::binary | std::ios::trunc);
                f << captured;
            }
            if (auto bytes = read_file_bytes(artifact)) captured = std::move(*bytes);
        }

        r.steps.push_back(std::move(rec));
        prev_output = std::move(captured);
        prev_artifact = artifact;
        prev_exit = pr.exit_code;
    }

    r.gen_output = prev_output;
    Diff d = compare_output(r.gen_output, test.expected_out());
    r.did_pass = d.equal;
    if (!d.equal) {
        r.reason = FailReason::OUTPUT_MISMATCH;
        r.diff = std::move(d.text);
    }
    finish(r);
    return r;
}

} // namespace gauntlet
