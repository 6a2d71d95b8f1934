#include "test_common.h"
#include "runner_utils.h"

#include <cstdlib>
#include <vector>

using namespace gauntlet;

static bool parse(std::vector<std::string> words, CliArgs* out, std::string* err) {
    words.insert(words.begin(), "gauntlet_cli");
    std::vector<char*> argv;
    for (auto& w : words) argv.push_back(&w[0]);
    argv.push_back(nullptr);
    return parse_cli_args((int)words.size(), argv.data(), out, err);
}

int main() {
    unsetenv("GAUNTLET_TIMEOUT_MS");
    unsetenv("GAUNTLET_SCRATCH_DIR");
    unsetenv("NO_COLOR");

    // defaults
    {
        CliArgs a;
        std::string err;
        expect_true(parse({"regular", "cfg.json"}, &a, &err), "minimal args: " + err);
        expect_eq_str(a.command, "regular", "command");
        expect_eq_str(a.config_path, "cfg.json", "config path");
        expect_eq_ll(a.timeout_ms, 5000, "default timeout");
        expect_eq_str(a.output_dir, ".", "default output dir");
        expect_eq_ll(a.verbosity, 0, "default verbosity");
        expect_true(!a.no_color && !a.keep_artifacts, "flags off");
    }

    // every option
    {
        CliArgs a;
        std::string err;
        bool ok = parse({"tournament", "cfg.json", "--timeout", "2.5", "--failure-log", "f.txt",
                         "--output-dir", "out", "--event-log", "e.jsonl", "--package", "p1",
                         "--scratch-dir", "/s", "--keep-artifacts", "--leak-wrapper", "vg --x 'a b'",
                         "-v", "--verbose", "--no-color"},
                        &a, &err);
        expect_true(ok, "full args: " + err);
        expect_eq_ll(a.timeout_ms, 2500, "fractional timeout");
        expect_eq_str(a.failure_log, "f.txt", "failure log");
        expect_eq_str(a.output_dir, "out", "output dir");
        expect_eq_str(a.event_log, "e.jsonl", "event log");
        expect_eq_str(a.package, "p1", "package");
        expect_eq_str(a.scratch_dir, "/s", "scratch dir");
        expect_true(a.keep_artifacts, "keep artifacts");
        expect_eq_ll((long long)a.leak_wrapper.size(), 3, "wrapper split");
        expect_eq_str(a.leak_wrapper[2], "a b", "quoted wrapper arg");
        expect_eq_ll(a.verbosity, 2, "repeated -v");
        expect_true(a.no_color, "no color");
    }

    // environment defaults, overridden by flags
    {
        setenv("GAUNTLET_TIMEOUT_MS", "1200", 1);
        setenv("GAUNTLET_SCRATCH_DIR", "/env/scratch", 1);
        setenv("NO_COLOR", "1", 1);
        CliArgs a;
        std::string err;
        expect_true(parse({"perf", "c.json", "--verbosity", "9"}, &a, &err), "env args: " + err);
        expect_eq_ll(a.timeout_ms, 1200, "timeout from env");
        expect_eq_str(a.scratch_dir, "/env/scratch", "scratch from env");
        expect_true(a.no_color, "NO_COLOR honoured");
        expect_eq_ll(a.verbosity, 3, "verbosity clamped");

        expect_true(parse({"perf", "c.json", "--timeout", "1"}, &a, &err), "flag override");
        expect_eq_ll(a.timeout_ms, 1000, "flag beats env");
        unsetenv("GAUNTLET_TIMEOUT_MS");
        unsetenv("GAUNTLET_SCRATCH_DIR");
        unsetenv("NO_COLOR");
    }

    // usage errors
    {
        CliArgs a;
        std::string err;
        expect_true(!parse({"regular"}, &a, &err), "missing config");
        expect_true(!parse({"bogus", "c.json"}, &a, &err), "unknown command");
        expect_true(err.find("bogus") != std::string::npos, "error names command");
        expect_true(!parse({"regular", "c.json", "--timeout"}, &a, &err), "missing value");
        expect_true(!parse({"regular", "c.json", "--timeout", "-1"}, &a, &err), "negative timeout");
        expect_true(!parse({"regular", "c.json", "--timeout", "abc"}, &a, &err), "non-numeric timeout");
        expect_true(!parse({"regular", "c.json", "--frobnicate"}, &a, &err), "unknown option");
        expect_true(!parse({"regular", "c.json", "extra"}, &a, &err), "extra positional");
        expect_true(parse({"check", "c.json"}, &a, &err), "check is a command");
    }

    // run ids
    {
        setenv("GAUNTLET_DETERMINISTIC_RUN_ID", "1", 1);
        expect_eq_str(gen_run_id(), gen_run_id(), "deterministic run id");
        unsetenv("GAUNTLET_DETERMINISTIC_RUN_ID");
        expect_true(!gen_run_id().empty(), "run id");
    }

    std::cerr << "test_cli: ALL PASSED" << std::endl;
    return 0;
}
