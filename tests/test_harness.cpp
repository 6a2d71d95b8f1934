#include "test_common.h"
#include "gauntlet/harness.h"
#include "gauntlet/log.h"
#include "gauntlet/policies.h"

#include <sstream>

using namespace gauntlet;
namespace fs = std::filesystem;

static Executable make_exe(const std::string& id, const fs::path& binary) {
    ExecutableSpec s;
    s.id = id;
    s.binary = binary.string();
    return Executable(s);
}

// "$EXE $INPUT" as the single step
static ToolChain exe_on_input(const std::string& name) {
    StepSpec s;
    s.name = "run";
    s.command = "$EXE";
    s.arguments = {"$INPUT"};
    return ToolChain(name, {Step(s)});
}

static size_t count_lines(const std::string& s) {
    size_t n = 0;
    for (char c : s) n += (c == '\n');
    return n;
}

// Records traversal to check the driver's counting.
class Recorder : public HarnessObserver {
public:
    int results{0};
    int subpackage_total{0};
    int executables{0};
    std::vector<std::string> order;
    const ToolChain* tc_seen{nullptr};
    bool same_toolchain{true};

    void on_executable_start(const Executable& e) override { order.push_back("exe:" + e.id()); }
    void on_toolchain_start(const Executable&, const ToolChain& tc) override { tc_seen = &tc; }
    void on_package_start(const RunContext& ctx) override { order.push_back("pkg:" + ctx.package->name); }
    void on_result(const RunContext& ctx, const std::optional<TestResult>&) override {
        results++;
        if (ctx.toolchain != tc_seen) same_toolchain = false;
    }
    void on_subpackage_end(const RunContext&, const Counter& c) override { subpackage_total += c.total; }
    void on_executable_end(const Executable&, const Counter&) override { executables++; }
};

int main() {
    TempDir tmp("gauntlet_test_harness");
    const fs::path d = tmp.path;

    write_script(d / "ref.sh", "/bin/sh \"$1\"\n");
    write_script(d / "bad.sh", "echo wrong\n");

    // pkgX: 5 tests, 3 with the right expectation for ref.sh
    const fs::path suite = d / "suite";
    for (int i = 0; i < 5; i++) {
        const std::string stem = "t" + std::to_string(i);
        write_file(suite / "pkgX" / (stem + ".sh"), "echo " + std::to_string(i) + "\n");
        write_file(suite / "pkgX" / (stem + ".out"), (i < 3 ? std::to_string(i) : std::string("nope")) + "\n");
    }
    write_file(suite / "pkgY" / "y.sh", "echo y\n");
    write_file(suite / "pkgY" / "y.out", "y\n");

    Discovery disc = gather_packages(suite);
    expect_eq_ll((long long)disc.packages.size(), 2, "two packages");

    Config cfg;
    cfg.test_dir = suite;
    cfg.executables.push_back(make_exe("ref", d / "ref.sh").with_baseline(true));
    cfg.executables.push_back(make_exe("Bad", d / "bad.sh"));
    cfg.toolchains.push_back(exe_on_input("sh"));
    cfg.solution_exe = "ref";

    RunOptions opts;
    opts.scratch_root = d / "scratch";
    opts.limits.timeout_ms = 3000;

    // driver counts each result once and visits scopes in order
    {
        std::ostringstream out, err;
        Reporter rep(out, err, false, 0);
        Recorder rec;
        Harness h(cfg, disc.packages, opts, rep, rec);
        bool all = h.run();
        expect_true(!all, "not all tests pass");
        expect_eq_ll(rec.results, 12, "2 exes x 6 tests");
        expect_eq_ll(rec.subpackage_total, 12, "subpackage counters sum");
        expect_eq_ll(rec.executables, 2, "executable scopes");
        expect_eq_ll(h.totals().total, 12, "total");
        expect_eq_ll(h.totals().pass, 4, "ref passes t0-t2 and y");
        expect_true(rec.same_toolchain, "context toolchain is the one announced at toolchain start");
        expect_true(rec.tc_seen == &cfg.toolchains[0], "context toolchain lives in the config");
        expect_eq_str(rec.order[0], "exe:ref", "first executable");
        expect_eq_str(rec.order[1], "pkg:pkgX", "first package");
        expect_true(out.str().find("Subpackage Passed: 3 / 5") != std::string::npos, "subpackage summary");
        expect_true(out.str().find("Executable Passed: 4 / 6") != std::string::npos, "executable summary");
    }

    // tournament: score matrix, CSV, feedback and baseline failure log
    {
        const fs::path outdir = d / "tournament";
        fs::create_directories(outdir);
        write_file(outdir / "Bad-sh-feedback.txt", "stale record\n");
        TournamentSettings ts;
        ts.output_dir = outdir;
        ts.failure_log = outdir / "failures.txt";

        std::ostringstream out, err;
        Reporter rep(out, err, false, 0);
        TournamentPolicy policy(rep, ts);
        Harness h(cfg, disc.packages, opts, rep, policy);
        expect_true(!h.run(), "tournament has failures");
        expect_true(policy.write_ok(), "report files written");

        const ScoreMatrix& m = policy.matrices().at("sh");
        expect_eq_str(m.get("ref", "pkgX"), "3 / 5", "ref vs pkgX");
        expect_eq_str(m.get("Bad", "pkgX"), "0 / 5", "Bad vs pkgX");
        expect_eq_str(m.get("ref", "pkgY"), "1 / 1", "ref vs pkgY");

        expect_eq_str(read_text(outdir / "toolchain_sh.csv"),
                      "sh,pkgX,pkgY\nBad,0 / 5,0 / 1\nref,3 / 5,1 / 1\n", "csv sorted ignoring case");

        std::string fb = read_text(outdir / "Bad-sh-feedback.txt");
        expect_true(fb.find("t0.sh") != std::string::npos, "feedback names the test");
        expect_true(fb.find("wrong") != std::string::npos, "feedback has generated output");
        expect_true(fb.find("stale record") == std::string::npos, "feedback from an earlier run dropped");
        expect_true(fs::exists(outdir / "ref-sh-feedback.txt"), "baseline feedback");

        std::string fl = read_text(ts.failure_log);
        expect_eq_ll((long long)count_lines(fl), 2, "baseline failures only");
        expect_true(fl.rfind("sh pkgX ", 0) == 0, "failure log format: " + fl);
        expect_true(out.str().find("pkgX --> ref") != std::string::npos, "attack line");
        expect_true(out.str().find("Subpackage Passed") == std::string::npos, "scope summaries suppressed");
    }

    // regular: failures kept for the listing
    {
        std::ostringstream out, err;
        Reporter rep(out, err, false, 1);
        RegularPolicy policy(rep);
        Harness h(cfg, disc.packages, opts, rep, policy);
        (void)h.run();
        expect_eq_ll((long long)policy.failures().size(), 8, "2 ref + 6 Bad failures");
        expect_true(out.str().find("[PASS] t0.sh") != std::string::npos, "pass line at verbosity 1");
        expect_true(out.str().find("Failure Log:") != std::string::npos, "failure listing");
    }

    // memcheck: leak tally reset per executable
    {
        const fs::path msuite = d / "msuite";
        write_file(msuite / "m" / "leak1.sh", "echo 1\nexit 111\n");
        write_file(msuite / "m" / "leak2.sh", "echo 1\nexit 111\n");
        write_file(msuite / "m" / "clean.sh", "echo 1\n");
        for (const char* n : {"leak1", "leak2", "clean"}) write_file(msuite / "m" / (std::string(n) + ".out"), "1\n");
        Discovery md = gather_packages(msuite);

        Config mcfg;
        mcfg.test_dir = msuite;
        mcfg.executables.push_back(make_exe("ref", d / "ref.sh"));
        mcfg.toolchains.push_back(exe_on_input("sh"));

        RunOptions mo = opts;
        mo.leak.enabled = true;
        mo.leak.exit_code = 111;
        mo.leak.wrapper.clear();

        std::ostringstream out, err;
        Reporter rep(out, err, false, 0);
        MemcheckPolicy policy(rep);
        Harness h(mcfg, md.packages, mo, rep, policy);
        expect_true(h.run(), "leaks do not fail tests");
        expect_eq_ll(policy.total_leaks(), 2, "two leaks");
        expect_eq_ll((long long)policy.leaks().size(), 2, "per-exe leak list");
        expect_true(out.str().find("Total Leaked: 2 / 3") != std::string::npos, "leak summary: " + out.str());
    }

    // perf: timing matrix and csv
    {
        const fs::path outdir = d / "perf";
        fs::create_directories(outdir);
        std::ostringstream out, err;
        Reporter rep(out, err, false, 0);
        PerfPolicy policy(rep, outdir);
        Harness h(cfg, disc.packages, opts, rep, policy);
        (void)h.run();
        expect_true(policy.write_ok(), "timing csv written");
        const ScoreMatrix& m = policy.timings().at("sh");
        expect_true(!m.get("ref", "pkgX").empty(), "timing cell");
        std::string csv = read_text(outdir / "timing_sh.csv");
        expect_true(csv.rfind("sh,pkgX,pkgY\n", 0) == 0, "timing header: " + csv);
    }

    // event log: one canonical JSON object per line
    {
        const fs::path log = d / "events.jsonl";
        RunHeader hdr;
        hdr.mode = "regular";
        hdr.run_id = "abc";
        JsonlLogger events(hdr, log.string());
        expect_true(events.ok(), "event log open");

        std::ostringstream out, err;
        Reporter rep(out, err, false, 0);
        Recorder rec;
        Harness h(cfg, disc.packages, opts, rep, rec, &events);
        (void)h.run();

        std::string text = read_text(log);
        expect_eq_ll((long long)count_lines(text), 1 + 12 + 2 + 1, "run_start + results + exe ends + run_end");
        expect_true(text.rfind("{\"event\":\"run_start\"", 0) == 0, "sorted keys, event first: " + text.substr(0, 60));
        expect_true(text.find("\"run_id\":\"abc\"") != std::string::npos, "run id");
        expect_true(text.find("\"event\":\"run_end\"") != std::string::npos, "run_end event");
    }

    // score matrix helpers
    {
        ScoreMatrix m;
        m.set("b", "Y,1", "1 / 2");
        m.set("A", "x", "2 / 2");
        expect_eq_str(m.to_csv("tc"), "tc,x,\"Y,1\"\nA,2 / 2,\nb,,1 / 2\n", "csv quoting and empty cells");
        Counter c;
        c.record(true);
        c.record(false);
        c.record(true);
        expect_eq_str(score_cell(c), "2 / 3", "score cell");
        expect_eq_str(failure_log_line("gcc", "pkg", "/t/a.c"), "gcc pkg /t/a.c\n", "failure line");
    }

    std::cerr << "test_harness: ALL PASSED" << std::endl;
    return 0;
}
