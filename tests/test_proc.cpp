#include "test_common.h"
#include "gauntlet/proc.h"

#include <chrono>

#include <signal.h>

using namespace gauntlet;

int main() {
    ProcLimits lim;
    lim.timeout_ms = 5000;

    // stdin is delivered and stdout captured
    {
        ProcResult r;
        bool ok = proc_run_capture({"/bin/cat"}, "", "hello\nworld\n", {}, lim, &r);
        expect_true(ok, "cat should launch: " + r.error);
        expect_eq_ll(r.exit_code, 0, "cat exit code");
        expect_eq_str(r.out, "hello\nworld\n", "cat echoes stdin");
        expect_true(r.err.empty(), "cat writes no stderr");
    }

    // stdout and stderr are kept apart, exit code preserved
    {
        ProcResult r;
        bool ok = proc_run_capture({"/bin/sh", "-c", "echo out; echo err 1>&2; exit 3"}, "", "", {}, lim, &r);
        expect_true(ok, "sh should launch");
        expect_eq_ll(r.exit_code, 3, "exit code");
        expect_eq_str(r.out, "out\n", "stdout");
        expect_eq_str(r.err, "err\n", "stderr");
        expect_true(!r.timed_out, "no timeout");
    }

    // timeout kills the child promptly
    {
        ProcLimits short_lim;
        short_lim.timeout_ms = 300;
        ProcResult r;
        auto t0 = std::chrono::steady_clock::now();
        bool ok = proc_run_capture({"/bin/sh", "-c", "sleep 5"}, "", "", {}, short_lim, &r);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - t0).count();
        expect_true(ok, "sleep should launch");
        expect_true(r.timed_out, "sleep 5 should time out");
        expect_true(ms < 3000, "timeout should return well before the child would exit");
        expect_eq_ll(r.exit_code, 128 + SIGKILL, "killed child reports 128+SIGKILL");
    }

    // launch failure is reported, not thrown
    {
        ProcResult r;
        bool ok = proc_run_capture({"/nonexistent/gauntlet-no-such-binary"}, "", "", {}, lim, &r);
        expect_true(!ok, "missing binary should not launch");
        expect_true(!r.launched, "launched flag false");
        expect_true(!r.error.empty(), "launch error text set");
    }

    // a bare name missing from PATH fails through the child's exec error path
    {
        ProcResult r;
        bool ok = proc_run_capture({"gauntlet-no-such-binary-on-path"}, "", "", {}, lim, &r);
        expect_true(!ok, "unknown bare name should not launch");
        expect_true(!r.launched, "launched flag false for bare name");
        expect_true(!r.error.empty(), "launch error text for bare name");
    }

    // working directory and environment overlay
    {
        TempDir tmp("gauntlet_test_proc");
        ProcResult r;
        bool ok = proc_run_capture({"/bin/sh", "-c", "pwd; echo $GAUNTLET_PROC_MARK"},
                                   tmp.path.string(), "", {{"GAUNTLET_PROC_MARK", "xyz"}}, lim, &r);
        expect_true(ok, "sh should launch");
        auto canon = std::filesystem::canonical(tmp.path).string();
        expect_eq_str(r.out, canon + "\nxyz\n", "cwd and env overlay");
    }

    // child that ignores stdin does not deadlock on a large write
    {
        std::string big(1 << 20, 'x');
        ProcResult r;
        bool ok = proc_run_capture({"/bin/sh", "-c", "exit 0"}, "", big, {}, lim, &r);
        expect_true(ok, "sh should launch");
        expect_eq_ll(r.exit_code, 0, "exit 0 with unread stdin");
    }

    // quoted command splitting
    {
        auto v = split_argv_quoted("valgrind --leak-check=full \"a b\" '' -q");
        expect_eq_ll((long long)v.size(), 5, "token count");
        expect_eq_str(v[2], "a b", "double-quoted token");
        expect_eq_str(v[3], "", "empty quoted token");
    }

    std::cerr << "test_proc: ALL PASSED" << std::endl;
    return 0;
}
