#include "gauntlet/harness.h"
#include "gauntlet/log.h"

#include <json-c/json.h>

namespace gauntlet {

static std::string ratio(const Counter& c) {
    return std::to_string(c.pass) + " / " + std::to_string(c.total);
}

Harness::Harness(const Config& cfg,
                 const std::vector<Package>& packages,
                 RunOptions opts,
                 Reporter& rep,
                 HarnessObserver& obs,
                 JsonlLogger* events)
    : cfg_(cfg), packages_(packages), opts_(std::move(opts)), rep_(rep), obs_(obs), events_(events) {}

void Harness::emit_result_event(const RunContext& ctx, const std::optional<TestResult>& r) {
    if (!events_) return;
    json_object* p = json_object_new_object();
    json_object_object_add(p, "exe", json_object_new_string(ctx.exe->id().c_str()));
    json_object_object_add(p, "toolchain", json_object_new_string(ctx.toolchain->name().c_str()));
    json_object_object_add(p, "package", json_object_new_string(ctx.package->name.c_str()));
    json_object_object_add(p, "subpackage", json_object_new_string(ctx.subpackage->name.c_str()));
    json_object_object_add(p, "test", json_object_new_string(ctx.test->path().c_str()));
    if (!r) {
        json_object_object_add(p, "passed", json_object_new_boolean(0));
        json_object_object_add(p, "error", json_object_new_string("no result"));
    } else {
        json_object_object_add(p, "passed", json_object_new_boolean(r->did_pass ? 1 : 0));
        json_object_object_add(p, "reason", json_object_new_string(fail_reason_name(r->reason)));
        if (!r->failing_step.empty())
            json_object_object_add(p, "failing_step", json_object_new_string(r->failing_step.c_str()));
        json_object_object_add(p, "memory_leak", json_object_new_boolean(r->memory_leak ? 1 : 0));
        json_object_object_add(p, "elapsed_ms", json_object_new_int(r->elapsed_ms));
        json_object* steps = json_object_new_array();
        for (const auto& s : r->steps) {
            json_object* so = json_object_new_object();
            json_object_object_add(so, "name", json_object_new_string(s.name.c_str()));
            json_object_object_add(so, "exit_code", json_object_new_int(s.exit_code));
            json_object_object_add(so, "timed_out", json_object_new_boolean(s.timed_out ? 1 : 0));
            json_object_object_add(so, "allowed_failure", json_object_new_boolean(s.allowed_failure ? 1 : 0));
            json_object_object_add(so, "elapsed_ms", json_object_new_int(s.elapsed_ms));
            json_object_array_add(steps, so);
        }
        json_object_object_add(p, "steps", steps);
    }
    events_->event("test_result", p);
}

bool Harness::run() {
    const bool scope_log = obs_.wants_scope_log();
    totals_ = Counter{};
    missing_ = 0;

    if (events_) {
        json_object* p = json_object_new_object();
        json_object_object_add(p, "config", json_object_new_string(cfg_.config_path.string().c_str()));
        json_object_object_add(p, "executables", json_object_new_int((int)cfg_.executables.size()));
        json_object_object_add(p, "toolchains", json_object_new_int((int)cfg_.toolchains.size()));
        json_object_object_add(p, "packages", json_object_new_int((int)packages_.size()));
        events_->event("run_start", p);
    }
    obs_.on_run_start();

    for (const auto& exe : cfg_.executables) {
        if (scope_log) rep_.info("Running executable:\t" + exe.id());
        obs_.on_executable_start(exe);
        Counter exe_count;

        for (const auto& tc : cfg_.toolchains) {
            ToolChainRunner tc_runner(tc, opts_);
            if (scope_log) rep_.info("Running toolchain:\t" + tc.name(), 1);
            obs_.on_toolchain_start(exe, tc);
            Counter tc_count;

            for (const auto& pkg : packages_) {
                RunContext ctx;
                ctx.exe = &exe;
                ctx.toolchain = &tc;
                ctx.package = &pkg;
                if (scope_log) rep_.info("Entering package " + pkg.name, 2);
                obs_.on_package_start(ctx);
                Counter pkg_count;

                for (const auto& spkg : pkg.subpackages) {
                    ctx.subpackage = &spkg;
                    ctx.test = nullptr;
                    if (scope_log) rep_.info("Entering subpackage " + spkg.name, 3);
                    obs_.on_subpackage_start(ctx);
                    Counter spkg_count;

                    for (const auto& test : spkg.tests) {
                        ctx.test = test.get();
                        std::optional<TestResult> r = tc_runner.run(*test, exe);
                        if (!r) {
                            missing_++;
                            rep_.error("failed to receive test result for " + test->path());
                        }
                        spkg_count.record(r && r->did_pass);
                        emit_result_event(ctx, r);
                        obs_.on_result(ctx, r);
                    }
                    ctx.test = nullptr;

                    obs_.on_subpackage_end(ctx, spkg_count);
                    if (scope_log) rep_.info("Subpackage Passed: " + ratio(spkg_count), 3);
                    pkg_count.add(spkg_count);
                }
                ctx.subpackage = nullptr;

                obs_.on_package_end(ctx, pkg_count);
                if (scope_log) rep_.info("Package Passed: " + ratio(pkg_count), 2);
                tc_count.add(pkg_count);
            }

            obs_.on_toolchain_end(exe, tc, tc_count);
            if (scope_log) rep_.info("Toolchain Passed: " + ratio(tc_count), 1);
            exe_count.add(tc_count);
        }

        obs_.on_executable_end(exe, exe_count);
        if (scope_log) rep_.info("Executable Passed: " + ratio(exe_count));
        if (events_) {
            json_object* p = json_object_new_object();
            json_object_object_add(p, "exe", json_object_new_string(exe.id().c_str()));
            json_object_object_add(p, "pass", json_object_new_int(exe_count.pass));
            json_object_object_add(p, "total", json_object_new_int(exe_count.total));
            events_->event("executable_end", p);
        }
        totals_.add(exe_count);
    }

    obs_.on_run_end(totals_);
    if (events_) {
        json_object* p = json_object_new_object();
        json_object_object_add(p, "pass", json_object_new_int(totals_.pass));
        json_object_object_add(p, "total", json_object_new_int(totals_.total));
        json_object_object_add(p, "missing", json_object_new_int(missing_));
        events_->event("run_end", p);
    }
    return totals_.all_passed() && missing_ == 0;
}

} // namespace gauntlet
