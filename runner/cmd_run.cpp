#include "cmd_run.h"

#include "gauntlet/config.h"
#include "gauntlet/harness.h"
#include "gauntlet/log.h"
#include "gauntlet/package.h"
#include "gauntlet/policies.h"

#include <filesystem>
#include <fstream>
#include <memory>

namespace gauntlet {

namespace fs = std::filesystem;

static bool prepare_output_dir(const std::string& dir, Reporter& rep) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        rep.error("cannot create output directory " + dir + ": " + ec.message());
        return false;
    }
    return true;
}

int cmd_run(const CliArgs& args, Reporter& rep) {
    RunMode mode;
    if (!parse_run_mode(args.command, &mode)) {
        rep.error("unknown mode: " + args.command);
        return 2;
    }

    Config cfg;
    Discovery disc;
    try {
        cfg = load_config(args.config_path);
        disc = gather_packages(cfg.test_dir, cfg.fixtures, args.package);
    } catch (const ConfigError& e) {
        rep.error(e.what());
        return 1;
    }
    for (const auto& issue : disc.issues) {
        rep.warn("skipping " + issue.path + ": " + issue.message);
    }
    if (!args.package.empty() && disc.packages.empty()) {
        rep.error("no package named " + args.package + " under " + cfg.test_dir.string());
        return 1;
    }

    RunOptions opts;
    opts.limits.timeout_ms = args.timeout_ms;
    opts.scratch_root = args.scratch_dir;
    opts.keep_artifacts = args.keep_artifacts;
    opts.leak = cfg.memcheck;
    opts.leak.enabled = (mode == RunMode::MEMCHECK);
    if (!args.leak_wrapper.empty()) opts.leak.wrapper = args.leak_wrapper;

    if ((mode == RunMode::TOURNAMENT || mode == RunMode::PERF) && !prepare_output_dir(args.output_dir, rep)) {
        return 1;
    }
    if (!args.failure_log.empty()) {
        // one run per log; failures are appended as they happen
        std::ofstream trunc(args.failure_log, std::ios::trunc);
        if (!trunc) {
            rep.error("cannot open failure log " + args.failure_log);
            return 1;
        }
    }

    std::unique_ptr<JsonlLogger> events;
    if (!args.event_log.empty()) {
        RunHeader hdr;
        hdr.mode = run_mode_name(mode);
        hdr.run_id = gen_run_id();
        events = std::make_unique<JsonlLogger>(hdr, args.event_log);
        if (!events->ok()) {
            rep.error("cannot open event log " + args.event_log);
            return 1;
        }
    }

    std::unique_ptr<HarnessObserver> policy;
    switch (mode) {
    case RunMode::REGULAR:
        policy = std::make_unique<RegularPolicy>(rep);
        break;
    case RunMode::MEMCHECK:
        policy = std::make_unique<MemcheckPolicy>(rep);
        break;
    case RunMode::PERF:
        policy = std::make_unique<PerfPolicy>(rep, args.output_dir);
        break;
    case RunMode::TOURNAMENT: {
        TournamentSettings ts;
        ts.output_dir = args.output_dir;
        ts.failure_log = args.failure_log;
        policy = std::make_unique<TournamentPolicy>(rep, ts);
        break;
    }
    }

    Harness harness(cfg, disc.packages, opts, rep, *policy, events.get());
    const bool all_passed = harness.run();
    return all_passed ? 0 : 1;
}

int cmd_check(const CliArgs& args, Reporter& rep) {
    Config cfg;
    Discovery disc;
    try {
        cfg = load_config(args.config_path);
        disc = gather_packages(cfg.test_dir, cfg.fixtures, args.package);
    } catch (const ConfigError& e) {
        rep.error(e.what());
        return 1;
    }

    rep.info("Config: " + cfg.config_path.string());
    rep.info("Test directory: " + cfg.test_dir.string());
    rep.info("Executables: " + std::to_string(cfg.executables.size()));
    for (const auto& e : cfg.executables) {
        std::string line = e.id() + " -> " + e.binary();
        if (e.is_baseline()) line += " (baseline)";
        rep.info(line, 1);
    }
    rep.info("Toolchains: " + std::to_string(cfg.toolchains.size()));
    for (const auto& tc : cfg.toolchains) {
        std::string line = tc.name() + ":";
        for (const auto& s : tc) line += " " + s.name();
        rep.info(line, 1);
    }
    rep.info("Packages: " + std::to_string(disc.packages.size()) + ", tests: " + std::to_string(disc.n_tests()));
    for (const auto& p : disc.packages) {
        rep.info(p.name + ": " + std::to_string(p.n_tests()), 1);
    }
    for (const auto& issue : disc.issues) {
        rep.warn(issue.path + ": " + issue.message);
    }
    if (!args.package.empty() && disc.packages.empty()) {
        rep.error("no package named " + args.package);
        return 1;
    }
    return disc.issues.empty() ? 0 : 1;
}

} // namespace gauntlet
